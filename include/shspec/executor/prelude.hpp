#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace shspec::executor {

// Environment variables the prelude reads.
inline constexpr const char* kHelperBinaryEnv = "__SHSPEC_BIN";
inline constexpr const char* kRegistryStateEnv = "__SHSPEC_REGISTRY";

// Bash library sourced into every context: assertion wrappers and the
// mock/stub API, both backed by the shspec helper binary.
auto PreludeScript() -> std::string_view;

struct EntryScriptOptions {
  std::filesystem::path prelude;
  std::filesystem::path test_file;
  std::string procedure;
  // Arm the DEBUG trap that writes "file:line" records to the side channel
  bool trace = false;
};

// Script that sources the prelude and the test file, runs one procedure and
// exits with its status. An EXIT trap removes every substitution and
// disarms tracing.
auto RenderEntryScript(const EntryScriptOptions& options) -> std::string;

}  // namespace shspec::executor
