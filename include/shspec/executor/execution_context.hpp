#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <utility>
#include <vector>

#include "shspec/common/diagnostic.hpp"
#include "shspec/common/scoped_temp_directory.hpp"
#include "shspec/discovery/test_case.hpp"
#include "shspec/substitution/registry.hpp"
#include "shspec/trace/trace_buffer.hpp"

namespace shspec::executor {

// Disposable state of one test: a directory holding the prelude, the entry
// script and the registry state, plus the trace buffer when tracing. The
// directory is removed when the context is destroyed.
class ExecutionContext {
 public:
  ExecutionContext(const ExecutionContext&) = delete;
  auto operator=(const ExecutionContext&) -> ExecutionContext& = delete;
  ExecutionContext(ExecutionContext&&) = delete;
  auto operator=(ExecutionContext&&) -> ExecutionContext& = delete;
  ~ExecutionContext();

  // trace_file empty: no tracing.
  static auto Create(
      const std::filesystem::path& run_dir, size_t index,
      const discovery::TestCase& test_case,
      const std::filesystem::path& working_dir,
      const std::filesystem::path& trace_file)
      -> Result<std::unique_ptr<ExecutionContext>>;

  [[nodiscard]] auto Dir() const -> const std::filesystem::path& {
    return dir_.Path();
  }
  [[nodiscard]] auto PreludePath() const -> std::filesystem::path;
  [[nodiscard]] auto EntryPath() const -> std::filesystem::path;
  [[nodiscard]] auto RegistryPath() const -> std::filesystem::path;

  // Null when tracing is off.
  [[nodiscard]] auto Trace() -> trace::TraceBuffer* {
    return trace_.get();
  }

  // Load the registry state left by the test, drop every entry and return
  // what was still active. Normally empty: the entry script cleans up.
  auto ReleaseSubstitutions() -> std::vector<substitution::SubstitutionEntry>;

 private:
  explicit ExecutionContext(common::ScopedTempDirectory dir)
      : dir_(std::move(dir)) {
  }

  common::ScopedTempDirectory dir_;
  std::unique_ptr<trace::TraceBuffer> trace_;
};

}  // namespace shspec::executor
