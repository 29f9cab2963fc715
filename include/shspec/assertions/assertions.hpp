#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "shspec/common/diagnostic.hpp"

namespace shspec::assertions {

// Result of one check. Expected and actual are kept verbatim.
struct AssertionOutcome {
  bool passed = false;
  std::string description;
  std::string expected;
  std::string actual;
};

auto Equals(
    std::string_view expected, std::string_view actual,
    std::optional<std::string_view> message = std::nullopt)
    -> AssertionOutcome;

auto NotEquals(
    std::string_view unexpected, std::string_view actual,
    std::optional<std::string_view> message = std::nullopt)
    -> AssertionOutcome;

auto CommandSucceeded(int exit_code, std::string_view command)
    -> AssertionOutcome;

auto CommandFailed(int exit_code, std::string_view command)
    -> AssertionOutcome;

auto OutputEquals(
    std::string_view expected, std::string_view output,
    std::string_view command) -> AssertionOutcome;

auto OutputContains(
    std::string_view needle, std::string_view output, std::string_view command)
    -> AssertionOutcome;

auto PathExists(const std::filesystem::path& path) -> AssertionOutcome;

auto PathAbsent(const std::filesystem::path& path) -> AssertionOutcome;

auto VariableIsSet(std::string_view name, bool is_set) -> AssertionOutcome;

auto ProcedureIsDefined(std::string_view name, bool is_defined)
    -> AssertionOutcome;

// Names used by `shspec assert <kind>`.
enum class AssertionKind : uint8_t {
  kEquals,
  kNotEquals,
  kSuccess,
  kFail,
  kOutputEquals,
  kOutputContains,
  kFileExists,
  kFileNotExists,
  kVariableSet,
  kFunction,
};

auto ParseAssertionKind(std::string_view name) -> std::optional<AssertionKind>;

// Evaluate a kind with the positional arguments gathered by the shell side.
// Fails only on a malformed argument list.
auto Evaluate(AssertionKind kind, std::span<const std::string> args)
    -> Result<AssertionOutcome>;

// "  PASS: <description>\n" for a pass; FAIL line plus expected/actual
// lines for a failure.
auto FormatOutcome(const AssertionOutcome& outcome) -> std::string;

}  // namespace shspec::assertions
