#include "shspec/assertions/assertions.hpp"

#include <charconv>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include <fmt/core.h>

#include "shspec/common/diagnostic.hpp"

namespace shspec::assertions {

namespace {

auto Pass(std::string description, std::string expected, std::string actual)
    -> AssertionOutcome {
  return AssertionOutcome{
      .passed = true,
      .description = std::move(description),
      .expected = std::move(expected),
      .actual = std::move(actual),
  };
}

auto Fail(std::string description, std::string expected, std::string actual)
    -> AssertionOutcome {
  return AssertionOutcome{
      .passed = false,
      .description = std::move(description),
      .expected = std::move(expected),
      .actual = std::move(actual),
  };
}

auto ParseExitCode(std::string_view text) -> std::optional<int> {
  int value = 0;
  const auto* end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), end, value);
  if (ec != std::errc() || ptr != end) {
    return std::nullopt;
  }
  return value;
}

auto ParseFlag(std::string_view text) -> std::optional<bool> {
  if (text == "1") {
    return true;
  }
  if (text == "0") {
    return false;
  }
  return std::nullopt;
}

auto ArityError(std::string_view kind, std::string_view usage) -> Diagnostic {
  return Diagnostic::HostError(fmt::format("usage: assert {} {}", kind, usage));
}

}  // namespace

auto Equals(
    std::string_view expected, std::string_view actual,
    std::optional<std::string_view> message) -> AssertionOutcome {
  if (expected == actual) {
    return Pass("should be equal", std::string(expected), std::string(actual));
  }
  std::string description =
      message ? std::string(*message)
              : fmt::format("Expected '{}', got '{}'", expected, actual);
  return Fail(
      std::move(description), std::string(expected), std::string(actual));
}

auto NotEquals(
    std::string_view unexpected, std::string_view actual,
    std::optional<std::string_view> message) -> AssertionOutcome {
  std::string expected = fmt::format("anything but '{}'", unexpected);
  if (unexpected != actual) {
    return Pass(
        "should not be equal", std::move(expected), std::string(actual));
  }
  std::string description =
      message ? std::string(*message)
              : fmt::format(
                    "Expected values to be different, but both were '{}'",
                    actual);
  return Fail(std::move(description), std::move(expected), std::string(actual));
}

auto CommandSucceeded(int exit_code, std::string_view command)
    -> AssertionOutcome {
  if (exit_code == 0) {
    return Pass(
        fmt::format("command should succeed: {}", command), "exit code 0",
        "exit code 0");
  }
  return Fail(
      fmt::format("command failed with exit code {}: {}", exit_code, command),
      "exit code 0", fmt::format("exit code {}", exit_code));
}

auto CommandFailed(int exit_code, std::string_view command)
    -> AssertionOutcome {
  if (exit_code != 0) {
    return Pass(
        fmt::format("command should fail: {}", command), "non-zero exit code",
        fmt::format("exit code {}", exit_code));
  }
  return Fail(
      fmt::format("command succeeded, but was expected to fail: {}", command),
      "non-zero exit code", "exit code 0");
}

auto OutputEquals(
    std::string_view expected, std::string_view output,
    std::string_view command) -> AssertionOutcome {
  if (expected == output) {
    return Pass(
        fmt::format("output should equal expected: {}", command),
        std::string(expected), std::string(output));
  }
  return Fail(
      fmt::format("output of '{}' differs from expected", command),
      std::string(expected), std::string(output));
}

auto OutputContains(
    std::string_view needle, std::string_view output, std::string_view command)
    -> AssertionOutcome {
  if (output.find(needle) != std::string_view::npos) {
    return Pass(
        fmt::format("output should contain '{}': {}", needle, command),
        std::string(needle), std::string(output));
  }
  return Fail(
      fmt::format("output of '{}' does not contain '{}'", command, needle),
      fmt::format("output containing '{}'", needle), std::string(output));
}

auto PathExists(const std::filesystem::path& path) -> AssertionOutcome {
  std::error_code ec;
  bool exists = std::filesystem::exists(path, ec);
  if (exists) {
    return Pass(
        fmt::format("path should exist: {}", path.string()), "exists",
        "exists");
  }
  return Fail(
      fmt::format("path does not exist: {}", path.string()), "exists",
      "missing");
}

auto PathAbsent(const std::filesystem::path& path) -> AssertionOutcome {
  std::error_code ec;
  bool exists = std::filesystem::exists(path, ec);
  if (!exists) {
    return Pass(
        fmt::format("path should not exist: {}", path.string()), "missing",
        "missing");
  }
  return Fail(
      fmt::format("path exists but should not: {}", path.string()), "missing",
      "exists");
}

auto VariableIsSet(std::string_view name, bool is_set) -> AssertionOutcome {
  if (is_set) {
    return Pass(fmt::format("variable should be set: {}", name), "set", "set");
  }
  return Fail(fmt::format("variable is not set: {}", name), "set", "unset");
}

auto ProcedureIsDefined(std::string_view name, bool is_defined)
    -> AssertionOutcome {
  if (is_defined) {
    return Pass(
        fmt::format("function should be defined: {}", name), "defined",
        "defined");
  }
  return Fail(
      fmt::format("function is not defined: {}", name), "defined",
      "undefined");
}

auto ParseAssertionKind(std::string_view name) -> std::optional<AssertionKind> {
  if (name == "equals") {
    return AssertionKind::kEquals;
  }
  if (name == "not-equals") {
    return AssertionKind::kNotEquals;
  }
  if (name == "success") {
    return AssertionKind::kSuccess;
  }
  if (name == "fail") {
    return AssertionKind::kFail;
  }
  if (name == "output-equals") {
    return AssertionKind::kOutputEquals;
  }
  if (name == "output-contains") {
    return AssertionKind::kOutputContains;
  }
  if (name == "file-exists") {
    return AssertionKind::kFileExists;
  }
  if (name == "file-not-exists") {
    return AssertionKind::kFileNotExists;
  }
  if (name == "variable-set") {
    return AssertionKind::kVariableSet;
  }
  if (name == "function") {
    return AssertionKind::kFunction;
  }
  return std::nullopt;
}

auto Evaluate(AssertionKind kind, std::span<const std::string> args)
    -> Result<AssertionOutcome> {
  auto optional_message = [&](size_t index) -> std::optional<std::string_view> {
    if (args.size() > index) {
      return args[index];
    }
    return std::nullopt;
  };

  switch (kind) {
    case AssertionKind::kEquals:
      if (args.size() < 2 || args.size() > 3) {
        return std::unexpected(
            ArityError("equals", "EXPECTED ACTUAL [MESSAGE]"));
      }
      return Equals(args[0], args[1], optional_message(2));

    case AssertionKind::kNotEquals:
      if (args.size() < 2 || args.size() > 3) {
        return std::unexpected(
            ArityError("not-equals", "UNEXPECTED ACTUAL [MESSAGE]"));
      }
      return NotEquals(args[0], args[1], optional_message(2));

    case AssertionKind::kSuccess:
    case AssertionKind::kFail: {
      bool expect_success = kind == AssertionKind::kSuccess;
      std::string_view label = expect_success ? "success" : "fail";
      if (args.size() != 2) {
        return std::unexpected(ArityError(label, "EXIT_CODE COMMAND"));
      }
      auto exit_code = ParseExitCode(args[0]);
      if (!exit_code) {
        return std::unexpected(
            Diagnostic::HostError(
                fmt::format("invalid exit code '{}'", args[0])));
      }
      return expect_success ? CommandSucceeded(*exit_code, args[1])
                            : CommandFailed(*exit_code, args[1]);
    }

    case AssertionKind::kOutputEquals:
      if (args.size() != 3) {
        return std::unexpected(
            ArityError("output-equals", "EXPECTED OUTPUT COMMAND"));
      }
      return OutputEquals(args[0], args[1], args[2]);

    case AssertionKind::kOutputContains:
      if (args.size() != 3) {
        return std::unexpected(
            ArityError("output-contains", "NEEDLE OUTPUT COMMAND"));
      }
      return OutputContains(args[0], args[1], args[2]);

    case AssertionKind::kFileExists:
      if (args.size() != 1) {
        return std::unexpected(ArityError("file-exists", "PATH"));
      }
      return PathExists(args[0]);

    case AssertionKind::kFileNotExists:
      if (args.size() != 1) {
        return std::unexpected(ArityError("file-not-exists", "PATH"));
      }
      return PathAbsent(args[0]);

    case AssertionKind::kVariableSet:
    case AssertionKind::kFunction: {
      bool is_variable = kind == AssertionKind::kVariableSet;
      std::string_view label = is_variable ? "variable-set" : "function";
      if (args.size() != 2) {
        return std::unexpected(ArityError(label, "NAME 0|1"));
      }
      auto flag = ParseFlag(args[1]);
      if (!flag) {
        return std::unexpected(
            Diagnostic::HostError(fmt::format("invalid flag '{}'", args[1])));
      }
      return is_variable ? VariableIsSet(args[0], *flag)
                         : ProcedureIsDefined(args[0], *flag);
    }
  }
  return std::unexpected(Diagnostic::HostError("unknown assertion kind"));
}

auto FormatOutcome(const AssertionOutcome& outcome) -> std::string {
  if (outcome.passed) {
    return fmt::format("  PASS: {}\n", outcome.description);
  }
  return fmt::format(
      "  FAIL: {}\n    expected: {}\n    actual: {}\n", outcome.description,
      outcome.expected, outcome.actual);
}

}  // namespace shspec::assertions
