#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "shspec/discovery/test_case.hpp"

namespace shspec::executor {

// Lifecycle of one test. Everything after kRunning is terminal.
enum class TestState : uint8_t {
  kPending,
  kRunning,
  kPassed,
  kFailed,
  kSkipped,
  kExpectedFail,    // todo test that failed
  kUnexpectedPass,  // todo test that passed
};

auto ToString(TestState state) -> std::string_view;

[[nodiscard]] auto IsTerminal(TestState state) -> bool;

// Only kFailed fails a run.
[[nodiscard]] auto CountsAsPassing(TestState state) -> bool;

// PASS, FAIL, SKIP or TODO. An unexpected pass reports PASS, an expected
// failure TODO.
auto StatusLabel(TestState state) -> std::string_view;

// Terminal state from the directive and the procedure's exit code.
auto DeriveState(const discovery::Directive& directive, int exit_code)
    -> TestState;

// Immutable outcome of one test case.
class ExecutionResult {
 public:
  ExecutionResult(
      discovery::TestCase test_case, int exit_code, std::string output,
      int64_t duration_ms);

  // Skipped test: never executed, zero cost.
  static auto Skipped(discovery::TestCase test_case) -> ExecutionResult;

  [[nodiscard]] auto Case() const -> const discovery::TestCase& {
    return test_case_;
  }
  [[nodiscard]] auto State() const -> TestState {
    return state_;
  }
  [[nodiscard]] auto ExitCode() const -> int {
    return exit_code_;
  }
  [[nodiscard]] auto Output() const -> const std::string& {
    return output_;
  }
  [[nodiscard]] auto DurationMs() const -> int64_t {
    return duration_ms_;
  }
  [[nodiscard]] auto Passed() const -> bool {
    return CountsAsPassing(state_);
  }

 private:
  ExecutionResult(
      discovery::TestCase test_case, TestState state, int exit_code,
      std::string output, int64_t duration_ms);

  discovery::TestCase test_case_;
  TestState state_;
  int exit_code_;
  std::string output_;
  int64_t duration_ms_;
};

}  // namespace shspec::executor
