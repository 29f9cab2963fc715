#include "shspec/executor/execution_result.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "shspec/discovery/test_case.hpp"

namespace shspec::executor {

auto ToString(TestState state) -> std::string_view {
  switch (state) {
    case TestState::kPending:
      return "pending";
    case TestState::kRunning:
      return "running";
    case TestState::kPassed:
      return "passed";
    case TestState::kFailed:
      return "failed";
    case TestState::kSkipped:
      return "skipped";
    case TestState::kExpectedFail:
      return "expected-fail";
    case TestState::kUnexpectedPass:
      return "unexpected-pass";
  }
  return "unknown";
}

auto IsTerminal(TestState state) -> bool {
  return state != TestState::kPending && state != TestState::kRunning;
}

auto CountsAsPassing(TestState state) -> bool {
  switch (state) {
    case TestState::kPassed:
    case TestState::kSkipped:
    case TestState::kExpectedFail:
    case TestState::kUnexpectedPass:
      return true;
    case TestState::kPending:
    case TestState::kRunning:
    case TestState::kFailed:
      return false;
  }
  return false;
}

auto StatusLabel(TestState state) -> std::string_view {
  switch (state) {
    case TestState::kPassed:
    case TestState::kUnexpectedPass:
      return "PASS";
    case TestState::kSkipped:
      return "SKIP";
    case TestState::kExpectedFail:
      return "TODO";
    case TestState::kPending:
    case TestState::kRunning:
    case TestState::kFailed:
      return "FAIL";
  }
  return "FAIL";
}

auto DeriveState(const discovery::Directive& directive, int exit_code)
    -> TestState {
  switch (directive.kind) {
    case discovery::DirectiveKind::kSkip:
      return TestState::kSkipped;
    case discovery::DirectiveKind::kTodo:
      return exit_code == 0 ? TestState::kUnexpectedPass
                            : TestState::kExpectedFail;
    case discovery::DirectiveKind::kNone:
      break;
  }
  return exit_code == 0 ? TestState::kPassed : TestState::kFailed;
}

ExecutionResult::ExecutionResult(
    discovery::TestCase test_case, int exit_code, std::string output,
    int64_t duration_ms)
    : ExecutionResult(
          std::move(test_case), TestState::kPending, exit_code,
          std::move(output), duration_ms) {
  state_ = DeriveState(test_case_.directive, exit_code_);
}

ExecutionResult::ExecutionResult(
    discovery::TestCase test_case, TestState state, int exit_code,
    std::string output, int64_t duration_ms)
    : test_case_(std::move(test_case)),
      state_(state),
      exit_code_(exit_code),
      output_(std::move(output)),
      duration_ms_(duration_ms) {
}

auto ExecutionResult::Skipped(discovery::TestCase test_case)
    -> ExecutionResult {
  return ExecutionResult(
      std::move(test_case), TestState::kSkipped, 0, std::string(), 0);
}

}  // namespace shspec::executor
