#include "shspec/report/result_sink.hpp"

#include "shspec/executor/execution_result.hpp"

namespace shspec::report {

void RunSummary::Add(const executor::ExecutionResult& result) {
  ++total;
  switch (result.State()) {
    case executor::TestState::kSkipped:
      ++skipped;
      ++passed;
      break;
    case executor::TestState::kExpectedFail:
    case executor::TestState::kUnexpectedPass:
      ++todo;
      ++passed;
      break;
    case executor::TestState::kPassed:
      ++passed;
      break;
    case executor::TestState::kPending:
    case executor::TestState::kRunning:
    case executor::TestState::kFailed:
      ++failed;
      break;
  }
}

}  // namespace shspec::report
