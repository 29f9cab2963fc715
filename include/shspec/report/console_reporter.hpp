#pragma once

#include <cstddef>
#include <cstdio>
#include <string_view>

#include "shspec/executor/execution_result.hpp"
#include "shspec/report/result_sink.hpp"

namespace shspec::report {

// Human-readable progress and summary. Captured output is shown for
// failures, and for every test when verbose.
class ConsoleReporter : public ResultSink {
 public:
  ConsoleReporter(FILE* sink, bool verbose, bool color)
      : sink_(sink), verbose_(verbose), color_(color) {
  }

  void OnPlan(size_t total) override;
  void OnResult(const executor::ExecutionResult& result) override;
  void OnComment(std::string_view text) override;
  void OnFinish(const RunSummary& summary) override;

 private:
  FILE* sink_;
  bool verbose_;
  bool color_;
};

// Colors unless NO_COLOR is set or the stream is not a terminal.
auto ColorEnabled(FILE* stream) -> bool;

}  // namespace shspec::report
