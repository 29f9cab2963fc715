#pragma once

#include <cstddef>
#include <string_view>

#include "shspec/executor/execution_result.hpp"

namespace shspec::report {

struct RunSummary {
  size_t total = 0;
  size_t passed = 0;
  size_t failed = 0;
  size_t skipped = 0;
  size_t todo = 0;

  void Add(const executor::ExecutionResult& result);

  [[nodiscard]] auto Success() const -> bool {
    return failed == 0;
  }
};

// Consumer of results, in plan order. Every run calls OnPlan once, then
// OnResult per test, then OnFinish.
class ResultSink {
 public:
  virtual ~ResultSink() = default;
  virtual void OnPlan(size_t total) = 0;
  virtual void OnResult(const executor::ExecutionResult& result) = 0;
  virtual void OnComment(std::string_view /*text*/) {
  }
  virtual void OnFinish(const RunSummary& /*summary*/) {
  }
};

}  // namespace shspec::report
