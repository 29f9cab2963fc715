#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

#include "shspec/discovery/test_case.hpp"
#include "shspec/executor/execution_result.hpp"

namespace shspec::executor {

struct ExecutorOptions {
  std::string interpreter = "bash";
  // Working directory of every test (the discovery root)
  std::filesystem::path working_dir;
  // shspec binary the prelude calls back into
  std::filesystem::path helper_binary;
  // Parent of the per-test context directories
  std::filesystem::path run_dir;
  // Directory receiving one trace record file per test; empty disables
  // tracing
  std::filesystem::path trace_dir;
};

// Runs test cases one at a time, each in a fresh interpreter process.
class Executor {
 public:
  explicit Executor(ExecutorOptions options);

  // Never fails for test-level reasons: a test that cannot be started is a
  // failed result carrying the reason as output. Throws
  // common::Interrupted when the engine is signaled.
  auto Run(const discovery::TestCase& test_case) -> ExecutionResult;

  [[nodiscard]] auto Options() const -> const ExecutorOptions& {
    return options_;
  }

 private:
  ExecutorOptions options_;
  size_t next_index_ = 0;
};

}  // namespace shspec::executor
