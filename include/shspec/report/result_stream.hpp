#pragma once

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <memory>
#include <ostream>
#include <string>

#include "shspec/common/diagnostic.hpp"
#include "shspec/executor/execution_result.hpp"
#include "shspec/report/result_sink.hpp"

namespace shspec::report {

// One JSON object: file, test, status, message, duration_ms. The message is
// ANSI-stripped and empty for PASS and SKIP.
auto FormatResultRecord(const executor::ExecutionResult& result)
    -> std::string;

// JSON Lines result stream for external reporting tools.
class ResultStream : public ResultSink {
 public:
  explicit ResultStream(std::ostream& out) : out_(&out) {
  }

  // Truncates path.
  static auto Open(const std::filesystem::path& path)
      -> Result<std::unique_ptr<ResultStream>>;

  void OnPlan(size_t /*total*/) override {
  }
  void OnResult(const executor::ExecutionResult& result) override;

 private:
  ResultStream() = default;

  std::ofstream file_;
  std::ostream* out_ = nullptr;
};

}  // namespace shspec::report
