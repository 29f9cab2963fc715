#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include "shspec/discovery/test_case.hpp"
#include "shspec/executor/execution_result.hpp"
#include "shspec/report/result_sink.hpp"

namespace shspec::report {

struct TapDiagnostic {
  std::string message;
  std::string file;
  std::string function;
  int64_t duration_ms = 0;
};

// One TAP result line and its optional diagnostic block.
struct TapEvent {
  size_t number = 0;
  bool ok = false;
  std::string description;
  discovery::Directive directive;
  std::optional<TapDiagnostic> diagnostic;
};

auto FormatTapEvent(const TapEvent& event) -> std::string;

// Single-quoted YAML scalar: ANSI stripped, quotes doubled, continuation
// lines indented to stay inside the block.
auto QuoteTapScalar(std::string_view text) -> std::string;

// TAP version 13 producer. Numbers results 1..N in the order received.
class TapWriter : public ResultSink {
 public:
  explicit TapWriter(std::ostream& out) : out_(out) {
  }

  void OnPlan(size_t total) override;
  void OnResult(const executor::ExecutionResult& result) override;
  void OnComment(std::string_view text) override;

  // Build the next event; advances the counter.
  auto MakeEvent(const executor::ExecutionResult& result) -> TapEvent;

  [[nodiscard]] auto Count() const -> size_t {
    return count_;
  }

 private:
  std::ostream& out_;
  size_t count_ = 0;
};

}  // namespace shspec::report
