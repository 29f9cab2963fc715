#include "shspec/report/tap_writer.hpp"

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>

#include <fmt/core.h>

#include "shspec/common/text.hpp"
#include "shspec/discovery/test_case.hpp"
#include "shspec/executor/execution_result.hpp"

namespace shspec::report {

auto QuoteTapScalar(std::string_view text) -> std::string {
  std::string clean = common::StripAnsi(text);
  while (!clean.empty() && clean.back() == '\n') {
    clean.pop_back();
  }

  std::string quoted = "'";
  for (char c : clean) {
    if (c == '\'') {
      quoted += "''";
    } else if (c == '\n') {
      quoted += "\n    ";
    } else {
      quoted.push_back(c);
    }
  }
  quoted.push_back('\'');
  return quoted;
}

auto FormatTapEvent(const TapEvent& event) -> std::string {
  std::string line = fmt::format(
      "{} {} - {}", event.ok ? "ok" : "not ok", event.number,
      event.description);

  if (event.directive.kind != discovery::DirectiveKind::kNone) {
    line += fmt::format(" # {}", discovery::ToString(event.directive.kind));
    if (!event.directive.reason.empty()) {
      line += fmt::format(" {}", event.directive.reason);
    }
  }
  line += '\n';

  if (event.diagnostic) {
    const auto& diag = *event.diagnostic;
    line += "  ---\n";
    line += fmt::format("  message: {}\n", QuoteTapScalar(diag.message));
    line += "  severity: fail\n";
    line += fmt::format("  file: {}\n", QuoteTapScalar(diag.file));
    line += fmt::format("  function: {}\n", QuoteTapScalar(diag.function));
    line += fmt::format("  duration_ms: {}\n", diag.duration_ms);
    line += "  ...\n";
  }
  return line;
}

void TapWriter::OnPlan(size_t total) {
  out_ << "TAP version 13\n";
  out_ << fmt::format("1..{}\n", total);
  out_.flush();
}

auto TapWriter::MakeEvent(const executor::ExecutionResult& result)
    -> TapEvent {
  const auto& test_case = result.Case();
  TapEvent event{
      .number = ++count_,
      .ok = false,
      .description = test_case.procedure,
      .directive = test_case.directive,
      .diagnostic = std::nullopt,
  };

  switch (result.State()) {
    case executor::TestState::kPassed:
    case executor::TestState::kSkipped:
    case executor::TestState::kUnexpectedPass:
      event.ok = true;
      break;
    case executor::TestState::kExpectedFail:
      event.ok = false;
      break;
    case executor::TestState::kPending:
    case executor::TestState::kRunning:
    case executor::TestState::kFailed:
      event.ok = false;
      event.diagnostic = TapDiagnostic{
          .message = result.Output(),
          .file = test_case.file.display_path,
          .function = test_case.procedure,
          .duration_ms = result.DurationMs(),
      };
      break;
  }
  return event;
}

void TapWriter::OnResult(const executor::ExecutionResult& result) {
  out_ << FormatTapEvent(MakeEvent(result));
  out_.flush();
}

void TapWriter::OnComment(std::string_view text) {
  for (auto line : common::SplitLines(text)) {
    out_ << fmt::format("# {}\n", line);
  }
  out_.flush();
}

}  // namespace shspec::report
