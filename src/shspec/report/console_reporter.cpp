#include "shspec/report/console_reporter.hpp"

#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <string_view>
#include <unistd.h>

#include <fmt/color.h>
#include <fmt/core.h>

#include "shspec/common/text.hpp"
#include "shspec/executor/execution_result.hpp"

namespace shspec::report {

namespace {

auto StateStyle(executor::TestState state) -> fmt::text_style {
  switch (state) {
    case executor::TestState::kPassed:
    case executor::TestState::kUnexpectedPass:
      return fmt::fg(fmt::terminal_color::bright_green) | fmt::emphasis::bold;
    case executor::TestState::kSkipped:
    case executor::TestState::kExpectedFail:
      return fmt::fg(fmt::terminal_color::bright_yellow) | fmt::emphasis::bold;
    case executor::TestState::kPending:
    case executor::TestState::kRunning:
    case executor::TestState::kFailed:
      return fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold;
  }
  return {};
}

auto StateNote(const executor::ExecutionResult& result) -> std::string {
  switch (result.State()) {
    case executor::TestState::kSkipped: {
      const auto& reason = result.Case().directive.reason;
      return reason.empty() ? std::string() : fmt::format(" ({})", reason);
    }
    case executor::TestState::kExpectedFail:
      return fmt::format(" ({} ms) [expected failure]", result.DurationMs());
    case executor::TestState::kUnexpectedPass:
      return fmt::format(
          " ({} ms) [TODO - unexpected pass!]", result.DurationMs());
    case executor::TestState::kPending:
    case executor::TestState::kRunning:
    case executor::TestState::kPassed:
    case executor::TestState::kFailed:
      break;
  }
  return fmt::format(" ({} ms)", result.DurationMs());
}

}  // namespace

auto ColorEnabled(FILE* stream) -> bool {
  const char* no_color = std::getenv("NO_COLOR");
  if (no_color != nullptr && *no_color != '\0') {
    return false;
  }
  return isatty(fileno(stream)) != 0;
}

void ConsoleReporter::OnPlan(size_t total) {
  if (total == 0) {
    fmt::print(sink_, "No tests found.\n");
    return;
  }
  fmt::print(sink_, "Found {} test{}.\n", total, total == 1 ? "" : "s");
}

void ConsoleReporter::OnResult(const executor::ExecutionResult& result) {
  auto state = result.State();
  auto style = color_ ? StateStyle(state) : fmt::text_style{};
  auto label = state == executor::TestState::kExpectedFail
                   ? std::string_view("TODO")
                   : executor::StatusLabel(state);

  fmt::print(
      sink_, "  - {} {}{}\n", fmt::styled(label, style),
      result.Case().QualifiedName(), StateNote(result));

  bool show_output = state == executor::TestState::kFailed || verbose_;
  if (show_output && !result.Output().empty()) {
    for (auto line : common::SplitLines(result.Output())) {
      fmt::print(sink_, "      {}\n", line);
    }
  }
  std::fflush(sink_);
}

void ConsoleReporter::OnComment(std::string_view text) {
  fmt::print(sink_, "{}\n", text);
}

void ConsoleReporter::OnFinish(const RunSummary& summary) {
  if (summary.total == 0) {
    return;
  }
  auto pass_style = color_ ? fmt::fg(fmt::terminal_color::bright_green)
                           : fmt::text_style{};
  auto fail_style = color_ && summary.failed > 0
                        ? fmt::fg(fmt::terminal_color::bright_red)
                        : fmt::text_style{};

  fmt::print(sink_, "\n--------------------\n");
  fmt::print(sink_, "Test Summary\n");
  fmt::print(sink_, "--------------------\n");
  fmt::print(sink_, "Total tests: {}\n", summary.total);
  fmt::print(
      sink_, "{}\n", fmt::styled(fmt::format("Passed: {}", summary.passed),
                                 pass_style));
  fmt::print(
      sink_, "{}\n", fmt::styled(fmt::format("Failed: {}", summary.failed),
                                 fail_style));
  if (summary.skipped > 0 || summary.todo > 0) {
    fmt::print(
        sink_, "Skipped: {}, Todo: {}\n", summary.skipped, summary.todo);
  }
  fmt::print(sink_, "--------------------\n");
  std::fflush(sink_);
}

}  // namespace shspec::report
