#include "print.hpp"

#include <cstdio>
#include <string>

#include <fmt/color.h>
#include <fmt/core.h>

#include "shspec/common/diagnostic.hpp"
#include "shspec/report/console_reporter.hpp"

namespace shspec::driver {

namespace {

constexpr auto kToolColor = fmt::terminal_color::white;
constexpr auto kToolStyle = fmt::fg(kToolColor) | fmt::emphasis::bold;

// Plain text when stderr is not a terminal or NO_COLOR is set.
auto StyleIfEnabled(fmt::text_style style) -> fmt::text_style {
  return report::ColorEnabled(stderr) ? style : fmt::text_style{};
}

void PrintTagged(
    const std::string& tag, fmt::text_style tag_style,
    const std::string& message) {
  fmt::print(
      stderr, "{}: {} {}\n", fmt::styled("shspec", StyleIfEnabled(kToolStyle)),
      fmt::styled(tag, StyleIfEnabled(tag_style)),
      fmt::styled(message, StyleIfEnabled(fmt::emphasis::bold)));
}

}  // namespace

void PrintError(const std::string& message) {
  PrintTagged(
      "error:", fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold,
      message);
}

void PrintWarning(const std::string& message) {
  PrintTagged(
      "warning:",
      fmt::fg(fmt::terminal_color::bright_yellow) | fmt::emphasis::bold,
      message);
}

void PrintDiagnostic(const Diagnostic& diag) {
  if (diag.IsError()) {
    PrintError(diag.message);
  } else {
    PrintWarning(diag.message);
  }
  for (const auto& note : diag.notes) {
    fmt::print(
        stderr, "  {} {}\n",
        fmt::styled(
            "note:",
            StyleIfEnabled(
                fmt::fg(fmt::terminal_color::bright_cyan) |
                fmt::emphasis::bold)),
        note);
  }
}

}  // namespace shspec::driver
