#include "shspec/trace/trace_record.hpp"

#include <charconv>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include <fmt/core.h>

namespace shspec::trace {

auto ParseTraceRecord(std::string_view text) -> std::optional<TraceRecord> {
  if (!text.empty() && text.back() == '\r') {
    text.remove_suffix(1);
  }
  auto colon = text.rfind(':');
  if (colon == std::string_view::npos || colon == 0 ||
      colon + 1 >= text.size()) {
    return std::nullopt;
  }

  auto number = text.substr(colon + 1);
  size_t line = 0;
  const auto* end = number.data() + number.size();
  auto [ptr, ec] = std::from_chars(number.data(), end, line);
  if (ec != std::errc() || ptr != end || line == 0) {
    return std::nullopt;
  }
  return TraceRecord{.path = std::string(text.substr(0, colon)), .line = line};
}

auto FormatTraceRecord(const TraceRecord& record) -> std::string {
  return fmt::format("{}:{}", record.path, record.line);
}

}  // namespace shspec::trace
