#pragma once

#include <compare>
#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace shspec::trace {

// One observed execution of a source line.
struct TraceRecord {
  std::string path;
  size_t line = 0;

  auto operator<=>(const TraceRecord&) const = default;
};

// Covered lines of a run. A set: hit counts are never kept.
using CoverageSet = std::set<TraceRecord>;

// Parse "path:line", splitting at the last ':'.
auto ParseTraceRecord(std::string_view text) -> std::optional<TraceRecord>;

auto FormatTraceRecord(const TraceRecord& record) -> std::string;

}  // namespace shspec::trace
