#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "shspec/common/diagnostic.hpp"
#include "shspec/trace/trace_record.hpp"

namespace shspec::trace {

// Extension of per-test trace record files.
inline constexpr const char* kTraceFileExtension = ".cov";

struct TraceSupport {
  bool available = false;
  std::string reason;
};

// Line tracing needs a DEBUG trap that propagates into functions (bash 4+).
// An unsupported interpreter is reported, never an error.
auto ProbeTraceSupport(const std::string& interpreter) -> TraceSupport;

// Heuristic per physical line. Blank lines, comments, shebangs, function
// headers and bare block keywords are not executable.
auto IsExecutableLine(std::string_view line) -> bool;

struct CoverageStats {
  size_t executable = 0;
  size_t covered = 0;

  // covered / executable * 100, 0 when nothing is executable
  [[nodiscard]] auto Percent() const -> double;
};

// Count executable and covered lines of one file. A missing file is 0/0.
auto ComputeCoverageStats(
    const std::filesystem::path& path, const CoverageSet& covered)
    -> CoverageStats;

// "<executable> <covered> <percent>", percent with one decimal or "0".
auto FormatStats(const CoverageStats& stats) -> std::string;

// Union of every *.cov file in dir.
auto MergeTraceRecords(const std::filesystem::path& dir) -> CoverageSet;

// Read and write the merged set as "path:line" lines.
auto LoadCoverageData(const std::filesystem::path& path)
    -> Result<CoverageSet>;
auto SaveCoverageData(
    const CoverageSet& covered, const std::filesystem::path& path)
    -> Result<void>;

struct FileCoverage {
  std::string path;
  CoverageStats stats;
  // Line number and covered flag of every executable line
  std::vector<std::pair<size_t, bool>> lines;
};

struct CoverageReport {
  std::vector<FileCoverage> files;
  CoverageStats total;
};

// Report over traced files plus targets, sorted by path. Files that no
// longer exist are left out.
auto BuildCoverageReport(
    const CoverageSet& covered,
    const std::vector<std::filesystem::path>& targets) -> CoverageReport;

// Aggregate percent rounded half to even; failure when below minimum.
auto CheckCoverageThreshold(const CoverageReport& report, int minimum)
    -> Result<void>;

// Human-readable report; paths under base_dir are shown relative to it.
auto FormatTextReport(
    const CoverageReport& report, const std::filesystem::path& base_dir)
    -> std::string;

auto WriteJsonReport(
    const CoverageReport& report, const std::filesystem::path& path)
    -> Result<void>;

}  // namespace shspec::trace
