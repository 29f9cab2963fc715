#include "shspec/trace/coverage.hpp"

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstddef>
#include <cstring>
#include <expected>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <regex>
#include <set>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "shspec/common/diagnostic.hpp"
#include "shspec/common/subprocess.hpp"
#include "shspec/common/text.hpp"
#include "shspec/trace/trace_record.hpp"

namespace shspec::trace {

namespace fs = std::filesystem;

namespace {

constexpr int kMinimumBashMajor = 4;

auto ResolvePath(const fs::path& path) -> std::string {
  std::error_code ec;
  fs::path absolute = fs::absolute(path, ec);
  if (ec) {
    return path.string();
  }
  fs::path canonical = fs::weakly_canonical(absolute, ec);
  return ec ? absolute.lexically_normal().string() : canonical.string();
}

// Visit every physical line of a file with its 1-based number.
template <typename Fn>
auto ForEachLine(const fs::path& path, Fn&& fn) -> bool {
  std::ifstream in(path);
  if (!in) {
    return false;
  }
  std::string line;
  size_t number = 0;
  while (std::getline(in, line)) {
    fn(++number, std::string_view(line));
  }
  return true;
}

auto RoundTo(double value, int decimals) -> double {
  double scale = std::pow(10.0, decimals);
  return std::round(value * scale) / scale;
}

auto DisplayPath(const std::string& path, const fs::path& base_dir)
    -> std::string {
  if (base_dir.empty()) {
    return path;
  }
  fs::path relative = fs::path(path).lexically_relative(base_dir);
  if (relative.empty() || *relative.begin() == "..") {
    return path;
  }
  return "./" + relative.generic_string();
}

}  // namespace

auto ProbeTraceSupport(const std::string& interpreter) -> TraceSupport {
  auto [exit_code, output] = common::RunSubprocess(
      {interpreter, "--noprofile", "--norc", "-c",
       R"(printf '%s\n' "${BASH_VERSINFO[0]:-0}")"});
  if (exit_code != 0) {
    return TraceSupport{
        .available = false,
        .reason = fmt::format(
            "cannot run '{}': {}", interpreter, common::Trim(output)),
    };
  }

  auto text = common::Trim(output);
  int major = 0;
  auto [ptr, ec] =
      std::from_chars(text.data(), text.data() + text.size(), major);
  if (ec != std::errc() || major < kMinimumBashMajor) {
    return TraceSupport{
        .available = false,
        .reason = fmt::format(
            "coverage requires bash {}+ (found '{}')", kMinimumBashMajor,
            text),
    };
  }
  return TraceSupport{.available = true, .reason = {}};
}

auto IsExecutableLine(std::string_view line) -> bool {
  static const std::regex kPosixHeader(
      R"(^[a-zA-Z_][a-zA-Z0-9_]*\s*\(\)\s*\{?$)");
  static const std::regex kKeywordHeader(
      R"(^function\s+[a-zA-Z_][a-zA-Z0-9_]*\s*\{?$)");
  static const std::regex kKeywordParenHeader(
      R"(^function\s+[a-zA-Z_][a-zA-Z0-9_]*\s*\(\)\s*\{?$)");

  auto text = common::Trim(line);
  if (text.empty() || text.starts_with('#')) {
    return false;
  }

  constexpr std::string_view kBareKeywords[] = {
      "}", "{", "fi", "done", "esac", "then", "else", "do"};
  if (std::ranges::find(kBareKeywords, text) != std::end(kBareKeywords)) {
    return false;
  }

  std::string owned(text);
  return !(
      std::regex_match(owned, kPosixHeader) ||
      std::regex_match(owned, kKeywordHeader) ||
      std::regex_match(owned, kKeywordParenHeader));
}

auto CoverageStats::Percent() const -> double {
  if (executable == 0) {
    return 0.0;
  }
  return static_cast<double>(covered) / static_cast<double>(executable) *
         100.0;
}

auto ComputeCoverageStats(const fs::path& path, const CoverageSet& covered)
    -> CoverageStats {
  CoverageStats stats;
  std::string resolved = ResolvePath(path);
  ForEachLine(resolved, [&](size_t number, std::string_view line) {
    if (!IsExecutableLine(line)) {
      return;
    }
    ++stats.executable;
    if (covered.contains(TraceRecord{.path = resolved, .line = number})) {
      ++stats.covered;
    }
  });
  return stats;
}

auto FormatStats(const CoverageStats& stats) -> std::string {
  if (stats.executable == 0) {
    return fmt::format("{} {} 0", stats.executable, stats.covered);
  }
  return fmt::format(
      "{} {} {:.1f}", stats.executable, stats.covered, stats.Percent());
}

auto MergeTraceRecords(const fs::path& dir) -> CoverageSet {
  CoverageSet merged;
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    return merged;
  }

  std::vector<fs::path> files;
  for (const auto& entry : fs::directory_iterator(dir, ec)) {
    if (entry.path().extension() == kTraceFileExtension) {
      files.push_back(entry.path());
    }
  }
  std::ranges::sort(files);

  for (const auto& file : files) {
    ForEachLine(file, [&](size_t /*number*/, std::string_view line) {
      if (auto record = ParseTraceRecord(line)) {
        merged.insert(std::move(*record));
      }
    });
  }
  return merged;
}

auto LoadCoverageData(const fs::path& path) -> Result<CoverageSet> {
  CoverageSet covered;
  bool readable = ForEachLine(path, [&](size_t number, std::string_view line) {
    if (common::Trim(line).empty()) {
      return;
    }
    if (auto record = ParseTraceRecord(line)) {
      covered.insert(std::move(*record));
    } else {
      spdlog::warn("{}:{}: ignoring malformed record", path.string(), number);
    }
  });
  if (!readable) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format("cannot read coverage data {}", path.string())));
  }
  return covered;
}

auto SaveCoverageData(const CoverageSet& covered, const fs::path& path)
    -> Result<void> {
  std::ofstream out(path, std::ios::trunc);
  if (!out) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format(
                "cannot write {}: {}", path.string(), std::strerror(errno))));
  }
  for (const auto& record : covered) {
    out << FormatTraceRecord(record) << '\n';
  }
  return {};
}

auto BuildCoverageReport(
    const CoverageSet& covered, const std::vector<fs::path>& targets)
    -> CoverageReport {
  std::set<std::string> paths;
  for (const auto& record : covered) {
    paths.insert(record.path);
  }
  for (const auto& target : targets) {
    paths.insert(ResolvePath(target));
  }

  CoverageReport report;
  for (const auto& path : paths) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
      continue;
    }
    FileCoverage file{.path = path, .stats = {}, .lines = {}};
    ForEachLine(path, [&](size_t number, std::string_view line) {
      if (!IsExecutableLine(line)) {
        return;
      }
      bool hit = covered.contains(TraceRecord{.path = path, .line = number});
      ++file.stats.executable;
      if (hit) {
        ++file.stats.covered;
      }
      file.lines.emplace_back(number, hit);
    });
    report.total.executable += file.stats.executable;
    report.total.covered += file.stats.covered;
    report.files.push_back(std::move(file));
  }
  return report;
}

auto CheckCoverageThreshold(const CoverageReport& report, int minimum)
    -> Result<void> {
  // nearbyint under the default rounding mode matches printf("%.0f")
  auto percent = static_cast<int>(std::nearbyint(report.total.Percent()));
  if (percent < minimum) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format(
                "Coverage {}% is below threshold {}%", percent, minimum)));
  }
  return {};
}

auto FormatTextReport(const CoverageReport& report, const fs::path& base_dir)
    -> std::string {
  auto percent_text = [](const CoverageStats& stats) {
    return stats.executable == 0 ? std::string("0")
                                 : fmt::format("{:.1f}", stats.Percent());
  };

  std::string text = "\n--- Coverage Report ---\n";
  for (const auto& file : report.files) {
    text += fmt::format(
        "Coverage: {}\n  Lines: {}/{} ({}%)\n",
        DisplayPath(file.path, base_dir), file.stats.covered,
        file.stats.executable, percent_text(file.stats));
  }
  text += "---------------------\n";
  text += fmt::format(
      "Total: {}/{} ({}%)\n", report.total.covered, report.total.executable,
      percent_text(report.total));
  return text;
}

auto WriteJsonReport(const CoverageReport& report, const fs::path& path)
    -> Result<void> {
  nlohmann::json files = nlohmann::json::object();
  for (const auto& file : report.files) {
    nlohmann::json lines = nlohmann::json::object();
    for (const auto& [number, hit] : file.lines) {
      lines[std::to_string(number)] = hit ? "covered" : "uncovered";
    }
    files[file.path] = {
        {"total_lines", file.stats.executable},
        {"covered_lines", file.stats.covered},
        {"coverage_percent", RoundTo(file.stats.Percent(), 1)},
        {"lines", std::move(lines)},
    };
  }

  nlohmann::json root = {
      {"files", std::move(files)},
      {"summary",
       {
           {"total_lines", report.total.executable},
           {"covered_lines", report.total.covered},
           {"coverage_percent", RoundTo(report.total.Percent(), 2)},
       }},
  };

  std::ofstream out(path, std::ios::trunc);
  if (!out) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format(
                "cannot write {}: {}", path.string(), std::strerror(errno))));
  }
  out << root.dump(2) << '\n';
  return {};
}

}  // namespace shspec::trace
