#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "shspec/common/diagnostic.hpp"
#include "shspec/discovery/planner.hpp"
#include "shspec/report/result_sink.hpp"
#include "shspec/trace/coverage.hpp"

namespace shspec::engine {

struct CoverageOptions {
  bool enabled = false;
  // Files reported even when never traced
  std::vector<std::filesystem::path> targets;
  std::optional<int> threshold;
  std::optional<std::filesystem::path> json_report;
  // Persist the merged record set for `shspec coverage stats`
  std::optional<std::filesystem::path> data_file;
};

struct EngineOptions {
  discovery::DiscoveryOptions discovery;
  // Binary the prelude calls back into (normally shspec itself)
  std::filesystem::path helper_binary;
  CoverageOptions coverage;
};

struct RunOutcome {
  report::RunSummary summary;
  // Files that could not be loaded and were skipped
  std::vector<Diagnostic> discovery_failures;
  // Non-fatal problems, such as coverage being unavailable
  std::vector<Diagnostic> warnings;
  std::optional<trace::CoverageReport> coverage;
  // Set when the coverage threshold was not met
  std::optional<Diagnostic> coverage_failure;

  [[nodiscard]] auto Success() const -> bool {
    return summary.Success() && !coverage_failure;
  }
};

// Discovers, plans and runs tests sequentially, feeding every result to the
// registered sinks in plan order. Owns the run directory for the duration
// of Run().
class Engine {
 public:
  explicit Engine(EngineOptions options);

  void AddSink(std::unique_ptr<report::ResultSink> sink);

  // Fails only on invalid discovery options or when the run directory cannot
  // be created. Throws common::Interrupted when signaled.
  auto Run() -> Result<RunOutcome>;

 private:
  void EmitComment(const std::string& text);
  void CollectCoverage(
      const std::filesystem::path& trace_dir, RunOutcome& outcome);

  EngineOptions options_;
  std::vector<std::unique_ptr<report::ResultSink>> sinks_;
};

}  // namespace shspec::engine
