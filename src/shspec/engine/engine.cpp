#include "shspec/engine/engine.hpp"

#include <expected>
#include <filesystem>
#include <memory>
#include <string>
#include <system_error>
#include <utility>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "shspec/common/diagnostic.hpp"
#include "shspec/common/interrupt.hpp"
#include "shspec/common/scoped_temp_directory.hpp"
#include "shspec/discovery/planner.hpp"
#include "shspec/executor/execution_result.hpp"
#include "shspec/executor/executor.hpp"
#include "shspec/report/result_sink.hpp"
#include "shspec/trace/coverage.hpp"

namespace shspec::engine {

namespace fs = std::filesystem;

Engine::Engine(EngineOptions options) : options_(std::move(options)) {
}

void Engine::AddSink(std::unique_ptr<report::ResultSink> sink) {
  sinks_.push_back(std::move(sink));
}

void Engine::EmitComment(const std::string& text) {
  for (auto& sink : sinks_) {
    sink->OnComment(text);
  }
}

auto Engine::Run() -> Result<RunOutcome> {
  RunOutcome outcome;

  auto discovered = discovery::BuildPlan(options_.discovery);
  if (!discovered) {
    return std::unexpected(discovered.error());
  }
  outcome.discovery_failures = std::move(discovered->failures);
  const auto& plan = discovered->plan;
  spdlog::info(
      "discovered {} test(s) in {} file(s)", plan.Size(),
      discovered->file_count);

  bool tracing = options_.coverage.enabled;
  if (tracing) {
    auto support = trace::ProbeTraceSupport(options_.discovery.interpreter);
    if (!support.available) {
      spdlog::warn("coverage disabled: {}", support.reason);
      outcome.warnings.push_back(
          Diagnostic::Warning(
              fmt::format("coverage disabled: {}", support.reason)));
      tracing = false;
    }
  }

  auto run_dir =
      common::MakeTempDirectory(common::DefaultTempRoot(), "shspec_run_");
  if (!run_dir) {
    return std::unexpected(run_dir.error());
  }
  spdlog::debug("run directory {}", run_dir->Path().string());

  fs::path trace_dir;
  if (tracing) {
    trace_dir = run_dir->Path() / "trace";
    std::error_code ec;
    fs::create_directories(trace_dir, ec);
    if (ec) {
      return std::unexpected(
          Diagnostic::HostError(
              fmt::format(
                  "cannot create {}: {}", trace_dir.string(), ec.message())));
    }
  }

  executor::Executor executor(
      executor::ExecutorOptions{
          .interpreter = options_.discovery.interpreter,
          .working_dir = fs::absolute(options_.discovery.root),
          .helper_binary = options_.helper_binary,
          .run_dir = run_dir->Path(),
          .trace_dir = trace_dir,
      });

  for (auto& sink : sinks_) {
    sink->OnPlan(plan.Size());
  }

  for (const auto& test_case : plan.Cases()) {
    common::ThrowIfInterrupted();
    auto result = executor.Run(test_case);
    outcome.summary.Add(result);
    for (auto& sink : sinks_) {
      sink->OnResult(result);
    }
  }

  if (tracing) {
    CollectCoverage(trace_dir, outcome);
  }

  for (auto& sink : sinks_) {
    sink->OnFinish(outcome.summary);
  }
  return outcome;
}

void Engine::CollectCoverage(const fs::path& trace_dir, RunOutcome& outcome) {
  auto covered = trace::MergeTraceRecords(trace_dir);
  spdlog::debug("merged {} covered line(s)", covered.size());

  auto report = trace::BuildCoverageReport(covered, options_.coverage.targets);
  EmitComment(trace::FormatTextReport(report, fs::current_path()));

  if (options_.coverage.json_report) {
    if (auto written =
            trace::WriteJsonReport(report, *options_.coverage.json_report);
        !written) {
      outcome.warnings.push_back(written.error());
    }
  }
  if (options_.coverage.data_file) {
    if (auto written =
            trace::SaveCoverageData(covered, *options_.coverage.data_file);
        !written) {
      outcome.warnings.push_back(written.error());
    }
  }
  if (options_.coverage.threshold) {
    if (auto checked =
            trace::CheckCoverageThreshold(report, *options_.coverage.threshold);
        !checked) {
      outcome.coverage_failure = checked.error();
    }
  }
  outcome.coverage = std::move(report);
}

}  // namespace shspec::engine
