#include "commands.hpp"

#include <cstdio>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <argparse/argparse.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "print.hpp"
#include "shspec/common/diagnostic.hpp"
#include "shspec/config/project_config.hpp"
#include "shspec/discovery/planner.hpp"
#include "shspec/engine/engine.hpp"
#include "shspec/report/console_reporter.hpp"
#include "shspec/report/result_stream.hpp"
#include "shspec/report/tap_writer.hpp"
#include "shspec/trace/coverage.hpp"

namespace shspec::driver {

namespace {

namespace fs = std::filesystem;

// Throws DiagnosticException when shspec.toml exists but is invalid.
auto LoadOptionalConfig() -> std::optional<config::ProjectConfig> {
  auto config_path = config::FindConfig();
  if (!config_path) {
    return std::nullopt;
  }
  spdlog::info("using {}", config_path->string());
  auto loaded = config::LoadConfig(*config_path);
  if (!loaded) {
    throw DiagnosticException(loaded.error());
  }
  return std::move(*loaded);
}

auto ExitCodeFor(const Diagnostic& diag) -> int {
  return diag.kind == DiagKind::kConfigError ? kExitConfigError : kExitFailure;
}

// Scalars: CLI overrides config, config overrides defaults.
auto BuildDiscoveryOptions(
    const argparse::ArgumentParser& cmd,
    const std::optional<config::ProjectConfig>& config)
    -> discovery::DiscoveryOptions {
  discovery::DiscoveryOptions options;
  if (config) {
    options.root = config->root;
    options.pattern = config->pattern;
    options.prefix = config->prefix;
    options.interpreter = config->interpreter;
  }
  if (auto pattern = cmd.present<std::string>("pattern")) {
    options.pattern = *pattern;
  }
  if (auto root = cmd.present<std::string>("--root")) {
    options.root = *root;
  }
  if (auto prefix = cmd.present<std::string>("--prefix")) {
    options.prefix = *prefix;
  }
  return options;
}

auto BuildCoverageOptions(
    const argparse::ArgumentParser& cmd,
    const std::optional<config::ProjectConfig>& config)
    -> engine::CoverageOptions {
  engine::CoverageOptions options;
  if (config) {
    options.enabled = config->coverage;
    options.targets = config->coverage_targets;
    options.threshold = config->coverage_threshold;
    options.json_report = config->coverage_json;
  }
  // Any coverage flag on the command line turns coverage on
  bool requested = cmd.get<bool>("--coverage");
  // Targets: config + CLI merged
  if (auto targets =
          cmd.present<std::vector<std::string>>("--coverage-target")) {
    for (const auto& target : *targets) {
      options.targets.push_back(fs::absolute(target));
    }
    requested = true;
  }
  if (auto threshold = cmd.present<int>("--coverage-threshold")) {
    options.threshold = *threshold;
    requested = true;
  }
  if (auto json = cmd.present<std::string>("--coverage-json")) {
    options.json_report = fs::absolute(*json);
    requested = true;
  }
  if (auto data = cmd.present<std::string>("--coverage-data")) {
    options.data_file = fs::absolute(*data);
    requested = true;
  }
  if (requested) {
    options.enabled = true;
  }
  return options;
}

// A file that failed to load is skipped, never fatal: a warning per file.
void PrintDiscoveryFailures(const std::vector<Diagnostic>& failures) {
  for (const auto& failure : failures) {
    auto warning = Diagnostic::Warning(failure.message);
    warning.notes = failure.notes;
    PrintDiagnostic(warning);
  }
}

}  // namespace

auto RunCommand(
    const argparse::ArgumentParser& cmd, const fs::path& helper_binary,
    bool verbose) -> int {
  auto config = LoadOptionalConfig();

  engine::EngineOptions options{
      .discovery = BuildDiscoveryOptions(cmd, config),
      .helper_binary = helper_binary,
      .coverage = BuildCoverageOptions(cmd, config),
  };
  if (options.coverage.threshold &&
      (*options.coverage.threshold < 0 || *options.coverage.threshold > 100)) {
    PrintError(
        fmt::format(
            "coverage threshold must be between 0 and 100, got {}",
            *options.coverage.threshold));
    return kExitConfigError;
  }

  bool tap = cmd.get<bool>("--tap") || (config && config->tap);
  std::optional<fs::path> results;
  if (auto path = cmd.present<std::string>("--results")) {
    results = fs::absolute(*path);
  } else if (config) {
    results = config->results;
  }

  engine::Engine engine(std::move(options));
  if (tap) {
    engine.AddSink(std::make_unique<report::TapWriter>(std::cout));
  } else {
    engine.AddSink(
        std::make_unique<report::ConsoleReporter>(
            stdout, verbose, report::ColorEnabled(stdout)));
  }
  if (results) {
    auto stream = report::ResultStream::Open(*results);
    if (!stream) {
      PrintDiagnostic(stream.error());
      return kExitConfigError;
    }
    engine.AddSink(std::move(*stream));
  }

  auto outcome = engine.Run();
  std::cout.flush();
  std::fflush(stdout);
  if (!outcome) {
    PrintDiagnostic(outcome.error());
    return ExitCodeFor(outcome.error());
  }
  PrintDiscoveryFailures(outcome->discovery_failures);
  for (const auto& warning : outcome->warnings) {
    PrintDiagnostic(warning);
  }
  if (outcome->coverage_failure) {
    PrintDiagnostic(*outcome->coverage_failure);
  }
  return outcome->Success() ? kExitSuccess : kExitFailure;
}

auto ListCommand(const argparse::ArgumentParser& cmd) -> int {
  auto config = LoadOptionalConfig();

  auto discovered = discovery::BuildPlan(BuildDiscoveryOptions(cmd, config));
  if (!discovered) {
    PrintDiagnostic(discovered.error());
    return ExitCodeFor(discovered.error());
  }

  for (const auto& test_case : discovered->plan.Cases()) {
    const auto& directive = test_case.directive;
    if (directive.kind == discovery::DirectiveKind::kNone) {
      fmt::print("{}\n", test_case.QualifiedName());
    } else if (directive.reason.empty()) {
      fmt::print(
          "{} # {}\n", test_case.QualifiedName(),
          discovery::ToString(directive.kind));
    } else {
      fmt::print(
          "{} # {} {}\n", test_case.QualifiedName(),
          discovery::ToString(directive.kind), directive.reason);
    }
  }
  PrintDiscoveryFailures(discovered->failures);
  return kExitSuccess;
}

auto CoverageStatsCommand(const argparse::ArgumentParser& cmd) -> int {
  auto data_path = cmd.get<std::string>("--data");
  auto covered = trace::LoadCoverageData(data_path);
  if (!covered) {
    PrintDiagnostic(covered.error());
    return kExitFailure;
  }

  auto scripts = cmd.present<std::vector<std::string>>("scripts");
  if (!scripts || scripts->empty()) {
    PrintError("no scripts given");
    return kExitConfigError;
  }
  for (const auto& script : *scripts) {
    auto stats = trace::ComputeCoverageStats(fs::absolute(script), *covered);
    fmt::print("{}\n", trace::FormatStats(stats));
  }
  return kExitSuccess;
}

}  // namespace shspec::driver
