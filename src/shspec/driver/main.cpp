#include <argparse/argparse.hpp>
#include <exception>
#include <filesystem>
#include <iostream>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <fmt/core.h>

#include "commands.hpp"
#include "helpers.hpp"
#include "logging.hpp"
#include "print.hpp"
#include "shspec/common/diagnostic.hpp"
#include "shspec/common/interrupt.hpp"

namespace {

namespace fs = std::filesystem;

// The prelude calls back into this very binary for assertions and registry
// updates.
auto HelperBinaryPath(std::string_view argv0) -> fs::path {
  std::error_code ec;
  auto self = fs::read_symlink("/proc/self/exe", ec);
  if (!ec) {
    return self;
  }
  return fs::absolute(argv0);
}

void AddVerbosity(argparse::ArgumentParser& cmd, int& verbosity) {
  cmd.add_argument("-v", "--verbose")
      .action([&verbosity](const auto&) { ++verbosity; })
      .append()
      .default_value(false)
      .implicit_value(true)
      .nargs(0)
      .help("Increase verbosity (repeatable)");
}

void AddDiscoveryFlags(argparse::ArgumentParser& cmd) {
  cmd.add_argument("pattern").nargs(0, 1).help(
      "Test file glob (default *_test.sh)");
  cmd.add_argument("--root").help("Directory searched for test files");
  cmd.add_argument("--prefix").help("Test procedure prefix (default test_)");
}

}  // namespace

auto main(int argc, char* argv[]) -> int {
  std::vector<std::string> args(argv, argv + argc);

  // Internal helpers take raw positional arguments that may look like
  // options, so they bypass the parser.
  if (args.size() >= 2 && (args[1] == "assert" || args[1] == "registry")) {
    shspec::driver::ConfigureLogging(0);
    auto rest = std::span<const std::string>(args).subspan(2);
    if (args[1] == "assert") {
      return shspec::driver::AssertHelper(rest);
    }
    return shspec::driver::RegistryHelper(rest);
  }

  int verbosity = 0;

  argparse::ArgumentParser program("shspec", "0.1.0");
  program.add_description("Test runner for bash scripts");
  program.add_argument("-C").help("Run as if started in <dir>").metavar("dir");

  // Subcommand: run
  argparse::ArgumentParser run_cmd("run");
  run_cmd.add_description("Discover and run tests");
  AddDiscoveryFlags(run_cmd);
  run_cmd.add_argument("--tap")
      .default_value(false)
      .implicit_value(true)
      .help("Write TAP version 13 to stdout");
  run_cmd.add_argument("--results")
      .metavar("FILE")
      .help("Write one JSON line per test to FILE");
  run_cmd.add_argument("--coverage")
      .default_value(false)
      .implicit_value(true)
      .help("Record line coverage");
  run_cmd.add_argument("--coverage-target")
      .append()
      .metavar("FILE")
      .help("Script to include in the coverage report (repeatable)");
  run_cmd.add_argument("--coverage-threshold")
      .scan<'i', int>()
      .metavar("N")
      .help("Fail when total coverage is below N percent");
  run_cmd.add_argument("--coverage-json")
      .metavar("FILE")
      .help("Write the coverage report as JSON");
  run_cmd.add_argument("--coverage-data")
      .metavar("FILE")
      .help("Write covered lines for `coverage stats`");
  AddVerbosity(run_cmd, verbosity);

  // Subcommand: list
  argparse::ArgumentParser list_cmd("list");
  list_cmd.add_description("List discovered tests without running them");
  AddDiscoveryFlags(list_cmd);
  AddVerbosity(list_cmd, verbosity);

  // Subcommand: coverage stats
  argparse::ArgumentParser coverage_cmd("coverage");
  coverage_cmd.add_description("Query recorded coverage");
  argparse::ArgumentParser stats_cmd("stats");
  stats_cmd.add_description(
      "Print '<executable> <covered> <percent>' per script");
  stats_cmd.add_argument("--data").required().metavar("FILE").help(
      "File written by run --coverage-data");
  stats_cmd.add_argument("scripts").remaining().help("Scripts to measure");
  coverage_cmd.add_subparser(stats_cmd);

  program.add_subparser(run_cmd);
  program.add_subparser(list_cmd);
  program.add_subparser(coverage_cmd);

  try {
    program.parse_args(args);
  } catch (const std::exception& err) {
    shspec::driver::PrintError(err.what());
    std::cerr << program;
    return shspec::driver::kExitConfigError;
  }

  shspec::driver::ConfigureLogging(verbosity);

  // Handle -C before dispatching subcommands
  if (auto dir = program.present("-C")) {
    std::error_code ec;
    fs::current_path(*dir, ec);
    if (ec) {
      shspec::driver::PrintError(
          fmt::format("cannot change to '{}': {}", *dir, ec.message()));
      return shspec::driver::kExitConfigError;
    }
  }

  shspec::common::InstallInterruptHandlers();

  try {
    if (program.is_subcommand_used("run")) {
      return shspec::driver::RunCommand(
          run_cmd, HelperBinaryPath(args[0]), verbosity > 0);
    }

    if (program.is_subcommand_used("list")) {
      return shspec::driver::ListCommand(list_cmd);
    }

    if (program.is_subcommand_used("coverage")) {
      if (coverage_cmd.is_subcommand_used("stats")) {
        return shspec::driver::CoverageStatsCommand(stats_cmd);
      }
      std::cout << coverage_cmd;
      return shspec::driver::kExitConfigError;
    }
  } catch (const shspec::common::Interrupted& interrupted) {
    shspec::driver::PrintError(interrupted.what());
    return 128 + interrupted.SignalNumber();
  } catch (const shspec::DiagnosticException& e) {
    shspec::driver::PrintDiagnostic(e.GetDiagnostic());
    return e.GetDiagnostic().kind == shspec::DiagKind::kConfigError
               ? shspec::driver::kExitConfigError
               : shspec::driver::kExitFailure;
  }

  // No subcommand provided
  std::cout << program;
  return shspec::driver::kExitSuccess;
}
