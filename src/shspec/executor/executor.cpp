#include "shspec/executor/executor.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "shspec/common/subprocess.hpp"
#include "shspec/discovery/test_case.hpp"
#include "shspec/executor/execution_context.hpp"
#include "shspec/executor/execution_result.hpp"
#include "shspec/executor/prelude.hpp"
#include "shspec/substitution/registry.hpp"
#include "shspec/trace/coverage.hpp"

namespace shspec::executor {

namespace fs = std::filesystem;

namespace {

// Host environment minus anything that would inject shell functions.
auto IsolatedEnvironment(const ExecutionContext& context, const fs::path& bin)
    -> std::vector<std::string> {
  auto env = common::FilteredEnvironment([](std::string_view entry) {
    return entry.starts_with("BASH_FUNC_") || entry.starts_with("BASH_ENV=") ||
           entry.starts_with("__SHSPEC_");
  });
  env.push_back(fmt::format("{}={}", kHelperBinaryEnv, bin.string()));
  env.push_back(
      fmt::format("{}={}", kRegistryStateEnv, context.RegistryPath().string()));
  return env;
}

}  // namespace

Executor::Executor(ExecutorOptions options) : options_(std::move(options)) {
}

auto Executor::Run(const discovery::TestCase& test_case) -> ExecutionResult {
  if (test_case.directive.kind == discovery::DirectiveKind::kSkip) {
    spdlog::debug("skipping {}", test_case.QualifiedName());
    return ExecutionResult::Skipped(test_case);
  }

  size_t index = next_index_++;
  fs::path trace_file;
  if (!options_.trace_dir.empty()) {
    trace_file = options_.trace_dir /
                 fmt::format("{:04}{}", index, trace::kTraceFileExtension);
  }

  auto start = std::chrono::steady_clock::now();
  auto elapsed_ms = [&start]() -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - start)
        .count();
  };

  auto context = ExecutionContext::Create(
      options_.run_dir, index, test_case, options_.working_dir, trace_file);
  if (!context) {
    spdlog::error(
        "cannot prepare {}: {}", test_case.QualifiedName(),
        context.error().message);
    return ExecutionResult(
        test_case, 1, context.error().message + "\n", elapsed_ms());
  }
  auto& ctx = **context;

  common::SubprocessOptions sub_options;
  sub_options.working_dir = options_.working_dir;
  sub_options.environment = IsolatedEnvironment(ctx, options_.helper_binary);
  if (auto* buffer = ctx.Trace()) {
    sub_options.on_side_channel = [buffer](std::string_view chunk) {
      buffer->Feed(chunk);
    };
  }

  spdlog::info("running {}", test_case.QualifiedName());
  start = std::chrono::steady_clock::now();
  auto run = common::RunSubprocess(
      {options_.interpreter, "--noprofile", "--norc", ctx.EntryPath().string()},
      sub_options);
  int64_t duration = elapsed_ms();

  if (auto* buffer = ctx.Trace()) {
    buffer->Finalize();
  }

  for (const auto& entry : ctx.ReleaseSubstitutions()) {
    spdlog::debug(
        "{}: removing leftover {} substitution '{}'",
        test_case.QualifiedName(), substitution::ToString(entry.kind),
        entry.target);
  }

  if (!run) {
    spdlog::error(
        "cannot run {}: {}", test_case.QualifiedName(), run.error().message);
    return ExecutionResult(test_case, 1, run.error().message + "\n", duration);
  }

  spdlog::debug(
      "{} exited with {} after {} ms", test_case.QualifiedName(),
      run->exit_code, duration);
  return ExecutionResult(
      test_case, run->exit_code, std::move(run->output), duration);
}

}  // namespace shspec::executor
