#include "shspec/executor/execution_context.hpp"

#include <cerrno>
#include <cstddef>
#include <cstring>
#include <expected>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "shspec/common/diagnostic.hpp"
#include "shspec/common/scoped_temp_directory.hpp"
#include "shspec/discovery/test_case.hpp"
#include "shspec/executor/prelude.hpp"
#include "shspec/substitution/registry.hpp"
#include "shspec/substitution/registry_store.hpp"
#include "shspec/trace/trace_buffer.hpp"

namespace shspec::executor {

namespace fs = std::filesystem;

namespace {

constexpr const char* kPreludeFileName = "prelude.sh";
constexpr const char* kEntryFileName = "entry.sh";

auto WriteTextFile(const fs::path& path, std::string_view content)
    -> Result<void> {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format(
                "cannot write {}: {}", path.string(), std::strerror(errno))));
  }
  out << content;
  if (!out) {
    return std::unexpected(
        Diagnostic::HostError(fmt::format("short write to {}", path.string())));
  }
  return {};
}

}  // namespace

ExecutionContext::~ExecutionContext() {
  if (trace_) {
    trace_->Finalize();
  }
  spdlog::debug("discarding context {}", dir_.Path().string());
}

auto ExecutionContext::Create(
    const fs::path& run_dir, size_t index, const discovery::TestCase& test_case,
    const fs::path& working_dir, const fs::path& trace_file)
    -> Result<std::unique_ptr<ExecutionContext>> {
  auto dir =
      common::MakeTempDirectory(run_dir, fmt::format("ctx_{:04}_", index));
  if (!dir) {
    return std::unexpected(dir.error());
  }

  // Private constructor: no make_unique
  std::unique_ptr<ExecutionContext> context(
      new ExecutionContext(std::move(*dir)));
  spdlog::debug(
      "context {} for {}", context->Dir().string(), test_case.QualifiedName());

  if (auto written = WriteTextFile(context->PreludePath(), PreludeScript());
      !written) {
    return std::unexpected(written.error());
  }

  bool trace = !trace_file.empty();
  auto entry = RenderEntryScript(
      EntryScriptOptions{
          .prelude = context->PreludePath(),
          .test_file = test_case.file.path,
          .procedure = test_case.procedure,
          .trace = trace,
      });
  if (auto written = WriteTextFile(context->EntryPath(), entry); !written) {
    return std::unexpected(written.error());
  }

  if (trace) {
    context->trace_ = std::make_unique<trace::TraceBuffer>(
        trace_file, working_dir,
        std::vector<fs::path>{context->PreludePath(), context->EntryPath()});
  }
  return context;
}

auto ExecutionContext::PreludePath() const -> fs::path {
  return Dir() / kPreludeFileName;
}

auto ExecutionContext::EntryPath() const -> fs::path {
  return Dir() / kEntryFileName;
}

auto ExecutionContext::RegistryPath() const -> fs::path {
  return Dir() / substitution::kRegistryFileName;
}

auto ExecutionContext::ReleaseSubstitutions()
    -> std::vector<substitution::SubstitutionEntry> {
  auto registry = substitution::LoadRegistry(RegistryPath());
  if (!registry) {
    spdlog::warn("{}", registry.error().message);
    return {};
  }
  auto leftover = registry->RemoveAll();
  if (auto saved = substitution::SaveRegistry(*registry, RegistryPath());
      !saved) {
    spdlog::warn("{}", saved.error().message);
  }
  return leftover;
}

}  // namespace shspec::executor
