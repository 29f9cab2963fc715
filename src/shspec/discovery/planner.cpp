#include "shspec/discovery/planner.hpp"

#include <algorithm>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <fnmatch.h>
#include <fstream>
#include <map>
#include <regex>
#include <sstream>
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
#include "shspec/discovery/test_case.hpp"

namespace shspec::discovery {

namespace fs = std::filesystem;

namespace {

// Sources the file with all of its output discarded, then lists functions.
constexpr std::string_view kListProceduresScript =
    R"(source "$1" >/dev/null 2>&1 </dev/null; declare -F)";

auto DiscoveryEnvironment() -> std::vector<std::string> {
  return common::FilteredEnvironment([](std::string_view entry) {
    return entry.starts_with("BASH_FUNC_");
  });
}

auto ReadFile(const fs::path& path) -> Result<std::string> {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::unexpected(
        Diagnostic::DiscoveryError(
            fmt::format("cannot read test file {}", path.string())));
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

// Procedure names from `declare -F` output ("declare -f name").
auto ParseDeclareOutput(std::string_view output) -> std::vector<std::string> {
  std::vector<std::string> names;
  for (auto line : common::SplitLines(output)) {
    line = common::Trim(line);
    if (!line.starts_with("declare -f")) {
      continue;
    }
    auto space = line.rfind(' ');
    if (space == std::string_view::npos || space + 1 >= line.size()) {
      continue;
    }
    names.emplace_back(line.substr(space + 1));
  }
  return names;
}

}  // namespace

auto ValidateOptions(const DiscoveryOptions& options) -> Result<void> {
  if (options.pattern.empty()) {
    return std::unexpected(
        Diagnostic::ConfigError("test file pattern must not be empty"));
  }
  if (options.pattern.find('/') != std::string::npos) {
    return std::unexpected(
        Diagnostic::ConfigError(
            fmt::format(
                "test file pattern '{}' must match a file name, not a path",
                options.pattern)));
  }
  if (!common::IsIdentifier(options.prefix)) {
    return std::unexpected(
        Diagnostic::ConfigError(
            fmt::format(
                "test prefix '{}' is not a valid function name prefix",
                options.prefix)));
  }
  std::error_code ec;
  if (!fs::is_directory(options.root, ec)) {
    return std::unexpected(
        Diagnostic::ConfigError(
            fmt::format(
                "test root '{}' is not a directory", options.root.string())));
  }
  return {};
}

auto FindTestFiles(const DiscoveryOptions& options)
    -> Result<std::vector<TestFile>> {
  if (auto valid = ValidateOptions(options); !valid) {
    return std::unexpected(valid.error());
  }

  fs::path root = fs::absolute(options.root).lexically_normal();
  std::vector<fs::path> paths;

  std::error_code ec;
  fs::recursive_directory_iterator it(
      root, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format("cannot scan {}: {}", root.string(), ec.message())));
  }
  for (auto end = fs::recursive_directory_iterator(); it != end;
       it.increment(ec)) {
    if (ec) {
      spdlog::warn("error while scanning {}: {}", root.string(), ec.message());
      break;
    }
    std::error_code type_ec;
    if (!it->is_regular_file(type_ec)) {
      continue;
    }
    std::string name = it->path().filename().string();
    if (fnmatch(options.pattern.c_str(), name.c_str(), 0) == 0) {
      paths.push_back(it->path());
    }
  }

  std::ranges::sort(paths);

  std::vector<TestFile> files;
  files.reserve(paths.size());
  for (auto& path : paths) {
    files.push_back(
        TestFile{
            .path = path,
            .display_path = path.lexically_relative(root).generic_string(),
        });
  }
  return files;
}

auto DeclaredProcedure(std::string_view line) -> std::string_view {
  // function name [()] ...
  static const std::regex kKeywordForm(
      R"(^[ \t]*function[ \t]+([A-Za-z_][A-Za-z0-9_:.\-]*))"
      R"(([ \t]*\([ \t]*\))?([ \t{(].*)?$)");
  // name() ...
  static const std::regex kPosixForm(
      R"(^[ \t]*([A-Za-z_][A-Za-z0-9_:.\-]*)[ \t]*\([ \t]*\).*$)");

  std::match_results<std::string_view::const_iterator> match;
  if (std::regex_match(line.begin(), line.end(), match, kKeywordForm) ||
      std::regex_match(line.begin(), line.end(), match, kPosixForm)) {
    return {match[1].first, match[1].second};
  }
  return {};
}

auto FindDeclarationLines(std::string_view source)
    -> std::map<std::string, size_t, std::less<>> {
  std::map<std::string, size_t, std::less<>> result;
  auto lines = common::SplitLines(source);
  for (size_t i = 0; i < lines.size(); ++i) {
    auto name = DeclaredProcedure(lines[i]);
    if (!name.empty()) {
      // First declaration wins
      result.emplace(std::string(name), i + 1);
    }
  }
  return result;
}

auto OrderByDeclaration(
    std::vector<std::string> names,
    const std::map<std::string, size_t, std::less<>>& declaration_lines)
    -> std::vector<std::string> {
  auto line_of = [&](const std::string& name) -> size_t {
    auto it = declaration_lines.find(name);
    return it == declaration_lines.end() ? 0 : it->second;
  };
  std::ranges::stable_sort(
      names, [&](const std::string& a, const std::string& b) {
        size_t la = line_of(a);
        size_t lb = line_of(b);
        if ((la == 0) != (lb == 0)) {
          return la != 0;
        }
        if (la != lb) {
          return la < lb;
        }
        return a < b;
      });
  return names;
}

auto DirectiveBefore(
    const std::vector<std::string_view>& lines, size_t decl_line)
    -> Directive {
  if (decl_line <= 1 || decl_line - 1 > lines.size()) {
    return {};
  }
  return ParseDirective(lines[decl_line - 2]);
}

auto LoadTestFile(const TestFile& file, const DiscoveryOptions& options)
    -> Result<std::vector<TestCase>> {
  auto source = ReadFile(file.path);
  if (!source) {
    return std::unexpected(source.error());
  }

  common::SubprocessOptions sub_options;
  sub_options.working_dir = options.root;
  sub_options.environment = DiscoveryEnvironment();

  auto syntax = common::RunSubprocess(
      {options.interpreter, "--noprofile", "--norc", "-n", file.path.string()},
      sub_options);
  if (!syntax) {
    return std::unexpected(syntax.error());
  }
  if (syntax->exit_code != 0) {
    return std::unexpected(
        Diagnostic::DiscoveryError(
            fmt::format("syntax error in {}", file.display_path))
            .WithNote(std::string(common::Trim(syntax->output))));
  }

  auto listing = common::RunSubprocess(
      {options.interpreter, "--noprofile", "--norc", "-c",
       std::string(kListProceduresScript), "shspec-discover",
       file.path.string()},
      sub_options);
  if (!listing) {
    return std::unexpected(listing.error());
  }
  if (listing->exit_code != 0) {
    return std::unexpected(
        Diagnostic::DiscoveryError(
            fmt::format(
                "failed to load {} (exit code {})", file.display_path,
                listing->exit_code))
            .WithNote(std::string(common::Trim(listing->output))));
  }

  std::vector<std::string> names;
  for (auto& name : ParseDeclareOutput(listing->output)) {
    if (name.starts_with(options.prefix)) {
      names.push_back(std::move(name));
    }
  }

  auto declaration_lines = FindDeclarationLines(*source);
  auto lines = common::SplitLines(*source);

  std::vector<TestCase> cases;
  for (auto& name : OrderByDeclaration(std::move(names), declaration_lines)) {
    Directive directive;
    if (auto it = declaration_lines.find(name); it != declaration_lines.end()) {
      directive = DirectiveBefore(lines, it->second);
    }
    cases.push_back(
        TestCase{
            .file = file,
            .procedure = std::move(name),
            .directive = std::move(directive),
        });
  }

  spdlog::debug("{}: {} test(s)", file.display_path, cases.size());
  return cases;
}

auto BuildPlan(const DiscoveryOptions& options) -> Result<DiscoveryResult> {
  auto files = FindTestFiles(options);
  if (!files) {
    return std::unexpected(files.error());
  }

  DiscoveryResult result;
  result.file_count = files->size();

  for (const auto& file : *files) {
    auto cases = LoadTestFile(file, options);
    if (!cases) {
      spdlog::error("{}", cases.error().message);
      for (const auto& note : cases.error().notes) {
        if (!note.empty()) {
          spdlog::debug("  {}", note);
        }
      }
      result.failures.push_back(cases.error());
      continue;
    }
    result.plan.Append(std::move(*cases));
  }
  return result;
}

}  // namespace shspec::discovery
