#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "shspec/common/diagnostic.hpp"
#include "shspec/discovery/test_case.hpp"

namespace shspec::discovery {

struct DiscoveryOptions {
  std::filesystem::path root = ".";
  std::string pattern = "*_test.sh";
  std::string prefix = "test_";
  std::string interpreter = "bash";
};

struct DiscoveryResult {
  ExecutionPlan plan;
  size_t file_count = 0;
  // Files that could not be loaded; they contribute no test cases
  std::vector<Diagnostic> failures;
};

// Reject an empty glob, a glob containing '/', a prefix that is not an
// identifier prefix and a root that is not a directory.
auto ValidateOptions(const DiscoveryOptions& options) -> Result<void>;

// Recursively list files under root whose name matches the glob, sorted.
auto FindTestFiles(const DiscoveryOptions& options)
    -> Result<std::vector<TestFile>>;

// Name of the procedure declared on this line (`name()`, `function name`,
// `function name()`), or empty.
auto DeclaredProcedure(std::string_view line) -> std::string_view;

// First declaration line (1-based) of every procedure declared in source.
auto FindDeclarationLines(std::string_view source)
    -> std::map<std::string, size_t, std::less<>>;

// Order names by declaration line; names without one follow in name order.
auto OrderByDeclaration(
    std::vector<std::string> names,
    const std::map<std::string, size_t, std::less<>>& declaration_lines)
    -> std::vector<std::string>;

// Directive attached to the procedure declared on decl_line (1-based), read
// from the line immediately before it.
auto DirectiveBefore(
    const std::vector<std::string_view>& lines, size_t decl_line)
    -> Directive;

// Resolve the test procedures of one file without running them: syntax
// check, then source it in a throwaway interpreter and read `declare -F`.
auto LoadTestFile(const TestFile& file, const DiscoveryOptions& options)
    -> Result<std::vector<TestCase>>;

// Validate, enumerate, load every file. Load failures are logged, collected
// and skipped; only invalid options fail the whole call.
auto BuildPlan(const DiscoveryOptions& options) -> Result<DiscoveryResult>;

}  // namespace shspec::discovery
