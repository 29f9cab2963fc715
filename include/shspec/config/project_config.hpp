#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "shspec/common/diagnostic.hpp"

namespace shspec::config {

inline constexpr const char* kConfigFileName = "shspec.toml";

struct ProjectConfig {
  // [discovery]
  std::filesystem::path root = ".";
  std::string pattern = "*_test.sh";
  std::string prefix = "test_";

  // [execution]
  std::string interpreter = "bash";

  // [coverage]
  bool coverage = false;
  std::vector<std::filesystem::path> coverage_targets;
  std::optional<int> coverage_threshold;
  std::optional<std::filesystem::path> coverage_json;

  // [report]
  bool tap = false;
  std::optional<std::filesystem::path> results;

  // Directory where shspec.toml was found; empty without a config file
  std::filesystem::path root_dir;
};

// Search for shspec.toml starting from dir, going up to parent dirs.
// Returns nullopt if not found.
auto FindConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

// Parse shspec.toml. Relative paths are resolved against its directory.
// Every section is optional; unset keys keep their defaults.
auto LoadConfig(const std::filesystem::path& config_path)
    -> Result<ProjectConfig>;

}  // namespace shspec::config
