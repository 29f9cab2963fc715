#include "shspec/config/project_config.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>

#include <fmt/core.h>
#include <toml++/toml.hpp>

#include "shspec/common/diagnostic.hpp"

namespace shspec::config {

namespace fs = std::filesystem;

namespace {

auto ResolveAgainst(const fs::path& base, const std::string& value)
    -> fs::path {
  fs::path path = value;
  if (path.is_relative()) {
    path = base / path;
  }
  return path.lexically_normal();
}

auto TypeError(const fs::path& config_path, const char* key, const char* type)
    -> Diagnostic {
  return Diagnostic::ConfigError(
      fmt::format("{}: '{}' must be {}", config_path.string(), key, type));
}

}  // namespace

auto FindConfig(const fs::path& start_dir) -> std::optional<fs::path> {
  fs::path dir = fs::absolute(start_dir);

  while (true) {
    fs::path config_path = dir / kConfigFileName;
    if (fs::exists(config_path)) {
      return config_path;
    }

    fs::path parent = dir.parent_path();
    if (parent == dir) {
      // Reached root
      return std::nullopt;
    }
    dir = parent;
  }
}

auto LoadConfig(const fs::path& config_path) -> Result<ProjectConfig> {
  ProjectConfig config;
  config.root_dir = fs::absolute(config_path).parent_path();
  config.root = config.root_dir;

  toml::table tbl;
  try {
    tbl = toml::parse_file(config_path.string());
  } catch (const toml::parse_error& e) {
    return std::unexpected(
        Diagnostic::ConfigError(
            fmt::format(
                "failed to parse {}: {}", config_path.string(),
                e.description())));
  }

  // [discovery] section (optional)
  if (auto discovery = tbl["discovery"]) {
    if (auto node = discovery["root"]) {
      auto value = node.value<std::string>();
      if (!value) {
        return std::unexpected(
            TypeError(config_path, "discovery.root", "a string"));
      }
      config.root = ResolveAgainst(config.root_dir, *value);
    }
    if (auto node = discovery["pattern"]) {
      auto value = node.value<std::string>();
      if (!value) {
        return std::unexpected(
            TypeError(config_path, "discovery.pattern", "a string"));
      }
      config.pattern = *value;
    }
    if (auto node = discovery["prefix"]) {
      auto value = node.value<std::string>();
      if (!value) {
        return std::unexpected(
            TypeError(config_path, "discovery.prefix", "a string"));
      }
      config.prefix = *value;
    }
  }

  // [execution] section (optional)
  if (auto execution = tbl["execution"]) {
    if (auto node = execution["interpreter"]) {
      auto value = node.value<std::string>();
      if (!value) {
        return std::unexpected(
            TypeError(config_path, "execution.interpreter", "a string"));
      }
      config.interpreter = *value;
    }
  }

  // [coverage] section (optional)
  if (auto coverage = tbl["coverage"]) {
    if (auto node = coverage["enabled"]) {
      auto value = node.value<bool>();
      if (!value) {
        return std::unexpected(
            TypeError(config_path, "coverage.enabled", "a boolean"));
      }
      config.coverage = *value;
    }
    if (auto node = coverage["targets"]) {
      auto* targets = node.as_array();
      if (targets == nullptr) {
        return std::unexpected(
            TypeError(config_path, "coverage.targets", "an array of strings"));
      }
      for (const auto& elem : *targets) {
        auto str = elem.value<std::string>();
        if (!str) {
          return std::unexpected(
              TypeError(
                  config_path, "coverage.targets", "an array of strings"));
        }
        config.coverage_targets.push_back(
            ResolveAgainst(config.root_dir, *str));
      }
    }
    if (auto node = coverage["threshold"]) {
      auto value = node.value<int64_t>();
      if (!value || *value < 0 || *value > 100) {
        return std::unexpected(
            TypeError(
                config_path, "coverage.threshold",
                "an integer between 0 and 100"));
      }
      config.coverage_threshold = static_cast<int>(*value);
    }
    if (auto node = coverage["json"]) {
      auto value = node.value<std::string>();
      if (!value) {
        return std::unexpected(
            TypeError(config_path, "coverage.json", "a string"));
      }
      config.coverage_json = ResolveAgainst(config.root_dir, *value);
    }
  }

  // [report] section (optional)
  if (auto report = tbl["report"]) {
    if (auto node = report["tap"]) {
      auto value = node.value<bool>();
      if (!value) {
        return std::unexpected(
            TypeError(config_path, "report.tap", "a boolean"));
      }
      config.tap = *value;
    }
    if (auto node = report["results"]) {
      auto value = node.value<std::string>();
      if (!value) {
        return std::unexpected(
            TypeError(config_path, "report.results", "a string"));
      }
      config.results = ResolveAgainst(config.root_dir, *value);
    }
  }

  return config;
}

}  // namespace shspec::config
