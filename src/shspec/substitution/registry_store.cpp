#include "shspec/substitution/registry_store.hpp"

#include <cerrno>
#include <cstring>
#include <expected>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>
#include <yaml-cpp/yaml.h>

#include <fmt/core.h>

#include "shspec/common/diagnostic.hpp"
#include "shspec/substitution/registry.hpp"

namespace shspec::substitution {

namespace fs = std::filesystem;

namespace {

auto ParseKind(const std::string& text) -> std::optional<SubstitutionKind> {
  if (text == "command") {
    return SubstitutionKind::kCommand;
  }
  if (text == "procedure") {
    return SubstitutionKind::kProcedure;
  }
  return std::nullopt;
}

}  // namespace

auto LoadRegistry(const fs::path& path) -> Result<SubstitutionRegistry> {
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    return SubstitutionRegistry{};
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(path.string());
  } catch (const YAML::Exception& e) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format("{}: YAML parse error: {}", path.string(), e.what())));
  }

  std::vector<SubstitutionEntry> entries;
  if (!root["entries"]) {
    return SubstitutionRegistry(std::move(entries));
  }

  try {
    for (const auto& node : root["entries"]) {
      auto kind = ParseKind(node["kind"].as<std::string>());
      if (!kind) {
        return std::unexpected(
            Diagnostic::HostError(
                fmt::format(
                    "{}: unknown substitution kind '{}'", path.string(),
                    node["kind"].as<std::string>())));
      }
      SubstitutionEntry entry{
          .target = node["target"].as<std::string>(),
          .kind = *kind,
          .body = node["body"].as<std::string>(),
          .original = std::nullopt,
      };
      if (node["original"]) {
        entry.original = node["original"].as<std::string>();
      }
      entries.push_back(std::move(entry));
    }
  } catch (const YAML::Exception& e) {
    return std::unexpected(
        Diagnostic::HostError(fmt::format("{}: {}", path.string(), e.what())));
  }

  return SubstitutionRegistry(std::move(entries));
}

auto SaveRegistry(const SubstitutionRegistry& registry, const fs::path& path)
    -> Result<void> {
  YAML::Emitter out;
  out << YAML::BeginMap;
  out << YAML::Key << "entries" << YAML::Value << YAML::BeginSeq;
  for (const auto& entry : registry.Entries()) {
    out << YAML::BeginMap;
    out << YAML::Key << "target" << YAML::Value << YAML::DoubleQuoted
        << entry.target;
    out << YAML::Key << "kind" << YAML::Value
        << std::string(ToString(entry.kind));
    out << YAML::Key << "body" << YAML::Value << YAML::DoubleQuoted
        << entry.body;
    if (entry.original) {
      out << YAML::Key << "original" << YAML::Value << YAML::DoubleQuoted
          << *entry.original;
    }
    out << YAML::EndMap;
  }
  out << YAML::EndSeq;
  out << YAML::EndMap;

  if (!out.good()) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format("cannot serialize registry: {}", out.GetLastError())));
  }

  // Write-then-rename so a reader never sees a partial file.
  fs::path tmp_path = path;
  tmp_path += ".tmp";
  {
    std::ofstream file(tmp_path, std::ios::trunc);
    if (!file) {
      return std::unexpected(
          Diagnostic::HostError(
              fmt::format(
                  "cannot write {}: {}", tmp_path.string(),
                  std::strerror(errno))));
    }
    file << out.c_str() << '\n';
  }

  std::error_code ec;
  fs::rename(tmp_path, path, ec);
  if (ec) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format("cannot replace {}: {}", path.string(), ec.message())));
  }
  return {};
}

}  // namespace shspec::substitution
