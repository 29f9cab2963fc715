#pragma once

#include <filesystem>

#include "shspec/common/diagnostic.hpp"
#include "shspec/substitution/registry.hpp"

namespace shspec::substitution {

// File name of the registry state inside an execution context directory.
inline constexpr const char* kRegistryFileName = "registry.yaml";

// Load registry state. A missing file is an empty registry.
auto LoadRegistry(const std::filesystem::path& path)
    -> Result<SubstitutionRegistry>;

// Replace the state file with the registry's entries.
auto SaveRegistry(
    const SubstitutionRegistry& registry, const std::filesystem::path& path)
    -> Result<void>;

}  // namespace shspec::substitution
