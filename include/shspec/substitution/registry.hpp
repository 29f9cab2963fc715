#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "shspec/common/diagnostic.hpp"

namespace shspec::substitution {

enum class SubstitutionKind : uint8_t {
  kCommand,    // Mock of an external command, exported to child shells
  kProcedure,  // Stub of a shell function, original restored on removal
};

auto ToString(SubstitutionKind kind) -> std::string_view;

struct SubstitutionEntry {
  std::string target;
  SubstitutionKind kind = SubstitutionKind::kCommand;
  std::string body;
  // Verbatim `declare -f` text of the function that was replaced
  std::optional<std::string> original;

  auto operator==(const SubstitutionEntry&) const -> bool = default;
};

// Names that must never be mocked. Shell builtins reported by `type -t` are
// rejected as well.
auto IsForbiddenCommand(std::string_view name, std::string_view shell_type)
    -> bool;

// Bash text that installs the entry.
auto InstallScript(const SubstitutionEntry& entry) -> std::string;

// Bash text that removes the entry: unset, or the saved original.
auto RestoreScript(const SubstitutionEntry& entry) -> std::string;
// Entries are given in registration order and restored in reverse.
auto RestoreScript(std::span<const SubstitutionEntry> entries) -> std::string;

// Active mocks and stubs of one execution context, in registration order.
// Mutations return the bash text the caller evaluates to apply them.
class SubstitutionRegistry {
 public:
  SubstitutionRegistry() = default;
  explicit SubstitutionRegistry(std::vector<SubstitutionEntry> entries)
      : entries_(std::move(entries)) {
  }

  // shell_type is the output of `type -t name` in the calling shell.
  auto MockCommand(
      std::string name, std::string body, std::string_view shell_type = "")
      -> Result<std::string>;

  auto StubProcedure(
      std::string name, std::string body, std::optional<std::string> original)
      -> Result<std::string>;

  auto UnmockCommand(std::string_view name) -> Result<std::string>;
  auto UnstubProcedure(std::string_view name) -> Result<std::string>;

  // Drop every entry and hand them back for restoration. No-op when empty.
  auto RemoveAll() -> std::vector<SubstitutionEntry>;

  [[nodiscard]] auto IsMocked(std::string_view name) const -> bool;
  [[nodiscard]] auto IsStubbed(std::string_view name) const -> bool;
  [[nodiscard]] auto IsSubstituted(std::string_view name) const -> bool;
  [[nodiscard]] auto List(SubstitutionKind kind) const
      -> std::vector<std::string>;
  [[nodiscard]] auto Entries() const -> const std::vector<SubstitutionEntry>& {
    return entries_;
  }
  [[nodiscard]] auto Empty() const -> bool {
    return entries_.empty();
  }

 private:
  [[nodiscard]] auto Find(std::string_view name, SubstitutionKind kind) const
      -> std::vector<SubstitutionEntry>::const_iterator;

  std::vector<SubstitutionEntry> entries_;
};

// "Mocked commands: a b" / "Stubbed functions: none", one line each.
auto FormatListing(const SubstitutionRegistry& registry) -> std::string;

}  // namespace shspec::substitution
