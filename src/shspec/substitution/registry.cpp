#include "shspec/substitution/registry.hpp"

#include <algorithm>
#include <array>
#include <expected>
#include <optional>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <fmt/ranges.h>

#include "shspec/common/diagnostic.hpp"

namespace shspec::substitution {

namespace {

// Builtins whose interception would break the harness itself.
constexpr std::array<std::string_view, 24> kForbiddenCommands = {
    "cd",    "export",   "source",  ".",       "exit",  "eval",
    "exec",  "return",   "set",     "unset",   "readonly", "declare",
    "local", "trap",     "builtin", "command", "type",  "hash",
    "read",  "echo",     "printf",  "test",    "[",     "]",
};

// Characters that would change the meaning of `name() {` under eval.
constexpr std::string_view kUnsafeNameChars = " \t\n;&|<>()$`\\\"'{}*?#=";

auto HasUnsafeChars(std::string_view name) -> bool {
  return name.find_first_of(kUnsafeNameChars) != std::string_view::npos;
}

auto RegistrationFailure(RegistrationError code, std::string message)
    -> std::unexpected<Diagnostic> {
  return std::unexpected(Diagnostic::Registration(code, std::move(message)));
}

}  // namespace

auto ToString(SubstitutionKind kind) -> std::string_view {
  switch (kind) {
    case SubstitutionKind::kCommand:
      return "command";
    case SubstitutionKind::kProcedure:
      return "procedure";
  }
  return "command";
}

auto IsForbiddenCommand(std::string_view name, std::string_view shell_type)
    -> bool {
  if (std::ranges::find(kForbiddenCommands, name) != kForbiddenCommands.end()) {
    return true;
  }
  return shell_type.find("builtin") != std::string_view::npos;
}

auto InstallScript(const SubstitutionEntry& entry) -> std::string {
  std::string script =
      fmt::format("{}() {{\n{}\n}}\n", entry.target, entry.body);
  if (entry.kind == SubstitutionKind::kCommand) {
    script += fmt::format("export -f {} 2>/dev/null || true\n", entry.target);
  }
  return script;
}

auto RestoreScript(const SubstitutionEntry& entry) -> std::string {
  if (entry.kind == SubstitutionKind::kProcedure && entry.original) {
    return *entry.original + "\n";
  }
  return fmt::format("unset -f {} 2>/dev/null\n", entry.target);
}

auto RestoreScript(std::span<const SubstitutionEntry> entries) -> std::string {
  std::string script;
  // Newest first, so layered substitutions of one name unwind in order.
  for (const auto& entry : entries | std::views::reverse) {
    script += RestoreScript(entry);
  }
  return script;
}

auto SubstitutionRegistry::Find(
    std::string_view name, SubstitutionKind kind) const
    -> std::vector<SubstitutionEntry>::const_iterator {
  return std::ranges::find_if(entries_, [&](const SubstitutionEntry& entry) {
    return entry.kind == kind && entry.target == name;
  });
}

auto SubstitutionRegistry::MockCommand(
    std::string name, std::string body, std::string_view shell_type)
    -> Result<std::string> {
  if (name.empty()) {
    return RegistrationFailure(
        RegistrationError::kEmptyName, "command name required");
  }
  if (body.empty()) {
    return RegistrationFailure(
        RegistrationError::kEmptyBody, "implementation required");
  }
  if (IsForbiddenCommand(name, shell_type)) {
    return RegistrationFailure(
        RegistrationError::kForbiddenTarget,
        fmt::format("cannot mock shell builtin '{}'", name));
  }
  if (HasUnsafeChars(name)) {
    return RegistrationFailure(
        RegistrationError::kForbiddenTarget,
        fmt::format("'{}' is not a valid command name", name));
  }
  if (IsMocked(name)) {
    return RegistrationFailure(
        RegistrationError::kAlreadyRegistered,
        fmt::format(
            "'{}' is already mocked (call unmock_command first)", name));
  }

  entries_.push_back(
      SubstitutionEntry{
          .target = std::move(name),
          .kind = SubstitutionKind::kCommand,
          .body = std::move(body),
          .original = std::nullopt,
      });
  return InstallScript(entries_.back());
}

auto SubstitutionRegistry::StubProcedure(
    std::string name, std::string body, std::optional<std::string> original)
    -> Result<std::string> {
  if (name.empty()) {
    return RegistrationFailure(
        RegistrationError::kEmptyName, "function name required");
  }
  if (body.empty()) {
    return RegistrationFailure(
        RegistrationError::kEmptyBody, "implementation required");
  }
  if (HasUnsafeChars(name)) {
    return RegistrationFailure(
        RegistrationError::kForbiddenTarget,
        fmt::format("'{}' is not a valid function name", name));
  }
  if (IsStubbed(name)) {
    return RegistrationFailure(
        RegistrationError::kAlreadyRegistered,
        fmt::format(
            "'{}' is already stubbed (call unstub_function first)", name));
  }

  if (original && original->empty()) {
    original.reset();
  }
  entries_.push_back(
      SubstitutionEntry{
          .target = std::move(name),
          .kind = SubstitutionKind::kProcedure,
          .body = std::move(body),
          .original = std::move(original),
      });
  return InstallScript(entries_.back());
}

auto SubstitutionRegistry::UnmockCommand(std::string_view name)
    -> Result<std::string> {
  if (name.empty()) {
    return RegistrationFailure(
        RegistrationError::kEmptyName, "command name required");
  }
  auto it = Find(name, SubstitutionKind::kCommand);
  if (it == entries_.end()) {
    return RegistrationFailure(
        RegistrationError::kNotRegistered,
        fmt::format("'{}' is not mocked", name));
  }
  std::string script = RestoreScript(*it);
  entries_.erase(it);
  return script;
}

auto SubstitutionRegistry::UnstubProcedure(std::string_view name)
    -> Result<std::string> {
  if (name.empty()) {
    return RegistrationFailure(
        RegistrationError::kEmptyName, "function name required");
  }
  auto it = Find(name, SubstitutionKind::kProcedure);
  if (it == entries_.end()) {
    return RegistrationFailure(
        RegistrationError::kNotRegistered,
        fmt::format("'{}' is not stubbed", name));
  }
  std::string script = RestoreScript(*it);
  entries_.erase(it);
  return script;
}

auto SubstitutionRegistry::RemoveAll() -> std::vector<SubstitutionEntry> {
  return std::exchange(entries_, {});
}

auto SubstitutionRegistry::IsMocked(std::string_view name) const -> bool {
  return Find(name, SubstitutionKind::kCommand) != entries_.end();
}

auto SubstitutionRegistry::IsStubbed(std::string_view name) const -> bool {
  return Find(name, SubstitutionKind::kProcedure) != entries_.end();
}

auto SubstitutionRegistry::IsSubstituted(std::string_view name) const
    -> bool {
  return IsMocked(name) || IsStubbed(name);
}

auto SubstitutionRegistry::List(SubstitutionKind kind) const
    -> std::vector<std::string> {
  std::vector<std::string> names;
  for (const auto& entry : entries_) {
    if (entry.kind == kind) {
      names.push_back(entry.target);
    }
  }
  return names;
}

auto FormatListing(const SubstitutionRegistry& registry) -> std::string {
  auto join = [](const std::vector<std::string>& names) -> std::string {
    if (names.empty()) {
      return "none";
    }
    return fmt::format("{}", fmt::join(names, " "));
  };
  return fmt::format(
      "Mocked commands: {}\nStubbed functions: {}\n",
      join(registry.List(SubstitutionKind::kCommand)),
      join(registry.List(SubstitutionKind::kProcedure)));
}

}  // namespace shspec::substitution
