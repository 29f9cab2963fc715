#include "helpers.hpp"

#include <cstdio>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "shspec/assertions/assertions.hpp"
#include "shspec/common/diagnostic.hpp"
#include "shspec/common/text.hpp"
#include "shspec/substitution/registry.hpp"
#include "shspec/substitution/registry_store.hpp"

namespace shspec::driver {

namespace {

constexpr int kUsageExit = 2;
constexpr std::string_view kStdinFlag = "--stdin";

// Shell-visible name of each registry verb, used to prefix errors.
auto ShellVerb(std::string_view verb) -> std::string_view {
  if (verb == "mock") {
    return "mock_command";
  }
  if (verb == "unmock") {
    return "unmock_command";
  }
  if (verb == "stub") {
    return "stub_function";
  }
  if (verb == "unstub") {
    return "unstub_function";
  }
  if (verb == "remove-all") {
    return "unmock_all";
  }
  if (verb == "is-mocked") {
    return "is_mocked";
  }
  if (verb == "is-stubbed") {
    return "is_stubbed";
  }
  if (verb == "list") {
    return "list_mocks";
  }
  return verb;
}

auto Arg(std::span<const std::string> args, size_t index) -> std::string {
  return index < args.size() ? args[index] : std::string();
}

}  // namespace

auto AssertHelper(std::span<const std::string> args) -> int {
  if (args.empty()) {
    fmt::print(stderr, "shspec assert: assertion kind required\n");
    return kUsageExit;
  }
  auto kind = assertions::ParseAssertionKind(args[0]);
  if (!kind) {
    fmt::print(stderr, "shspec assert: unknown assertion '{}'\n", args[0]);
    return kUsageExit;
  }

  // With --stdin the values arrive NUL-terminated on stdin, which has no
  // per-argument size limit.
  std::vector<std::string> values;
  std::span<const std::string> operands = args.subspan(1);
  if (!operands.empty() && operands[0] == kStdinFlag) {
    std::string input(
        std::istreambuf_iterator<char>(std::cin),
        std::istreambuf_iterator<char>{});
    values = common::SplitNulTerminated(input);
    operands = values;
  }

  auto outcome = assertions::Evaluate(*kind, operands);
  if (!outcome) {
    fmt::print(stderr, "shspec assert: {}\n", outcome.error().message);
    return kUsageExit;
  }

  auto text = assertions::FormatOutcome(*outcome);
  fmt::print(outcome->passed ? stdout : stderr, "{}", text);
  return outcome->passed ? 0 : 1;
}

auto RegistryHelper(std::span<const std::string> args) -> int {
  if (args.size() < 3 || args[0] != "--state") {
    fmt::print(
        stderr, "shspec registry: usage: registry --state FILE <verb> ...\n");
    return kUsageExit;
  }
  std::filesystem::path state_path = args[1];
  const std::string& verb = args[2];
  auto rest = args.subspan(3);

  auto registry = substitution::LoadRegistry(state_path);
  if (!registry) {
    fmt::print(stderr, "{}: {}\n", ShellVerb(verb), registry.error().message);
    return 1;
  }

  // Queries: no output beyond the listing, state untouched.
  if (verb == "is-mocked") {
    return registry->IsMocked(Arg(rest, 0)) ? 0 : 1;
  }
  if (verb == "is-stubbed") {
    return registry->IsStubbed(Arg(rest, 0)) ? 0 : 1;
  }
  if (verb == "list") {
    fmt::print("{}", substitution::FormatListing(*registry));
    return 0;
  }

  Result<std::string> script;
  if (verb == "mock") {
    script = registry->MockCommand(Arg(rest, 0), Arg(rest, 1), Arg(rest, 2));
  } else if (verb == "stub") {
    std::optional<std::string> original;
    if (auto text = Arg(rest, 2); !text.empty()) {
      original = std::move(text);
    }
    script = registry->StubProcedure(
        Arg(rest, 0), Arg(rest, 1), std::move(original));
  } else if (verb == "unmock") {
    script = registry->UnmockCommand(Arg(rest, 0));
  } else if (verb == "unstub") {
    script = registry->UnstubProcedure(Arg(rest, 0));
  } else if (verb == "remove-all") {
    auto removed = registry->RemoveAll();
    script = substitution::RestoreScript(removed);
  } else {
    fmt::print(stderr, "shspec registry: unknown verb '{}'\n", verb);
    return kUsageExit;
  }

  if (!script) {
    fmt::print(stderr, "{}: {}\n", ShellVerb(verb), script.error().message);
    return 1;
  }
  if (auto saved = substitution::SaveRegistry(*registry, state_path); !saved) {
    fmt::print(stderr, "{}: {}\n", ShellVerb(verb), saved.error().message);
    return 1;
  }
  spdlog::debug(
      "registry {} applied, {} active", verb, registry->Entries().size());
  fmt::print("{}", *script);
  return 0;
}

}  // namespace shspec::driver
