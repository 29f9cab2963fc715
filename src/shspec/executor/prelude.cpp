#include "shspec/executor/prelude.hpp"

#include <string>
#include <string_view>

#include <fmt/core.h>

#include "shspec/common/subprocess.hpp"
#include "shspec/common/text.hpp"

namespace shspec::executor {

namespace {

constexpr std::string_view kPrelude = R"BASH(# shspec prelude. Generated for one test context.

__shspec_run() {
  if (( $# == 1 )); then
    eval "$1"
  else
    "$@"
  fi
}

# Values go NUL-terminated through stdin: argv strings are size-limited.
__shspec_assert() {
  local __shspec_kind="$1"
  shift
  if (( $# > 0 )); then
    printf '%s\0' "$@"
  fi | "$__SHSPEC_BIN" assert "$__shspec_kind" --stdin
}

__shspec_registry() {
  "$__SHSPEC_BIN" registry --state "$__SHSPEC_REGISTRY" "$@"
}

# --- Assertions ---

assert_equals() {
  __shspec_assert equals "$@"
}

assert_not_equals() {
  __shspec_assert not-equals "$@"
}

assert_success() {
  local __shspec_status=0
  __shspec_run "$@" || __shspec_status=$?
  __shspec_assert success "$__shspec_status" "$*"
}

assert_fail() {
  local __shspec_status=0
  __shspec_run "$@" || __shspec_status=$?
  __shspec_assert fail "$__shspec_status" "$*"
}

assert_output_equals() {
  local __shspec_expected="${1:-}"
  shift
  local __shspec_output
  __shspec_output=$(__shspec_run "$@") || true
  __shspec_assert output-equals "$__shspec_expected" "$__shspec_output" "$*"
}

assert_output_contains() {
  local __shspec_needle="${1:-}"
  shift
  local __shspec_output
  __shspec_output=$(__shspec_run "$@") || true
  __shspec_assert output-contains "$__shspec_needle" "$__shspec_output" "$*"
}

assert_file_exists() {
  __shspec_assert file-exists "$@"
}

assert_file_not_exists() {
  __shspec_assert file-not-exists "$@"
}

assert_is_variable_set() {
  local __shspec_flag=0
  if [[ "${1:-}" =~ ^[A-Za-z_][A-Za-z0-9_]*$ ]] && [[ -n "${!1+x}" ]]; then
    __shspec_flag=1
  fi
  __shspec_assert variable-set "${1:-}" "$__shspec_flag"
}

assert_is_function() {
  local __shspec_flag=0
  if [[ -n "${1:-}" ]] && declare -F "$1" >/dev/null 2>&1; then
    __shspec_flag=1
  fi
  __shspec_assert function "${1:-}" "$__shspec_flag"
}

# --- Mocks and stubs ---

mock_command() {
  local __shspec_type __shspec_script
  __shspec_type=$(type -t "${1:-}" 2>/dev/null) || true
  __shspec_script=$(__shspec_registry mock "${1:-}" "${2:-}" "$__shspec_type") || return 1
  eval "$__shspec_script"
}

unmock_command() {
  local __shspec_script
  __shspec_script=$(__shspec_registry unmock "${1:-}") || return 1
  eval "$__shspec_script"
}

stub_function() {
  local __shspec_original="" __shspec_script
  if [[ -n "${1:-}" ]] && declare -F "$1" >/dev/null 2>&1; then
    __shspec_original=$(declare -f "$1")
  fi
  __shspec_script=$(__shspec_registry stub "${1:-}" "${2:-}" "$__shspec_original") || return 1
  eval "$__shspec_script"
}

unstub_function() {
  local __shspec_script
  __shspec_script=$(__shspec_registry unstub "${1:-}") || return 1
  eval "$__shspec_script"
}

unmock_all() {
  local __shspec_script
  __shspec_script=$(__shspec_registry remove-all) || return 1
  eval "$__shspec_script"
}

is_mocked() {
  __shspec_registry is-mocked "${1:-}"
}

is_stubbed() {
  __shspec_registry is-stubbed "${1:-}"
}

list_mocks() {
  __shspec_registry list
}
)BASH";

}  // namespace

auto PreludeScript() -> std::string_view {
  return kPrelude;
}

auto RenderEntryScript(const EntryScriptOptions& options) -> std::string {
  std::string script = "# shspec entry script. Generated for one test.\n";
  script += fmt::format(
      "source {}\n", common::ShellQuote(options.prelude.string()));
  script +=
      "trap '__shspec_status=$?; trap - DEBUG; set +T; set +e; "
      "unmock_all || true; exit \"$__shspec_status\"' EXIT\n";
  if (options.trace) {
    script += "set -T\n";
    script += fmt::format(
        "trap 'printf \"%s:%s\\n\" \"${{BASH_SOURCE[0]}}\" \"$LINENO\" "
        ">&{}' DEBUG\n",
        common::kSideChannelFd);
  }
  script += fmt::format(
      "source {}\n", common::ShellQuote(options.test_file.string()));
  script += fmt::format("{}\n", common::ShellQuote(options.procedure));
  return script;
}

}  // namespace shspec::executor
