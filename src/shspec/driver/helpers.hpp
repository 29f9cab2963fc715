#pragma once

#include <span>
#include <string>

namespace shspec::driver {

// `shspec assert <kind> args...` or `shspec assert <kind> --stdin` with the
// args NUL-terminated on stdin. Exit 0 on pass, 1 on failure, 2 on a
// malformed call.
auto AssertHelper(std::span<const std::string> args) -> int;

// `shspec registry --state FILE <verb> args...`. Mutating verbs print the
// bash text to evaluate; queries answer through the exit status.
auto RegistryHelper(std::span<const std::string> args) -> int;

}  // namespace shspec::driver
