#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "shspec/common/diagnostic.hpp"

namespace shspec::common {

// Descriptor number the child sees as its side channel.
inline constexpr int kSideChannelFd = 8;

struct SubprocessOptions {
  // If provided, child process runs in this directory.
  std::optional<std::filesystem::path> working_dir;

  // Complete child environment as KEY=VALUE entries. Inherits ours if unset.
  std::optional<std::vector<std::string>> environment;

  // Receives every chunk written by the child to kSideChannelFd. The side
  // channel is only opened when this is set.
  std::function<void(std::string_view)> on_side_channel;
};

struct SubprocessResult {
  // Exit status, or 128 + signal number when the child was killed.
  int exit_code = -1;
  // Merged stdout and stderr, in the order the child wrote them.
  std::string output;
};

// Execute command with argv array (no shell interpretation).
// argv[0] = program name, argv[1..n] = arguments.
// working_dir: if provided, child process runs in this directory.
// Returns (exit_code, merged_stdout_stderr).
// If exec fails, returns (-1, error_message).
auto RunSubprocess(
    const std::vector<std::string>& argv,
    const std::optional<std::filesystem::path>& working_dir = std::nullopt)
    -> std::pair<int, std::string>;

// Same as above with a side channel and explicit environment. Stdin is
// /dev/null and the child leads its own process group. Throws Interrupted
// (after killing the child's group) if the engine receives a termination
// signal while waiting.
auto RunSubprocess(
    const std::vector<std::string>& argv, const SubprocessOptions& options)
    -> Result<SubprocessResult>;

// Current environment minus entries for which drop(entry) is true.
auto FilteredEnvironment(const std::function<bool(std::string_view)>& drop)
    -> std::vector<std::string>;

}  // namespace shspec::common
