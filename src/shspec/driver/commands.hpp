#pragma once

#include <filesystem>

#include <argparse/argparse.hpp>

namespace shspec::driver {

// Process exit status of the run and list commands.
inline constexpr int kExitSuccess = 0;
inline constexpr int kExitFailure = 1;
inline constexpr int kExitConfigError = 2;

auto RunCommand(
    const argparse::ArgumentParser& cmd,
    const std::filesystem::path& helper_binary, bool verbose) -> int;

auto ListCommand(const argparse::ArgumentParser& cmd) -> int;

auto CoverageStatsCommand(const argparse::ArgumentParser& cmd) -> int;

}  // namespace shspec::driver
