#include "tests/cli/cli_test_fixture.hpp"

#include <array>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <sys/wait.h>
#include <utility>

#include <fmt/core.h>

namespace shspec::test {
namespace {

auto GenerateRandomSuffix() -> std::string {
  static std::random_device rd;
  static std::mt19937 gen(rd());
  static std::uniform_int_distribution<> dis(0, 999999);
  return std::to_string(dis(gen));
}

// Quote for /bin/sh as a single word
auto Quote(const std::string& text) -> std::string {
  std::string result = "'";
  for (char c : text) {
    if (c == '\'') {
      result += "'\\''";
    } else {
      result.push_back(c);
    }
  }
  result.push_back('\'');
  return result;
}

// Execute command and capture its stdout
// Uses popen; the caller redirects stderr where needed
auto ExecuteCommand(const std::string& cmd) -> std::pair<int, std::string> {
  std::string output;
  std::array<char, 4096> buffer{};

  FILE* pipe = popen(cmd.c_str(), "r");
  if (pipe == nullptr) {
    return {-1, "Failed to execute command"};
  }

  size_t n = 0;
  while ((n = fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
    output.append(buffer.data(), n);
  }

  int status = pclose(pipe);
  int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;

  return {exit_code, output};
}

auto Slurp(const std::filesystem::path& path) -> std::string {
  std::ifstream in(path);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

}  // namespace

auto CountOccurrences(const std::string& haystack, const std::string& needle)
    -> size_t {
  size_t count = 0;
  for (auto pos = haystack.find(needle); pos != std::string::npos;
       pos = haystack.find(needle, pos + needle.size())) {
    ++count;
  }
  return count;
}

void CliTestFixture::SetUp() {
  // Create unique test directory
  auto tmp = std::filesystem::temp_directory_path();
  test_dir_ = std::filesystem::weakly_canonical(
      tmp / ("shspec_cli_test_" + GenerateRandomSuffix()));
  std::filesystem::create_directories(test_dir_);

  // CMake passes the built binary through SHSPEC_BIN
  const char* bin = std::getenv("SHSPEC_BIN");
  if (bin != nullptr && *bin != '\0') {
    shspec_bin_ = bin;
  } else {
    // Fallback: whatever is on PATH
    shspec_bin_ = "shspec";
  }
}

void CliTestFixture::TearDown() {
  // Clean up test directory
  if (!test_dir_.empty() && std::filesystem::exists(test_dir_)) {
    std::filesystem::remove_all(test_dir_);
  }
}

auto CliTestFixture::Run(std::initializer_list<std::string> args) -> CliResult {
  return RunIn(test_dir_, std::vector<std::string>(args));
}

auto CliTestFixture::Run(const std::vector<std::string>& args) -> CliResult {
  return RunIn(test_dir_, args);
}

auto CliTestFixture::RunIn(
    const std::filesystem::path& dir, std::initializer_list<std::string> args)
    -> CliResult {
  return RunImpl(dir, std::vector<std::string>(args));
}

auto CliTestFixture::RunIn(
    const std::filesystem::path& dir, const std::vector<std::string>& args)
    -> CliResult {
  return RunImpl(dir, args);
}

auto CliTestFixture::RunImpl(
    const std::filesystem::path& working_dir,
    const std::vector<std::string>& args) -> CliResult {
  auto stderr_file = test_dir_ / ".stderr";

  // Build command string
  std::string cmd = fmt::format(
      "cd {} && NO_COLOR=1 {}", Quote(working_dir.string()),
      Quote(shspec_bin_.string()));
  for (const auto& arg : args) {
    cmd += " " + Quote(arg);
  }
  cmd += fmt::format(" 2>{}", Quote(stderr_file.string()));

  auto [exit_code, output] = ExecuteCommand(cmd);
  std::string errors = Slurp(stderr_file);
  std::filesystem::remove(stderr_file);

  return CliResult{
      .exit_code = exit_code,
      .stdout_output = output,
      .stderr_output = errors,
      .combined_output = output + errors,
  };
}

void CliTestFixture::WriteFile(
    const std::filesystem::path& relative_path, const std::string& content) {
  auto full_path = test_dir_ / relative_path;
  std::filesystem::create_directories(full_path.parent_path());
  std::ofstream out(full_path);
  if (!out) {
    throw std::runtime_error("Failed to create file: " + full_path.string());
  }
  out << content;
}

void CliTestFixture::WriteConfig(const std::string& content) {
  WriteFile("shspec.toml", content);
}

auto CliTestFixture::FileExists(
    const std::filesystem::path& relative_path) const -> bool {
  return std::filesystem::exists(test_dir_ / relative_path);
}

auto CliTestFixture::ReadFile(const std::filesystem::path& relative_path) const
    -> std::string {
  auto full_path = test_dir_ / relative_path;
  std::ifstream in(full_path);
  if (!in) {
    throw std::runtime_error("Failed to read file: " + full_path.string());
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

}  // namespace shspec::test
