#pragma once

#include <filesystem>
#include <string_view>
#include <utility>

#include "shspec/common/diagnostic.hpp"

namespace shspec::common {

// Environment variable that keeps temporary directories for debugging.
inline constexpr const char* kKeepTmpEnv = "SHSPEC_KEEP_TMP";

// Owns a directory tree and removes it on destruction, unless
// SHSPEC_KEEP_TMP is set.
class ScopedTempDirectory {
 public:
  ScopedTempDirectory() = default;
  explicit ScopedTempDirectory(std::filesystem::path path)
      : path_(std::move(path)) {
  }

  ScopedTempDirectory(const ScopedTempDirectory&) = delete;
  auto operator=(const ScopedTempDirectory&) -> ScopedTempDirectory& = delete;

  ScopedTempDirectory(ScopedTempDirectory&& other) noexcept
      : path_(std::exchange(other.path_, {})) {
  }
  auto operator=(ScopedTempDirectory&& other) noexcept
      -> ScopedTempDirectory& {
    if (this != &other) {
      Cleanup();
      path_ = std::exchange(other.path_, {});
    }
    return *this;
  }

  ~ScopedTempDirectory() noexcept {
    Cleanup();
  }

  [[nodiscard]] auto Path() const -> const std::filesystem::path& {
    return path_;
  }

 private:
  void Cleanup() noexcept;

  std::filesystem::path path_;
};

// Create a uniquely named directory <parent>/<prefix>XXXXXX with mkdtemp.
auto MakeTempDirectory(
    const std::filesystem::path& parent, std::string_view prefix)
    -> Result<ScopedTempDirectory>;

// Parent for run directories: $TMPDIR, falling back to /tmp.
auto DefaultTempRoot() -> std::filesystem::path;

}  // namespace shspec::common
