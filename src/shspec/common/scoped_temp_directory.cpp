#include "shspec/common/scoped_temp_directory.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "shspec/common/diagnostic.hpp"

namespace shspec::common {

namespace fs = std::filesystem;

void ScopedTempDirectory::Cleanup() noexcept {
  if (path_.empty()) {
    return;
  }
  if (std::getenv(kKeepTmpEnv) != nullptr) {
    spdlog::info("keeping temporary directory {}", path_.string());
    return;
  }
  std::error_code ec;
  fs::remove_all(path_, ec);
  if (ec) {
    spdlog::debug("failed to remove {}: {}", path_.string(), ec.message());
  }
  path_.clear();
}

auto MakeTempDirectory(const fs::path& parent, std::string_view prefix)
    -> Result<ScopedTempDirectory> {
  std::string tmpl = (parent / fmt::format("{}XXXXXX", prefix)).string();
  std::vector<char> buffer(tmpl.begin(), tmpl.end());
  buffer.push_back('\0');

  if (mkdtemp(buffer.data()) == nullptr) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format(
                "cannot create temporary directory under {}: {}",
                parent.string(), std::strerror(errno))));
  }
  return ScopedTempDirectory(fs::path(buffer.data()));
}

auto DefaultTempRoot() -> fs::path {
  const char* tmpdir = std::getenv("TMPDIR");
  if (tmpdir != nullptr && *tmpdir != '\0') {
    return tmpdir;
  }
  return "/tmp";
}

}  // namespace shspec::common
