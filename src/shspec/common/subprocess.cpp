#include "shspec/common/subprocess.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <optional>
#include <poll.h>
#include <string>
#include <string_view>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "shspec/common/diagnostic.hpp"
#include "shspec/common/interrupt.hpp"

extern char** environ;

namespace shspec::common {

namespace {

// Poll timeout so a signal that lands between the flag check and poll()
// is still noticed promptly.
constexpr int kPollTimeoutMs = 200;

// Closes a descriptor on scope exit unless released.
class ScopedFd {
 public:
  explicit ScopedFd(int fd = -1) : fd_(fd) {
  }
  ScopedFd(const ScopedFd&) = delete;
  auto operator=(const ScopedFd&) -> ScopedFd& = delete;
  ScopedFd(ScopedFd&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {
  }
  auto operator=(ScopedFd&& other) noexcept -> ScopedFd& {
    if (this != &other) {
      Reset();
      fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
  }
  ~ScopedFd() {
    Reset();
  }

  [[nodiscard]] auto Get() const -> int {
    return fd_;
  }

  void Reset() {
    if (fd_ >= 0) {
      close(fd_);
      fd_ = -1;
    }
  }

 private:
  int fd_;
};

struct Pipe {
  ScopedFd read_end;
  ScopedFd write_end;
};

auto MakePipe() -> std::optional<Pipe> {
  std::array<int, 2> fds{};
  if (pipe2(fds.data(), O_CLOEXEC) != 0) {
    return std::nullopt;
  }
  return Pipe{.read_end = ScopedFd(fds[0]), .write_end = ScopedFd(fds[1])};
}

// dup2 that also clears FD_CLOEXEC when source and target already coincide.
// Only async-signal-safe calls: runs in the forked child.
auto MoveFd(int from, int to) -> bool {
  if (from == to) {
    int flags = fcntl(to, F_GETFD);
    return flags != -1 && fcntl(to, F_SETFD, flags & ~FD_CLOEXEC) != -1;
  }
  return dup2(from, to) != -1;
}

auto DecodeWaitStatus(int status) -> int {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

void KillAndReap(pid_t pid) {
  kill(-pid, SIGTERM);
  int status = 0;
  while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {
  }
}

auto ToCStrings(const std::vector<std::string>& strings)
    -> std::vector<char*> {
  std::vector<char*> result;
  result.reserve(strings.size() + 1);
  for (const auto& s : strings) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-const-cast)
    result.push_back(const_cast<char*>(s.c_str()));
  }
  result.push_back(nullptr);
  return result;
}

}  // namespace

auto RunSubprocess(
    const std::vector<std::string>& argv,
    const std::optional<std::filesystem::path>& working_dir)
    -> std::pair<int, std::string> {
  SubprocessOptions options;
  options.working_dir = working_dir;
  auto result = RunSubprocess(argv, options);
  if (!result) {
    return {-1, result.error().message};
  }
  return {result->exit_code, std::move(result->output)};
}

auto RunSubprocess(
    const std::vector<std::string>& argv, const SubprocessOptions& options)
    -> Result<SubprocessResult> {
  if (argv.empty()) {
    return std::unexpected(Diagnostic::HostError("empty argv"));
  }

  auto output_pipe = MakePipe();
  if (!output_pipe) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format("pipe() failed: {}", std::strerror(errno))));
  }

  std::optional<Pipe> side_pipe;
  if (options.on_side_channel) {
    side_pipe = MakePipe();
    if (!side_pipe) {
      return std::unexpected(
          Diagnostic::HostError(
              fmt::format("pipe() failed: {}", std::strerror(errno))));
    }
  }

  // Everything the child touches is prepared before fork().
  auto c_argv = ToCStrings(argv);
  std::vector<char*> c_env;
  if (options.environment) {
    c_env = ToCStrings(*options.environment);
  }
  std::string working_dir_str =
      options.working_dir ? options.working_dir->string() : std::string();

  pid_t pid = fork();
  if (pid == -1) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format("fork() failed: {}", std::strerror(errno))));
  }

  if (pid == 0) {
    // Child: own process group so the engine can stop the whole tree.
    setpgid(0, 0);

    int null_fd = open("/dev/null", O_RDONLY);
    if (null_fd == -1 || !MoveFd(null_fd, STDIN_FILENO)) {
      _exit(127);
    }
    int out_fd = output_pipe->write_end.Get();
    if (!MoveFd(out_fd, STDOUT_FILENO) || !MoveFd(out_fd, STDERR_FILENO)) {
      _exit(127);
    }
    if (side_pipe && !MoveFd(side_pipe->write_end.Get(), kSideChannelFd)) {
      _exit(127);
    }

    if (!working_dir_str.empty() && chdir(working_dir_str.c_str()) != 0) {
      _exit(127);
    }

    if (options.environment) {
      execvpe(c_argv[0], c_argv.data(), c_env.data());
    } else {
      execvp(c_argv[0], c_argv.data());
    }
    // If exec returns, it failed
    _exit(127);
  }

  // Parent: close write ends so EOF arrives when the child exits.
  output_pipe->write_end.Reset();
  if (side_pipe) {
    side_pipe->write_end.Reset();
  }

  SubprocessResult result;
  std::array<char, 4096> buffer{};

  std::vector<pollfd> poll_fds;
  poll_fds.push_back({.fd = output_pipe->read_end.Get(), .events = POLLIN,
                      .revents = 0});
  if (side_pipe) {
    poll_fds.push_back({.fd = side_pipe->read_end.Get(), .events = POLLIN,
                        .revents = 0});
  }

  size_t open_streams = poll_fds.size();
  while (open_streams > 0) {
    if (int sig = PendingInterrupt(); sig != 0) {
      KillAndReap(pid);
      throw Interrupted(sig);
    }

    int ready = poll(
        poll_fds.data(), static_cast<nfds_t>(poll_fds.size()), kPollTimeoutMs);
    if (ready == -1) {
      if (errno == EINTR) {
        continue;
      }
      KillAndReap(pid);
      return std::unexpected(
          Diagnostic::HostError(
              fmt::format("poll() failed: {}", std::strerror(errno))));
    }

    for (size_t i = 0; i < poll_fds.size(); ++i) {
      auto& entry = poll_fds[i];
      if (entry.fd < 0 || entry.revents == 0) {
        continue;
      }
      ssize_t bytes_read = read(entry.fd, buffer.data(), buffer.size());
      if (bytes_read > 0) {
        std::string_view chunk(buffer.data(), static_cast<size_t>(bytes_read));
        if (i == 0) {
          result.output.append(chunk);
        } else {
          options.on_side_channel(chunk);
        }
        continue;
      }
      if (bytes_read == -1 && errno == EINTR) {
        continue;
      }
      // EOF or error: stop watching this stream.
      entry.fd = -1;
      --open_streams;
    }
  }

  int status = 0;
  while (waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) {
      return std::unexpected(
          Diagnostic::HostError(
              fmt::format("waitpid() failed: {}", std::strerror(errno))));
    }
    if (int sig = PendingInterrupt(); sig != 0) {
      KillAndReap(pid);
      throw Interrupted(sig);
    }
  }

  result.exit_code = DecodeWaitStatus(status);
  return result;
}

auto FilteredEnvironment(const std::function<bool(std::string_view)>& drop)
    -> std::vector<std::string> {
  std::vector<std::string> result;
  for (char** entry = environ; entry != nullptr && *entry != nullptr;
       ++entry) {
    std::string_view view(*entry);
    if (!drop(view)) {
      result.emplace_back(view);
    }
  }
  return result;
}

}  // namespace shspec::common
