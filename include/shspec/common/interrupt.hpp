#pragma once

#include <stdexcept>
#include <string>

namespace shspec::common {

// Thrown out of blocking waits once SIGINT, SIGTERM or SIGHUP arrived, so
// that RAII guards above the wait clean up before the process exits.
class Interrupted : public std::runtime_error {
 public:
  explicit Interrupted(int signal_number)
      : std::runtime_error(
            "interrupted by signal " + std::to_string(signal_number)),
        signal_number_(signal_number) {
  }

  [[nodiscard]] auto SignalNumber() const -> int {
    return signal_number_;
  }

 private:
  int signal_number_;
};

// Install handlers that only record the signal. Safe to call more than once.
void InstallInterruptHandlers();

// Signal received since start, or 0.
auto PendingInterrupt() -> int;

void ThrowIfInterrupted();

}  // namespace shspec::common
