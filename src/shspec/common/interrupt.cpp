#include "shspec/common/interrupt.hpp"

#include <array>
#include <csignal>

namespace shspec::common {

namespace {

volatile std::sig_atomic_t g_pending_signal = 0;

void RecordSignal(int signal_number) {
  g_pending_signal = signal_number;
}

}  // namespace

void InstallInterruptHandlers() {
  struct sigaction action {};
  action.sa_handler = RecordSignal;
  sigemptyset(&action.sa_mask);
  // No SA_RESTART: blocking waits must return EINTR.
  action.sa_flags = 0;

  constexpr std::array<int, 3> kSignals = {SIGINT, SIGTERM, SIGHUP};
  for (int sig : kSignals) {
    sigaction(sig, &action, nullptr);
  }
}

auto PendingInterrupt() -> int {
  return static_cast<int>(g_pending_signal);
}

void ThrowIfInterrupted() {
  if (int sig = PendingInterrupt(); sig != 0) {
    throw Interrupted(sig);
  }
}

}  // namespace shspec::common
