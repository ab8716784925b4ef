#include "photocal/shutdown_guard.hpp"

#include "photocal/errors.hpp"
#include "photocal/hardware_channel.hpp"

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <string>
#include <thread>
#include <unistd.h>

namespace photocal {
namespace shutdown_guard {

namespace {

// The armed channel (non-owning) and the number of triggers in progress.
std::atomic<SafeHardwareChannel*> g_armed{nullptr};
std::atomic<int> g_triggers_in_flight{0};
std::atomic<bool> g_installed{false};

static_assert(std::atomic<SafeHardwareChannel*>::is_always_lock_free,
              "shutdown slot must be lock-free to be used from a signal handler");
static_assert(std::atomic<int>::is_always_lock_free,
              "trigger counter must be lock-free to be used from a signal handler");

constexpr int kHandledSignals[] = {SIGINT, SIGTERM, SIGHUP, SIGQUIT, SIGABRT};

void writeStderr(const char* msg) noexcept {
  const size_t len = std::strlen(msg);
  const ssize_t n = ::write(STDERR_FILENO, msg, len);
  (void)n; // nothing to do if stderr is gone
}

void onSignal(int sig) {
  const int saved_errno = errno;

  writeStderr("[WARN] termination signal received, zeroing actuator\n");
  trigger();

  errno = saved_errno;

  // SA_RESETHAND restored SIG_DFL on entry; delivered once we return.
  ::raise(sig);
}

void onExit() {
  if (trigger()) {
    writeStderr("[WARN] process exit with an armed actuator channel, zeroed\n");
  }
}

} // namespace

// ============================================================================
// Installation
// ============================================================================
void install() {
  static std::mutex install_mutex;
  std::lock_guard<std::mutex> lock(install_mutex);

  if (g_installed.load()) {
    return;
  }

  if (std::atexit(onExit) != 0) {
    throw ConnectionError("Failed to register exit hook for actuator shutdown");
  }

  struct sigaction sa;
  std::memset(&sa, 0, sizeof(sa));
  sa.sa_handler = onSignal;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = SA_RESETHAND;

  for (int sig : kHandledSignals) {
    if (sigaction(sig, &sa, nullptr) < 0) {
      throw ConnectionError(std::string("Failed to install handler for signal ") +
                            std::to_string(sig) + ": " + std::strerror(errno));
    }
  }

  g_installed.store(true);
}

bool installed() noexcept {
  return g_installed.load();
}

// ============================================================================
// Slot operations
// ============================================================================
void arm(SafeHardwareChannel* channel) noexcept {
  g_armed.exchange(channel);
}

bool disarm(SafeHardwareChannel* channel) noexcept {
  SafeHardwareChannel* expected = channel;
  const bool cleared = g_armed.compare_exchange_strong(expected, nullptr);

  // A trigger on another thread may hold the pointer already. In the
  // same-thread (signal handler) case the trigger has finished before we
  // get here, so this loop does not spin.
  while (g_triggers_in_flight.load() > 0) {
    std::this_thread::yield();
  }
  return cleared;
}

SafeHardwareChannel* armed() noexcept {
  return g_armed.load();
}

bool trigger() noexcept {
  g_triggers_in_flight.fetch_add(1);

  SafeHardwareChannel* channel = g_armed.exchange(nullptr);
  if (channel != nullptr) {
    channel->emergencyShutdown();
  }

  g_triggers_in_flight.fetch_sub(1);
  return channel != nullptr;
}

} // namespace shutdown_guard
} // namespace photocal
