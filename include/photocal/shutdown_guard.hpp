#pragma once

// Process-wide emergency shutdown for the armed actuator channel.
//
// Lifetime: process-wide state. Armed by SafeHardwareChannel::open(),
// disarmed by SafeHardwareChannel::close(), read only by the termination
// handlers:
//   - normal process exit (std::atexit hook)
//   - SIGINT, SIGTERM, SIGHUP, SIGQUIT, SIGABRT
//
// The slot is a single lock-free atomic pointer (non-owning). Arming a new
// channel silently disarms the previous one. A trigger takes the pointer out
// of the slot with one atomic exchange, so each armed channel is shut down
// at most once; the trigger path never locks, allocates or throws.
//
// After a signal-triggered shutdown the default disposition is restored and
// the signal re-raised, so the process still dies by that signal.

namespace photocal {

class SafeHardwareChannel;

namespace shutdown_guard {

// Register the exit hook and signal handlers. Idempotent.
// Throws ConnectionError if the handlers cannot be installed.
void install();
bool installed() noexcept;

// Make `channel` the armed channel, replacing any previous one.
void arm(SafeHardwareChannel* channel) noexcept;

// Clear the slot if it still holds `channel`; returns whether it did.
// Waits for a trigger that is running concurrently on another thread
// to finish, so the caller may release `channel` afterwards.
bool disarm(SafeHardwareChannel* channel) noexcept;

SafeHardwareChannel* armed() noexcept;

// Run the emergency shutdown of the armed channel, if any.
// Returns true when a channel was shut down by this call.
bool trigger() noexcept;

} // namespace shutdown_guard
} // namespace photocal
