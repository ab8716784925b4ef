#pragma once

// Fail-safe channel to the light actuator.
//
// SAFETY PRINCIPLES:
// 1. De-energized on every exit path: close(), destructor, process exit hook
//    and termination signals all drive the actuator to 0.
// 2. No read-back: currentLevel() is the last value successfully sent.
// 3. Level 0 is always allowed; every other level is clamped to the soft
//    bounds of the channel.
// 4. The forced zero on release never throws; release always completes.
// 5. close() zeroes before it disarms, so a termination signal at any
//    point of close() still finds the channel armed or already zeroed.
//
// Wire protocol: ASCII decimal level (0-255) followed by one '\n', flushed
// after each command. No acknowledgement.
//
// State machine:
//   Closed --open()--> Open --setLevel()--> Open --close()/emergency--> Closed

#include "photocal/transport.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <string>

namespace photocal {

constexpr int kProtocolMinLevel = 0;
constexpr int kProtocolMaxLevel = 255;

struct LevelBounds final {
  int min = kProtocolMinLevel;
  int max = kProtocolMaxLevel;
};

struct ChannelConfig final {
  std::string connection_spec;       // e.g. /dev/ttyUSB0
  int baud_rate = 9600;
  LevelBounds bounds{};              // soft clamp, inside [0,255]
  double transport_timeout_s = 1.0;  // bound on a single write
};

using TransportFactory = std::function<std::unique_ptr<Transport>(const ChannelConfig&)>;

// Opens a SerialTransport on cfg.connection_spec.
std::unique_ptr<Transport> openSerialTransport(const ChannelConfig& cfg);

class SafeHardwareChannel final {
public:
  SafeHardwareChannel();
  explicit SafeHardwareChannel(TransportFactory factory);

  // Scoped release: always closes (zeroes) the actuator.
  ~SafeHardwareChannel();

  SafeHardwareChannel(const SafeHardwareChannel&) = delete;
  SafeHardwareChannel& operator=(const SafeHardwareChannel&) = delete;

  // Establish the transport, arm the process shutdown guard, send 0.
  // Throws ConnectionError on invalid bounds or transport failure.
  // No-op (with a warning) when already open.
  void open(const ChannelConfig& cfg);

  // Throws RangeError outside [0,255], StateError when closed,
  // TransportError when the write fails (mirrored level unchanged).
  void setLevel(int level);

  int currentLevel() const noexcept { return mirrored_level_.load(); }
  bool isOpen() const noexcept { return open_.load(); }
  const LevelBounds& bounds() const noexcept { return cfg_.bounds; }

  // Forced zero (best effort) while still armed, then disarm and release
  // the transport. Idempotent, never throws.
  void close() noexcept;

  // Forced zero for the process shutdown guard; marks the channel closed.
  // Async-signal-safe provided the transport is. The zero is sent even when
  // close() already sent one or is midway through sending it. The transport
  // itself is released by close() or by process teardown.
  void emergencyShutdown() noexcept;

private:
  TransportFactory factory_;
  std::unique_ptr<Transport> transport_;
  ChannelConfig cfg_;

  // Touched by the emergency path, hence lock-free atomics.
  std::atomic<int> mirrored_level_{0};
  std::atomic<bool> open_{false};

  // Unvalidated "0\n"; never throws.
  bool sendZero() noexcept;
  bool transmit(int level) noexcept;
};

} // namespace photocal
