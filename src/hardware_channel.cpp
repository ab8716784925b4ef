// Fail-safe actuator channel: range/state validation, soft clamping,
// mirrored level bookkeeping and the unconditional zero-on-release.

#include "photocal/hardware_channel.hpp"

#include "photocal/errors.hpp"
#include "photocal/log.hpp"
#include "photocal/shutdown_guard.hpp"

#include <cerrno>
#include <cmath>
#include <cstring>
#include <utility>

namespace photocal {

namespace {

int timeoutMs(const ChannelConfig& cfg) {
  return static_cast<int>(std::lround(cfg.transport_timeout_s * 1000.0));
}

// "<level>\n" without allocation (usable from the emergency path).
size_t formatCommand(int level, char (&buf)[8]) noexcept {
  char digits[4];
  size_t n = 0;
  unsigned v = static_cast<unsigned>(level);
  do {
    digits[n++] = static_cast<char>('0' + (v % 10));
    v /= 10;
  } while (v > 0 && n < sizeof(digits));

  size_t len = 0;
  while (n > 0) {
    buf[len++] = digits[--n];
  }
  buf[len++] = '\n';
  return len;
}

} // namespace

std::unique_ptr<Transport> openSerialTransport(const ChannelConfig& cfg) {
  return SerialTransport::open(cfg.connection_spec, cfg.baud_rate, timeoutMs(cfg));
}

// ============================================================================
// Lifecycle
// ============================================================================
SafeHardwareChannel::SafeHardwareChannel()
    : factory_(openSerialTransport)
{}

SafeHardwareChannel::SafeHardwareChannel(TransportFactory factory)
    : factory_(std::move(factory))
{
  if (!factory_) {
    factory_ = openSerialTransport;
  }
}

SafeHardwareChannel::~SafeHardwareChannel() {
  close();
}

void SafeHardwareChannel::open(const ChannelConfig& cfg) {
  if (open_.load()) {
    LogLine(LogLevel::Warn) << "Actuator channel already open on " << cfg_.connection_spec;
    return;
  }

  // ------------------------------------------------------------------------
  // Validate soft bounds and timing before touching the device
  // ------------------------------------------------------------------------
  if (cfg.bounds.min < kProtocolMinLevel || cfg.bounds.max > kProtocolMaxLevel) {
    throw ConnectionError("Channel bounds must lie within [0, 255], got [" +
                          std::to_string(cfg.bounds.min) + ", " + std::to_string(cfg.bounds.max) + "]");
  }
  if (cfg.bounds.min >= cfg.bounds.max) {
    throw ConnectionError("Channel bounds minimum must be less than maximum");
  }
  if (!(cfg.transport_timeout_s > 0.0)) {
    throw ConnectionError("Transport timeout must be positive");
  }

  shutdown_guard::install();

  // ------------------------------------------------------------------------
  // Establish the transport
  // ------------------------------------------------------------------------
  std::unique_ptr<Transport> transport;
  try {
    transport = factory_(cfg);
  } catch (const ConnectionError&) {
    throw;
  } catch (const std::exception& e) {
    throw ConnectionError("Failed to open actuator transport " + cfg.connection_spec + ": " + e.what());
  }
  if (!transport || !transport->isOpen()) {
    throw ConnectionError("Failed to open actuator transport " + cfg.connection_spec);
  }

  transport_ = std::move(transport);
  cfg_ = cfg;
  mirrored_level_.store(0);
  open_.store(true);

  shutdown_guard::arm(this);

  // ------------------------------------------------------------------------
  // Unconditional zero: the actuator starts de-energized
  // ------------------------------------------------------------------------
  if (!transmit(0)) {
    const std::string reason = std::strerror(errno);
    close();
    throw ConnectionError("Initial zero command to " + cfg.connection_spec + " failed: " + reason);
  }

  LogLine(LogLevel::Info) << "Opened actuator channel " << transport_->describe()
                          << " (range: " << cfg_.bounds.min << "-" << cfg_.bounds.max << ")";
}

void SafeHardwareChannel::close() noexcept {
  const bool was_open = open_.load();

  // Zero while still armed: a signal arriving from here on runs the
  // emergency zero itself instead of finding an empty slot.
  if (was_open) {
    if (sendZero()) {
      LogLine(LogLevel::Info) << "Actuator set to 0 (off)";
    } else {
      LogLine(LogLevel::Error) << "Failed to zero actuator on close of " << cfg_.connection_spec
                               << ": " << std::strerror(errno);
    }
  }

  // After this no trigger can reach this channel, and none is running.
  shutdown_guard::disarm(this);

  open_.store(false);
  mirrored_level_.store(0);
  if (transport_) {
    transport_->release();
    transport_.reset();
  }

  if (was_open) {
    LogLine(LogLevel::Info) << "Closed actuator channel " << cfg_.connection_spec;
  }
}

void SafeHardwareChannel::emergencyShutdown() noexcept {
  sendZero();
  mirrored_level_.store(0);
  open_.store(false);
}

// ============================================================================
// Level control
// ============================================================================
void SafeHardwareChannel::setLevel(int level) {
  if (level < kProtocolMinLevel || level > kProtocolMaxLevel) {
    throw RangeError("Level must be 0-255, got " + std::to_string(level));
  }
  if (!open_.load()) {
    throw StateError("Cannot set level: actuator channel not open");
  }

  // Zero is the off command and bypasses the soft clamp.
  int target = level;
  if (level != 0 && level < cfg_.bounds.min) {
    LogLine(LogLevel::Warn) << "Requested level " << level << " below minimum "
                            << cfg_.bounds.min << ", clamping to minimum";
    target = cfg_.bounds.min;
  } else if (level > cfg_.bounds.max) {
    LogLine(LogLevel::Warn) << "Requested level " << level << " above maximum "
                            << cfg_.bounds.max << ", clamping to maximum";
    target = cfg_.bounds.max;
  }

  if (!transmit(target)) {
    // Device state unknown; keep the last confirmed level.
    throw TransportError("Failed to write level " + std::to_string(target) + " to " +
                         cfg_.connection_spec + ": " + std::strerror(errno));
  }

  mirrored_level_.store(target);
  LogLine(LogLevel::Info) << "Actuator level set to " << target;
}

// ============================================================================
// Internals
// ============================================================================
bool SafeHardwareChannel::transmit(int level) noexcept {
  if (!transport_) {
    errno = EBADF;
    return false;
  }
  char buf[8];
  const size_t len = formatCommand(level, buf);
  return transport_->send(buf, len);
}

bool SafeHardwareChannel::sendZero() noexcept {
  // No range/clamp validation: the off command must always go out.
  if (!transport_) {
    errno = EBADF;
    return false;
  }
  static const char kZero[] = "0\n";
  return transport_->send(kZero, sizeof(kZero) - 1);
}

} // namespace photocal
