#pragma once

// Send-only byte transports to the actuator.
//
// SAFETY:
// - send() writes every byte and flushes before returning; nothing stays
//   buffered in the process.
// - send() and release() of the fd-based transports only use
//   async-signal-safe calls (write, poll, tcdrain, close) so the emergency
//   shutdown path may call them from a signal handler.
// - Writes are bounded by the configured timeout; a stalled device never
//   blocks the caller indefinitely.

#include <cstddef>
#include <memory>
#include <string>

namespace photocal {

class Transport {
public:
  virtual ~Transport() = default;

  // Write `len` bytes and flush. Returns false on failure (errno is set).
  virtual bool send(const char* data, size_t len) noexcept = 0;

  // Release the underlying handle. Idempotent.
  virtual void release() noexcept = 0;

  virtual bool isOpen() const noexcept = 0;

  // Human-readable endpoint name for logs.
  virtual std::string describe() const = 0;
};

// Transport over an already open POSIX file descriptor (pipe, pty, tty).
// The descriptor is switched to non-blocking mode and owned by this object.
class FdTransport : public Transport {
public:
  FdTransport(int fd, int timeout_ms, std::string name);
  ~FdTransport() override;

  FdTransport(const FdTransport&) = delete;
  FdTransport& operator=(const FdTransport&) = delete;

  bool send(const char* data, size_t len) noexcept override;
  void release() noexcept override;
  bool isOpen() const noexcept override { return fd_ >= 0; }
  std::string describe() const override { return name_; }

  int fd() const noexcept { return fd_; }

protected:
  // Wait until written bytes have left the process/driver. Default: no-op.
  virtual bool drain() noexcept { return true; }

  int fd_;
  int timeout_ms_;
  std::string name_;
};

// Serial port actuator link: raw 8N1, no flow control, exclusive open.
class SerialTransport final : public FdTransport {
public:
  // Throws ConnectionError if the port cannot be opened or configured.
  static std::unique_ptr<SerialTransport> open(const std::string& path, int baud_rate, int timeout_ms);

protected:
  bool drain() noexcept override;

private:
  SerialTransport(int fd, int timeout_ms, std::string name, bool is_tty);

  bool is_tty_;
};

} // namespace photocal
