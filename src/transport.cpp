#include "photocal/transport.hpp"

#include "photocal/errors.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>
#include <utility>

namespace photocal {

// -----------------------------------------------------------------------------
// FdTransport Implementation
// -----------------------------------------------------------------------------

FdTransport::FdTransport(int fd, int timeout_ms, std::string name)
    : fd_(fd)
    , timeout_ms_(timeout_ms)
    , name_(std::move(name))
{
  if (fd_ >= 0) {
    const int flags = fcntl(fd_, F_GETFL, 0);
    if (flags >= 0) {
      fcntl(fd_, F_SETFL, flags | O_NONBLOCK);
    }
  }
}

FdTransport::~FdTransport() {
  release();
}

bool FdTransport::send(const char* data, size_t len) noexcept {
  if (fd_ < 0) {
    errno = EBADF;
    return false;
  }

  size_t written = 0;
  while (written < len) {
    const ssize_t n = ::write(fd_, data + written, len - written);
    if (n > 0) {
      written += static_cast<size_t>(n);
      continue;
    }
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      // Device not accepting data: wait, bounded by the timeout
      struct pollfd pfd;
      pfd.fd = fd_;
      pfd.events = POLLOUT;
      pfd.revents = 0;
      const int ready = ::poll(&pfd, 1, timeout_ms_);
      if (ready > 0) {
        continue;
      }
      if (ready < 0 && errno == EINTR) {
        continue;
      }
      if (ready == 0) {
        errno = ETIMEDOUT;
      }
      return false;
    }
    return false;
  }

  return drain();
}

void FdTransport::release() noexcept {
  if (fd_ >= 0) {
    const int fd = fd_;
    fd_ = -1;
    ::close(fd);
  }
}

// -----------------------------------------------------------------------------
// SerialTransport Implementation
// -----------------------------------------------------------------------------

namespace {

bool baudToSpeed(int baud_rate, speed_t& out) {
  switch (baud_rate) {
    case 1200: out = B1200; return true;
    case 2400: out = B2400; return true;
    case 4800: out = B4800; return true;
    case 9600: out = B9600; return true;
    case 19200: out = B19200; return true;
    case 38400: out = B38400; return true;
    case 57600: out = B57600; return true;
    case 115200: out = B115200; return true;
    case 230400: out = B230400; return true;
    default: return false;
  }
}

std::string errnoText(const std::string& what) {
  return what + ": " + std::strerror(errno);
}

} // namespace

SerialTransport::SerialTransport(int fd, int timeout_ms, std::string name, bool is_tty)
    : FdTransport(fd, timeout_ms, std::move(name))
    , is_tty_(is_tty)
{}

std::unique_ptr<SerialTransport> SerialTransport::open(const std::string& path, int baud_rate, int timeout_ms) {
  speed_t speed;
  if (!baudToSpeed(baud_rate, speed)) {
    throw ConnectionError("Unsupported baud rate " + std::to_string(baud_rate) + " for " + path);
  }

  const int fd = ::open(path.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK | O_CLOEXEC);
  if (fd < 0) {
    throw ConnectionError(errnoText("Failed to open serial port " + path));
  }

  const bool is_tty = isatty(fd) == 1;
  if (is_tty) {
    // One owner per device
    if (ioctl(fd, TIOCEXCL) < 0) {
      const std::string msg = errnoText("Failed to lock serial port " + path);
      ::close(fd);
      throw ConnectionError(msg);
    }

    struct termios tio;
    if (tcgetattr(fd, &tio) < 0) {
      const std::string msg = errnoText("Failed to read attributes of " + path);
      ::close(fd);
      throw ConnectionError(msg);
    }

    cfmakeraw(&tio);
    tio.c_cflag |= (CLOCAL | CREAD);
    tio.c_cflag &= ~(CSTOPB | PARENB | CRTSCTS);
    tio.c_cflag &= ~CSIZE;
    tio.c_cflag |= CS8;
    cfsetispeed(&tio, speed);
    cfsetospeed(&tio, speed);

    if (tcsetattr(fd, TCSANOW, &tio) < 0) {
      const std::string msg = errnoText("Failed to configure serial port " + path);
      ::close(fd);
      throw ConnectionError(msg);
    }
    tcflush(fd, TCIOFLUSH);
  }

  return std::unique_ptr<SerialTransport>(new SerialTransport(fd, timeout_ms, path, is_tty));
}

bool SerialTransport::drain() noexcept {
  if (!is_tty_) {
    return true;
  }
  while (tcdrain(fd_) < 0) {
    if (errno != EINTR) {
      return false;
    }
  }
  return true;
}

} // namespace photocal
