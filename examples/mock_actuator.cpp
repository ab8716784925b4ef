// Simulated light actuator on a pseudo-terminal (test/bench use only).
//
// Prints the slave device path; point serial_port at it. Every received
// command is echoed with a timestamp. Malformed commands and levels that
// stay non-zero longer than --max-on seconds are reported as violations.

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <iomanip>
#include <iostream>
#include <poll.h>
#include <string>
#include <unistd.h>

namespace {

volatile std::sig_atomic_t g_stop = 0;

void onSignal(int) {
  g_stop = 1;
}

bool parseLevel(const std::string& cmd, int& level) {
  if (cmd.empty() || cmd.size() > 3) return false;
  int v = 0;
  for (char c : cmd) {
    if (c < '0' || c > '9') return false;
    v = v * 10 + (c - '0');
  }
  if (v > 255) return false;
  level = v;
  return true;
}

} // namespace

int main(int argc, char** argv) {
  double max_on_s = 0.0;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--max-on" && i + 1 < argc) {
      max_on_s = std::atof(argv[++i]);
    } else {
      std::cerr << "Usage: " << argv[0] << " [--max-on SECONDS]\n";
      return 2;
    }
  }

  const int master = posix_openpt(O_RDWR | O_NOCTTY);
  if (master < 0 || grantpt(master) < 0 || unlockpt(master) < 0) {
    std::cerr << "Failed to create pseudo-terminal: " << std::strerror(errno) << "\n";
    return 1;
  }
  const char* slave_name = ptsname(master);
  if (slave_name == nullptr) {
    std::cerr << "Failed to resolve pseudo-terminal name: " << std::strerror(errno) << "\n";
    close(master);
    return 1;
  }

  // Hold the slave open so the master does not see hang-ups between clients
  const int keepalive = open(slave_name, O_RDWR | O_NOCTTY);

  std::signal(SIGINT, onSignal);
  std::signal(SIGTERM, onSignal);

  std::cout << "Mock actuator listening on " << slave_name << "\n";
  if (max_on_s > 0.0) {
    std::cout << "Flagging levels held non-zero for more than " << max_on_s << " s\n";
  }
  std::cout << std::flush;

  const auto t0 = std::chrono::steady_clock::now();
  auto elapsed = [&]() {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
  };

  std::string pending;
  int level = 0;
  double on_since = 0.0;
  bool overdue_reported = false;
  int violations = 0;

  while (!g_stop) {
    struct pollfd pfd;
    pfd.fd = master;
    pfd.events = POLLIN;
    pfd.revents = 0;
    const int ready = poll(&pfd, 1, 100);

    if (level != 0 && max_on_s > 0.0 && !overdue_reported && elapsed() - on_since > max_on_s) {
      std::cout << "[" << std::fixed << std::setprecision(3) << elapsed() << "] VIOLATION: level "
                << level << " held for more than " << max_on_s << " s\n" << std::flush;
      overdue_reported = true;
      ++violations;
    }

    if (ready <= 0) {
      continue;
    }

    char buf[256];
    const ssize_t n = read(master, buf, sizeof(buf));
    if (n <= 0) {
      if (n < 0 && errno != EINTR && errno != EAGAIN && errno != EIO) {
        std::cerr << "Read failed: " << std::strerror(errno) << "\n";
        break;
      }
      usleep(100000);
      continue;
    }
    pending.append(buf, static_cast<size_t>(n));

    size_t nl;
    while ((nl = pending.find('\n')) != std::string::npos) {
      std::string cmd = pending.substr(0, nl);
      pending.erase(0, nl + 1);
      if (!cmd.empty() && cmd.back() == '\r') cmd.pop_back();

      int next = 0;
      std::cout << "[" << std::fixed << std::setprecision(3) << elapsed() << "] ";
      if (!parseLevel(cmd, next)) {
        std::cout << "VIOLATION: malformed command '" << cmd << "'\n" << std::flush;
        ++violations;
        continue;
      }

      std::cout << "level=" << next << (next == 0 ? " (off)" : "") << "\n" << std::flush;
      if (level == 0 && next != 0) {
        on_since = elapsed();
        overdue_reported = false;
      }
      level = next;
    }
  }

  std::cout << "\nMock actuator stopping; final level " << level << ", " << violations << " violation(s)\n";
  if (keepalive >= 0) close(keepalive);
  close(master);
  return violations == 0 ? 0 : 1;
}
