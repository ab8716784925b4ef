#pragma once

// Minimal line-oriented logging.
//
// Every line is "[LEVEL] message". The sink defaults to std::clog and can be
// redirected (log file, test capture). Not for use from signal handlers.

#include <cstdint>
#include <ostream>
#include <sstream>
#include <string>

namespace photocal {

enum class LogLevel : uint8_t {
  Debug = 0,
  Info = 1,
  Warn = 2,
  Error = 3
};

// Process-wide sink and threshold. Passing nullptr restores std::clog.
// Returns the previous sink (nullptr for std::clog).
std::ostream* setLogSink(std::ostream* sink);
void setLogLevel(LogLevel level);
LogLevel logLevel();

void log(LogLevel level, const std::string& message);

const char* logLevelName(LogLevel level);

// Stream-style helper: LogLine(LogLevel::Info) << "x=" << x;
class LogLine final {
public:
  explicit LogLine(LogLevel level) : level_(level) {}
  ~LogLine() { log(level_, buf_.str()); }

  LogLine(const LogLine&) = delete;
  LogLine& operator=(const LogLine&) = delete;

  template <typename T>
  LogLine& operator<<(const T& v) {
    buf_ << v;
    return *this;
  }

private:
  LogLevel level_;
  std::ostringstream buf_;
};

} // namespace photocal
