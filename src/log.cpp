#include "photocal/log.hpp"

#include <iostream>
#include <mutex>

namespace photocal {

namespace {

std::mutex g_log_mutex;
std::ostream* g_sink = nullptr;
LogLevel g_level = LogLevel::Info;

} // namespace

std::ostream* setLogSink(std::ostream* sink) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  std::ostream* previous = g_sink;
  g_sink = sink;
  return previous;
}

void setLogLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  g_level = level;
}

LogLevel logLevel() {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  return g_level;
}

const char* logLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO";
    case LogLevel::Warn: return "WARN";
    case LogLevel::Error: return "ERROR";
    default: return "UNKNOWN";
  }
}

void log(LogLevel level, const std::string& message) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  if (static_cast<uint8_t>(level) < static_cast<uint8_t>(g_level)) {
    return;
  }
  std::ostream& out = g_sink ? *g_sink : std::clog;
  out << "[" << logLevelName(level) << "] " << message << "\n";
  out.flush();
}

} // namespace photocal
