// Light discomfort threshold calibration, driven from the operator console.
//
// The actuator is zeroed on every exit path: normal completion, errors,
// operator abort ('q'), Ctrl+C / SIGTERM and uncaught exceptions.

#include "photocal/config.hpp"
#include "photocal/errors.hpp"
#include "photocal/hardware_channel.hpp"
#include "photocal/log.hpp"
#include "photocal/staircase.hpp"
#include "photocal/trial_controller.hpp"
#include "photocal/trial_logger.hpp"

#include <cerrno>
#include <chrono>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <poll.h>
#include <string>
#include <unistd.h>

using namespace photocal;

namespace {

const char* kDefaultConfigPath = "~/Calibration/config/experiment_config.ini";

// -----------------------------------------------------------------------------
// Console input with timeouts
// -----------------------------------------------------------------------------
class ConsoleInput final {
public:
  // Next line typed within `timeout_ms` (negative waits forever).
  // Nothing on timeout; throws AbortRequested on end of input.
  std::optional<std::string> readLine(int timeout_ms) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    for (;;) {
      const size_t nl = pending_.find('\n');
      if (nl != std::string::npos) {
        std::string line = pending_.substr(0, nl);
        pending_.erase(0, nl + 1);
        if (!line.empty() && line.back() == '\r') {
          line.pop_back();
        }
        return line;
      }

      int wait_ms = -1;
      if (timeout_ms >= 0) {
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (left <= 0) {
          return std::nullopt;
        }
        wait_ms = static_cast<int>(left);
      }

      struct pollfd pfd;
      pfd.fd = STDIN_FILENO;
      pfd.events = POLLIN;
      pfd.revents = 0;
      const int ready = ::poll(&pfd, 1, wait_ms);
      if (ready < 0) {
        if (errno == EINTR) continue;
        throw AbortRequested("console input failed");
      }
      if (ready == 0) {
        return std::nullopt;
      }

      char buf[256];
      const ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
      if (n < 0) {
        if (errno == EINTR || errno == EAGAIN) continue;
        throw AbortRequested("console input failed");
      }
      if (n == 0) {
        throw AbortRequested("console input closed");
      }
      pending_.append(buf, static_cast<size_t>(n));
    }
  }

private:
  std::string pending_;
};

// -----------------------------------------------------------------------------
// Console UI
// -----------------------------------------------------------------------------
class ConsoleUI final : public ExperimentUI {
public:
  void showInstructions(const std::string& participant_id, const std::string& session_id) override {
    std::cout << "\nParticipant: " << participant_id << "\n"
              << "Session:     " << session_id << "\n\n"
              << "EXPERIMENTER INSTRUCTIONS\n\n"
              << "1. Make sure the subject is wearing the goggles comfortably.\n"
              << "2. Tell the subject: \"You will see brief flashes of light. Tell me only\n"
              << "   if a flash is uncomfortable. Saying nothing counts as comfortable.\"\n"
              << "3. During each trial, after the flash ask \"Uncomfortable?\" and type\n"
              << "   'y' + Enter ONLY if the subject reports discomfort.\n"
              << "4. Type 'q' + Enter at any time to abort; the light is switched off.\n\n"
              << "Press Enter to begin the experiment ('q' aborts)\n" << std::flush;

    const auto line = input_.readLine(-1);
    if (line && (*line == "q" || *line == "Q")) throw AbortRequested();
  }

  void showTrialInfo(const TrialInfo& info) override {
    std::cout << "\nTrial " << info.trial_number << "/" << info.total_trials
              << "  level=" << info.level << "  reversals=" << info.reversals << "\n";
  }

  void countdown(double seconds, const std::string& label) override {
    double left = seconds;
    while (left > 0.0) {
      const int shown = static_cast<int>(std::ceil(left));
      std::cout << "  " << label << " " << shown << "...\n" << std::flush;
      const double slice = left - (shown - 1);
      waitWithAbort(slice);
      left -= slice;
    }
  }

  void presentStimulus(int level, double seconds) override {
    std::cout << "  STIMULUS ON (level " << level << ")\n" << std::flush;
    waitWithAbort(seconds);
    std::cout << "  stimulus off\n";
  }

  bool collectResponse(int trial_number, double timeout_s) override {
    std::cout << "  Trial " << trial_number << ": type 'y' + Enter if uncomfortable"
              << " ('q' aborts)" << std::flush;
    if (timeout_s > 0.0) {
      std::cout << ", window " << timeout_s << " s\n" << std::flush;
    } else {
      std::cout << ", 'n' if comfortable\n" << std::flush;
    }

    bool uncomfortable = false;
    const auto start = std::chrono::steady_clock::now();
    for (;;) {
      int wait_ms = -1;
      if (timeout_s > 0.0) {
        const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        if (elapsed >= timeout_s) break;
        wait_ms = static_cast<int>((timeout_s - elapsed) * 1000.0);
      }

      const auto line = input_.readLine(wait_ms);
      if (!line) break;
      if (*line == "q" || *line == "Q") throw AbortRequested();
      if (*line == "y" || *line == "Y") {
        uncomfortable = true;
        std::cout << "  recorded: uncomfortable\n" << std::flush;
        // Keep waiting for the full window to hold the trial cadence
        if (timeout_s <= 0.0) break;
      } else if (timeout_s <= 0.0 && (*line == "n" || *line == "N")) {
        break;
      }
    }
    return uncomfortable;
  }

  void showCompletion(const StaircaseSummary& summary) override {
    std::cout << "\nCalibration complete\n";
    std::cout << "  trials:    " << summary.trials_completed << "\n";
    std::cout << "  reversals: " << summary.reversal_intensities.size() << "\n";
    if (summary.threshold) {
      std::cout << "  threshold: " << std::fixed << std::setprecision(2) << *summary.threshold << "\n";
    } else {
      std::cout << "  threshold: n/a (no reversals)\n";
    }
  }

  void showAbort(const std::string& message) override {
    std::cout << "\n" << message << " (actuator is off)\n";
  }

  ConsoleInput& input() { return input_; }

private:
  ConsoleInput input_;

  void waitWithAbort(double seconds) {
    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::milliseconds(static_cast<long>(seconds * 1000.0));
    for (;;) {
      const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - std::chrono::steady_clock::now()).count();
      if (left <= 0) return;
      const auto line = input_.readLine(static_cast<int>(left));
      if (line && (*line == "q" || *line == "Q")) throw AbortRequested();
    }
  }
};

// -----------------------------------------------------------------------------
// Arguments / participant prompt
// -----------------------------------------------------------------------------
struct Options {
  std::string config_path = kDefaultConfigPath;
  std::string participant;
  std::string session;
  std::optional<int> start;
  bool verbose = false;
};

void printUsage(const char* argv0) {
  std::cerr << "Usage: " << argv0
            << " [--config PATH] [--participant ID] [--session ID] [--start 1-255] [--verbose]\n";
}

bool parseArgs(int argc, char** argv, Options& opts) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    auto value = [&](std::string& out) {
      if (i + 1 >= argc) return false;
      out = argv[++i];
      return true;
    };
    std::string v;
    if (arg == "--config") {
      if (!value(opts.config_path)) return false;
    } else if (arg == "--participant") {
      if (!value(opts.participant)) return false;
    } else if (arg == "--session") {
      if (!value(opts.session)) return false;
    } else if (arg == "--start") {
      if (!value(v)) return false;
      opts.start = parseStartingIntensity(v);
      if (!opts.start) return false;
    } else if (arg == "--verbose") {
      opts.verbose = true;
    } else {
      return false;
    }
  }
  return true;
}

std::string promptIdentifier(ConsoleInput& in, const char* label) {
  for (;;) {
    std::cout << "Enter " << label << ": " << std::flush;
    const auto line = in.readLine(-1);
    if (line && isValidIdentifier(*line)) return *line;
    std::cout << "ERROR: Invalid " << label << ". Use only letters, numbers, underscores, and hyphens.\n";
  }
}

int promptStart(ConsoleInput& in) {
  for (;;) {
    std::cout << "Enter Starting Intensity (1-255): " << std::flush;
    const auto line = in.readLine(-1);
    if (line) {
      const auto v = parseStartingIntensity(*line);
      if (v) return *v;
    }
    std::cout << "ERROR: Invalid Starting Intensity. Must be an integer between 1 and 255.\n";
  }
}

} // namespace

int main(int argc, char** argv) {
  Options opts;
  if (!parseArgs(argc, argv, opts)) {
    printUsage(argv[0]);
    return 2;
  }

  std::ofstream log_file;
  ConsoleUI ui;

  try {
    // ------------------------------------------------------------------------
    // Configuration and logging
    // ------------------------------------------------------------------------
    const ExperimentConfig cfg = loadOrCreateConfig(expandPath(opts.config_path));
    ensureDirectories(cfg);

    const std::string timestamp = fileTimestamp();
    const std::string log_path = expandPath(cfg.paths.log_directory) + "/calibration_" + timestamp + ".log";
    log_file.open(log_path);
    if (log_file) {
      setLogSink(&log_file);
    } else {
      std::cerr << "WARNING: cannot open log file " << log_path << ", logging to stderr\n";
    }
    setLogLevel(opts.verbose ? LogLevel::Debug : LogLevel::Info);
    log(LogLevel::Info, "LIGHT DISCOMFORT CALIBRATION STARTING");

    // ------------------------------------------------------------------------
    // Participant / session
    // ------------------------------------------------------------------------
    std::cout << "\n============================================================\n";
    std::cout << "LIGHT DISCOMFORT CALIBRATION\n";
    std::cout << "============================================================\n\n";

    SessionInfo session;
    session.participant_id = isValidIdentifier(opts.participant)
        ? opts.participant : promptIdentifier(ui.input(), "Participant ID");
    session.session_id = isValidIdentifier(opts.session)
        ? opts.session : promptIdentifier(ui.input(), "Session ID");
    session.starting_intensity = opts.start ? *opts.start : promptStart(ui.input());
    session.timestamp = timestamp;

    LogLine(LogLevel::Info) << "Participant=" << session.participant_id
                            << ", session=" << session.session_id
                            << ", starting_intensity=" << *session.starting_intensity;

    // ------------------------------------------------------------------------
    // Run
    // ------------------------------------------------------------------------
    AdaptiveStaircaseEngine engine(cfg.staircaseConfig(*session.starting_intensity));
    CsvTrialLogger trial_log(expandPath(cfg.paths.data_directory), session, cfg.data.auto_flush);
    SafeHardwareChannel channel;

    TrialController controller(engine, channel, ui, trial_log, cfg.timing, cfg.data.threshold_reversals);
    controller.run(cfg.channelConfig(), session);

    log(LogLevel::Info, "Calibration completed successfully");
    setLogSink(nullptr);
    return 0;

  } catch (const AbortRequested& e) {
    log(LogLevel::Warn, std::string("Aborted: ") + e.what());
    setLogSink(nullptr);
    return 130;
  } catch (const ConfigError& e) {
    log(LogLevel::Error, std::string("Configuration error: ") + e.what());
    setLogSink(nullptr);
    std::cerr << "\nCONFIGURATION ERROR: " << e.what() << "\nPlease check your configuration file.\n";
    return 2;
  } catch (const ConnectionError& e) {
    log(LogLevel::Error, std::string("Connection error: ") + e.what());
    setLogSink(nullptr);
    std::cerr << "\nACTUATOR ERROR: " << e.what() << "\nPlease check the serial port connection and configuration.\n";
    return 3;
  } catch (const TransportError& e) {
    log(LogLevel::Error, std::string("Transport error: ") + e.what());
    setLogSink(nullptr);
    std::cerr << "\nACTUATOR WRITE ERROR: " << e.what() << "\nThe run was stopped; the actuator was zeroed.\n";
    return 4;
  } catch (const std::exception& e) {
    log(LogLevel::Error, std::string("Unexpected error: ") + e.what());
    setLogSink(nullptr);
    std::cerr << "\nUNEXPECTED ERROR: " << e.what() << "\nPlease check the log file for details.\n";
    return 1;
  }
}
