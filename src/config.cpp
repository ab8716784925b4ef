#include "photocal/config.hpp"

#include "photocal/errors.hpp"
#include "photocal/log.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>

namespace photocal {

// -----------------------------------------------------------------------------
// Projections onto component configs
// -----------------------------------------------------------------------------

StaircaseConfig ExperimentConfig::staircaseConfig() const {
  return staircaseConfig(staircase.start_value);
}

StaircaseConfig ExperimentConfig::staircaseConfig(int start_value) const {
  StaircaseConfig sc;
  sc.start_value = start_value;
  sc.step_sizes = staircase.step_sizes;
  sc.up_count = staircase.n_up;
  sc.down_count = staircase.n_down;
  sc.n_trials = staircase.n_trials;
  sc.step_type = staircase.step_type;
  sc.bounds.min_val = hardware.brightness_min;
  sc.bounds.max_val = hardware.brightness_max;
  sc.apply_initial_rule = staircase.apply_initial_rule;
  return sc;
}

ChannelConfig ExperimentConfig::channelConfig() const {
  ChannelConfig cc;
  cc.connection_spec = hardware.serial_port;
  cc.baud_rate = hardware.baud_rate;
  cc.bounds.min = hardware.brightness_min;
  cc.bounds.max = hardware.brightness_max;
  cc.transport_timeout_s = hardware.serial_timeout_s;
  return cc;
}

// -----------------------------------------------------------------------------
// Validation
// -----------------------------------------------------------------------------

void validateConfig(const ExperimentConfig& cfg) {
  const HardwareConfig& hw = cfg.hardware;
  if (hw.serial_port.empty()) {
    throw ConfigError("serial_port must not be empty");
  }
  if (hw.brightness_min < 0 || hw.brightness_min > 255) {
    throw ConfigError("brightness_min must be 0-255, got " + std::to_string(hw.brightness_min));
  }
  if (hw.brightness_max < 0 || hw.brightness_max > 255) {
    throw ConfigError("brightness_max must be 0-255, got " + std::to_string(hw.brightness_max));
  }
  if (hw.brightness_min >= hw.brightness_max) {
    throw ConfigError("brightness_min must be less than brightness_max");
  }
  if (hw.baud_rate <= 0) {
    throw ConfigError("baud_rate must be positive, got " + std::to_string(hw.baud_rate));
  }
  if (!(hw.serial_timeout_s > 0.0)) {
    throw ConfigError("serial_timeout must be positive");
  }

  const StaircaseSection& sc = cfg.staircase;
  if (sc.start_value < hw.brightness_min || sc.start_value > hw.brightness_max) {
    std::ostringstream msg;
    msg << "start_value " << sc.start_value << " outside brightness range ["
        << hw.brightness_min << ", " << hw.brightness_max << "]";
    throw ConfigError(msg.str());
  }
  if (sc.n_up < 1) {
    throw ConfigError("n_up must be >= 1, got " + std::to_string(sc.n_up));
  }
  if (sc.n_down < 1) {
    throw ConfigError("n_down must be >= 1, got " + std::to_string(sc.n_down));
  }
  if (sc.n_trials < 1) {
    throw ConfigError("n_trials must be >= 1, got " + std::to_string(sc.n_trials));
  }
  if (sc.step_sizes.empty()) {
    throw ConfigError("step_sizes cannot be empty");
  }
  for (int step : sc.step_sizes) {
    if (step < 1) {
      throw ConfigError("all step_sizes must be >= 1");
    }
  }

  const TimingConfig& tm = cfg.timing;
  if (tm.pre_stimulus_delay_s < 0.0) {
    throw ConfigError("pre_stimulus_delay must be >= 0");
  }
  if (!(tm.stimulus_duration_s > 0.0)) {
    throw ConfigError("stimulus_duration must be > 0");
  }
  if (tm.inter_trial_interval_s < 0.0) {
    throw ConfigError("inter_trial_interval must be >= 0");
  }

  if (cfg.data.threshold_reversals < 0) {
    throw ConfigError("threshold_reversals must be >= 0, got " +
                      std::to_string(cfg.data.threshold_reversals));
  }
}

// -----------------------------------------------------------------------------
// Parsing
// -----------------------------------------------------------------------------

namespace {

std::string trim(const std::string& s) {
  const char* ws = " \t\r\n";
  const size_t b = s.find_first_not_of(ws);
  if (b == std::string::npos) {
    return "";
  }
  const size_t e = s.find_last_not_of(ws);
  return s.substr(b, e - b + 1);
}

class LineParser final {
public:
  LineParser(const std::string& origin, int line) : origin_(origin), line_(line) {}

  [[noreturn]] void fail(const std::string& msg) const {
    throw ConfigError(origin_ + ":" + std::to_string(line_) + ": " + msg);
  }

  int toInt(const std::string& key, const std::string& value) const {
    size_t pos = 0;
    long v = 0;
    try {
      v = std::stol(value, &pos);
    } catch (const std::exception&) {
      fail("'" + key + "' expects an integer, got '" + value + "'");
    }
    if (pos != value.size() ||
        v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
      fail("'" + key + "' expects an integer, got '" + value + "'");
    }
    return static_cast<int>(v);
  }

  double toDouble(const std::string& key, const std::string& value) const {
    size_t pos = 0;
    double v = 0.0;
    try {
      v = std::stod(value, &pos);
    } catch (const std::exception&) {
      fail("'" + key + "' expects a number, got '" + value + "'");
    }
    if (pos != value.size()) {
      fail("'" + key + "' expects a number, got '" + value + "'");
    }
    return v;
  }

  bool toBool(const std::string& key, const std::string& value) const {
    if (value == "true" || value == "yes" || value == "on" || value == "1") return true;
    if (value == "false" || value == "no" || value == "off" || value == "0") return false;
    fail("'" + key + "' expects true/false, got '" + value + "'");
  }

  std::vector<int> toIntList(const std::string& key, const std::string& value) const {
    std::vector<int> out;
    if (value.empty()) {
      return out;
    }
    std::istringstream iss(value);
    std::string item;
    while (std::getline(iss, item, ',')) {
      out.push_back(toInt(key, trim(item)));
    }
    return out;
  }

  StepType toStepType(const std::string& value) const {
    try {
      return parseStepType(value);
    } catch (const ConfigError& e) {
      fail(e.what());
    }
  }

private:
  const std::string& origin_;
  int line_;
};

void assign(ExperimentConfig& cfg, const std::string& section, const std::string& key,
            const std::string& value, const LineParser& p) {
  if (section == "hardware") {
    HardwareConfig& hw = cfg.hardware;
    if (key == "serial_port") hw.serial_port = value;
    else if (key == "baud_rate") hw.baud_rate = p.toInt(key, value);
    else if (key == "brightness_min") hw.brightness_min = p.toInt(key, value);
    else if (key == "brightness_max") hw.brightness_max = p.toInt(key, value);
    else if (key == "serial_timeout") hw.serial_timeout_s = p.toDouble(key, value);
    else p.fail("unknown key '" + key + "' in [hardware]");
  } else if (section == "staircase") {
    StaircaseSection& sc = cfg.staircase;
    if (key == "start_value") sc.start_value = p.toInt(key, value);
    else if (key == "step_sizes") sc.step_sizes = p.toIntList(key, value);
    else if (key == "n_up") sc.n_up = p.toInt(key, value);
    else if (key == "n_down") sc.n_down = p.toInt(key, value);
    else if (key == "n_trials") sc.n_trials = p.toInt(key, value);
    else if (key == "step_type") sc.step_type = p.toStepType(value);
    else if (key == "apply_initial_rule") sc.apply_initial_rule = p.toBool(key, value);
    else p.fail("unknown key '" + key + "' in [staircase]");
  } else if (section == "timing") {
    TimingConfig& tm = cfg.timing;
    if (key == "pre_stimulus_delay") tm.pre_stimulus_delay_s = p.toDouble(key, value);
    else if (key == "stimulus_duration") tm.stimulus_duration_s = p.toDouble(key, value);
    else if (key == "inter_trial_interval") tm.inter_trial_interval_s = p.toDouble(key, value);
    else p.fail("unknown key '" + key + "' in [timing]");
  } else if (section == "paths") {
    if (key == "data_directory") cfg.paths.data_directory = value;
    else if (key == "log_directory") cfg.paths.log_directory = value;
    else p.fail("unknown key '" + key + "' in [paths]");
  } else if (section == "data") {
    if (key == "threshold_reversals") cfg.data.threshold_reversals = p.toInt(key, value);
    else if (key == "auto_save") cfg.data.auto_flush = p.toBool(key, value);
    else p.fail("unknown key '" + key + "' in [data]");
  } else if (section.empty()) {
    p.fail("key '" + key + "' outside of any section");
  } else {
    p.fail("unknown section [" + section + "]");
  }
}

} // namespace

ExperimentConfig parseConfig(const std::string& text, const std::string& origin) {
  ExperimentConfig cfg;
  std::istringstream iss(text);
  std::string raw;
  std::string section;
  int line_no = 0;

  while (std::getline(iss, raw)) {
    ++line_no;
    const std::string line = trim(raw);
    if (line.empty() || line[0] == '#' || line[0] == ';') {
      continue;
    }

    LineParser p(origin, line_no);

    if (line.front() == '[') {
      if (line.back() != ']') {
        p.fail("malformed section header '" + line + "'");
      }
      section = trim(line.substr(1, line.size() - 2));
      continue;
    }

    const size_t eq = line.find('=');
    if (eq == std::string::npos) {
      p.fail("expected 'key = value', got '" + line + "'");
    }
    const std::string key = trim(line.substr(0, eq));
    const std::string value = trim(line.substr(eq + 1));
    if (key.empty()) {
      p.fail("missing key before '='");
    }
    assign(cfg, section, key, value, p);
  }

  try {
    validateConfig(cfg);
  } catch (const ConfigError& e) {
    throw ConfigError("Invalid configuration in " + origin + ": " + e.what());
  }
  return cfg;
}

ExperimentConfig loadConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("Cannot read configuration file " + path);
  }
  std::ostringstream buf;
  buf << in.rdbuf();
  ExperimentConfig cfg = parseConfig(buf.str(), path);
  LogLine(LogLevel::Info) << "Loaded configuration from " << path;
  return cfg;
}

ExperimentConfig loadOrCreateConfig(const std::string& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    LogLine(LogLevel::Warn) << "Configuration file not found at " << path << ", writing defaults";
    writeDefaultConfig(path);
  }
  return loadConfig(path);
}

// -----------------------------------------------------------------------------
// Serialization
// -----------------------------------------------------------------------------

std::string formatConfig(const ExperimentConfig& cfg) {
  std::ostringstream out;
  out << "# Light discomfort calibration configuration\n\n";

  out << "[hardware]\n";
  out << "serial_port = " << cfg.hardware.serial_port << "\n";
  out << "baud_rate = " << cfg.hardware.baud_rate << "\n";
  out << "brightness_min = " << cfg.hardware.brightness_min << "\n";
  out << "brightness_max = " << cfg.hardware.brightness_max << "\n";
  out << "serial_timeout = " << cfg.hardware.serial_timeout_s << "\n\n";

  out << "[staircase]\n";
  out << "start_value = " << cfg.staircase.start_value << "\n";
  out << "step_sizes = ";
  for (size_t i = 0; i < cfg.staircase.step_sizes.size(); ++i) {
    if (i > 0) out << ", ";
    out << cfg.staircase.step_sizes[i];
  }
  out << "\n";
  out << "n_up = " << cfg.staircase.n_up << "\n";
  out << "n_down = " << cfg.staircase.n_down << "\n";
  out << "n_trials = " << cfg.staircase.n_trials << "\n";
  out << "step_type = " << stepTypeName(cfg.staircase.step_type) << "\n";
  out << "apply_initial_rule = " << (cfg.staircase.apply_initial_rule ? "true" : "false") << "\n\n";

  out << "[timing]\n";
  out << "pre_stimulus_delay = " << cfg.timing.pre_stimulus_delay_s << "\n";
  out << "stimulus_duration = " << cfg.timing.stimulus_duration_s << "\n";
  out << "inter_trial_interval = " << cfg.timing.inter_trial_interval_s << "\n\n";

  out << "[paths]\n";
  out << "data_directory = " << cfg.paths.data_directory << "\n";
  out << "log_directory = " << cfg.paths.log_directory << "\n\n";

  out << "[data]\n";
  out << "threshold_reversals = " << cfg.data.threshold_reversals << "\n";
  out << "auto_save = " << (cfg.data.auto_flush ? "true" : "false") << "\n";
  return out.str();
}

void writeDefaultConfig(const std::string& path) {
  std::error_code ec;
  const std::filesystem::path parent = std::filesystem::path(path).parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      throw ConfigError("Cannot create configuration directory " + parent.string() + ": " + ec.message());
    }
  }

  std::ofstream out(path);
  if (!out) {
    throw ConfigError("Cannot write configuration file " + path);
  }
  out << formatConfig(ExperimentConfig{});
  out.flush();
  if (!out) {
    throw ConfigError("Failed writing configuration file " + path);
  }
  LogLine(LogLevel::Info) << "Created default configuration file at " << path;
}

// -----------------------------------------------------------------------------
// Paths
// -----------------------------------------------------------------------------

std::string expandPath(const std::string& path) {
  if (path.empty() || path[0] != '~') {
    return path;
  }
  if (path.size() > 1 && path[1] != '/') {
    return path; // ~user is not supported
  }
  const char* home = std::getenv("HOME");
  if (home == nullptr) {
    return path;
  }
  return std::string(home) + path.substr(1);
}

void ensureDirectories(const ExperimentConfig& cfg) {
  for (const std::string& dir : {cfg.paths.data_directory, cfg.paths.log_directory}) {
    const std::string expanded = expandPath(dir);
    std::error_code ec;
    std::filesystem::create_directories(expanded, ec);
    if (ec) {
      throw ConfigError("Cannot create directory " + expanded + ": " + ec.message());
    }
    LogLine(LogLevel::Debug) << "Ensured directory exists: " << expanded;
  }
}

} // namespace photocal
