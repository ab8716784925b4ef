#pragma once

// Run configuration: explicit, auditable policy parameters.
//
// File format (INI style):
//
//   # comment            ; comment
//   [hardware]
//   serial_port = /dev/ttyUSB0
//   [staircase]
//   step_sizes = 32, 16, 8, 4, 2, 1
//
// Unknown sections/keys and malformed values are rejected with the file
// name and line number. Every loaded configuration is validated.

#include "photocal/hardware_channel.hpp"
#include "photocal/staircase.hpp"

#include <string>
#include <vector>

namespace photocal {

struct HardwareConfig final {
  std::string serial_port = "/dev/ttyUSB0";
  int baud_rate = 9600;
  int brightness_min = 0;
  int brightness_max = 255;
  double serial_timeout_s = 1.0;
};

struct StaircaseSection final {
  int start_value = 128;
  std::vector<int> step_sizes{32, 16, 8, 4, 2, 1};
  int n_up = 1;
  int n_down = 3;
  int n_trials = 30;
  StepType step_type = StepType::Linear;
  bool apply_initial_rule = false;
};

struct TimingConfig final {
  double pre_stimulus_delay_s = 6.0;
  double stimulus_duration_s = 2.0;
  double inter_trial_interval_s = 6.0;  // also the response window
};

struct PathsConfig final {
  std::string data_directory = "~/Calibration/data";
  std::string log_directory = "~/Calibration/logs";
};

struct DataConfig final {
  int threshold_reversals = 6;  // 0 = average all reversals
  bool auto_flush = true;
};

struct ExperimentConfig final {
  HardwareConfig hardware;
  StaircaseSection staircase;
  TimingConfig timing;
  PathsConfig paths;
  DataConfig data;

  // Staircase parameters; bounds come from the hardware brightness range.
  StaircaseConfig staircaseConfig() const;
  StaircaseConfig staircaseConfig(int start_value) const;

  ChannelConfig channelConfig() const;
};

// Throws ConfigError describing the first invalid value.
void validateConfig(const ExperimentConfig& cfg);

// Parse configuration text; `origin` names the source in error messages.
ExperimentConfig parseConfig(const std::string& text, const std::string& origin = "<config>");
ExperimentConfig loadConfig(const std::string& path);

// Loads `path`, first writing the defaults there if it does not exist.
ExperimentConfig loadOrCreateConfig(const std::string& path);

std::string formatConfig(const ExperimentConfig& cfg);
void writeDefaultConfig(const std::string& path);

// "~" → $HOME
std::string expandPath(const std::string& path);

// Create the data and log directories.
void ensureDirectories(const ExperimentConfig& cfg);

} // namespace photocal
