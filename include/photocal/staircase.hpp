#pragma once

// Adaptive staircase (n-up / m-down) for discomfort threshold estimation.
//
// PRINCIPLES:
// 1. Determinism: identical response sequences → identical intensities
// 2. Inspectability: every step and reversal is explicit and logged
// 3. Bounded: intensity never leaves [min_val, max_val]
// 4. Pure decision logic: never touches hardware
//
// Response encoding:
//   recordResponse(true)  → the response supports INCREASING intensity
//   recordResponse(false) → the response supports DECREASING intensity
// The trial controller maps "comfortable" → true and "uncomfortable" → false,
// so up_count comfortable reports raise the level and down_count
// uncomfortable reports lower it.

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace photocal {

enum class Direction : uint8_t {
  Undefined = 0,
  Increase = 1,
  Decrease = 2
};

// How a step magnitude is applied to the current intensity.
enum class StepType : uint8_t {
  Linear = 0,  // "lin": I ± step
  Log = 1,     // "log": I · 10^(±step)
  Decibel = 2  // "db":  I · 10^(±step/20)
};

const char* stepTypeName(StepType t);
// Throws ConfigError for anything but "lin", "log" or "db".
StepType parseStepType(const std::string& name);

// Inclusive soft bounds for intensities.
struct IntensityBounds final {
  int min_val = 0;
  int max_val = 255;

  int clamp(int v) const { return v < min_val ? min_val : (v > max_val ? max_val : v); }
  double clamp(double v) const {
    return v < min_val ? static_cast<double>(min_val) : (v > max_val ? static_cast<double>(max_val) : v);
  }
  bool contains(int v) const { return v >= min_val && v <= max_val; }
};

// Ordered, shrinking step magnitudes. The index only moves forward and
// saturates at the smallest (last) step.
class StepSchedule final {
public:
  StepSchedule() = default;
  explicit StepSchedule(std::vector<int> steps) : steps_(std::move(steps)) {}

  const std::vector<int>& steps() const { return steps_; }
  bool empty() const { return steps_.empty(); }
  size_t size() const { return steps_.size(); }

  int current() const { return steps_[index_]; }
  size_t index() const { return index_; }

  // Advance to the next (smaller) step; no-op on the last one.
  void advance() {
    if (index_ + 1 < steps_.size()) ++index_;
  }

private:
  std::vector<int> steps_;
  size_t index_ = 0;
};

// Strategy applying one step of a given magnitude in a direction.
// Implementations must be monotonic in the step magnitude. Works on the
// unrounded intensity so small multiplicative steps accumulate.
class StepScaling {
public:
  virtual ~StepScaling() = default;
  virtual double apply(double intensity, int step, Direction dir) const = 0;
  virtual StepType type() const = 0;
};

std::unique_ptr<StepScaling> makeStepScaling(StepType type);

// Static parameters of one staircase run. Explicit and auditable.
struct StaircaseConfig final {
  int start_value = 128;
  std::vector<int> step_sizes{32, 16, 8, 4, 2, 1};
  int up_count = 1;    // comfortable runs before an increase
  int down_count = 3;  // uncomfortable runs before a decrease
  int n_trials = 30;   // minimum number of trials
  StepType step_type = StepType::Linear;
  IntensityBounds bounds{};
  bool apply_initial_rule = false;  // 1-up/1-down until the first reversal
};

// Terminal snapshot of a run (persisted by the trial logger).
struct StaircaseSummary final {
  int trials_completed = 0;
  std::vector<int> reversal_intensities;
  std::optional<double> threshold;
  bool finished = false;
  int start_value = 0;
  int min_val = 0;
  int max_val = 0;
};

class AdaptiveStaircaseEngine final {
public:
  // Validates the configuration; throws ConfigError when:
  // - step_sizes is empty or any step < 1
  // - up_count < 1, down_count < 1 or n_trials < 1
  // - min_val >= max_val or start_value outside [min_val, max_val]
  explicit AdaptiveStaircaseEngine(const StaircaseConfig& cfg);

  // Level for the next trial, or nothing once the run is finished.
  // Must be called exactly once before each recordResponse().
  std::optional<int> nextLevel();

  // Feed back one response (see encoding above). Throws StateError if no
  // level is pending.
  void recordResponse(bool positive);

  int reversalCount() const { return static_cast<int>(reversals_.size()); }

  // Mean of the last `last_n` reversal intensities (all of them when
  // last_n == 0 or fewer exist). Nothing when no reversal happened yet.
  std::optional<double> estimateThreshold(int last_n) const;

  bool isFinished() const { return finished_; }

  // Level presented next: the internal intensity rounded and clamped.
  int currentIntensity() const;
  double exactIntensity() const { return intensity_; }
  size_t stepIndex() const { return schedule_.index(); }
  int trialsCompleted() const { return trials_completed_; }
  const std::vector<int>& reversalIntensities() const { return reversals_; }
  Direction lastDirection() const { return last_direction_; }
  int runLength() const { return run_length_; }
  const StaircaseConfig& config() const { return cfg_; }

  StaircaseSummary summary(int last_n) const;

private:
  StaircaseConfig cfg_;
  std::unique_ptr<StepScaling> scaling_;
  StepSchedule schedule_;

  double intensity_ = 0.0;  // unrounded, always within the bounds
  Direction last_direction_ = Direction::Undefined;
  Direction run_direction_ = Direction::Undefined;
  int run_length_ = 0;
  std::vector<int> reversals_;
  int trials_completed_ = 0;
  bool finished_ = false;
  bool level_pending_ = false;

  static void validate(const StaircaseConfig& cfg);
};

} // namespace photocal
