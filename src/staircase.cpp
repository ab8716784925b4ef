// Deterministic adaptive staircase: intensity selection, reversal detection
// and threshold estimation.

#include "photocal/staircase.hpp"

#include "photocal/errors.hpp"
#include "photocal/log.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <numeric>
#include <sstream>

namespace photocal {

// ============================================================================
// Step type names
// ============================================================================
const char* stepTypeName(StepType t) {
  switch (t) {
    case StepType::Linear: return "lin";
    case StepType::Log: return "log";
    case StepType::Decibel: return "db";
    default: return "unknown";
  }
}

StepType parseStepType(const std::string& name) {
  if (name == "lin") return StepType::Linear;
  if (name == "log") return StepType::Log;
  if (name == "db") return StepType::Decibel;
  throw ConfigError("step_type must be 'lin', 'log' or 'db', got '" + name + "'");
}

// ============================================================================
// Step scaling strategies
// ============================================================================
namespace {

class LinearStepScaling final : public StepScaling {
public:
  double apply(double intensity, int step, Direction dir) const override {
    if (dir == Direction::Increase) return intensity + step;
    if (dir == Direction::Decrease) return intensity - step;
    return intensity;
  }
  StepType type() const override { return StepType::Linear; }
};

// Multiplicative steps: I' = I · 10^(±step / divisor).
// Increases start from at least 1 so a dark (near zero) level can climb;
// decreases of a non-positive level stay put.
class MultiplicativeStepScaling final : public StepScaling {
public:
  MultiplicativeStepScaling(StepType type, double divisor) : type_(type), divisor_(divisor) {}

  double apply(double intensity, int step, Direction dir) const override {
    if (dir == Direction::Undefined) return intensity;

    const double factor = std::pow(10.0, static_cast<double>(step) / divisor_);
    if (dir == Direction::Decrease) {
      return intensity > 0.0 ? intensity / factor : intensity;
    }

    // Finite even for huge steps; the engine clamps to the real bounds.
    constexpr double kLimit = 1.0e9;
    const double next = std::max(intensity, 1.0) * factor;
    return std::isfinite(next) ? std::min(next, kLimit) : kLimit;
  }
  StepType type() const override { return type_; }

private:
  StepType type_;
  double divisor_;
};

const char* directionName(Direction d) {
  switch (d) {
    case Direction::Increase: return "up";
    case Direction::Decrease: return "down";
    default: return "none";
  }
}

} // namespace

std::unique_ptr<StepScaling> makeStepScaling(StepType type) {
  switch (type) {
    case StepType::Log:
      return std::make_unique<MultiplicativeStepScaling>(StepType::Log, 1.0);
    case StepType::Decibel:
      return std::make_unique<MultiplicativeStepScaling>(StepType::Decibel, 20.0);
    case StepType::Linear:
    default:
      return std::make_unique<LinearStepScaling>();
  }
}

// ============================================================================
// Construction / validation
// ============================================================================
void AdaptiveStaircaseEngine::validate(const StaircaseConfig& cfg) {
  if (cfg.step_sizes.empty()) {
    throw ConfigError("step_sizes cannot be empty");
  }
  for (int step : cfg.step_sizes) {
    if (step < 1) {
      throw ConfigError("all step_sizes must be >= 1, got " + std::to_string(step));
    }
  }
  if (cfg.up_count < 1) {
    throw ConfigError("n_up must be >= 1, got " + std::to_string(cfg.up_count));
  }
  if (cfg.down_count < 1) {
    throw ConfigError("n_down must be >= 1, got " + std::to_string(cfg.down_count));
  }
  if (cfg.n_trials < 1) {
    throw ConfigError("n_trials must be >= 1, got " + std::to_string(cfg.n_trials));
  }
  if (cfg.bounds.min_val >= cfg.bounds.max_val) {
    throw ConfigError("min_val must be less than max_val");
  }
  if (!cfg.bounds.contains(cfg.start_value)) {
    std::ostringstream msg;
    msg << "start_value " << cfg.start_value << " outside range ["
        << cfg.bounds.min_val << ", " << cfg.bounds.max_val << "]";
    throw ConfigError(msg.str());
  }
}

AdaptiveStaircaseEngine::AdaptiveStaircaseEngine(const StaircaseConfig& cfg)
    : cfg_(cfg)
{
  validate(cfg_);

  scaling_ = makeStepScaling(cfg_.step_type);
  schedule_ = StepSchedule(cfg_.step_sizes);
  intensity_ = static_cast<double>(cfg_.start_value);

  LogLine(LogLevel::Info) << "Staircase initialized: start=" << cfg_.start_value
                          << ", " << cfg_.up_count << "-up/" << cfg_.down_count << "-down"
                          << ", steps=" << cfg_.step_sizes.size() << " (" << stepTypeName(cfg_.step_type) << ")"
                          << ", range=[" << cfg_.bounds.min_val << ", " << cfg_.bounds.max_val << "]"
                          << ", trials=" << cfg_.n_trials
                          << (cfg_.apply_initial_rule ? ", initial 1-up/1-down" : "");
}

// ============================================================================
// Trial sequencing
// ============================================================================
std::optional<int> AdaptiveStaircaseEngine::nextLevel() {
  if (finished_) {
    return std::nullopt;
  }
  level_pending_ = true;
  return currentIntensity();
}

int AdaptiveStaircaseEngine::currentIntensity() const {
  return cfg_.bounds.clamp(static_cast<int>(std::lround(intensity_)));
}

void AdaptiveStaircaseEngine::recordResponse(bool positive) {
  if (!level_pending_) {
    throw StateError(finished_ ? "staircase already finished"
                               : "recordResponse() called without a pending nextLevel()");
  }
  level_pending_ = false;

  // ------------------------------------------------------------------------
  // Step 1: Active rule (forced 1-up/1-down before the first reversal)
  // ------------------------------------------------------------------------
  const bool initial_rule = cfg_.apply_initial_rule && reversals_.empty();
  const int up_needed = initial_rule ? 1 : cfg_.up_count;
  const int down_needed = initial_rule ? 1 : cfg_.down_count;

  // ------------------------------------------------------------------------
  // Step 2: Run length in the direction this response supports
  // ------------------------------------------------------------------------
  const Direction dir = positive ? Direction::Increase : Direction::Decrease;
  if (run_direction_ == dir) {
    ++run_length_;
  } else {
    run_direction_ = dir;
    run_length_ = 1;
  }

  // ------------------------------------------------------------------------
  // Steps 3-5: Step, reversal bookkeeping, last direction
  // ------------------------------------------------------------------------
  const int needed = (dir == Direction::Increase) ? up_needed : down_needed;
  if (run_length_ >= needed) {
    // Reversals record the level that was actually presented.
    const int pre_step = currentIntensity();
    const int step = schedule_.current();

    intensity_ = cfg_.bounds.clamp(scaling_->apply(intensity_, step, dir));
    run_length_ = 0;

    if (last_direction_ != Direction::Undefined && last_direction_ != dir) {
      reversals_.push_back(pre_step);
      schedule_.advance();
      LogLine(LogLevel::Info) << "Reversal #" << reversals_.size() << " at " << pre_step
                              << " (step index now " << schedule_.index() << ")";
    }
    last_direction_ = dir;

    LogLine(LogLevel::Debug) << "Step " << directionName(dir) << " by " << step << ": "
                             << pre_step << " -> " << currentIntensity();
  }

  // ------------------------------------------------------------------------
  // Step 6: Trial accounting (finished never reverts)
  // ------------------------------------------------------------------------
  ++trials_completed_;
  if (trials_completed_ >= cfg_.n_trials) {
    finished_ = true;
  }
}

// ============================================================================
// Threshold estimation
// ============================================================================
std::optional<double> AdaptiveStaircaseEngine::estimateThreshold(int last_n) const {
  if (reversals_.empty()) {
    return std::nullopt;
  }

  auto first = reversals_.begin();
  if (last_n > 0 && static_cast<size_t>(last_n) < reversals_.size()) {
    first = reversals_.end() - last_n;
  }

  const double sum = std::accumulate(first, reversals_.end(), 0.0);
  return sum / static_cast<double>(std::distance(first, reversals_.end()));
}

StaircaseSummary AdaptiveStaircaseEngine::summary(int last_n) const {
  StaircaseSummary s;
  s.trials_completed = trials_completed_;
  s.reversal_intensities = reversals_;
  s.threshold = estimateThreshold(last_n);
  s.finished = finished_;
  s.start_value = cfg_.start_value;
  s.min_val = cfg_.bounds.min_val;
  s.max_val = cfg_.bounds.max_val;
  return s;
}

} // namespace photocal
