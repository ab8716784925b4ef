#pragma once

// Trial sequencing around the two core components.
//
// Per trial, strictly in this order:
//   engine.nextLevel() → channel.setLevel(level) → stimulus window →
//   channel.setLevel(0) → UI response → trial record → engine.recordResponse()
//
// The controller owns none of its collaborators. Any exception (operator
// abort, transport failure, logging failure) closes the channel before it
// propagates.

#include "photocal/config.hpp"
#include "photocal/hardware_channel.hpp"
#include "photocal/staircase.hpp"
#include "photocal/trial_logger.hpp"

#include <string>

namespace photocal {

struct TrialInfo final {
  int trial_number = 0;
  int total_trials = 0;
  int level = 0;
  int reversals = 0;
};

// Operator/subject facing collaborator. Any call may throw AbortRequested.
class ExperimentUI {
public:
  virtual ~ExperimentUI() = default;

  // Operator briefing before the first trial; returns once the operator
  // is ready to begin.
  virtual void showInstructions(const std::string& participant_id, const std::string& session_id) = 0;

  virtual void showTrialInfo(const TrialInfo& info) = 0;
  virtual void countdown(double seconds, const std::string& label) = 0;

  // Blocks for the stimulus window while the actuator is at `level`.
  virtual void presentStimulus(int level, double seconds) = 0;

  // True when the subject reported discomfort within the window.
  virtual bool collectResponse(int trial_number, double timeout_s) = 0;

  virtual void showCompletion(const StaircaseSummary& summary) = 0;
  virtual void showAbort(const std::string& message) = 0;
};

class TrialController final {
public:
  TrialController(AdaptiveStaircaseEngine& engine, SafeHardwareChannel& channel,
                  ExperimentUI& ui, TrialSink& sink,
                  TimingConfig timing, int threshold_reversals);

  // Opens the sink and the channel, runs trials until the staircase is
  // finished and returns the terminal snapshot. Rethrows any failure after
  // the channel has been closed.
  StaircaseSummary run(const ChannelConfig& channel_cfg);

  // Shows the session instructions first; an abort there leaves the sink
  // and the channel untouched.
  StaircaseSummary run(const ChannelConfig& channel_cfg, const SessionInfo& session);

  // One trial at `level`; returns the uncomfortable flag.
  bool runTrial(int trial_number, int level);

private:
  AdaptiveStaircaseEngine& engine_;
  SafeHardwareChannel& channel_;
  ExperimentUI& ui_;
  TrialSink& sink_;
  TimingConfig timing_;
  int threshold_reversals_;

  void closeSink() noexcept;
};

} // namespace photocal
