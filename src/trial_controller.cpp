#include "photocal/trial_controller.hpp"

#include "photocal/errors.hpp"
#include "photocal/log.hpp"

#include <iomanip>

namespace photocal {

TrialController::TrialController(AdaptiveStaircaseEngine& engine, SafeHardwareChannel& channel,
                                 ExperimentUI& ui, TrialSink& sink,
                                 TimingConfig timing, int threshold_reversals)
    : engine_(engine)
    , channel_(channel)
    , ui_(ui)
    , sink_(sink)
    , timing_(timing)
    , threshold_reversals_(threshold_reversals)
{}

// ============================================================================
// Single trial
// ============================================================================
bool TrialController::runTrial(int trial_number, int level) {
  TrialInfo info;
  info.trial_number = trial_number;
  info.total_trials = engine_.config().n_trials;
  info.level = level;
  info.reversals = engine_.reversalCount();
  ui_.showTrialInfo(info);

  ui_.countdown(timing_.pre_stimulus_delay_s, "Stimulus in");

  LogLine(LogLevel::Info) << "Trial " << trial_number << ": setting actuator to " << level;
  channel_.setLevel(level);

  ui_.presentStimulus(level, timing_.stimulus_duration_s);

  LogLine(LogLevel::Info) << "Trial " << trial_number << ": turning actuator off";
  channel_.setLevel(0);

  // Response window doubles as the inter-trial interval
  const bool uncomfortable = ui_.collectResponse(trial_number, timing_.inter_trial_interval_s);

  // Persist before the staircase moves on
  TrialRecord record;
  record.trial_number = trial_number;
  record.level = level;
  record.uncomfortable = uncomfortable;
  record.reversals_so_far = engine_.reversalCount();
  sink_.logTrial(record);

  // Comfortable supports going up, uncomfortable supports going down
  engine_.recordResponse(!uncomfortable);

  LogLine(LogLevel::Info) << "Trial " << trial_number << ": response="
                          << (uncomfortable ? "uncomfortable" : "comfortable")
                          << " (reversals: " << engine_.reversalCount() << ")";
  return uncomfortable;
}

// ============================================================================
// Full run
// ============================================================================
StaircaseSummary TrialController::run(const ChannelConfig& channel_cfg) {
  sink_.open();

  try {
    channel_.open(channel_cfg);

    int trial_number = 0;
    while (const auto level = engine_.nextLevel()) {
      ++trial_number;
      runTrial(trial_number, *level);
    }

    // De-energize and release before anything else can fail
    channel_.close();
    LogLine(LogLevel::Info) << "Run completed after " << engine_.trialsCompleted() << " trials";

    const StaircaseSummary summary = engine_.summary(threshold_reversals_);
    if (summary.threshold) {
      LogLine(LogLevel::Info) << "Threshold estimate: " << std::fixed << std::setprecision(2)
                              << *summary.threshold << " from " << summary.reversal_intensities.size()
                              << " reversals";
    } else {
      LogLine(LogLevel::Warn) << "No reversals recorded, no threshold estimate";
    }

    sink_.writeFinalResults(summary);
    sink_.close();
    ui_.showCompletion(summary);
    return summary;

  } catch (const AbortRequested& e) {
    channel_.close();
    LogLine(LogLevel::Warn) << "Run aborted by operator: " << e.what();
    try {
      sink_.markAborted();
    } catch (const std::exception& le) {
      LogLine(LogLevel::Error) << "Failed to mark run as aborted: " << le.what();
    }
    closeSink();
    ui_.showAbort("Experiment aborted");
    throw;

  } catch (const std::exception& e) {
    channel_.close();
    LogLine(LogLevel::Error) << "Run failed: " << e.what();
    closeSink();
    throw;
  }
}

StaircaseSummary TrialController::run(const ChannelConfig& channel_cfg, const SessionInfo& session) {
  try {
    ui_.showInstructions(session.participant_id, session.session_id);
  } catch (const AbortRequested& e) {
    LogLine(LogLevel::Warn) << "Run aborted before the first trial: " << e.what();
    throw;
  }
  return run(channel_cfg);
}

void TrialController::closeSink() noexcept {
  try {
    sink_.close();
  } catch (const std::exception& e) {
    LogLine(LogLevel::Error) << "Failed to close trial log: " << e.what();
  }
}

} // namespace photocal
