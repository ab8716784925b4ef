#include "photocal/errors.hpp"
#include "photocal/hardware_channel.hpp"
#include "photocal/shutdown_guard.hpp"
#include "photocal/staircase.hpp"
#include "photocal/trial_controller.hpp"
#include "photocal/trial_logger.hpp"

#include "test_support.hpp"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <vector>

using namespace photocal;
using photocal_test::LogCapture;
using photocal_test::WireLog;
using photocal_test::makeChannelConfig;
using photocal_test::recordingFactory;
using photocal_test::throws;

// -----------------------------------------------------------------------------
// Test doubles
// -----------------------------------------------------------------------------

// Subject with a fixed discomfort threshold; records what it was shown and
// the actuator state at each step.
class SimulatedSubject final : public ExperimentUI {
public:
  SimulatedSubject(const SafeHardwareChannel& channel, int threshold)
      : channel_(channel), threshold_(threshold) {}

  void showInstructions(const std::string& participant_id, const std::string& session_id) override {
    calls.push_back("instructions");
    briefed = participant_id + "/" + session_id;
    assert(!channel_.isOpen());
    if (abort_at_instructions) {
      throw AbortRequested();
    }
  }

  void showTrialInfo(const TrialInfo& info) override {
    infos.push_back(info);
    calls.push_back("info");
  }

  void countdown(double, const std::string&) override {
    calls.push_back("countdown");
    // The actuator is off between stimuli
    assert(channel_.currentLevel() == 0);
  }

  void presentStimulus(int level, double seconds) override {
    calls.push_back("stimulus");
    presented.push_back(level);
    stimulus_seconds = seconds;
    levels_during_stimulus.push_back(channel_.currentLevel());

    const int trial = static_cast<int>(presented.size());
    if (trial == abort_at_trial) {
      throw AbortRequested();
    }
    if (trial == fail_wire_at_trial) {
      wire->fail_next = 1;  // the following setLevel(0) fails
    }
  }

  bool collectResponse(int trial_number, double timeout_s) override {
    calls.push_back("response");
    response_timeout = timeout_s;
    levels_during_response.push_back(channel_.currentLevel());
    assert(trial_number == static_cast<int>(presented.size()));
    return presented.back() >= threshold_;
  }

  void showCompletion(const StaircaseSummary&) override { completed = true; }
  void showAbort(const std::string& message) override { abort_message = message; }

  std::vector<TrialInfo> infos;
  std::vector<std::string> calls;
  std::vector<int> presented;
  std::vector<int> levels_during_stimulus;
  std::vector<int> levels_during_response;
  double stimulus_seconds = 0.0;
  double response_timeout = 0.0;
  bool completed = false;
  std::string abort_message;
  std::string briefed;

  bool abort_at_instructions = false;
  int abort_at_trial = 0;
  int fail_wire_at_trial = 0;
  std::shared_ptr<WireLog> wire;

private:
  const SafeHardwareChannel& channel_;
  int threshold_;
};

class MemorySink final : public TrialSink {
public:
  void open() override { opened = true; }

  void logTrial(const TrialRecord& record) override {
    if (static_cast<int>(records.size()) + 1 == fail_at_trial) {
      throw std::runtime_error("disk full");
    }
    records.push_back(record);
  }

  void markAborted() override { aborted = true; }
  void writeFinalResults(const StaircaseSummary& s) override { summary = s; }
  void close() override { closed = true; }

  std::vector<TrialRecord> records;
  bool opened = false;
  bool aborted = false;
  bool closed = false;
  std::optional<StaircaseSummary> summary;
  int fail_at_trial = 0;
};

static StaircaseConfig make_staircase(int n_trials, int down = 1) {
  StaircaseConfig cfg;
  cfg.start_value = 128;
  cfg.step_sizes = {32, 16, 8, 4, 2, 1};
  cfg.up_count = 1;
  cfg.down_count = down;
  cfg.n_trials = n_trials;
  return cfg;
}

static TimingConfig fast_timing() {
  TimingConfig t;
  t.pre_stimulus_delay_s = 0.0;
  t.stimulus_duration_s = 0.01;
  t.inter_trial_interval_s = 0.02;
  return t;
}

// Every non-zero command is followed by an explicit zero.
static void check_zero_after_every_stimulus(const std::vector<std::string>& commands) {
  assert(!commands.empty());
  assert(commands.front() == "0\n");
  assert(commands.back() == "0\n");
  for (size_t i = 0; i < commands.size(); ++i) {
    if (commands[i] != "0\n") {
      assert(i + 1 < commands.size());
      assert(commands[i + 1] == "0\n");
    }
  }
}

// -----------------------------------------------------------------------------
// Test 1: Full run converges on the subject's threshold
// -----------------------------------------------------------------------------
static void test_full_run_converges() {
  auto wire = std::make_shared<WireLog>();
  SafeHardwareChannel channel(recordingFactory(wire));
  AdaptiveStaircaseEngine engine(make_staircase(40));
  SimulatedSubject ui(channel, 100);
  MemorySink sink;

  TrialController controller(engine, channel, ui, sink, fast_timing(), 6);
  const StaircaseSummary summary = controller.run(makeChannelConfig());

  assert(summary.finished);
  assert(summary.trials_completed == 40);
  assert(summary.threshold.has_value());
  assert(std::fabs(*summary.threshold - 99.5) <= 1.0);

  // Channel closed and zeroed, guard disarmed
  assert(!channel.isOpen());
  assert(channel.currentLevel() == 0);
  assert(shutdown_guard::armed() == nullptr);

  // Wire: open zero, (level, zero) per trial, close zero
  assert(wire->commands.size() == 1 + 2 * 40 + 1);
  check_zero_after_every_stimulus(wire->commands);

  // Sink lifecycle
  assert(sink.opened && sink.closed && !sink.aborted);
  assert(sink.records.size() == 40);
  assert(sink.summary.has_value());
  assert(sink.summary->trials_completed == 40);
  assert(ui.completed);
  assert(ui.abort_message.empty());
}

// -----------------------------------------------------------------------------
// Test 2: Per-trial ordering and records
// -----------------------------------------------------------------------------
static void test_trial_sequence() {
  auto wire = std::make_shared<WireLog>();
  SafeHardwareChannel channel(recordingFactory(wire));
  AdaptiveStaircaseEngine engine(make_staircase(6));
  SimulatedSubject ui(channel, 140);
  MemorySink sink;

  const TimingConfig timing = fast_timing();
  TrialController controller(engine, channel, ui, sink, timing, 0);
  controller.run(makeChannelConfig());

  // UI call order per trial
  assert(ui.calls.size() == 6 * 4);
  for (size_t t = 0; t < 6; ++t) {
    assert(ui.calls[4 * t] == "info");
    assert(ui.calls[4 * t + 1] == "countdown");
    assert(ui.calls[4 * t + 2] == "stimulus");
    assert(ui.calls[4 * t + 3] == "response");
  }

  // Actuator on during the stimulus, off for the response
  assert(ui.levels_during_stimulus == ui.presented);
  for (int level : ui.levels_during_response) {
    assert(level == 0);
  }
  assert(ui.stimulus_seconds == timing.stimulus_duration_s);
  assert(ui.response_timeout == timing.inter_trial_interval_s);

  // Records match what was presented; reversal counts are pre-response
  assert(sink.records.size() == 6);
  int prev_reversals = 0;
  for (size_t i = 0; i < sink.records.size(); ++i) {
    const TrialRecord& r = sink.records[i];
    assert(r.trial_number == static_cast<int>(i) + 1);
    assert(r.level == ui.presented[i]);
    assert(r.uncomfortable == (r.level >= 140));
    assert(r.reversals_so_far >= prev_reversals);
    assert(r.reversals_so_far == ui.infos[i].reversals);
    assert(ui.infos[i].total_trials == 6);
    prev_reversals = r.reversals_so_far;
  }
  assert(sink.records[0].reversals_so_far == 0);

  // Comfortable at 128 → up to 160; uncomfortable at 160 → down to 128
  assert(ui.presented[0] == 128);
  assert(ui.presented[1] == 160);
  assert(ui.presented[2] == 128);
}

// -----------------------------------------------------------------------------
// Test 3: Operator abort during the stimulus zeroes and propagates
// -----------------------------------------------------------------------------
static void test_abort_during_stimulus() {
  auto wire = std::make_shared<WireLog>();
  SafeHardwareChannel channel(recordingFactory(wire));
  AdaptiveStaircaseEngine engine(make_staircase(20));
  SimulatedSubject ui(channel, 100);
  ui.abort_at_trial = 3;
  MemorySink sink;

  TrialController controller(engine, channel, ui, sink, fast_timing(), 6);
  assert(throws<AbortRequested>([&] { controller.run(makeChannelConfig()); }));

  assert(!channel.isOpen());
  assert(channel.currentLevel() == 0);
  assert(shutdown_guard::armed() == nullptr);

  // Level for trial 3 went out, then the forced zero
  assert(wire->commands.size() == 1 + 2 * 2 + 2);
  assert(wire->commands[5] == std::to_string(ui.presented[2]) + "\n");
  assert(wire->last() == "0\n");

  assert(sink.records.size() == 2);
  assert(sink.aborted);
  assert(sink.closed);
  assert(!sink.summary.has_value());
  assert(!ui.abort_message.empty());
  assert(!ui.completed);
  assert(engine.trialsCompleted() == 2);
}

// -----------------------------------------------------------------------------
// Test 4: A failed off command stops the run and still zeroes on close
// -----------------------------------------------------------------------------
static void test_transport_failure_stops_run() {
  LogCapture capture(LogLevel::Error);
  auto wire = std::make_shared<WireLog>();
  SafeHardwareChannel channel(recordingFactory(wire));
  AdaptiveStaircaseEngine engine(make_staircase(20));
  SimulatedSubject ui(channel, 100);
  ui.fail_wire_at_trial = 2;
  ui.wire = wire;
  MemorySink sink;

  TrialController controller(engine, channel, ui, sink, fast_timing(), 6);
  assert(throws<TransportError>([&] { controller.run(makeChannelConfig()); }));

  assert(!channel.isOpen());
  assert(channel.currentLevel() == 0);
  assert(wire->last() == "0\n");
  assert(wire->releases == 1);

  // Trial 2 never got a response or a record
  assert(sink.records.size() == 1);
  assert(!sink.aborted);
  assert(sink.closed);
  assert(engine.trialsCompleted() == 1);
  assert(capture.contains("Run failed"));
}

// -----------------------------------------------------------------------------
// Test 5: A failing trial sink stops the run with the actuator off
// -----------------------------------------------------------------------------
static void test_sink_failure_stops_run() {
  LogCapture capture(LogLevel::Error);
  auto wire = std::make_shared<WireLog>();
  SafeHardwareChannel channel(recordingFactory(wire));
  AdaptiveStaircaseEngine engine(make_staircase(20));
  SimulatedSubject ui(channel, 100);
  MemorySink sink;
  sink.fail_at_trial = 3;

  TrialController controller(engine, channel, ui, sink, fast_timing(), 6);
  assert(throws<std::runtime_error>([&] { controller.run(makeChannelConfig()); }));

  assert(!channel.isOpen());
  assert(wire->last() == "0\n");
  assert(sink.records.size() == 2);
  assert(sink.closed);
  // The failed trial's response was not applied
  assert(engine.trialsCompleted() == 2);
}

// -----------------------------------------------------------------------------
// Test 6: Connection failure leaves nothing energized
// -----------------------------------------------------------------------------
static void test_connection_failure() {
  LogCapture capture(LogLevel::Error);
  auto wire = std::make_shared<WireLog>();
  wire->fail_all = true;
  SafeHardwareChannel channel(recordingFactory(wire));
  AdaptiveStaircaseEngine engine(make_staircase(5));
  SimulatedSubject ui(channel, 100);
  MemorySink sink;

  TrialController controller(engine, channel, ui, sink, fast_timing(), 6);
  assert(throws<ConnectionError>([&] { controller.run(makeChannelConfig()); }));

  assert(!channel.isOpen());
  assert(ui.presented.empty());
  assert(sink.opened && sink.closed);
  assert(engine.trialsCompleted() == 0);
}

// -----------------------------------------------------------------------------
// Test 7: End to end with the CSV trial logger
// -----------------------------------------------------------------------------
static void test_run_with_csv_logger() {
  char tmpl[] = "/tmp/photocal_run_XXXXXX";
  const char* dir_c = ::mkdtemp(tmpl);
  assert(dir_c != nullptr);
  const std::string dir = dir_c;

  auto wire = std::make_shared<WireLog>();
  SafeHardwareChannel channel(recordingFactory(wire));
  AdaptiveStaircaseEngine engine(make_staircase(12, 3));
  SimulatedSubject ui(channel, 90);

  SessionInfo session;
  session.participant_id = "P07";
  session.session_id = "S2";
  session.starting_intensity = 128;
  session.timestamp = "20240315_093000";
  CsvTrialLogger logger(dir, session);

  TrialController controller(engine, channel, ui, logger, fast_timing(), 0);
  const StaircaseSummary summary = controller.run(makeChannelConfig());
  assert(!logger.isOpen());

  std::ifstream csv(logger.csvPath());
  std::string line;
  int rows = -1;  // header
  while (std::getline(csv, line)) {
    ++rows;
  }
  assert(rows == 12);

  std::ifstream meta(logger.metaPath());
  std::string meta_text((std::istreambuf_iterator<char>(meta)), std::istreambuf_iterator<char>());
  assert(meta_text.find("total_trials: 12") != std::string::npos);
  assert(meta_text.find("aborted: false") != std::string::npos);
  assert(std::filesystem::exists(logger.summaryPath()));
  assert(summary.trials_completed == 12);

  std::filesystem::remove_all(dir);
}

// -----------------------------------------------------------------------------
// Test 8: Instructions come before anything is opened
// -----------------------------------------------------------------------------
static void test_instructions_before_first_trial() {
  SessionInfo session;
  session.participant_id = "P03";
  session.session_id = "S1";

  auto wire = std::make_shared<WireLog>();
  SafeHardwareChannel channel(recordingFactory(wire));
  AdaptiveStaircaseEngine engine(make_staircase(3));
  SimulatedSubject ui(channel, 100);
  MemorySink sink;

  TrialController controller(engine, channel, ui, sink, fast_timing(), 0);
  const StaircaseSummary summary = controller.run(makeChannelConfig(), session);
  assert(summary.trials_completed == 3);
  assert(ui.briefed == "P03/S1");
  assert(ui.calls.front() == "instructions");
  assert(ui.calls[1] == "info");
  assert(std::count(ui.calls.begin(), ui.calls.end(), "instructions") == 1);

  // Aborting at the briefing touches neither the sink nor the actuator
  auto idle_wire = std::make_shared<WireLog>();
  SafeHardwareChannel idle_channel(recordingFactory(idle_wire));
  AdaptiveStaircaseEngine idle_engine(make_staircase(3));
  SimulatedSubject quitter(idle_channel, 100);
  quitter.abort_at_instructions = true;
  MemorySink idle_sink;

  TrialController aborted(idle_engine, idle_channel, quitter, idle_sink, fast_timing(), 0);
  assert(throws<AbortRequested>([&] { aborted.run(makeChannelConfig(), session); }));
  assert(!idle_sink.opened);
  assert(idle_wire->opens == 0);
  assert(idle_wire->commands.empty());
  assert(quitter.presented.empty());
  assert(idle_engine.trialsCompleted() == 0);
}

// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------
int main() {
  std::cout << "Running trial controller tests...\n";
  LogCapture quiet(LogLevel::Error);

  test_full_run_converges();
  test_trial_sequence();
  test_abort_during_stimulus();
  test_transport_failure_stops_run();
  test_sink_failure_stops_run();
  test_connection_failure();
  test_run_with_csv_logger();
  test_instructions_before_first_trial();

  std::cout << "[PASS] All trial controller tests passed!\n";
  return 0;
}
