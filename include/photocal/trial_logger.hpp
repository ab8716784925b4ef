#pragma once

// Trial-by-trial persistence of a calibration run.
//
// Files (in the data directory), named so they sort by participant →
// session → date:
//   {participant}_{session}_{timestamp}.csv   one row per trial
//   {participant}_{session}_{timestamp}.meta  session metadata, key: value
//   {participant}_{session}_{timestamp}.json  terminal staircase snapshot
//
// Rows are flushed immediately when auto-flush is on so a crash loses at
// most the trial in progress. Write failures throw std::runtime_error.

#include "photocal/staircase.hpp"

#include <fstream>
#include <optional>
#include <string>

namespace photocal {

struct TrialRecord final {
  int trial_number = 0;
  int level = 0;
  bool uncomfortable = false;
  int reversals_so_far = 0;  // before this trial's response was applied
};

// Collaborator receiving trial records. Failures here must never keep the
// actuator channel from closing.
class TrialSink {
public:
  virtual ~TrialSink() = default;

  virtual void open() = 0;
  virtual void logTrial(const TrialRecord& record) = 0;
  virtual void markAborted() = 0;
  virtual void writeFinalResults(const StaircaseSummary& summary) = 0;
  virtual void close() = 0;
};

struct SessionInfo final {
  std::string participant_id;
  std::string session_id;
  std::optional<int> starting_intensity;
  std::string timestamp;  // YYYYMMDD_HHMMSS; generated when empty
};

class CsvTrialLogger final : public TrialSink {
public:
  // Throws std::invalid_argument for ids that are not valid identifiers.
  CsvTrialLogger(std::string data_dir, SessionInfo session, bool auto_flush = true);
  ~CsvTrialLogger() override;

  CsvTrialLogger(const CsvTrialLogger&) = delete;
  CsvTrialLogger& operator=(const CsvTrialLogger&) = delete;

  void open() override;
  void logTrial(const TrialRecord& record) override;
  void markAborted() override;
  void writeFinalResults(const StaircaseSummary& summary) override;
  void close() override;

  bool isOpen() const { return open_; }
  const std::string& csvPath() const { return csv_path_; }
  const std::string& metaPath() const { return meta_path_; }
  const std::string& summaryPath() const { return summary_path_; }
  const std::string& timestamp() const { return session_.timestamp; }

private:
  std::string data_dir_;
  SessionInfo session_;
  bool auto_flush_;

  std::string csv_path_;
  std::string meta_path_;
  std::string summary_path_;

  std::ofstream csv_;
  bool open_ = false;

  std::string start_time_;
  std::string end_time_;
  bool aborted_ = false;
  std::optional<StaircaseSummary> final_;

  void writeMetadata();
};

// Letters, digits, '_' and '-' only; non-empty.
bool isValidIdentifier(const std::string& id);

// Parses a starting intensity in [1, 255]; nothing when invalid.
std::optional<int> parseStartingIntensity(const std::string& text);

// Local time as YYYYMMDD_HHMMSS (file names) or YYYY-MM-DD HH:MM:SS.
std::string fileTimestamp();
std::string displayTimestamp();

std::string summaryToJson(const StaircaseSummary& summary);

} // namespace photocal
