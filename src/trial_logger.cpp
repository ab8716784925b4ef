#include "photocal/trial_logger.hpp"

#include "photocal/log.hpp"

#include <cctype>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace photocal {

// -----------------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------------

namespace {

std::string formatNow(const char* fmt) {
  const std::time_t now = std::time(nullptr);
  std::tm local{};
  localtime_r(&now, &local);
  std::ostringstream oss;
  oss << std::put_time(&local, fmt);
  return oss.str();
}

} // namespace

std::string fileTimestamp() {
  return formatNow("%Y%m%d_%H%M%S");
}

std::string displayTimestamp() {
  return formatNow("%Y-%m-%d %H:%M:%S");
}

bool isValidIdentifier(const std::string& id) {
  if (id.empty()) {
    return false;
  }
  for (char c : id) {
    const unsigned char uc = static_cast<unsigned char>(c);
    if (!std::isalnum(uc) && c != '_' && c != '-') {
      return false;
    }
  }
  return true;
}

std::optional<int> parseStartingIntensity(const std::string& text) {
  if (text.empty() || text.size() > 3) {
    return std::nullopt;
  }
  int value = 0;
  for (char c : text) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return std::nullopt;
    }
    value = value * 10 + (c - '0');
  }
  if (value < 1 || value > 255) {
    return std::nullopt;
  }
  return value;
}

std::string summaryToJson(const StaircaseSummary& summary) {
  std::ostringstream json;
  json << std::fixed << std::setprecision(6);
  json << "{\n";
  json << "  \"n_trials\": " << summary.trials_completed << ",\n";
  json << "  \"n_reversals\": " << summary.reversal_intensities.size() << ",\n";
  json << "  \"reversal_intensities\": [";
  for (size_t i = 0; i < summary.reversal_intensities.size(); ++i) {
    if (i > 0) {
      json << ", ";
    }
    json << summary.reversal_intensities[i];
  }
  json << "],\n";
  if (summary.threshold) {
    json << "  \"threshold\": " << *summary.threshold << ",\n";
  } else {
    json << "  \"threshold\": null,\n";
  }
  json << "  \"start_value\": " << summary.start_value << ",\n";
  json << "  \"min_val\": " << summary.min_val << ",\n";
  json << "  \"max_val\": " << summary.max_val << ",\n";
  json << "  \"finished\": " << (summary.finished ? "true" : "false") << "\n";
  json << "}\n";
  return json.str();
}

// -----------------------------------------------------------------------------
// CsvTrialLogger Implementation
// -----------------------------------------------------------------------------

CsvTrialLogger::CsvTrialLogger(std::string data_dir, SessionInfo session, bool auto_flush)
    : data_dir_(std::move(data_dir))
    , session_(std::move(session))
    , auto_flush_(auto_flush)
{
  if (!isValidIdentifier(session_.participant_id)) {
    throw std::invalid_argument("Invalid participant id '" + session_.participant_id + "'");
  }
  if (!isValidIdentifier(session_.session_id)) {
    throw std::invalid_argument("Invalid session id '" + session_.session_id + "'");
  }
  if (session_.timestamp.empty()) {
    session_.timestamp = fileTimestamp();
  }

  const std::string stem = session_.participant_id + "_" + session_.session_id + "_" + session_.timestamp;
  const std::filesystem::path dir(data_dir_);
  csv_path_ = (dir / (stem + ".csv")).string();
  meta_path_ = (dir / (stem + ".meta")).string();
  summary_path_ = (dir / (stem + ".json")).string();
}

CsvTrialLogger::~CsvTrialLogger() {
  try {
    close();
  } catch (const std::exception& e) {
    LogLine(LogLevel::Error) << "Error closing trial log " << csv_path_ << ": " << e.what();
  }
}

void CsvTrialLogger::open() {
  if (open_) {
    LogLine(LogLevel::Warn) << "Trial log already open: " << csv_path_;
    return;
  }

  std::error_code ec;
  std::filesystem::create_directories(data_dir_, ec);
  if (ec) {
    throw std::runtime_error("Cannot create data directory " + data_dir_ + ": " + ec.message());
  }

  csv_.open(csv_path_, std::ios::out | std::ios::trunc);
  if (!csv_) {
    throw std::runtime_error("Failed to open CSV file " + csv_path_);
  }

  csv_ << "trial_number,goggle_level,uncomfortable,reversals_so_far,timestamp\n";
  if (auto_flush_) {
    csv_.flush();
  }
  if (!csv_) {
    throw std::runtime_error("Failed to write CSV header to " + csv_path_);
  }

  open_ = true;
  start_time_ = displayTimestamp();
  writeMetadata();

  LogLine(LogLevel::Info) << "Opened trial log " << csv_path_;
}

void CsvTrialLogger::logTrial(const TrialRecord& record) {
  if (!open_) {
    throw std::runtime_error("Cannot log trial: trial log not open");
  }

  csv_ << record.trial_number << ','
       << record.level << ','
       << (record.uncomfortable ? 1 : 0) << ','
       << record.reversals_so_far << ','
       << displayTimestamp() << '\n';
  if (auto_flush_) {
    csv_.flush();
  }
  if (!csv_) {
    throw std::runtime_error("Failed to write trial " + std::to_string(record.trial_number) +
                             " to " + csv_path_);
  }

  LogLine(LogLevel::Debug) << "Logged trial " << record.trial_number << ": level=" << record.level
                           << ", uncomfortable=" << record.uncomfortable;
}

void CsvTrialLogger::markAborted() {
  aborted_ = true;
  writeMetadata();
  LogLine(LogLevel::Warn) << "Run marked as aborted in " << meta_path_;
}

void CsvTrialLogger::writeFinalResults(const StaircaseSummary& summary) {
  final_ = summary;
  writeMetadata();

  std::ofstream out(summary_path_, std::ios::out | std::ios::trunc);
  out << summaryToJson(summary);
  out.flush();
  if (!out) {
    throw std::runtime_error("Failed to write staircase summary " + summary_path_);
  }
  LogLine(LogLevel::Info) << "Staircase summary saved to " << summary_path_;
}

void CsvTrialLogger::close() {
  if (!open_) {
    return;
  }
  open_ = false;
  csv_.close();
  end_time_ = displayTimestamp();
  writeMetadata();
  LogLine(LogLevel::Info) << "Closed trial log " << csv_path_;
}

void CsvTrialLogger::writeMetadata() {
  std::ofstream meta(meta_path_, std::ios::out | std::ios::trunc);

  meta << "participant_id: " << session_.participant_id << "\n";
  meta << "session_id: " << session_.session_id << "\n";
  if (session_.starting_intensity) {
    meta << "starting_intensity: " << *session_.starting_intensity << "\n";
  }
  meta << "experiment_start: " << start_time_ << "\n";
  if (!end_time_.empty()) {
    meta << "experiment_end: " << end_time_ << "\n";
  }
  meta << "aborted: " << (aborted_ ? "true" : "false") << "\n";

  if (final_) {
    meta << std::fixed << std::setprecision(2);
    if (final_->threshold) {
      meta << "final_threshold: " << *final_->threshold << "\n";
    } else {
      meta << "final_threshold: none\n";
    }
    meta << "total_trials: " << final_->trials_completed << "\n";
    meta << "total_reversals: " << final_->reversal_intensities.size() << "\n";
  }

  meta.flush();
  if (!meta) {
    throw std::runtime_error("Failed to write metadata " + meta_path_);
  }
}

} // namespace photocal
