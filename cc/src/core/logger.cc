#include "deskbridge/core/logger.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "absl/strings/ascii.h"

namespace deskbridge {
namespace core {

Logger& Logger::GetInstance() {
  static Logger instance;
  return instance;
}

void Logger::Log(LogLevel level, const std::string& message) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (level < min_level_) return;

  std::string ts = GetTimestamp();
  entries_.push_back({level, message, ts});

  if (console_output_) {
    std::ostream& out = (level == LogLevel::kError || level == LogLevel::kWarn)
                            ? std::cerr
                            : std::cout;
    out << "[" << ts << "] [" << LevelToString(level) << "] " << message
        << std::endl;
  }

  // Cap entries so a long-running shell does not grow without bound.
  if (entries_.size() > kMaxEntries) {
    entries_.erase(entries_.begin(), entries_.begin() + kTrimCount);
  }
}

void Logger::SetMinLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  min_level_ = level;
}

LogLevel Logger::GetMinLevel() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return min_level_;
}

bool Logger::IsEnabled(LogLevel level) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return level >= min_level_;
}

void Logger::SetConsoleOutput(bool enabled) {
  std::lock_guard<std::mutex> lock(mutex_);
  console_output_ = enabled;
}

std::vector<LogEntry> Logger::GetEntries() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_;
}

void Logger::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.clear();
}

std::string Logger::GetTimestamp() {
  auto now = std::chrono::system_clock::now();
  auto in_time_t = std::chrono::system_clock::to_time_t(now);
  std::tm local_tm{};
  localtime_r(&in_time_t, &local_tm);
  std::stringstream ss;
  ss << std::put_time(&local_tm, "%H:%M:%S");
  return ss.str();
}

const char* Logger::LevelToString(LogLevel level) {
  switch (level) {
    case LogLevel::kTrace: return "TRACE";
    case LogLevel::kDebug: return "DEBUG";
    case LogLevel::kInfo:  return "INFO";
    case LogLevel::kWarn:  return "WARN";
    case LogLevel::kError: return "ERROR";
    default: return "UNKNOWN";
  }
}

bool Logger::ParseLevel(const std::string& text, LogLevel* level) {
  const std::string lower = absl::AsciiStrToLower(text);
  if (lower == "trace") {
    *level = LogLevel::kTrace;
  } else if (lower == "debug") {
    *level = LogLevel::kDebug;
  } else if (lower == "info") {
    *level = LogLevel::kInfo;
  } else if (lower == "warn" || lower == "warning") {
    *level = LogLevel::kWarn;
  } else if (lower == "error") {
    *level = LogLevel::kError;
  } else {
    return false;
  }
  return true;
}

}  // namespace core
}  // namespace deskbridge
