#ifndef DESKBRIDGE_CORE_LOGGER_H_
#define DESKBRIDGE_CORE_LOGGER_H_

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace deskbridge {
namespace core {

enum class LogLevel {
  kTrace,
  kDebug,
  kInfo,
  kWarn,
  kError
};

struct LogEntry {
  LogLevel level;
  std::string message;
  std::string timestamp;
};

// Process-wide diagnostic log. Entries below the minimum level are dropped
// before they reach the console or the in-memory history.
class Logger {
 public:
  static Logger& GetInstance();

  void Log(LogLevel level, const std::string& message);

  void Trace(const std::string& message) { Log(LogLevel::kTrace, message); }
  void Debug(const std::string& message) { Log(LogLevel::kDebug, message); }
  void Info(const std::string& message) { Log(LogLevel::kInfo, message); }
  void Warn(const std::string& message) { Log(LogLevel::kWarn, message); }
  void Error(const std::string& message) { Log(LogLevel::kError, message); }

  void SetMinLevel(LogLevel level);
  LogLevel GetMinLevel() const;
  bool IsEnabled(LogLevel level) const;

  // Console output is on by default; tests switch it off.
  void SetConsoleOutput(bool enabled);

  std::vector<LogEntry> GetEntries() const;
  void Clear();

  static const char* LevelToString(LogLevel level);
  static bool ParseLevel(const std::string& text, LogLevel* level);

 private:
  Logger() = default;
  ~Logger() = default;
  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  std::string GetTimestamp();

  static constexpr size_t kMaxEntries = 1000;
  static constexpr size_t kTrimCount = 100;

  std::vector<LogEntry> entries_;
  LogLevel min_level_ = LogLevel::kInfo;
  bool console_output_ = true;
  mutable std::mutex mutex_;
};

#define DESKBRIDGE_LOG_TRACE(msg) ::deskbridge::core::Logger::GetInstance().Trace(msg)
#define DESKBRIDGE_LOG_DEBUG(msg) ::deskbridge::core::Logger::GetInstance().Debug(msg)
#define DESKBRIDGE_LOG_INFO(msg)  ::deskbridge::core::Logger::GetInstance().Info(msg)
#define DESKBRIDGE_LOG_WARN(msg)  ::deskbridge::core::Logger::GetInstance().Warn(msg)
#define DESKBRIDGE_LOG_ERROR(msg) ::deskbridge::core::Logger::GetInstance().Error(msg)

}  // namespace core
}  // namespace deskbridge

#endif  // DESKBRIDGE_CORE_LOGGER_H_
