#pragma once

#include <cstdint>
#include <fstream>
#include <mutex>
#include <ostream>
#include <string>

namespace hrseed::util {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

const char* LogLevelName(LogLevel level);
// Case-insensitive; accepts "warning" for kWarn. Throws std::runtime_error.
LogLevel ParseLogLevelString(const std::string& value);

// Leveled logger with two independent sinks: a console stream (stderr by
// default) and an append-mode file. Each sink has its own threshold.
// Messages are dropped when no sink accepts them.
class Logger {
 public:
  void EnableConsole(LogLevel threshold, std::ostream* stream = nullptr);
  void DisableConsole();
  // Throws std::runtime_error if the file cannot be opened.
  void EnableFile(const std::string& path, LogLevel threshold);
  void DisableFile();

  void Log(LogLevel level, const std::string& message);
  bool Enabled(LogLevel level) const;

 private:
  mutable std::mutex mutex_;
  std::ostream* console_{nullptr};
  LogLevel console_threshold_{LogLevel::kWarn};
  std::ofstream file_;
  LogLevel file_threshold_{LogLevel::kDebug};
};

Logger& GlobalLogger();

void LogDebug(const std::string& message);
void LogInfo(const std::string& message);
void LogWarn(const std::string& message);
void LogError(const std::string& message);

}  // namespace hrseed::util
