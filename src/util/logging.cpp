#include "util/logging.hpp"

#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace hrseed::util {

namespace {

std::string FormatTimestamp() {
  const auto now = std::chrono::system_clock::now();
  const std::time_t time = std::chrono::system_clock::to_time_t(now);
  std::tm tm_buf{};
#ifdef _WIN32
  localtime_s(&tm_buf, &time);
#else
  localtime_r(&time, &tm_buf);
#endif
  std::ostringstream oss;
  oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
  return oss.str();
}

bool Passes(LogLevel level, LogLevel threshold) {
  return static_cast<int>(level) >= static_cast<int>(threshold);
}

}  // namespace

const char* LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "DEBUG";
    case LogLevel::kInfo:
      return "INFO";
    case LogLevel::kWarn:
      return "WARN";
    case LogLevel::kError:
      return "ERROR";
  }
  return "UNKNOWN";
}

LogLevel ParseLogLevelString(const std::string& value) {
  std::string lower;
  lower.reserve(value.size());
  for (char c : value) {
    lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (lower == "debug") {
    return LogLevel::kDebug;
  }
  if (lower == "info") {
    return LogLevel::kInfo;
  }
  if (lower == "warn" || lower == "warning") {
    return LogLevel::kWarn;
  }
  if (lower == "error") {
    return LogLevel::kError;
  }
  throw std::runtime_error("invalid log level: " + value);
}

void Logger::EnableConsole(LogLevel threshold, std::ostream* stream) {
  std::lock_guard<std::mutex> lock(mutex_);
  console_ = stream ? stream : &std::cerr;
  console_threshold_ = threshold;
}

void Logger::DisableConsole() {
  std::lock_guard<std::mutex> lock(mutex_);
  console_ = nullptr;
}

void Logger::EnableFile(const std::string& path, LogLevel threshold) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open()) {
    file_.close();
  }
  const auto parent = std::filesystem::path(path).parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
  }
  file_.open(path, std::ios::app);
  if (!file_) {
    throw std::runtime_error("failed to open log file: " + path);
  }
  file_threshold_ = threshold;
  file_ << "---- hrseed log started " << FormatTimestamp() << " ----\n";
  file_.flush();
}

void Logger::DisableFile() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open()) {
    file_.close();
  }
}

void Logger::Log(LogLevel level, const std::string& message) {
  std::lock_guard<std::mutex> lock(mutex_);
  const bool to_console = console_ != nullptr && Passes(level, console_threshold_);
  const bool to_file = file_.is_open() && Passes(level, file_threshold_);
  if (!to_console && !to_file) {
    return;
  }
  std::ostringstream line;
  line << "[" << FormatTimestamp() << "] [" << LogLevelName(level) << "] " << message << '\n';
  const std::string text = line.str();
  if (to_console) {
    *console_ << text;
    console_->flush();
  }
  if (to_file) {
    file_ << text;
    file_.flush();
  }
}

bool Logger::Enabled(LogLevel level) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return (console_ != nullptr && Passes(level, console_threshold_)) ||
         (file_.is_open() && Passes(level, file_threshold_));
}

Logger& GlobalLogger() {
  static Logger logger;
  return logger;
}

void LogDebug(const std::string& message) { GlobalLogger().Log(LogLevel::kDebug, message); }
void LogInfo(const std::string& message) { GlobalLogger().Log(LogLevel::kInfo, message); }
void LogWarn(const std::string& message) { GlobalLogger().Log(LogLevel::kWarn, message); }
void LogError(const std::string& message) { GlobalLogger().Log(LogLevel::kError, message); }

}  // namespace hrseed::util
