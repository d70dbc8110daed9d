#include "util/logging.hpp"

#include <cctype>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include "util/time.hpp"

namespace mostrix::util {

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
  if (lower == "debug" || lower == "trace") {
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

void Logger::Enable(const std::filesystem::path& path) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (stream_.is_open()) {
    stream_.close();
  }
  path_ = path;
  const auto parent = path.parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
  }
  stream_.open(path, std::ios::app);
  if (!stream_) {
    throw std::runtime_error("failed to open log file: " + path.string());
  }
  current_size_ = 0;
  std::error_code ec;
  const auto size = std::filesystem::file_size(path, ec);
  if (!ec) {
    current_size_ = size;
  }
  const std::string header = "---- mostrix log started " + FormatLocalTimestamp() + " ----\n";
  stream_ << header;
  stream_.flush();
  current_size_ += static_cast<std::uintmax_t>(header.size());
}

void Logger::Disable() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (stream_.is_open()) {
    stream_.close();
  }
  path_.clear();
}

void Logger::Configure(LogLevel level, std::uintmax_t max_bytes, std::size_t max_files) {
  std::lock_guard<std::mutex> lock(mutex_);
  level_threshold_ = level;
  max_bytes_ = max_bytes;
  max_files_ = max_files;
}

void Logger::SetStderr(bool enabled) {
  std::lock_guard<std::mutex> lock(mutex_);
  mirror_stderr_ = enabled;
}

void Logger::Log(LogLevel level, const std::string& message) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (static_cast<int>(level) < static_cast<int>(level_threshold_)) {
    return;
  }
  if (!stream_.is_open() && !mirror_stderr_) {
    return;
  }
  std::ostringstream line;
  line << "[" << FormatLocalTimestamp() << "] [" << LogLevelName(level) << "] " << message
       << '\n';
  const std::string text = line.str();
  if (mirror_stderr_) {
    std::cerr << text;
  }
  if (!stream_.is_open()) {
    return;
  }
  if (max_bytes_ > 0 && current_size_ >= max_bytes_) {
    RotateLocked();
  }
  stream_ << text;
  stream_.flush();
  current_size_ += static_cast<std::uintmax_t>(text.size());
}

bool Logger::Enabled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stream_.is_open() || mirror_stderr_;
}

bool Logger::WouldLog(LogLevel level) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<int>(level) >= static_cast<int>(level_threshold_) &&
         (stream_.is_open() || mirror_stderr_);
}

LogLevel Logger::Level() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return level_threshold_;
}

void Logger::RotateLocked() {
  if (path_.empty() || max_bytes_ == 0 || max_files_ == 0) {
    return;
  }
  stream_.close();
  // mostrix.log.(n-1) -> mostrix.log.n
  for (std::size_t i = max_files_; i > 0; --i) {
    std::filesystem::path rotated = std::filesystem::path(path_).concat("." + std::to_string(i));
    std::filesystem::path previous =
        (i == 1) ? path_ : std::filesystem::path(path_).concat("." + std::to_string(i - 1));
    std::error_code ec;
    if (std::filesystem::exists(previous, ec)) {
      std::filesystem::rename(previous, rotated, ec);
    }
  }
  stream_.open(path_, std::ios::trunc);
  current_size_ = 0;
}

Logger& GetLogger() {
  static Logger logger;
  return logger;
}

void LogDebug(const std::string& message) { GetLogger().Log(LogLevel::kDebug, message); }
void LogInfo(const std::string& message) { GetLogger().Log(LogLevel::kInfo, message); }
void LogWarn(const std::string& message) { GetLogger().Log(LogLevel::kWarn, message); }
void LogError(const std::string& message) { GetLogger().Log(LogLevel::kError, message); }

}  // namespace mostrix::util
