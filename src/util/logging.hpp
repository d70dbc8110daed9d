#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>

namespace mostrix::util {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

const char* LogLevelName(LogLevel level);

// Accepts debug/info/warn/warning/error in any case; throws on anything else.
LogLevel ParseLogLevelString(const std::string& value);

class Logger {
 public:
  // Open (append) a log file. Throws std::runtime_error if it cannot be opened.
  void Enable(const std::filesystem::path& path);
  void Disable();
  void Configure(LogLevel level, std::uintmax_t max_bytes, std::size_t max_files);
  // Mirror every accepted line to stderr as well.
  void SetStderr(bool enabled);

  void Log(LogLevel level, const std::string& message);

  bool Enabled() const;
  bool WouldLog(LogLevel level) const;
  LogLevel Level() const;

 private:
  void RotateLocked();

  mutable std::mutex mutex_;
  std::ofstream stream_;
  std::filesystem::path path_;
  LogLevel level_threshold_{LogLevel::kInfo};
  bool mirror_stderr_{false};
  std::uintmax_t max_bytes_{0};
  std::size_t max_files_{0};
  std::uintmax_t current_size_{0};
};

// Process-wide sink. Components log through the helpers below.
Logger& GetLogger();

void LogDebug(const std::string& message);
void LogInfo(const std::string& message);
void LogWarn(const std::string& message);
void LogError(const std::string& message);

}  // namespace mostrix::util
