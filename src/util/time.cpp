#include "util/time.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <limits>
#include <sstream>

namespace mostrix::util {

std::int64_t NowSeconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::string FormatLocalTimestamp() {
  const auto now = std::chrono::system_clock::now();
  const std::time_t time = std::chrono::system_clock::to_time_t(now);
  std::tm tm_buf{};
  localtime_r(&time, &tm_buf);
  std::ostringstream oss;
  oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
  return oss.str();
}

std::optional<std::string> FormatUtc(std::int64_t unix_seconds, const char* format) {
  if (unix_seconds < 0 ||
      unix_seconds > static_cast<std::int64_t>(std::numeric_limits<std::time_t>::max())) {
    return std::nullopt;
  }
  const std::time_t time = static_cast<std::time_t>(unix_seconds);
  std::tm tm_buf{};
  if (gmtime_r(&time, &tm_buf) == nullptr || tm_buf.tm_year + 1900 > 9999) {
    return std::nullopt;
  }
  std::ostringstream oss;
  oss << std::put_time(&tm_buf, format);
  return oss.str();
}

std::optional<std::int64_t> ParseUtc(const std::string& text, const char* format) {
  std::tm tm_buf{};
  std::istringstream in(text);
  in >> std::get_time(&tm_buf, format);
  if (in.fail()) {
    return std::nullopt;
  }
  return static_cast<std::int64_t>(timegm(&tm_buf));
}

}  // namespace mostrix::util
