#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace mostrix::util {

// Wall-clock seconds since the Unix epoch.
std::int64_t NowSeconds();

// "YYYY-MM-DD HH:MM:SS" in local time.
std::string FormatLocalTimestamp();

// strftime-style formatting of a Unix timestamp in UTC. Returns nullopt for
// timestamps the C library cannot represent.
std::optional<std::string> FormatUtc(std::int64_t unix_seconds, const char* format);

// Inverse of FormatUtc for fully specified "%d-%m-%Y %H:%M:%S" style input.
std::optional<std::int64_t> ParseUtc(const std::string& text, const char* format);

}  // namespace mostrix::util
