#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "nlohmann/json.hpp"

namespace mostrix::config {

enum class UserMode {
  kUser,
  kAdmin,
};

const char* UserModeName(UserMode mode);
std::optional<UserMode> ParseUserMode(std::string_view name);

constexpr const char* kConfigFileName = "mostrix.conf";
constexpr const char* kLogFileName = "mostrix.log";
constexpr const char* kEnvPrefix = "MOSTRIX_";

struct Settings {
  std::string mostro_pubkey;
  std::vector<std::string> relays;
  std::string log_level{"info"};
  std::uint8_t pow{0};
  std::string admin_privkey;
  // Fiat codes shown in the order book; empty means all.
  std::vector<std::string> currencies;
  std::string data_dir;
  // Empty means <data_dir>/mostrix.log.
  std::string log_file;
  std::size_t log_max_size_mb{0};
  std::size_t log_max_files{0};
  bool log_stderr{false};
  UserMode user_mode{UserMode::kUser};
  bool full_privacy{false};
  // Relative paths resolve against data_dir.
  std::string attachment_dir{"downloads"};
  std::uint32_t poll_interval_seconds{5};
  std::uint32_t chat_window_days{7};

  std::string config_path;
  bool disable_config_file{false};

  // Throws std::runtime_error describing the first invalid field.
  void Validate() const;

  std::filesystem::path DataDir() const;
  std::filesystem::path ConfigFilePath() const;
  std::filesystem::path LogFilePath() const;
  std::filesystem::path AttachmentDir() const;

  // admin_privkey is redacted.
  nlohmann::json ToJson() const;
};

// $HOME/.mostrix, or .mostrix in the working directory when HOME is unset.
std::string DefaultDataDir();

// 1/true/yes/on and 0/false/no/off in any case; empty means true.
bool ParseBool(const std::string& value);

// Drops '-' and '_' and lowercases, so log-level, log_level and LOGLEVEL
// name the same option.
std::string NormalizeKey(std::string_view key);

// Applies one option. List-valued keys accept comma separated values; the
// first occurrence of a list key within one source (tracked in
// `replaced_lists`) replaces what lower-priority sources set, later ones
// append. Throws std::runtime_error for a malformed value. Returns false for
// an unknown key.
bool ApplyConfigOption(const std::string& key, const std::string& value, Settings* settings,
                       std::set<std::string>* replaced_lists);

// `key = value` lines with '#' comments; a bare key means 1. A missing file is
// not an error. Throws with "path:lineno: message" on a bad line.
void LoadConfigFile(const std::filesystem::path& path, Settings* settings);

// MOSTRIX_<OPTION> variables, e.g. MOSTRIX_LOG_LEVEL or MOSTRIX_RELAYS.
void ApplyEnvironmentOverrides(Settings* settings);

// Applies --option value / --option=value flags and returns the remaining
// positional arguments in order. Boolean options take no value; --no-<flag>
// clears one. Throws for an unknown option or a missing value.
std::vector<std::string> ApplyCommandLine(const std::vector<std::string>& args,
                                          Settings* settings);

// defaults, then the config file, then the environment, then the command line.
Settings LoadSettings(const std::vector<std::string>& args,
                      std::vector<std::string>* positional = nullptr);

// Points the process logger at the configured file, level and rotation.
void ConfigureLogging(const Settings& settings);

}  // namespace mostrix::config
