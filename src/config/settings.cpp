#include "config/settings.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <utility>

#include "crypto/keys.hpp"
#include "util/logging.hpp"

namespace mostrix::config {

namespace {

constexpr std::uint8_t kMaxPowDifficulty = 32;

constexpr std::array<std::string_view, 18> kEnvOptions = {
    "MOSTRO_PUBKEY", "RELAYS",      "LOG_LEVEL",    "POW",
    "ADMIN_PRIVKEY", "CURRENCIES",  "DATA_DIR",     "LOG_FILE",
    "LOG_MAX_SIZE_MB", "LOG_MAX_FILES", "LOG_STDERR", "USER_MODE",
    "FULL_PRIVACY",  "ATTACHMENT_DIR", "POLL_INTERVAL_SECONDS", "CHAT_WINDOW_DAYS",
    "CONF",          "NO_CONF",
};

const std::set<std::string> kBoolKeys = {"logstderr", "fullprivacy", "noconf"};

std::string Trim(const std::string& text) {
  const auto begin = text.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return {};
  }
  const auto end = text.find_last_not_of(" \t\r\n");
  return text.substr(begin, end - begin + 1);
}

std::string ToUpper(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return text;
}

std::uint64_t ParseUnsigned(const std::string& value, std::string_view name, std::uint64_t max) {
  std::size_t consumed = 0;
  unsigned long long parsed = 0;
  try {
    if (value.empty() || value.front() == '-') {
      throw std::invalid_argument(value);
    }
    parsed = std::stoull(value, &consumed);
  } catch (const std::exception&) {
    throw std::runtime_error("invalid " + std::string(name) + ": " + value);
  }
  if (consumed != value.size() || parsed > max) {
    throw std::runtime_error("invalid " + std::string(name) + ": " + value);
  }
  return parsed;
}

void ApplyList(const std::string& key, const std::string& value, std::vector<std::string>* target,
               std::set<std::string>* replaced_lists, bool upper) {
  if (replaced_lists != nullptr && replaced_lists->insert(key).second) {
    target->clear();
  }
  std::string_view rest = value;
  while (!rest.empty()) {
    const auto sep = rest.find(',');
    auto token = Trim(std::string(rest.substr(0, sep)));
    if (!token.empty()) {
      if (upper) {
        token = ToUpper(std::move(token));
      }
      if (std::find(target->begin(), target->end(), token) == target->end()) {
        target->push_back(std::move(token));
      }
    }
    if (sep == std::string_view::npos) {
      break;
    }
    rest.remove_prefix(sep + 1);
  }
}

std::optional<std::string> GetEnvValue(const std::string& name) {
  const char* value = std::getenv(name.c_str());
  if (!value || value[0] == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

std::vector<std::string> SplitEqualsForm(const std::vector<std::string>& args) {
  std::vector<std::string> out;
  out.reserve(args.size());
  for (const auto& token : args) {
    const auto eq_pos = token.find('=');
    if (eq_pos != std::string::npos && token.rfind("--", 0) == 0) {
      out.push_back(token.substr(0, eq_pos));
      out.push_back("=" + token.substr(eq_pos + 1));
    } else {
      out.push_back(token);
    }
  }
  return out;
}

}  // namespace

const char* UserModeName(UserMode mode) {
  return mode == UserMode::kAdmin ? "admin" : "user";
}

std::optional<UserMode> ParseUserMode(std::string_view name) {
  std::string lower(name);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lower == "user") {
    return UserMode::kUser;
  }
  if (lower == "admin") {
    return UserMode::kAdmin;
  }
  return std::nullopt;
}

std::string DefaultDataDir() {
  if (const auto home = GetEnvValue("HOME")) {
    return (std::filesystem::path(*home) / ".mostrix").string();
  }
  return ".mostrix";
}

bool ParseBool(const std::string& value) {
  std::string lower;
  lower.reserve(value.size());
  for (char c : value) {
    lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (lower.empty()) {
    return true;
  }
  if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
    return true;
  }
  if (lower == "0" || lower == "false" || lower == "no" || lower == "off") {
    return false;
  }
  throw std::runtime_error("invalid boolean value: " + value);
}

std::string NormalizeKey(std::string_view key) {
  std::string out;
  out.reserve(key.size());
  for (char c : key) {
    if (c == '-' || c == '_') {
      continue;
    }
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

bool ApplyConfigOption(const std::string& raw_key, const std::string& value, Settings* settings,
                       std::set<std::string>* replaced_lists) {
  const auto key = NormalizeKey(raw_key);
  if (key == "mostropubkey") {
    settings->mostro_pubkey = value;
  } else if (key == "relays" || key == "relay") {
    ApplyList("relays", value, &settings->relays, replaced_lists, false);
  } else if (key == "loglevel") {
    util::ParseLogLevelString(value);
    settings->log_level = value;
  } else if (key == "pow") {
    settings->pow = static_cast<std::uint8_t>(ParseUnsigned(value, "pow", 255));
  } else if (key == "adminprivkey") {
    settings->admin_privkey = value;
  } else if (key == "currencies" || key == "currency") {
    ApplyList("currencies", value, &settings->currencies, replaced_lists, true);
  } else if (key == "datadir") {
    settings->data_dir = value;
  } else if (key == "logfile" || key == "debuglog") {
    settings->log_file = value;
  } else if (key == "logmaxsizemb") {
    settings->log_max_size_mb =
        static_cast<std::size_t>(ParseUnsigned(value, "log_max_size_mb", 1u << 20));
  } else if (key == "logmaxfiles") {
    settings->log_max_files =
        static_cast<std::size_t>(ParseUnsigned(value, "log_max_files", 1000));
  } else if (key == "logstderr") {
    settings->log_stderr = ParseBool(value);
  } else if (key == "usermode" || key == "mode") {
    const auto mode = ParseUserMode(value);
    if (!mode) {
      throw std::runtime_error("invalid user_mode: " + value + " (expected user or admin)");
    }
    settings->user_mode = *mode;
  } else if (key == "fullprivacy") {
    settings->full_privacy = ParseBool(value);
  } else if (key == "attachmentdir") {
    settings->attachment_dir = value;
  } else if (key == "pollintervalseconds" || key == "pollinterval") {
    settings->poll_interval_seconds =
        static_cast<std::uint32_t>(ParseUnsigned(value, "poll_interval_seconds", 86'400));
  } else if (key == "chatwindowdays") {
    settings->chat_window_days =
        static_cast<std::uint32_t>(ParseUnsigned(value, "chat_window_days", 3650));
  } else if (key == "conf" || key == "config") {
    settings->config_path = value;
  } else if (key == "noconf") {
    settings->disable_config_file = ParseBool(value);
  } else {
    return false;
  }
  return true;
}

void LoadConfigFile(const std::filesystem::path& path, Settings* settings) {
  if (path.empty() || !std::filesystem::exists(path)) {
    return;
  }
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("failed to open config file: " + path.string());
  }
  std::set<std::string> replaced_lists;
  std::string line;
  std::size_t lineno = 0;
  while (std::getline(in, line)) {
    ++lineno;
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.resize(comment_pos);
    }
    line = Trim(line);
    if (line.empty()) {
      continue;
    }
    std::string key;
    std::string value;
    const auto eq_pos = line.find_first_of("= ");
    if (eq_pos == std::string::npos) {
      key = line;
      value = "1";
    } else {
      key = Trim(line.substr(0, eq_pos));
      value = Trim(line.substr(eq_pos + 1));
      if (!value.empty() && value.front() == '=') {
        value = Trim(value.substr(1));
      }
      if (value.empty()) {
        value = "1";
      }
    }
    try {
      if (!ApplyConfigOption(key, value, settings, &replaced_lists)) {
        util::LogWarn(path.string() + ":" + std::to_string(lineno) + ": unknown config key '" +
                      key + "'");
      }
    } catch (const std::exception& ex) {
      throw std::runtime_error(path.string() + ":" + std::to_string(lineno) + ": " + ex.what());
    }
  }
}

void ApplyEnvironmentOverrides(Settings* settings) {
  std::set<std::string> replaced_lists;
  for (const auto option : kEnvOptions) {
    const auto name = std::string(kEnvPrefix) + std::string(option);
    const auto value = GetEnvValue(name);
    if (!value) {
      continue;
    }
    try {
      ApplyConfigOption(std::string(option), *value, settings, &replaced_lists);
    } catch (const std::exception& ex) {
      throw std::runtime_error(name + ": " + ex.what());
    }
  }
}

std::vector<std::string> ApplyCommandLine(const std::vector<std::string>& raw_args,
                                          Settings* settings) {
  const auto args = SplitEqualsForm(raw_args);
  std::set<std::string> replaced_lists;
  std::vector<std::string> positional;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const auto& arg = args[i];
    if (arg.rfind("--", 0) != 0 || arg.size() == 2) {
      positional.push_back(arg);
      continue;
    }
    auto key = NormalizeKey(arg.substr(2));
    const bool has_inline = i + 1 < args.size() && args[i + 1].rfind("=", 0) == 0;
    std::string value;
    if (kBoolKeys.count(key) != 0) {
      value = has_inline ? args[++i].substr(1) : "1";
    } else if (key.rfind("no", 0) == 0 && kBoolKeys.count(key.substr(2)) != 0 && !has_inline) {
      key = key.substr(2);
      value = "0";
    } else if (has_inline) {
      value = args[++i].substr(1);
    } else {
      if (i + 1 >= args.size()) {
        throw std::runtime_error("missing value for " + arg);
      }
      value = args[++i];
    }
    bool known = false;
    try {
      known = ApplyConfigOption(key, value, settings, &replaced_lists);
    } catch (const std::exception& ex) {
      throw std::runtime_error(arg + ": " + ex.what());
    }
    if (!known) {
      throw std::runtime_error("unknown option: " + arg);
    }
  }
  return positional;
}

Settings LoadSettings(const std::vector<std::string>& args,
                      std::vector<std::string>* positional) {
  // The config file location depends on --conf, --data-dir and their
  // environment forms, so resolve those before reading the file.
  Settings locate;
  ApplyEnvironmentOverrides(&locate);
  ApplyCommandLine(args, &locate);

  Settings settings;
  if (!locate.disable_config_file) {
    Settings located;
    located.data_dir = locate.data_dir;
    located.config_path = locate.config_path;
    LoadConfigFile(located.ConfigFilePath(), &settings);
  }
  ApplyEnvironmentOverrides(&settings);
  auto rest = ApplyCommandLine(args, &settings);
  if (positional != nullptr) {
    *positional = std::move(rest);
  }
  return settings;
}

void Settings::Validate() const {
  if (mostro_pubkey.empty()) {
    throw std::runtime_error("mostro_pubkey is required");
  }
  if (!crypto::ParsePublicKey(mostro_pubkey)) {
    throw std::runtime_error("invalid mostro_pubkey: " + mostro_pubkey);
  }
  if (relays.empty()) {
    throw std::runtime_error("at least one relay is required");
  }
  for (const auto& relay : relays) {
    if (relay.rfind("ws://", 0) != 0 && relay.rfind("wss://", 0) != 0) {
      throw std::runtime_error("invalid relay url: " + relay + " (expected ws:// or wss://)");
    }
  }
  if (pow > kMaxPowDifficulty) {
    throw std::runtime_error("pow must be between 0 and " + std::to_string(kMaxPowDifficulty) +
                             ", got " + std::to_string(pow));
  }
  util::ParseLogLevelString(log_level);
  if (poll_interval_seconds == 0) {
    throw std::runtime_error("poll_interval_seconds must be positive");
  }
  if (chat_window_days == 0) {
    throw std::runtime_error("chat_window_days must be positive");
  }
  if (user_mode == UserMode::kAdmin) {
    if (admin_privkey.empty()) {
      throw std::runtime_error("admin mode requires admin_privkey");
    }
    if (!crypto::Keys::Parse(admin_privkey)) {
      throw std::runtime_error("invalid admin_privkey (expected 64 hex characters or nsec)");
    }
  }
}

std::filesystem::path Settings::DataDir() const {
  return data_dir.empty() ? std::filesystem::path(DefaultDataDir())
                          : std::filesystem::path(data_dir);
}

std::filesystem::path Settings::ConfigFilePath() const {
  if (!config_path.empty()) {
    return config_path;
  }
  return DataDir() / kConfigFileName;
}

std::filesystem::path Settings::LogFilePath() const {
  if (!log_file.empty()) {
    return log_file;
  }
  return DataDir() / kLogFileName;
}

std::filesystem::path Settings::AttachmentDir() const {
  const std::filesystem::path dir(attachment_dir.empty() ? "downloads" : attachment_dir);
  return dir.is_absolute() ? dir : DataDir() / dir;
}

nlohmann::json Settings::ToJson() const {
  nlohmann::json json;
  json["mostro_pubkey"] = mostro_pubkey;
  json["relays"] = relays;
  json["log_level"] = log_level;
  json["pow"] = pow;
  json["admin_privkey"] = admin_privkey.empty() ? "" : "<redacted>";
  json["currencies"] = currencies;
  json["data_dir"] = DataDir().string();
  json["log_file"] = LogFilePath().string();
  json["log_max_size_mb"] = log_max_size_mb;
  json["log_max_files"] = log_max_files;
  json["log_stderr"] = log_stderr;
  json["user_mode"] = UserModeName(user_mode);
  json["full_privacy"] = full_privacy;
  json["attachment_dir"] = AttachmentDir().string();
  json["poll_interval_seconds"] = poll_interval_seconds;
  json["chat_window_days"] = chat_window_days;
  json["config_file"] = disable_config_file ? "" : ConfigFilePath().string();
  return json;
}

void ConfigureLogging(const Settings& settings) {
  auto& logger = util::GetLogger();
  logger.Configure(util::ParseLogLevelString(settings.log_level),
                   static_cast<std::uintmax_t>(settings.log_max_size_mb) * 1024 * 1024,
                   settings.log_max_files);
  logger.SetStderr(settings.log_stderr);
  logger.Enable(settings.LogFilePath());
}

}  // namespace mostrix::config
