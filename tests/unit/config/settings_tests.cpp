#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <random>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "config/settings.hpp"
#include "crypto/keys.hpp"

using namespace mostrix;
using config::Settings;

namespace {

std::filesystem::path MakeTempDir() {
  const auto suffix = static_cast<std::uint64_t>(std::random_device{}());
  auto dir = std::filesystem::temp_directory_path() /
             ("mostrix_settings_tests_" + std::to_string(suffix));
  std::filesystem::create_directories(dir);
  return dir;
}

void WriteFile(const std::filesystem::path& path, const std::string& text) {
  std::ofstream out(path);
  out << text;
}

std::string ErrorOf(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const std::runtime_error& e) {
    return e.what();
  }
  return {};
}

Settings ValidSettings() {
  Settings settings;
  settings.mostro_pubkey = crypto::Keys::Generate().PublicKeyHex();
  settings.relays = {"wss://relay.mostro.network"};
  return settings;
}

bool TestOptions() {
  if (config::NormalizeKey("Log-Level") != "loglevel" ||
      config::NormalizeKey("log_level") != "loglevel") {
    std::cerr << "key normalization mismatch\n";
    return false;
  }
  if (!config::ParseBool("") || !config::ParseBool("Yes") || config::ParseBool("off") ||
      ErrorOf([] { config::ParseBool("maybe"); }).empty()) {
    std::cerr << "boolean parsing mismatch\n";
    return false;
  }

  Settings settings;
  std::set<std::string> replaced;
  if (!config::ApplyConfigOption("currencies", "usd, eur", &settings, &replaced) ||
      !config::ApplyConfigOption("currency", "ars,usd", &settings, &replaced) ||
      settings.currencies != std::vector<std::string>{"USD", "EUR", "ARS"}) {
    std::cerr << "currency list not merged within one source\n";
    return false;
  }
  std::set<std::string> next_source;
  if (!config::ApplyConfigOption("currencies", "ves", &settings, &next_source) ||
      settings.currencies != std::vector<std::string>{"VES"}) {
    std::cerr << "higher-priority source did not replace the list\n";
    return false;
  }
  if (config::ApplyConfigOption("colour", "blue", &settings, &replaced)) {
    std::cerr << "unknown key accepted\n";
    return false;
  }
  if (ErrorOf([&] { config::ApplyConfigOption("pow", "-1", &settings, &replaced); }).empty() ||
      ErrorOf([&] { config::ApplyConfigOption("user_mode", "root", &settings, &replaced); })
          .empty() ||
      ErrorOf([&] { config::ApplyConfigOption("log_level", "loud", &settings, &replaced); })
          .empty()) {
    std::cerr << "malformed option value accepted\n";
    return false;
  }
  return true;
}

bool TestConfigFile() {
  const auto dir = MakeTempDir();
  const auto pubkey = crypto::Keys::Generate().PublicKeyHex();
  const auto path = dir / config::kConfigFileName;
  WriteFile(path, "# mostrix settings\n"
                  "mostro_pubkey = " + pubkey + "\n"
                  "relays = wss://one.example\n"
                  "relays = wss://two.example   # second relay\n"
                  "log-level debug\n"
                  "full_privacy\n"
                  "unknown_key = 3\n");
  Settings settings;
  config::LoadConfigFile(path, &settings);
  if (settings.mostro_pubkey != pubkey || settings.log_level != "debug" ||
      !settings.full_privacy ||
      settings.relays != std::vector<std::string>{"wss://one.example", "wss://two.example"}) {
    std::cerr << "config file not applied\n";
    return false;
  }

  WriteFile(dir / "bad.conf", "pow = 2\n\npow = lots\n");
  const auto error = ErrorOf([&] { config::LoadConfigFile(dir / "bad.conf", &settings); });
  if (error.rfind((dir / "bad.conf").string() + ":3: ", 0) != 0) {
    std::cerr << "bad line not reported with its location: " << error << "\n";
    return false;
  }

  Settings untouched;
  config::LoadConfigFile(dir / "missing.conf", &untouched);
  std::filesystem::remove_all(dir);
  return true;
}

bool TestCommandLine() {
  Settings settings;
  const auto positional = config::ApplyCommandLine(
      {"--pow=4", "orders", "--relays", "wss://a.example,wss://b.example", "--full-privacy",
       "--no-full-privacy", "--mode", "admin", "--", "extra"},
      &settings);
  if (settings.pow != 4 || settings.full_privacy ||
      settings.user_mode != config::UserMode::kAdmin || settings.relays.size() != 2 ||
      positional != std::vector<std::string>{"orders", "--", "extra"}) {
    std::cerr << "command line not applied\n";
    return false;
  }
  if (ErrorOf([&] { config::ApplyCommandLine({"--bogus", "1"}, &settings); }).empty() ||
      ErrorOf([&] { config::ApplyCommandLine({"--pow"}, &settings); }).empty()) {
    std::cerr << "bad command line accepted\n";
    return false;
  }
  return true;
}

bool TestPriority() {
  const auto dir = MakeTempDir();
  WriteFile(dir / config::kConfigFileName,
            "pow = 2\nlog_level = debug\nrelays = wss://file.example\ncurrencies = usd\n");
  ::setenv("MOSTRIX_LOG_LEVEL", "warn", 1);
  ::setenv("MOSTRIX_CURRENCIES", "eur", 1);
  std::vector<std::string> positional;
  const auto settings =
      config::LoadSettings({"--data-dir", dir.string(), "--pow=4", "disputes"}, &positional);
  ::unsetenv("MOSTRIX_LOG_LEVEL");
  ::unsetenv("MOSTRIX_CURRENCIES");

  if (settings.pow != 4 || settings.log_level != "warn" ||
      settings.relays != std::vector<std::string>{"wss://file.example"} ||
      settings.currencies != std::vector<std::string>{"EUR"} ||
      positional != std::vector<std::string>{"disputes"}) {
    std::cerr << "sources not applied in priority order\n";
    return false;
  }

  const auto skipped = config::LoadSettings({"--data-dir", dir.string(), "--no-conf"});
  if (skipped.pow != 0 || !skipped.relays.empty()) {
    std::cerr << "--no-conf still read the config file\n";
    return false;
  }
  if (settings.AttachmentDir() != dir / "downloads" ||
      settings.LogFilePath() != dir / config::kLogFileName) {
    std::cerr << "derived paths do not follow the data dir\n";
    return false;
  }
  std::filesystem::remove_all(dir);
  return true;
}

bool TestValidate() {
  if (!ErrorOf([] { ValidSettings().Validate(); }).empty()) {
    std::cerr << "valid settings rejected\n";
    return false;
  }
  const std::vector<std::pair<std::function<void(Settings*)>, std::string>> cases = {
      {[](Settings* s) { s->mostro_pubkey.clear(); }, "mostro_pubkey is required"},
      {[](Settings* s) { s->mostro_pubkey = "npub1xyz"; }, "invalid mostro_pubkey: npub1xyz"},
      {[](Settings* s) { s->relays.clear(); }, "at least one relay is required"},
      {[](Settings* s) { s->relays = {"https://relay.example"}; },
       "invalid relay url: https://relay.example (expected ws:// or wss://)"},
      {[](Settings* s) { s->pow = 33; }, "pow must be between 0 and 32, got 33"},
      {[](Settings* s) { s->user_mode = config::UserMode::kAdmin; },
       "admin mode requires admin_privkey"},
  };
  for (const auto& [mutate, expected] : cases) {
    auto settings = ValidSettings();
    mutate(&settings);
    const auto error = ErrorOf([&] { settings.Validate(); });
    if (error != expected) {
      std::cerr << "expected '" << expected << "', got '" << error << "'\n";
      return false;
    }
  }

  auto admin = ValidSettings();
  admin.user_mode = config::UserMode::kAdmin;
  admin.admin_privkey = crypto::Keys::Generate().SecretHex();
  admin.Validate();
  const auto json = admin.ToJson();
  if (json.at("admin_privkey") != "<redacted>" || json.at("user_mode") != "admin") {
    std::cerr << "admin key not redacted\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  try {
    if (!TestOptions() || !TestConfigFile() || !TestCommandLine() || !TestPriority() ||
        !TestValidate()) {
      return EXIT_FAILURE;
    }
  } catch (const std::exception& ex) {
    std::cerr << "settings_tests exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  std::cout << "settings_tests: OK\n";
  return EXIT_SUCCESS;
}
