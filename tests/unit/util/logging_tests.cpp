#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>

#include "util/logging.hpp"

using namespace mostrix;

namespace {

std::string ReadAll(const std::filesystem::path& path) {
  std::ifstream in(path);
  std::ostringstream out;
  out << in.rdbuf();
  return out.str();
}

}  // namespace

int main() {
  try {
    if (util::ParseLogLevelString("WARNING") != util::LogLevel::kWarn ||
        util::ParseLogLevelString("Debug") != util::LogLevel::kDebug ||
        util::ParseLogLevelString("error") != util::LogLevel::kError) {
      std::cerr << "log level parsing mismatch\n";
      return EXIT_FAILURE;
    }
    bool threw = false;
    try {
      util::ParseLogLevelString("verbose");
    } catch (const std::runtime_error&) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "unknown log level accepted\n";
      return EXIT_FAILURE;
    }

    const auto suffix = static_cast<std::uint64_t>(std::random_device{}());
    const auto dir = std::filesystem::temp_directory_path() /
                     ("mostrix_logging_tests_" + std::to_string(suffix));
    const auto path = dir / "nested" / "mostrix.log";

    util::Logger logger;
    logger.Configure(util::LogLevel::kInfo, 0, 0);
    logger.Enable(path);
    logger.Log(util::LogLevel::kDebug, "hidden debug line");
    logger.Log(util::LogLevel::kWarn, "relay timed out");
    auto text = ReadAll(path);
    if (text.find("---- mostrix log started") != 0) {
      std::cerr << "missing log header\n";
      return EXIT_FAILURE;
    }
    if (text.find("hidden debug line") != std::string::npos) {
      std::cerr << "debug line written below threshold\n";
      return EXIT_FAILURE;
    }
    if (text.find("] [WARN] relay timed out\n") == std::string::npos) {
      std::cerr << "warn line missing or malformed:\n" << text;
      return EXIT_FAILURE;
    }
    if (!logger.WouldLog(util::LogLevel::kError) || logger.WouldLog(util::LogLevel::kDebug)) {
      std::cerr << "WouldLog disagrees with threshold\n";
      return EXIT_FAILURE;
    }

    // Rotation: a tiny size cap forces the current file into mostrix.log.1.
    logger.Configure(util::LogLevel::kDebug, 64, 2);
    for (int i = 0; i < 8; ++i) {
      logger.Log(util::LogLevel::kInfo, "rotation filler line " + std::to_string(i));
    }
    const auto rotated = std::filesystem::path(path).concat(".1");
    if (!std::filesystem::exists(rotated)) {
      std::cerr << "expected rotated log file " << rotated << "\n";
      return EXIT_FAILURE;
    }
    if (std::filesystem::exists(std::filesystem::path(path).concat(".3"))) {
      std::cerr << "rotation kept more files than configured\n";
      return EXIT_FAILURE;
    }
    text = ReadAll(path);
    if (text.find("rotation filler line 7") == std::string::npos) {
      std::cerr << "latest line missing from active log\n";
      return EXIT_FAILURE;
    }

    logger.Disable();
    if (logger.Enabled()) {
      std::cerr << "logger still enabled after Disable\n";
      return EXIT_FAILURE;
    }
    std::filesystem::remove_all(dir);
  } catch (const std::exception& ex) {
    std::cerr << "logging_tests exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  std::cout << "logging_tests: OK\n";
  return EXIT_SUCCESS;
}
