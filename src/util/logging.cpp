#include "zw/util/logging.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <vector>
#include "zw/util/xdg.hpp"

namespace zw::util {

namespace {
constexpr size_t kMaxFileSize = 1024 * 1024 * 5;
constexpr size_t kMaxFiles = 3;
constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v";
}  // namespace

Result<void> setupLogging(const LoggingConfig& config) {
  auto level = spdlog::level::from_str(config.level);
  if (level == spdlog::level::off && config.level != "off") {
    return makeErrorResult<void>(ErrorCode::kInvalidArgument,
        "Unknown log level: " + config.level);
  }

  auto log_file = config.file;
  if (log_file.empty()) {
    log_file = Xdg::logDir() / "zeichenwerk.log";
  }

  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  console_sink->set_level(spdlog::level::warn);

  try {
    if (log_file.has_parent_path() &&
        !Xdg::ensureDirectory(log_file.parent_path(), std::filesystem::perms::owner_all)) {
      throw std::runtime_error("cannot create " + log_file.parent_path().string());
    }

    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
      log_file.string(), kMaxFileSize, kMaxFiles);

    std::vector<spdlog::sink_ptr> sinks = {file_sink, console_sink};
    auto logger = std::make_shared<spdlog::logger>("zeichenwerk", sinks.begin(), sinks.end());
    logger->set_pattern(kPattern);
    logger->set_level(level);
    spdlog::set_default_logger(logger);

  } catch (const std::exception& e) {
    // Fallback to console-only logging if file setup fails
    auto logger = std::make_shared<spdlog::logger>("zeichenwerk", console_sink);
    logger->set_pattern(kPattern);
    logger->set_level(level);
    spdlog::set_default_logger(logger);
    spdlog::warn("Failed to setup file logging: {}", e.what());
  }

  return {};
}

void muteConsoleLogging() {
  for (auto& sink : spdlog::default_logger()->sinks()) {
    if (std::dynamic_pointer_cast<spdlog::sinks::stderr_color_sink_mt>(sink)) {
      sink->set_level(spdlog::level::off);
    }
  }
}

}  // namespace zw::util
