#pragma once

#include <filesystem>
#include <string>
#include "zw/common.hpp"

namespace zw::util {

// Logging settings, read from the [logging] section of editor.toml
struct LoggingConfig {
  std::string level = "info";     // trace, debug, info, warn, error, critical, off
  std::filesystem::path file;     // Empty selects <data home>/logs/zeichenwerk.log
};

// Install the default spdlog logger: a rotating file sink (5MB x 3) at the
// configured level plus a stderr sink for warnings and above.
// Falls back to console-only logging when the file cannot be opened.
Result<void> setupLogging(const LoggingConfig& config);

// Silence the stderr sink of the default logger, e.g. while a full-screen UI
// owns the terminal. File logging is unaffected.
void muteConsoleLogging();

}  // namespace zw::util
