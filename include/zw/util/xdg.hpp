#pragma once

#include <filesystem>
#include <string>

namespace zw::util {

// XDG Base Directory Specification utilities
class Xdg {
 public:
  // Get XDG data home directory (~/.local/share/zeichenwerk)
  static std::filesystem::path dataHome();

  // Get XDG config home directory (~/.config/zeichenwerk)
  static std::filesystem::path configHome();

  // Ensure directory exists with proper permissions
  static bool ensureDirectory(const std::filesystem::path& path, std::filesystem::perms perms);

  // Get log directory
  static std::filesystem::path logDir();

 private:
  // Get environment variable with default
  static std::string getEnvVar(const std::string& name, const std::string& default_value);
};

}  // namespace zw::util
