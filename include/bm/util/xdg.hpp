#pragma once

#include <filesystem>
#include <string>

namespace bm::util {

// XDG Base Directory Specification utilities
class Xdg {
 public:
  // Get XDG data home directory (~/.local/share/bm)
  static std::filesystem::path dataHome();

  // Get XDG config home directory (~/.config/bm)
  static std::filesystem::path configHome();

  // Ensure directory exists with proper permissions
  static bool ensureDirectory(const std::filesystem::path& path, std::filesystem::perms perms);

  // Get config file path
  static std::filesystem::path configFile();

  // Get default bookmark database path
  static std::filesystem::path databaseFile();

  // Get the page written for the browser hand-off
  static std::filesystem::path htmlFile();

  // Browser command from $BROWSER, xdg-open otherwise
  static std::string browserCommand();

 private:
  // Get environment variable with default
  static std::string getEnvVar(const std::string& name, const std::string& default_value);
};

}  // namespace bm::util
