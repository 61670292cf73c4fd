#pragma once

#include <filesystem>
#include <string>

#include "bm/common.hpp"

namespace bm::config {

// Configuration for the bookmark manager
class Config {
 public:
  // Defaults from the XDG directories and the environment
  Config();

  // Bookmark database (local path or remote locator)
  std::string database_file;

  // Command used for the browser hand-off
  std::string browser;

  // Page written for the browser hand-off
  std::filesystem::path html_file;

  // Timeout for fetching a remote database
  int fetch_timeout_seconds = 30;

  // Rewrite URL arguments naming existing files to absolute paths
  bool path_substitution = true;

  struct LoggingConfig {
    std::string level = "warn";
    std::filesystem::path file;    // Rotating log file, none when empty
  };
  LoggingConfig logging;

  // Load configuration from file
  Result<void> load(const std::filesystem::path& config_path);

  // Validate configuration
  Result<void> validate() const;

  // Get default configuration file path
  static std::filesystem::path defaultConfigPath();

  const std::filesystem::path& configPath() const { return config_path_; }

 private:
  std::filesystem::path config_path_;
};

}  // namespace bm::config
