#include "bm/util/xdg.hpp"

#include <cstdlib>

namespace bm::util {

std::filesystem::path Xdg::dataHome() {
  std::string xdg_data_home = getEnvVar("XDG_DATA_HOME", "");
  if (!xdg_data_home.empty()) {
    return std::filesystem::path(xdg_data_home) / "bm";
  }

  std::string home = getEnvVar("HOME", "");
  if (home.empty()) {
    return std::filesystem::current_path() / ".bm_data";
  }

  return std::filesystem::path(home) / ".local" / "share" / "bm";
}

std::filesystem::path Xdg::configHome() {
  std::string xdg_config_home = getEnvVar("XDG_CONFIG_HOME", "");
  if (!xdg_config_home.empty()) {
    return std::filesystem::path(xdg_config_home) / "bm";
  }

  std::string home = getEnvVar("HOME", "");
  if (home.empty()) {
    return std::filesystem::current_path() / ".bm_config";
  }

  return std::filesystem::path(home) / ".config" / "bm";
}

bool Xdg::ensureDirectory(const std::filesystem::path& path, std::filesystem::perms perms) {
  std::error_code ec;

  if (std::filesystem::exists(path, ec)) {
    return !ec;
  }

  if (!std::filesystem::create_directories(path, ec)) {
    return false;
  }

  std::filesystem::permissions(path, perms, ec);
  return !ec;
}

std::filesystem::path Xdg::configFile() {
  return configHome() / "config.toml";
}

std::filesystem::path Xdg::databaseFile() {
  return dataHome() / "bookmarks.db";
}

std::filesystem::path Xdg::htmlFile() {
  std::error_code ec;
  auto tmp = std::filesystem::temp_directory_path(ec);
  if (ec) {
    tmp = "/tmp";
  }
  return tmp / "bookmark.html";
}

std::string Xdg::browserCommand() {
  return getEnvVar("BROWSER", "xdg-open");
}

std::string Xdg::getEnvVar(const std::string& name, const std::string& default_value) {
  const char* value = std::getenv(name.c_str());
  return (value && *value) ? std::string(value) : default_value;
}

}  // namespace bm::util
