#include "bm/config/config.hpp"

#include <cstdint>

#include <toml++/toml.hpp>

#include "bm/util/logging.hpp"
#include "bm/util/xdg.hpp"

namespace bm::config {

namespace {

constexpr int64_t kMaxFetchTimeoutSeconds = 24 * 60 * 60;

}  // namespace

Config::Config() {
  database_file = bm::util::Xdg::databaseFile().string();
  browser = bm::util::Xdg::browserCommand();
  html_file = bm::util::Xdg::htmlFile();
}

Result<void> Config::load(const std::filesystem::path& config_path) {
  config_path_ = config_path;

  if (!std::filesystem::exists(config_path)) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Config file not found: " + config_path.string()));
  }

  try {
    auto config_data = toml::parse_file(config_path.string());

    if (auto value = config_data["database_file"].value<std::string>()) {
      database_file = *value;
    }
    if (auto value = config_data["browser"].value<std::string>()) {
      browser = *value;
    }
    if (auto value = config_data["html_file"].value<std::string>()) {
      html_file = *value;
    }
    if (auto value = config_data["fetch_timeout_seconds"].value<int64_t>()) {
      if (*value <= 0 || *value > kMaxFetchTimeoutSeconds) {
        return std::unexpected(makeError(ErrorCode::kConfigError,
                                         "fetch_timeout_seconds out of range: " +
                                         std::to_string(*value)));
      }
      fetch_timeout_seconds = static_cast<int>(*value);
    }
    if (auto value = config_data["path_substitution"].value<bool>()) {
      path_substitution = *value;
    }

    if (auto logging_table = config_data["logging"].as_table()) {
      if (auto value = (*logging_table)["level"].value<std::string>()) {
        logging.level = *value;
      }
      if (auto value = (*logging_table)["file"].value<std::string>()) {
        logging.file = *value;
      }
    }

    return {};

  } catch (const toml::parse_error& e) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "TOML parse error: " + std::string(e.what())));
  }
}

Result<void> Config::validate() const {
  if (database_file.empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "database_file must not be empty"));
  }

  if (fetch_timeout_seconds <= 0) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "fetch_timeout_seconds must be positive"));
  }

  if (!bm::util::Logging::parseLevel(logging.level).has_value()) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Unknown log level: " + logging.level));
  }

  return {};
}

std::filesystem::path Config::defaultConfigPath() {
  return bm::util::Xdg::configFile();
}

}  // namespace bm::config
