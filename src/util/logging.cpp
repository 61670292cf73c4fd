#include "bm/util/logging.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace bm::util {

Result<void> Logging::initialize(spdlog::level::level_enum level,
                                 const std::filesystem::path& log_file) {
  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  console_sink->set_level(level);
  console_sink->set_pattern("%^%l%$: %v");

  std::vector<spdlog::sink_ptr> sinks = {console_sink};
  spdlog::level::level_enum logger_level = level;

  if (!log_file.empty()) {
    try {
      auto parent = log_file.parent_path();
      if (!parent.empty()) {
        std::filesystem::create_directories(parent);
      }
      auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        log_file.string(), 1024 * 1024, 3); // 1MB files, 3 backups
      file_sink->set_level(spdlog::level::debug);
      file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
      sinks.push_back(file_sink);
      logger_level = std::min(level, spdlog::level::debug);
    } catch (const std::exception& e) {
      auto logger = std::make_shared<spdlog::logger>("bm", console_sink);
      logger->set_level(level);
      spdlog::set_default_logger(logger);
      return std::unexpected(makeError(ErrorCode::kConfigError,
                                       "Failed to setup file logging: " + std::string(e.what())));
    }
  }

  auto logger = std::make_shared<spdlog::logger>("bm", sinks.begin(), sinks.end());
  logger->set_level(logger_level);
  spdlog::set_default_logger(logger);
  return {};
}

std::optional<spdlog::level::level_enum> Logging::parseLevel(const std::string& name) {
  std::string lowered = name;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lowered == "warning") {
    return spdlog::level::warn;
  }

  auto level = spdlog::level::from_str(lowered);
  // from_str() falls back to "off" for unknown names
  if (level == spdlog::level::off && lowered != "off") {
    return std::nullopt;
  }
  return level;
}

}  // namespace bm::util
