#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include <spdlog/common.h>

#include "bm/common.hpp"

namespace bm::util {

// Process-wide spdlog setup. Diagnostics go to stderr; stdout is left to
// command output.
class Logging {
 public:
  // Install the default "bm" logger: colored stderr sink at level, plus a
  // rotating file sink when log_file is not empty
  static Result<void> initialize(spdlog::level::level_enum level,
                                 const std::filesystem::path& log_file = {});

  // "warn", "debug", ... (spdlog names, case-insensitive)
  static std::optional<spdlog::level::level_enum> parseLevel(const std::string& name);
};

}  // namespace bm::util
