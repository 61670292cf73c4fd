#include "bm/cli/command_error_handler.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace bm::cli {

int CommandErrorHandler::handleCommandError(const Error& error) {
  int exit_code = exitCodeFor(error.code());

  spdlog::debug("{} (exit {}): {}", errorCodeToString(error.code()), exit_code, error.message());

  if (options_.json) {
    nlohmann::json error_json;
    error_json["error"] = error.message();
    error_json["code"] = static_cast<int>(error.code());
    err_ << error_json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
         << std::endl;
  } else {
    err_ << "Error: " << error.message() << std::endl;
  }

  return exit_code;
}

int CommandErrorHandler::exitCodeFor(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSuccess:
      return 0;
    case ErrorCode::kNotFound:
    case ErrorCode::kPatternError:
    case ErrorCode::kInvalidArgument:
      return 1;
    default:
      return 2;
  }
}

} // namespace bm::cli
