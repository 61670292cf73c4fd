#pragma once

#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

#include "bm/common.hpp"

namespace bm::util {

/**
 * @brief Launching helper commands without a shell
 *
 * A configured command line such as "firefox --new-window" is split on
 * whitespace, resolved against PATH and started with posix_spawn, so no
 * argument is ever interpreted by /bin/sh.
 */
class SafeProcess {
public:
  /**
   * @brief Start a configured command line on target without waiting
   *
   * Every "%s" word of command_line is replaced by target; when there is
   * none, target is appended as the last argument.
   *
   * @return Process ID or error (kInvalidArgument for an empty or unsafe
   *         command, kProcessError when it cannot be found or started)
   */
  static Result<pid_t> spawnDetached(const std::string& command_line, const std::string& target);

  /**
   * @brief Argument vector (program first) for command_line and target
   */
  static std::vector<std::string> buildArgv(const std::string& command_line,
                                            const std::string& target);

  /**
   * @brief Full path of an executable, looked up in PATH unless absolute
   */
  static std::optional<std::string> findCommand(const std::string& command);

private:
  SafeProcess() = default;
};

} // namespace bm::util
