#pragma once

#include <ostream>

#include "bm/common.hpp"
#include "bm/cli/dispatcher.hpp"

namespace bm::cli {

// Formats command errors for the error stream and picks the exit status
class CommandErrorHandler {
public:
  CommandErrorHandler(const Options& options, std::ostream& err)
      : options_(options), err_(err) {}

  // Report error and return the process exit code
  int handleCommandError(const Error& error);

  // 1 for lookup, pattern and usage failures, 2 for everything fatal
  static int exitCodeFor(ErrorCode code);

private:
  const Options& options_;
  std::ostream& err_;
};

} // namespace bm::cli
