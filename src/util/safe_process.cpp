#include "bm/util/safe_process.hpp"

#include <spawn.h>
#include <unistd.h>

#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <sstream>

extern char **environ;

namespace bm::util {

namespace {

constexpr const char* kTargetPlaceholder = "%s";

// Shell metacharacters never make sense in a program name
bool isSafeProgram(const std::string& program) {
  if (program.empty() || program.length() > 255) {
    return false;
  }
  const std::string shell_chars = "|&;(){}[]<>*?~$`\"'\\";
  for (char c : program) {
    if (shell_chars.find(c) != std::string::npos || static_cast<unsigned char>(c) < 32) {
      return false;
    }
  }
  return true;
}

bool isExecutable(const std::filesystem::path& path) {
  std::error_code ec;
  return std::filesystem::is_regular_file(path, ec) && ::access(path.c_str(), X_OK) == 0;
}

}  // namespace

std::vector<std::string> SafeProcess::buildArgv(const std::string& command_line,
                                                const std::string& target) {
  std::vector<std::string> argv;
  std::istringstream stream(command_line);
  std::string word;
  bool placed = false;
  while (stream >> word) {
    if (word == kTargetPlaceholder) {
      argv.push_back(target);
      placed = true;
    } else {
      argv.push_back(word);
    }
  }

  if (!argv.empty() && !placed) {
    argv.push_back(target);
  }
  return argv;
}

std::optional<std::string> SafeProcess::findCommand(const std::string& command) {
  if (!isSafeProgram(command)) {
    return std::nullopt;
  }

  if (command.find('/') != std::string::npos) {
    return isExecutable(command) ? std::optional<std::string>(command) : std::nullopt;
  }

  const char* path_env = std::getenv("PATH");
  if (!path_env) {
    return std::nullopt;
  }

  std::istringstream path_stream{std::string(path_env)};
  std::string dir;
  while (std::getline(path_stream, dir, ':')) {
    if (dir.empty()) continue;

    auto candidate = std::filesystem::path(dir) / command;
    if (isExecutable(candidate)) {
      return candidate.string();
    }
  }

  return std::nullopt;
}

Result<pid_t> SafeProcess::spawnDetached(const std::string& command_line,
                                         const std::string& target) {
  auto args = buildArgv(command_line, target);
  if (args.empty()) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument, "Empty command line"));
  }
  if (!isSafeProgram(args.front())) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "Invalid command name: " + args.front()));
  }

  auto program = findCommand(args.front());
  if (!program.has_value()) {
    return std::unexpected(makeError(ErrorCode::kProcessError,
                                     "Command not found: " + args.front()));
  }

  std::vector<char*> argv;
  argv.reserve(args.size() + 1);
  for (auto& arg : args) {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);

  pid_t pid;
  int result = posix_spawn(&pid, program->c_str(), nullptr, nullptr, argv.data(), environ);
  if (result != 0) {
    return std::unexpected(makeError(ErrorCode::kProcessError,
                                     "Failed to spawn " + *program + ": " + std::strerror(result)));
  }

  return pid;
}

} // namespace bm::util
