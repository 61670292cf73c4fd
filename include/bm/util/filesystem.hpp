#pragma once

#include <filesystem>
#include <string>

#include "bm/common.hpp"

namespace bm::util {

// Whole-file replacement: write to a sibling temp file, then rename over
// the target. The parent directory must already exist.
class AtomicFileWriter {
 public:
  explicit AtomicFileWriter(const std::filesystem::path& target_path);
  ~AtomicFileWriter();

  // Non-copyable, movable
  AtomicFileWriter(const AtomicFileWriter&) = delete;
  AtomicFileWriter& operator=(const AtomicFileWriter&) = delete;
  AtomicFileWriter(AtomicFileWriter&&) = default;
  AtomicFileWriter& operator=(AtomicFileWriter&&) = default;

  // Write content to temporary file
  Result<void> write(const std::string& content);

  // Commit the changes (rename temp to target)
  Result<void> commit();

 private:
  std::filesystem::path target_path_;
  std::filesystem::path temp_path_;
  bool committed_;

  void cleanup();
};

// Named temporary file, removed when the object goes out of scope
class TempFile {
 public:
  static Result<TempFile> create(const std::filesystem::path& dir = {},
                                 const std::string& prefix = "bm_temp");

  ~TempFile();

  // Non-copyable, movable
  TempFile(const TempFile&) = delete;
  TempFile& operator=(const TempFile&) = delete;
  TempFile(TempFile&& other) noexcept;
  TempFile& operator=(TempFile&& other) noexcept;

  Result<void> write(const std::string& content);

  const std::filesystem::path& path() const { return path_; }

 private:
  TempFile(int fd, std::filesystem::path path);

  int fd_;
  std::filesystem::path path_;

  void cleanup();
};

// Filesystem utilities
class FileSystem {
 public:
  // Atomic write with fsync and rename
  static Result<void> writeFileAtomic(const std::filesystem::path& path,
                                      const std::string& content);

  // Read a whole file. Missing files report kFileNotFound, unreadable ones
  // kFilePermissionDenied.
  static Result<std::string> readFile(const std::filesystem::path& path);

  // Absolute form of path when it names an existing filesystem entry,
  // path unchanged otherwise
  static std::string absoluteIfExists(const std::string& path);
};

}  // namespace bm::util
