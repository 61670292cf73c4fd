#include "bm/util/filesystem.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <random>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace bm::util {

namespace {

std::string randomSuffix() {
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<> dis(100000, 999999);
  return std::to_string(dis(gen));
}

ErrorCode errnoToErrorCode(int err, ErrorCode fallback) {
  switch (err) {
    case EACCES:
    case EPERM:
    case EROFS:
      return ErrorCode::kFilePermissionDenied;
    case ENOENT:
      return ErrorCode::kFileNotFound;
    default:
      return fallback;
  }
}

// Write all of content to fd, retrying on EINTR and short writes. Returns 0
// or the errno of the failing write.
int writeAll(int fd, const std::string& content) {
  const char* data = content.data();
  std::size_t remaining = content.size();
  while (remaining > 0) {
    ssize_t written = ::write(fd, data, remaining);
    if (written < 0) {
      if (errno == EINTR) {
        continue;
      }
      return errno;
    }
    data += written;
    remaining -= static_cast<std::size_t>(written);
  }
  return 0;
}

}  // namespace

// AtomicFileWriter implementation
AtomicFileWriter::AtomicFileWriter(const std::filesystem::path& target_path)
    : target_path_(target_path), committed_(false) {
  temp_path_ = target_path_;
  temp_path_ += ".tmp." + randomSuffix();
}

AtomicFileWriter::~AtomicFileWriter() {
  if (!committed_) {
    cleanup();
  }
}

Result<void> AtomicFileWriter::write(const std::string& content) {
  if (committed_) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError, "Writer already used"));
  }

  auto parent = target_path_.parent_path();
  std::error_code ec;
  if (!parent.empty() && !std::filesystem::is_directory(parent, ec)) {
    return std::unexpected(makeError(ErrorCode::kDirectoryNotFound,
                                     "Directory does not exist: " + parent.string()));
  }

  int fd = ::open(temp_path_.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_EXCL, S_IRUSR | S_IWUSR);
  if (fd < 0) {
    int err = errno;
    return std::unexpected(makeError(errnoToErrorCode(err, ErrorCode::kFileWriteError),
                                     "Cannot create temporary file " + temp_path_.string() +
                                     ": " + std::strerror(err)));
  }

  if (int err = writeAll(fd, content); err != 0) {
    ::close(fd);
    cleanup();
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Failed to write to temporary file: " +
                                     std::string(std::strerror(err))));
  }

  ::fsync(fd);
  if (::close(fd) != 0) {
    cleanup();
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Failed to close temporary file"));
  }

  return {};
}

Result<void> AtomicFileWriter::commit() {
  if (committed_) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError, "Already committed"));
  }

  std::error_code ec;
  std::filesystem::rename(temp_path_, target_path_, ec);
  if (ec) {
    cleanup();
    return std::unexpected(makeError(errnoToErrorCode(ec.value(), ErrorCode::kFileWriteError),
                                     "Cannot replace " + target_path_.string() + ": " + ec.message()));
  }

  // Sync parent directory to ensure rename is persistent
  auto parent = target_path_.parent_path();
  if (!parent.empty()) {
    int dir_fd = ::open(parent.c_str(), O_RDONLY);
    if (dir_fd >= 0) {
      ::fsync(dir_fd);
      ::close(dir_fd);
    }
  }

  committed_ = true;
  return {};
}

void AtomicFileWriter::cleanup() {
  std::error_code ec;
  std::filesystem::remove(temp_path_, ec);
}

// TempFile implementation
Result<TempFile> TempFile::create(const std::filesystem::path& dir, const std::string& prefix) {
  std::error_code ec;
  std::filesystem::path temp_dir = dir.empty() ? std::filesystem::temp_directory_path(ec) : dir;
  if (ec) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "No temporary directory: " + ec.message()));
  }

  std::filesystem::path temp_path = temp_dir / (prefix + "." + randomSuffix());
  int fd = ::open(temp_path.c_str(), O_CREAT | O_RDWR | O_EXCL, S_IRUSR | S_IWUSR);
  if (fd < 0) {
    int err = errno;
    return std::unexpected(makeError(errnoToErrorCode(err, ErrorCode::kFileWriteError),
                                     "Cannot create temporary file: " + std::string(std::strerror(err))));
  }

  return TempFile(fd, temp_path);
}

TempFile::TempFile(int fd, std::filesystem::path path)
    : fd_(fd), path_(std::move(path)) {}

TempFile::TempFile(TempFile&& other) noexcept
    : fd_(other.fd_), path_(std::move(other.path_)) {
  other.fd_ = -1;
  other.path_.clear();
}

TempFile& TempFile::operator=(TempFile&& other) noexcept {
  if (this != &other) {
    cleanup();
    fd_ = other.fd_;
    path_ = std::move(other.path_);
    other.fd_ = -1;
    other.path_.clear();
  }
  return *this;
}

TempFile::~TempFile() {
  cleanup();
}

Result<void> TempFile::write(const std::string& content) {
  if (fd_ < 0) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError, "File not open"));
  }

  if (int err = writeAll(fd_, content); err != 0) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Write failed: " + std::string(std::strerror(err))));
  }

  if (::fsync(fd_) < 0) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError, "Sync failed"));
  }

  return {};
}

void TempFile::cleanup() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }

  if (!path_.empty()) {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    path_.clear();
  }
}

// FileSystem implementation
Result<void> FileSystem::writeFileAtomic(const std::filesystem::path& path,
                                         const std::string& content) {
  AtomicFileWriter writer(path);

  auto write_result = writer.write(content);
  if (!write_result.has_value()) {
    return write_result;
  }

  return writer.commit();
}

Result<std::string> FileSystem::readFile(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec) && !ec) {
    return std::unexpected(makeError(ErrorCode::kFileNotFound,
                                     "No such file: " + path.string()));
  }
  if (std::filesystem::is_directory(path, ec)) {
    return std::unexpected(makeError(ErrorCode::kFileReadError,
                                     "Is a directory: " + path.string()));
  }

  errno = 0;
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    int err = errno;
    return std::unexpected(makeError(errnoToErrorCode(err, ErrorCode::kFileReadError),
                                     "Cannot open file " + path.string() +
                                     (err != 0 ? ": " + std::string(std::strerror(err)) : "")));
  }

  std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  if (file.bad()) {
    return std::unexpected(makeError(ErrorCode::kFileReadError, "Read failed: " + path.string()));
  }

  return content;
}

std::string FileSystem::absoluteIfExists(const std::string& path) {
  std::error_code ec;
  if (path.empty() || !std::filesystem::exists(path, ec)) {
    return path;
  }

  auto absolute = std::filesystem::absolute(path, ec);
  if (ec) {
    return path;
  }
  auto normal = absolute.lexically_normal().string();
  if (normal.size() > 1 && normal.back() == '/') {
    normal.pop_back();
  }
  return normal;
}

}  // namespace bm::util
