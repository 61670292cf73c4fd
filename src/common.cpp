#include "bm/common.hpp"

#include <sstream>

namespace bm {

std::string_view errorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSuccess:
      return "Success";
    case ErrorCode::kInvalidArgument:
      return "Invalid argument";
    case ErrorCode::kFileNotFound:
      return "File not found";
    case ErrorCode::kFileReadError:
      return "File read error";
    case ErrorCode::kFileWriteError:
      return "File write error";
    case ErrorCode::kFilePermissionDenied:
      return "File permission denied";
    case ErrorCode::kDirectoryNotFound:
      return "Directory not found";
    case ErrorCode::kParseError:
      return "Parse error";
    case ErrorCode::kPatternError:
      return "Invalid pattern";
    case ErrorCode::kNetworkError:
      return "Network error";
    case ErrorCode::kConfigError:
      return "Configuration error";
    case ErrorCode::kProcessError:
      return "Process error";
    case ErrorCode::kNotFound:
      return "Not found";
    case ErrorCode::kUnknownError:
      return "Unknown error";
  }
  return "Unknown error";
}

std::string Version::toString() const {
  std::ostringstream oss;
  oss << major << "." << minor << "." << patch;
  return oss.str();
}

Version getVersion() {
#ifdef BM_VERSION_MAJOR
  return Version{BM_VERSION_MAJOR, BM_VERSION_MINOR, BM_VERSION_PATCH};
#else
  return Version{0, 1, 0};
#endif
}

}  // namespace bm
