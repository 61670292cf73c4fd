#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "bm/common.hpp"
#include "bm/core/database.hpp"
#include "bm/util/http_client.hpp"

namespace bm::store {

struct StoreOptions {
  std::chrono::seconds fetch_timeout{30};
  // Where remote payloads are staged; the system temp dir when empty
  std::filesystem::path temp_dir;
};

/**
 * @brief Loads and persists the bookmark database.
 *
 * A source is either a local path or, when it contains "://", a remote
 * locator fetched through the transport. Missing files, corrupt payloads
 * and failed fetches are logged as warnings and yield an empty database;
 * only permission failures come back as errors.
 */
class DatabaseStore {
public:
  explicit DatabaseStore(std::shared_ptr<util::HttpTransport> transport,
                         StoreOptions options = {});

  static bool isRemote(std::string_view source);

  Result<core::Database> load(const std::string& source);

  /**
   * @brief Load the working database, creating a missing local file empty
   *
   * A file that cannot be created for lack of a directory is only a
   * warning; kFilePermissionDenied is returned when the directory is not
   * writable.
   */
  Result<core::Database> open(const std::string& source);

  /**
   * @brief GET locator, stage the body in a temporary file and load it
   *
   * The temporary file is removed before returning, whatever the outcome.
   */
  Result<core::Database> fetchAndLoad(const std::string& locator);

  /**
   * @brief Rewrite destination with the full database
   * @return kInvalidArgument for a remote destination, kDirectoryNotFound
   *         when the parent directory is missing, kFilePermissionDenied or
   *         kFileWriteError on I/O failure
   */
  Result<void> save(const core::Database& db, const std::string& destination);

  // Load every source and add its bookmarks to db
  Result<void> mergeFrom(core::Database& db, const std::vector<std::string>& sources);

private:
  Result<core::Database> loadFile(const std::filesystem::path& path, const std::string& label);

  std::shared_ptr<util::HttpTransport> transport_;
  StoreOptions options_;
};

}  // namespace bm::store
