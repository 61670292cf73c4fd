#include "bm/store/database_store.hpp"

#include <spdlog/spdlog.h>

#include "bm/store/codec.hpp"
#include "bm/util/filesystem.hpp"

namespace bm::store {

DatabaseStore::DatabaseStore(std::shared_ptr<util::HttpTransport> transport,
                             StoreOptions options)
    : transport_(std::move(transport)), options_(std::move(options)) {
}

bool DatabaseStore::isRemote(std::string_view source) {
  return source.find("://") != std::string_view::npos;
}

Result<core::Database> DatabaseStore::load(const std::string& source) {
  if (isRemote(source)) {
    return fetchAndLoad(source);
  }
  return loadFile(source, source);
}

Result<core::Database> DatabaseStore::open(const std::string& source) {
  std::error_code ec;
  if (isRemote(source) || std::filesystem::exists(source, ec) || ec) {
    return load(source);
  }

  auto created = util::FileSystem::writeFileAtomic(source, "");
  if (!created.has_value()) {
    if (created.error().code() == ErrorCode::kFilePermissionDenied) {
      return std::unexpected(created.error());
    }
    spdlog::warn("The file \"{}\" does not exist and cannot be created: {}",
                 source, created.error().message());
    return core::Database{};
  }

  spdlog::warn("The file \"{}\" does not exist: created an empty database", source);
  return core::Database{};
}

Result<core::Database> DatabaseStore::loadFile(const std::filesystem::path& path,
                                               const std::string& label) {
  auto content = util::FileSystem::readFile(path);
  if (!content.has_value()) {
    switch (content.error().code()) {
      case ErrorCode::kFilePermissionDenied:
        return std::unexpected(content.error());
      case ErrorCode::kFileNotFound:
        spdlog::warn("The file \"{}\" does not exist: starting with an empty database", label);
        return core::Database{};
      default:
        spdlog::warn("Cannot read \"{}\": {}", label, content.error().message());
        return core::Database{};
    }
  }

  auto db = codec::decode(*content);
  if (!db.has_value()) {
    spdlog::warn("Cannot decode \"{}\", using an empty database: {}", label, db.error().message());
    return core::Database{};
  }

  spdlog::debug("Loaded {} bookmark(s) from {}", db->size(), label);
  return db;
}

Result<core::Database> DatabaseStore::fetchAndLoad(const std::string& locator) {
  if (!transport_) {
    spdlog::warn("No network transport configured, cannot fetch {}", locator);
    return core::Database{};
  }

  auto temp = util::TempFile::create(options_.temp_dir, "bm_remote");
  if (!temp.has_value()) {
    spdlog::warn("Cannot stage {}: {}", locator, temp.error().message());
    return core::Database{};
  }

  auto response = transport_->get(locator, options_.fetch_timeout);
  if (!response.has_value()) {
    spdlog::warn("Cannot fetch {}: {}", locator, response.error().message());
    return core::Database{};
  }

  if (!response->ok()) {
    spdlog::warn("Cannot fetch {}: HTTP status {}", locator, response->status_code);
    return core::Database{};
  }

  // The payload is binary and kept byte for byte whatever the charset says
  spdlog::debug("Fetched {} byte(s) from {} (charset {})",
                response->body.size(), locator, util::charsetOf(response->content_type));

  auto write_result = temp->write(response->body);
  if (!write_result.has_value()) {
    spdlog::warn("Cannot stage {}: {}", locator, write_result.error().message());
    return core::Database{};
  }

  return loadFile(temp->path(), locator);
}

Result<void> DatabaseStore::save(const core::Database& db, const std::string& destination) {
  if (isRemote(destination)) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "Remote database " + destination + " is read-only"));
  }

  auto write_result = util::FileSystem::writeFileAtomic(destination, codec::encode(db));
  if (!write_result.has_value()) {
    return write_result;
  }

  spdlog::debug("Saved {} bookmark(s) to {}", db.size(), destination);
  return {};
}

Result<void> DatabaseStore::mergeFrom(core::Database& db, const std::vector<std::string>& sources) {
  for (const auto& source : sources) {
    auto imported = load(source);
    if (!imported.has_value()) {
      return std::unexpected(imported.error());
    }
    spdlog::info("Importing {} bookmark(s) from {}", imported->size(), source);
    db.merge(*imported);
  }
  return {};
}

}  // namespace bm::store
