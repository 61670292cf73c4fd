#include "bm/store/codec.hpp"

#include <cstdint>
#include <vector>

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace bm::store::codec {

namespace {

bool isMsgpackMap(std::uint8_t marker) {
  // fixmap, map16, map32
  return (marker >= 0x80 && marker <= 0x8f) || marker == 0xde || marker == 0xdf;
}

Result<core::Database> decodeMsgpack(std::string_view bytes) {
  nlohmann::json root;
  try {
    root = nlohmann::json::from_msgpack(bytes.begin(), bytes.end());
  } catch (const nlohmann::json::exception& e) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Corrupt database payload: " + std::string(e.what())));
  }

  if (!root.is_object()) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Database payload is not a mapping"));
  }

  core::Database::Map entries;
  for (const auto& [url, tags] : root.items()) {
    if (!tags.is_array()) {
      return std::unexpected(makeError(ErrorCode::kParseError,
                                       "Tags of '" + url + "' are not a list"));
    }
    core::TagList list;
    list.reserve(tags.size());
    for (const auto& tag : tags) {
      if (!tag.is_string()) {
        return std::unexpected(makeError(ErrorCode::kParseError,
                                         "Non-string tag for '" + url + "'"));
      }
      list.push_back(tag.get<std::string>());
    }
    entries.emplace(url, std::move(list));
  }
  return core::Database(std::move(entries));
}

Result<core::Database> decodeYaml(std::string_view bytes) {
  try {
    YAML::Node root = YAML::Load(std::string(bytes));

    if (root.IsNull()) {
      return core::Database{};
    }
    if (!root.IsMap()) {
      return std::unexpected(makeError(ErrorCode::kParseError,
                                       "Database payload is not a mapping"));
    }

    core::Database::Map entries;
    for (const auto& pair : root) {
      auto url = pair.first.as<std::string>();
      const auto& tags = pair.second;
      if (!tags.IsSequence()) {
        return std::unexpected(makeError(ErrorCode::kParseError,
                                         "Tags of '" + url + "' are not a list"));
      }
      core::TagList list;
      list.reserve(tags.size());
      for (const auto& tag : tags) {
        if (!tag.IsScalar()) {
          return std::unexpected(makeError(ErrorCode::kParseError,
                                           "Non-scalar tag for '" + url + "'"));
        }
        list.emplace_back(tag.as<std::string>());
      }
      entries.emplace(std::move(url), std::move(list));
    }
    return core::Database(std::move(entries));

  } catch (const YAML::Exception& e) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "YAML parse error: " + std::string(e.what())));
  }
}

}  // namespace

std::string encode(const core::Database& db) {
  nlohmann::json root = nlohmann::json::object();
  for (const auto& [url, tags] : db.entries()) {
    core::TagList sorted = tags;
    core::normalizeTags(sorted);
    root[url] = sorted;
  }

  std::vector<std::uint8_t> packed = nlohmann::json::to_msgpack(root);
  return std::string(packed.begin(), packed.end());
}

Result<core::Database> decode(std::string_view bytes) {
  if (bytes.empty()) {
    return core::Database{};
  }

  if (isMsgpackMap(static_cast<std::uint8_t>(bytes.front()))) {
    return decodeMsgpack(bytes);
  }
  return decodeYaml(bytes);
}

}  // namespace bm::store::codec
