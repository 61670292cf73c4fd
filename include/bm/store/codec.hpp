#pragma once

#include <string>
#include <string_view>

#include "bm/common.hpp"
#include "bm/core/database.hpp"

namespace bm::store::codec {

// Serialize db as a MessagePack map of string -> array of strings
std::string encode(const core::Database& db);

// Deserialize a database file.
//
// MessagePack payloads are recognized by their leading map marker; anything
// else is read as the legacy YAML layout (mapping of url -> list of tags).
// Empty input is an empty database. Any other shape is kParseError.
Result<core::Database> decode(std::string_view bytes);

}  // namespace bm::store::codec
