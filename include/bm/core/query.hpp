#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "bm/common.hpp"
#include "bm/core/database.hpp"

namespace bm::core {

// One listed bookmark. tags is sorted and unique.
struct Entry {
  std::string url;
  TagList tags;

  bool operator==(const Entry& other) const = default;
};

// How many URLs carry a tag
struct TagCount {
  std::string tag;
  std::size_t count = 0;

  bool operator==(const TagCount& other) const = default;
};

// Read-only queries over a Database. Results are sorted by URL (or by tag
// for counts) so repeated runs print the same thing.
namespace query {

// URLs sharing at least one tag with tags; every URL when tags is empty
std::vector<Entry> listAny(const Database& db, const std::vector<std::string>& tags);

// URLs carrying all of tags. An empty request is a subset of everything.
std::vector<Entry> listEvery(const Database& db, const std::vector<std::string>& tags);

// Number of URLs per distinct tag
std::vector<TagCount> tagFrequency(const Database& db);

// tagFrequency() restricted to tags matched anywhere by the ECMAScript
// regular expression pattern. Fails with kPatternError on a bad pattern.
Result<std::vector<TagCount>> searchTag(const Database& db, const std::string& pattern);

// Least used first, ties broken by tag name
void sortByUsage(std::vector<TagCount>& counts);

// Every tag in use when tags asks for "all" (any case), tags otherwise
std::vector<std::string> expandAllTag(const Database& db, const std::vector<std::string>& tags);

}  // namespace query

}  // namespace bm::core
