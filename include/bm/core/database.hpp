#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "bm/common.hpp"

namespace bm::core {

// Tags attached to one URL. Mutations keep the list sorted and unique;
// a freshly decoded list may still carry duplicates until clean().
using TagList = std::vector<std::string>;

// Bookmark database: URL -> tags.
//
// Invariant: a URL whose tags are exhausted by remove() is dropped from the
// map entirely. Absent URLs are no-ops for add/remove/erase.
class Database {
 public:
  using Map = std::map<std::string, TagList>;

  Database() = default;
  explicit Database(Map entries);

  // Union of the current tags of url with tags. Empty strings are ignored,
  // so a call without any real tag never creates an entry.
  void add(const std::string& url, const std::vector<std::string>& tags);

  // Set difference; drops the entry once no tag is left
  void remove(const std::string& url, const std::vector<std::string>& tags);

  // Drop url and all of its tags
  void erase(const std::string& url);

  // Sorted, de-duplicated tags of url
  Result<TagList> tags(const std::string& url) const;

  // Sort and de-duplicate every tag list in place. Entries are never
  // deleted here, not even those with no tags.
  void clean();

  // add() every entry of other into this database
  void merge(const Database& other);

  bool contains(const std::string& url) const noexcept;
  std::size_t size() const noexcept { return entries_.size(); }
  bool empty() const noexcept { return entries_.empty(); }
  const Map& entries() const noexcept { return entries_; }

  // Same URLs, and the same tag *set* for each URL
  bool operator==(const Database& other) const;

 private:
  Map entries_;
};

// Sort and drop duplicates
void normalizeTags(TagList& tags);

}  // namespace bm::core
