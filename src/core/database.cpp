#include "bm/core/database.hpp"

#include <algorithm>
#include <set>

namespace bm::core {

void normalizeTags(TagList& tags) {
  std::sort(tags.begin(), tags.end());
  tags.erase(std::unique(tags.begin(), tags.end()), tags.end());
}

Database::Database(Map entries) : entries_(std::move(entries)) {
}

void Database::add(const std::string& url, const std::vector<std::string>& tags) {
  TagList incoming;
  incoming.reserve(tags.size());
  for (const auto& tag : tags) {
    if (!tag.empty()) {
      incoming.push_back(tag);
    }
  }

  if (incoming.empty()) {
    return;
  }

  auto& current = entries_[url];
  current.insert(current.end(), incoming.begin(), incoming.end());
  normalizeTags(current);
}

void Database::remove(const std::string& url, const std::vector<std::string>& tags) {
  auto it = entries_.find(url);
  if (it == entries_.end()) {
    return;
  }

  std::set<std::string> doomed(tags.begin(), tags.end());
  auto& current = it->second;
  current.erase(std::remove_if(current.begin(), current.end(),
                               [&doomed](const std::string& tag) {
                                 return doomed.count(tag) > 0;
                               }),
                current.end());
  normalizeTags(current);

  if (current.empty()) {
    entries_.erase(it);
  }
}

void Database::erase(const std::string& url) {
  entries_.erase(url);
}

Result<TagList> Database::tags(const std::string& url) const {
  auto it = entries_.find(url);
  if (it == entries_.end()) {
    return std::unexpected(makeError(ErrorCode::kNotFound, "No such bookmark: " + url));
  }

  TagList result = it->second;
  normalizeTags(result);
  return result;
}

void Database::clean() {
  for (auto& [url, tags] : entries_) {
    normalizeTags(tags);
  }
}

void Database::merge(const Database& other) {
  for (const auto& [url, tags] : other.entries_) {
    add(url, tags);
  }
}

bool Database::contains(const std::string& url) const noexcept {
  return entries_.find(url) != entries_.end();
}

bool Database::operator==(const Database& other) const {
  if (entries_.size() != other.entries_.size()) {
    return false;
  }

  for (const auto& [url, tags] : entries_) {
    auto it = other.entries_.find(url);
    if (it == other.entries_.end()) {
      return false;
    }
    std::set<std::string> lhs(tags.begin(), tags.end());
    std::set<std::string> rhs(it->second.begin(), it->second.end());
    if (lhs != rhs) {
      return false;
    }
  }
  return true;
}

}  // namespace bm::core
