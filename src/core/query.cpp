#include "bm/core/query.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <regex>
#include <set>

namespace bm::core::query {

namespace {

Entry makeEntry(const std::string& url, const TagList& tags) {
  Entry entry{url, tags};
  normalizeTags(entry.tags);
  return entry;
}

bool equalsIgnoreCase(const std::string& a, const std::string& b) {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::tolower(static_cast<unsigned char>(x)) ==
                  std::tolower(static_cast<unsigned char>(y));
         });
}

std::vector<TagCount> toCounts(const std::map<std::string, std::size_t>& counts) {
  std::vector<TagCount> result;
  result.reserve(counts.size());
  for (const auto& [tag, count] : counts) {
    result.push_back(TagCount{tag, count});
  }
  return result;
}

}  // namespace

std::vector<Entry> listAny(const Database& db, const std::vector<std::string>& tags) {
  std::vector<Entry> result;

  if (tags.empty()) {
    for (const auto& [url, url_tags] : db.entries()) {
      result.push_back(makeEntry(url, url_tags));
    }
    return result;
  }

  std::set<std::string> wanted(tags.begin(), tags.end());
  for (const auto& [url, url_tags] : db.entries()) {
    bool hit = std::any_of(url_tags.begin(), url_tags.end(), [&wanted](const std::string& tag) {
      return wanted.count(tag) > 0;
    });
    if (hit) {
      result.push_back(makeEntry(url, url_tags));
    }
  }
  return result;
}

std::vector<Entry> listEvery(const Database& db, const std::vector<std::string>& tags) {
  std::vector<Entry> result;

  std::set<std::string> wanted(tags.begin(), tags.end());
  for (const auto& [url, url_tags] : db.entries()) {
    std::set<std::string> have(url_tags.begin(), url_tags.end());
    if (std::includes(have.begin(), have.end(), wanted.begin(), wanted.end())) {
      result.push_back(makeEntry(url, url_tags));
    }
  }
  return result;
}

std::vector<TagCount> tagFrequency(const Database& db) {
  std::map<std::string, std::size_t> counts;
  for (const auto& [url, url_tags] : db.entries()) {
    // A tag listed twice for one URL still counts once
    std::set<std::string> distinct(url_tags.begin(), url_tags.end());
    for (const auto& tag : distinct) {
      ++counts[tag];
    }
  }
  return toCounts(counts);
}

Result<std::vector<TagCount>> searchTag(const Database& db, const std::string& pattern) {
  // regex_search may also throw (error_complexity, error_stack) on a valid pattern
  try {
    std::regex matcher(pattern);

    std::vector<TagCount> result;
    for (auto& count : tagFrequency(db)) {
      if (std::regex_search(count.tag, matcher)) {
        result.push_back(std::move(count));
      }
    }
    return result;
  } catch (const std::regex_error& e) {
    return std::unexpected(makeError(ErrorCode::kPatternError,
                                     "Invalid pattern '" + pattern + "': " + e.what()));
  }
}

void sortByUsage(std::vector<TagCount>& counts) {
  std::sort(counts.begin(), counts.end(), [](const TagCount& a, const TagCount& b) {
    if (a.count != b.count) {
      return a.count < b.count;
    }
    return a.tag < b.tag;
  });
}

std::vector<std::string> expandAllTag(const Database& db, const std::vector<std::string>& tags) {
  bool wants_all = std::any_of(tags.begin(), tags.end(), [](const std::string& tag) {
    return equalsIgnoreCase(tag, "all");
  });
  if (!wants_all) {
    return tags;
  }

  std::vector<std::string> every;
  for (const auto& count : tagFrequency(db)) {
    every.push_back(count.tag);
  }
  return every;
}

}  // namespace bm::core::query
