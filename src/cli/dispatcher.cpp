#include "bm/cli/dispatcher.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "bm/cli/html_renderer.hpp"
#include "bm/util/filesystem.hpp"
#include "bm/util/safe_process.hpp"

namespace bm::cli {

namespace {

std::string joinTags(const core::TagList& tags) {
  std::string result;
  for (const auto& tag : tags) {
    if (!result.empty()) {
      result += ' ';
    }
    result += tag;
  }
  return result;
}

// Keys may hold non UTF-8 bytes (Latin-1 file names); replace them rather
// than throw
std::string dumpJson(const nlohmann::json& value) {
  return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace

BrowserOpener systemBrowserOpener() {
  return [](const std::string& browser, const std::filesystem::path& page) -> Result<void> {
    auto pid = util::SafeProcess::spawnDetached(browser, page.string());
    if (!pid.has_value()) {
      return std::unexpected(pid.error());
    }
    spdlog::debug("Started '{}' (pid {}) on {}", browser, *pid, page.string());
    return {};
  };
}

Dispatcher::Dispatcher(const config::Config& config, store::DatabaseStore& store,
                       std::ostream& out, BrowserOpener opener)
    : config_(config), store_(store), out_(out), opener_(std::move(opener)) {
}

bool Dispatcher::isMutating(Action action) {
  switch (action) {
    case Action::kAdd:
    case Action::kRemove:
    case Action::kDelete:
    case Action::kImport:
      return true;
    case Action::kLookup:
    case Action::kListAny:
    case Action::kListEvery:
    case Action::kTags:
    case Action::kSearch:
      return false;
  }
  return false;
}

std::string Dispatcher::databaseLocator(const Request& request) const {
  return request.options.file.empty() ? config_.database_file : request.options.file;
}

std::vector<std::string> Dispatcher::resolveUrls(const Request& request) const {
  // Import sources are locators, not bookmark keys
  if (request.action == Action::kImport ||
      request.options.no_path_subs || !config_.path_substitution) {
    return request.urls;
  }

  std::vector<std::string> resolved;
  resolved.reserve(request.urls.size());
  for (const auto& url : request.urls) {
    resolved.push_back(util::FileSystem::absoluteIfExists(url));
  }
  return resolved;
}

Result<int> Dispatcher::run(const Request& request) {
  const auto locator = databaseLocator(request);

  auto loaded = store_.open(locator);
  if (!loaded.has_value()) {
    return std::unexpected(loaded.error());
  }
  core::Database db = std::move(*loaded);

  if (request.options.clean) {
    db.clean();
  }

  const auto urls = resolveUrls(request);
  const auto tags = core::query::expandAllTag(db, request.tags);

  switch (request.action) {
    case Action::kLookup:
      return lookup(db, urls, request.options);

    case Action::kAdd:
      for (const auto& url : urls) {
        db.add(url, tags);
      }
      break;

    case Action::kRemove:
      for (const auto& url : urls) {
        db.remove(url, tags);
      }
      break;

    case Action::kDelete:
      for (const auto& url : urls) {
        db.erase(url);
      }
      break;

    case Action::kImport: {
      auto merged = store_.mergeFrom(db, urls);
      if (!merged.has_value()) {
        return std::unexpected(merged.error());
      }
      break;
    }

    case Action::kListAny:
    case Action::kListEvery: {
      auto entries = request.action == Action::kListAny
          ? core::query::listAny(db, tags)
          : core::query::listEvery(db, tags);
      if (request.options.web) {
        showInBrowser(request.tags, entries);
      } else {
        printEntries(entries, request.options);
      }
      return 0;
    }

    case Action::kTags: {
      auto counts = core::query::tagFrequency(db);
      core::query::sortByUsage(counts);
      printCounts(counts, request.options);
      return 0;
    }

    case Action::kSearch: {
      auto counts = core::query::searchTag(db, request.pattern);
      if (!counts.has_value()) {
        return std::unexpected(counts.error());
      }
      core::query::sortByUsage(*counts);
      printCounts(*counts, request.options);
      return 0;
    }
  }

  auto saved = persist(db, locator);
  if (!saved.has_value()) {
    return std::unexpected(saved.error());
  }
  return 0;
}

Result<void> Dispatcher::persist(const core::Database& db, const std::string& locator) {
  auto saved = store_.save(db, locator);
  if (saved.has_value()) {
    return {};
  }

  if (saved.error().code() == ErrorCode::kFilePermissionDenied) {
    return saved;
  }

  spdlog::warn("Changes not saved: {}", saved.error().message());
  return {};
}

Result<int> Dispatcher::lookup(const core::Database& db, const std::vector<std::string>& urls,
                               const Options& options) {
  if (urls.empty()) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument, "No URL given"));
  }

  nlohmann::json json_output = nlohmann::json::array();
  for (const auto& url : urls) {
    auto tags = db.tags(url);
    if (!tags.has_value()) {
      return std::unexpected(tags.error());
    }

    if (options.json) {
      json_output.push_back({{"url", url}, {"tags", *tags}});
      continue;
    }

    if (urls.size() > 1) {
      out_ << url << ":\n";
    }
    for (const auto& tag : *tags) {
      out_ << tag << "\n";
    }
  }

  if (options.json) {
    out_ << dumpJson(json_output) << "\n";
  }
  return 0;
}

void Dispatcher::printEntries(const std::vector<core::Entry>& entries, const Options& options) {
  if (options.json) {
    nlohmann::json output = nlohmann::json::array();
    for (const auto& entry : entries) {
      output.push_back({{"url", entry.url}, {"tags", entry.tags}});
    }
    out_ << dumpJson(output) << "\n";
    return;
  }

  for (const auto& entry : entries) {
    out_ << entry.url;
    if (options.verbose) {
      out_ << "\t" << joinTags(entry.tags);
    }
    out_ << "\n";
  }
}

void Dispatcher::printCounts(const std::vector<core::TagCount>& counts, const Options& options) {
  if (options.json) {
    nlohmann::json output = nlohmann::json::array();
    for (const auto& count : counts) {
      output.push_back({{"tag", count.tag}, {"count", count.count}});
    }
    out_ << dumpJson(output) << "\n";
    return;
  }

  for (const auto& count : counts) {
    out_ << count.count << "\t" << count.tag << "\n";
  }
}

void Dispatcher::showInBrowser(const std::vector<std::string>& filters,
                               const std::vector<core::Entry>& entries) {
  auto page = HtmlRenderer::render(filters, entries);
  auto written = util::FileSystem::writeFileAtomic(config_.html_file, page);
  if (!written.has_value()) {
    spdlog::warn("Cannot write {}: {}", config_.html_file.string(), written.error().message());
    return;
  }

  auto opened = opener_(config_.browser, config_.html_file);
  if (!opened.has_value()) {
    spdlog::warn("Cannot open browser '{}': {}", config_.browser, opened.error().message());
  }
}

} // namespace bm::cli
