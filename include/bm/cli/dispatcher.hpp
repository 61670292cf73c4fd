#pragma once

#include <filesystem>
#include <functional>
#include <ostream>
#include <string>
#include <vector>

#include "bm/common.hpp"
#include "bm/config/config.hpp"
#include "bm/core/database.hpp"
#include "bm/core/query.hpp"
#include "bm/store/database_store.hpp"

namespace bm::cli {

enum class Action {
  kLookup,     // print the tags of each URL
  kAdd,
  kRemove,
  kDelete,
  kImport,     // urls are import sources
  kListAny,
  kListEvery,
  kTags,       // tag usage counts
  kSearch      // tag usage counts filtered by pattern
};

struct Options {
  bool verbose = false;
  bool web = false;
  bool no_path_subs = false;
  bool clean = false;
  bool json = false;
  std::string file;            // Database override, config value when empty
};

// A parsed command line
struct Request {
  Action action = Action::kLookup;
  std::vector<std::string> urls;
  std::vector<std::string> tags;
  std::string pattern;
  Options options;
};

// Hands a rendered page to the browser command
using BrowserOpener = std::function<Result<void>(const std::string& browser,
                                                 const std::filesystem::path& page)>;

// Opener that spawns the configured browser command
BrowserOpener systemBrowserOpener();

/**
 * @brief Runs one request against the database
 *
 * Loads the database once, applies every mutation in memory and rewrites
 * the file once at the end of a mutating action. Listing actions never
 * write. Result rows go to the output stream, diagnostics to spdlog.
 */
class Dispatcher {
public:
  Dispatcher(const config::Config& config, store::DatabaseStore& store,
             std::ostream& out, BrowserOpener opener = systemBrowserOpener());

  /**
   * @brief Execute request
   * @return 0 on success; kNotFound for an unknown URL on lookup,
   *         kPatternError for a bad search pattern and
   *         kFilePermissionDenied when the database cannot be accessed
   */
  Result<int> run(const Request& request);

  static bool isMutating(Action action);

private:
  std::string databaseLocator(const Request& request) const;
  std::vector<std::string> resolveUrls(const Request& request) const;

  Result<void> persist(const core::Database& db, const std::string& locator);
  Result<int> lookup(const core::Database& db, const std::vector<std::string>& urls,
                     const Options& options);
  void printEntries(const std::vector<core::Entry>& entries, const Options& options);
  void printCounts(const std::vector<core::TagCount>& counts, const Options& options);
  void showInBrowser(const std::vector<std::string>& filters,
                     const std::vector<core::Entry>& entries);

  const config::Config& config_;
  store::DatabaseStore& store_;
  std::ostream& out_;
  BrowserOpener opener_;
};

} // namespace bm::cli
