#pragma once

#include <iostream>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "bm/common.hpp"
#include "bm/cli/dispatcher.hpp"
#include "bm/config/config.hpp"
#include "bm/util/http_client.hpp"

namespace bm::cli {

/**
 * @brief Command line front end
 *
 * Parses the bookmark usage (action flags plus positional URL and
 * TAG arguments) into a Request and hands it to the Dispatcher.
 */
class Application {
public:
  Application();

  /**
   * @brief Application with injected collaborators
   * @param transport Used for remote databases; HttpClient when null
   * @param out Result stream
   * @param err Error stream
   * @param opener Browser hand-off
   */
  Application(std::shared_ptr<util::HttpTransport> transport, std::ostream& out,
              std::ostream& err, BrowserOpener opener = systemBrowserOpener());

  /**
   * @brief Run the application with command line arguments
   * @return Exit code (0 = success)
   */
  int run(int argc, const char* const argv[]);

  /**
   * @brief Turn the parsed flags and positionals into a Request
   */
  Result<Request> buildRequest() const;

private:
  void setupOptions();
  void setupHelp();
  Result<config::Config> loadConfig() const;
  Result<int> execute(const config::Config& config, const Request& request);

  CLI::App app_;

  // Action flags
  bool remove_ = false;
  bool delete_ = false;
  bool list_any_ = false;
  bool list_every_ = false;
  bool tag_counts_ = false;
  bool import_ = false;
  std::string pattern_;

  std::vector<std::string> args_;
  std::string config_file_;
  Options options_;

  std::shared_ptr<util::HttpTransport> transport_;
  std::ostream& out_;
  std::ostream& err_;
  BrowserOpener opener_;
};

} // namespace bm::cli
