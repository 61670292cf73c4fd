#include "bm/cli/application.hpp"

#include <chrono>
#include <filesystem>

#include <spdlog/spdlog.h>

#include "bm/cli/command_error_handler.hpp"
#include "bm/store/database_store.hpp"
#include "bm/util/logging.hpp"
#include "bm/util/xdg.hpp"

namespace bm::cli {

Application::Application()
    : Application(nullptr, std::cout, std::cerr) {
}

Application::Application(std::shared_ptr<util::HttpTransport> transport, std::ostream& out,
                         std::ostream& err, BrowserOpener opener)
    : app_("Simple command line browser independent bookmark utility", "bookmark")
    , transport_(std::move(transport))
    , out_(out)
    , err_(err)
    , opener_(std::move(opener)) {

  app_.set_version_flag("--version", bm::getVersion().toString());

  setupOptions();
  setupHelp();
}

void Application::setupOptions() {
  std::vector<CLI::Option*> actions = {
    app_.add_flag("-r,--remove", remove_, "Remove TAGs from URL"),
    app_.add_flag("-d,--delete", delete_, "Delete the URLs from the database"),
    app_.add_flag("-l,--list-any", list_any_, "List the urls with any of TAGs"),
    app_.add_flag("-L,--list-every", list_every_, "List the urls with every TAG"),
    app_.add_flag("-t,--tags", tag_counts_, "Print tag usage counts, least used first"),
    app_.add_option("-s,--search", pattern_, "Print usage counts of tags matching PATTERN"),
    app_.add_flag("-i,--import", import_, "Merge the databases at SOURCEs into the database"),
  };
  for (auto* action : actions) {
    for (auto* other : actions) {
      if (action != other) {
        action->excludes(other);
      }
    }
  }

  app_.add_option("-f,--file", options_.file, "Use FILE (path or http(s) URL) as the database");
  app_.add_flag("--no-path-subs", options_.no_path_subs, "Disable file path substitution");
  app_.add_flag("-c,--clean", options_.clean, "Remove duplicated tags while loading");
  app_.add_flag("-v,--verbose", options_.verbose, "Print the tags of listed urls");
  app_.add_flag("-w,--web", options_.web, "Show listings in the browser");
  app_.add_flag("--json", options_.json, "Output in JSON format");
  app_.add_option("--config", config_file_, "Path to config file");

  app_.add_option("args", args_, "URL [TAG...], TAG... or SOURCE...");
}

void Application::setupHelp() {
  app_.get_formatter()->column_width(40);

  app_.footer(R"(Usage:
  bookmark [options] URL TAG...      tag URL
  bookmark [options] -r URL TAG...   remove TAGs from URL
  bookmark [options] -d URL...       delete URLs
  bookmark [options] -l TAG...       list urls with any TAG
  bookmark [options] -L TAG...       list urls with every TAG
  bookmark [options] -t              tag usage counts
  bookmark [options] -s PATTERN      tags matching PATTERN
  bookmark [options] -i SOURCE...    import other databases
  bookmark [options] URL             print the tags of URL

If URL names an existing file its absolute path is used instead.
'all' is a special TAG that matches every other tag.)");
}

int Application::run(int argc, const char* const argv[]) {
  try {
    app_.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app_.exit(e, out_, err_);
  }

  CommandErrorHandler handler(options_, err_);

  // Warnings raised while reading the config still belong on stderr
  if (auto early = util::Logging::initialize(spdlog::level::warn); !early.has_value()) {
    err_ << "Error: " << early.error().message() << std::endl;
  }

  auto config = loadConfig();
  if (!config.has_value()) {
    return handler.handleCommandError(config.error());
  }

  auto level = util::Logging::parseLevel(config->logging.level).value_or(spdlog::level::warn);
  auto logging = util::Logging::initialize(level, config->logging.file);
  if (!logging.has_value()) {
    spdlog::warn("{}", logging.error().message());
  }

  auto request = buildRequest();
  if (!request.has_value()) {
    return handler.handleCommandError(request.error());
  }

  try {
    auto result = execute(*config, *request);
    if (!result.has_value()) {
      return handler.handleCommandError(result.error());
    }
    return *result;
  } catch (const std::exception& e) {
    return handler.handleCommandError(makeError(ErrorCode::kUnknownError, e.what()));
  }
}

Result<config::Config> Application::loadConfig() const {
  config::Config config;

  if (!config_file_.empty()) {
    auto loaded = config.load(config_file_);
    if (!loaded.has_value()) {
      return std::unexpected(loaded.error());
    }
  } else {
    auto default_path = config::Config::defaultConfigPath();
    if (std::filesystem::exists(default_path)) {
      auto loaded = config.load(default_path);
      if (!loaded.has_value()) {
        spdlog::warn("Ignoring {}: {}", default_path.string(), loaded.error().message());
        config = config::Config{};
      }
    }
  }

  auto valid = config.validate();
  if (!valid.has_value()) {
    return std::unexpected(valid.error());
  }
  return config;
}

Result<Request> Application::buildRequest() const {
  Request request;
  request.options = options_;

  auto usage = [](const std::string& message) -> Result<Request> {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument, message));
  };

  if (list_any_ || list_every_) {
    request.action = list_any_ ? Action::kListAny : Action::kListEvery;
    request.tags = args_;
  } else if (tag_counts_) {
    request.action = Action::kTags;
  } else if (app_.count("--search") > 0) {
    request.action = Action::kSearch;
    request.pattern = pattern_;
  } else if (import_) {
    if (args_.empty()) {
      return usage("--import needs at least one SOURCE");
    }
    request.action = Action::kImport;
    request.urls = args_;
  } else if (delete_) {
    if (args_.empty()) {
      return usage("--delete needs at least one URL");
    }
    request.action = Action::kDelete;
    request.urls = args_;
  } else if (remove_) {
    if (args_.size() < 2) {
      return usage("--remove needs a URL and at least one TAG");
    }
    request.action = Action::kRemove;
    request.urls = {args_.front()};
    request.tags.assign(args_.begin() + 1, args_.end());
  } else if (args_.size() == 1) {
    request.action = Action::kLookup;
    request.urls = args_;
  } else if (args_.size() > 1) {
    request.action = Action::kAdd;
    request.urls = {args_.front()};
    request.tags.assign(args_.begin() + 1, args_.end());
  } else {
    return usage("Nothing to do, see --help");
  }

  return request;
}

Result<int> Application::execute(const config::Config& config, const Request& request) {
  // Only the default location is created on demand; a custom --file must
  // point into an existing directory
  if (request.options.file.empty() &&
      config.database_file == util::Xdg::databaseFile().string()) {
    if (!util::Xdg::ensureDirectory(util::Xdg::dataHome(), std::filesystem::perms::owner_all)) {
      spdlog::debug("Cannot create {}", util::Xdg::dataHome().string());
    }
  }

  if (!transport_) {
    transport_ = std::make_shared<util::HttpClient>();
  }

  store::StoreOptions store_options;
  store_options.fetch_timeout = std::chrono::seconds(config.fetch_timeout_seconds);
  store::DatabaseStore store(transport_, store_options);

  Dispatcher dispatcher(config, store, out_, opener_);
  return dispatcher.run(request);
}

} // namespace bm::cli
