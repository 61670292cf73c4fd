#include <gtest/gtest.h>

#include <unistd.h>

#include <nlohmann/json.hpp>

#include "bm/cli/dispatcher.hpp"
#include "bm/store/codec.hpp"
#include "bm/util/filesystem.hpp"
#include "test_helpers.hpp"

using namespace bm::cli;
using namespace bm::core;
using namespace bm::test;
using bm::ErrorCode;

class DispatcherTest : public TempDirTest {
 protected:
  void SetUp() override {
    TempDirTest::SetUp();
    config_.database_file = (temp_dir_ / "bookmarks.db").string();
    config_.html_file = temp_dir_ / "bookmark.html";
    config_.browser = "test-browser --new-window";

    transport_ = std::make_shared<FakeTransport>();
    bm::store::StoreOptions options;
    options.temp_dir = temp_dir_;
    store_ = std::make_unique<bm::store::DatabaseStore>(transport_, options);
  }

  void seed(const Database& db) {
    ASSERT_OK(store_->save(db, config_.database_file));
  }

  Database stored() {
    auto db = store_->load(config_.database_file);
    EXPECT_TRUE(db.has_value());
    return db.has_value() ? *db : Database{};
  }

  bm::Result<int> run(Request request) {
    Dispatcher dispatcher(config_, *store_, out_, [this](const std::string& browser,
                                                         const std::filesystem::path& page)
                                                         -> bm::Result<void> {
      opened_.emplace_back(browser, page);
      return {};
    });
    return dispatcher.run(request);
  }

  static Request make(Action action, std::vector<std::string> urls = {},
                      std::vector<std::string> tags = {}) {
    Request request;
    request.action = action;
    request.urls = std::move(urls);
    request.tags = std::move(tags);
    return request;
  }

  bm::config::Config config_;
  std::shared_ptr<FakeTransport> transport_;
  std::unique_ptr<bm::store::DatabaseStore> store_;
  std::ostringstream out_;
  std::vector<std::pair<std::string, std::filesystem::path>> opened_;
};

TEST_F(DispatcherTest, AddPersistsTags) {
  auto result = run(make(Action::kAdd, {"http://example.com"}, {"news", "daily"}));

  ASSERT_OK(result);
  EXPECT_EQ(*result, 0);
  EXPECT_EQ(stored(), makeDatabase({{"http://example.com", {"daily", "news"}}}));
  EXPECT_TRUE(out_.str().empty());
}

TEST_F(DispatcherTest, AddToMissingDatabaseCreatesIt) {
  LogCapture logs;

  ASSERT_OK(run(make(Action::kAdd, {"u"}, {"a"})));

  EXPECT_TRUE(logs.contains("does not exist"));
  EXPECT_TRUE(std::filesystem::exists(config_.database_file));
}

TEST_F(DispatcherTest, ListingCreatesMissingDatabase) {
  auto result = run(make(Action::kListAny));

  ASSERT_OK(result);
  EXPECT_EQ(*result, 0);
  EXPECT_TRUE(out_.str().empty());
  EXPECT_TRUE(std::filesystem::exists(config_.database_file));
}

TEST_F(DispatcherTest, ImportDoesNotCreateMissingSource) {
  seed(makeDatabase({{"u", {"a"}}}));
  auto absent = (temp_dir_ / "absent.db").string();

  ASSERT_OK(run(make(Action::kImport, {absent})));

  EXPECT_FALSE(std::filesystem::exists(absent));
  EXPECT_EQ(stored(), makeDatabase({{"u", {"a"}}}));
}

TEST_F(DispatcherTest, RemoveDropsTagsAndExhaustedUrls) {
  seed(makeDatabase({{"u", {"a", "b"}}, {"v", {"a"}}}));

  ASSERT_OK(run(make(Action::kRemove, {"u"}, {"a"})));
  ASSERT_OK(run(make(Action::kRemove, {"v"}, {"a"})));

  EXPECT_EQ(stored(), makeDatabase({{"u", {"b"}}}));
}

TEST_F(DispatcherTest, DeleteErasesEveryUrl) {
  seed(makeDatabase({{"u", {"a"}}, {"v", {"b"}}, {"w", {"c"}}}));

  ASSERT_OK(run(make(Action::kDelete, {"u", "w", "absent"})));

  EXPECT_EQ(stored(), makeDatabase({{"v", {"b"}}}));
}

TEST_F(DispatcherTest, LookupPrintsTags) {
  seed(makeDatabase({{"http://example.com", {"news", "daily"}}}));

  auto result = run(make(Action::kLookup, {"http://example.com"}));

  ASSERT_OK(result);
  EXPECT_EQ(out_.str(), "daily\nnews\n");
}

TEST_F(DispatcherTest, LookupOfUnknownUrlIsNotFound) {
  seed(makeDatabase({{"u", {"a"}}}));

  EXPECT_ERROR(run(make(Action::kLookup, {"http://nowhere"})), ErrorCode::kNotFound);
  EXPECT_TRUE(out_.str().empty());
}

TEST_F(DispatcherTest, LookupAsJson) {
  seed(makeDatabase({{"u", {"b", "a"}}}));
  auto request = make(Action::kLookup, {"u"});
  request.options.json = true;

  ASSERT_OK(run(request));

  auto json = nlohmann::json::parse(out_.str());
  ASSERT_TRUE(json.is_array());
  ASSERT_EQ(json.size(), 1u);
  EXPECT_EQ(json[0]["url"], "u");
  EXPECT_EQ(json[0]["tags"], nlohmann::json({"a", "b"}));
}

TEST_F(DispatcherTest, ListAnyPrintsUrls) {
  seed(makeDatabase({{"http://x", {"a", "b"}}, {"http://y", {"b"}}}));

  ASSERT_OK(run(make(Action::kListAny, {}, {"a"})));
  EXPECT_EQ(out_.str(), "http://x\n");
}

TEST_F(DispatcherTest, ListEveryVerboseShowsTags) {
  seed(makeDatabase({{"http://x", {"a", "b"}}, {"http://y", {"b"}}}));
  auto request = make(Action::kListEvery, {}, {"b"});
  request.options.verbose = true;

  ASSERT_OK(run(request));
  EXPECT_EQ(out_.str(), "http://x\ta b\nhttp://y\tb\n");
}

TEST_F(DispatcherTest, ListWithoutTagsListsEverything) {
  seed(makeDatabase({{"http://x", {"a"}}, {"http://y", {"b"}}}));

  ASSERT_OK(run(make(Action::kListAny)));
  EXPECT_EQ(out_.str(), "http://x\nhttp://y\n");
}

TEST_F(DispatcherTest, ListAsJson) {
  seed(makeDatabase({{"http://x", {"a"}}}));
  auto request = make(Action::kListAny);
  request.options.json = true;

  ASSERT_OK(run(request));

  auto json = nlohmann::json::parse(out_.str());
  ASSERT_EQ(json.size(), 1u);
  EXPECT_EQ(json[0]["url"], "http://x");
  EXPECT_EQ(json[0]["tags"], nlohmann::json({"a"}));
}

TEST_F(DispatcherTest, JsonOutputReplacesInvalidUtf8) {
  // Latin-1 encoded file name
  seed(makeDatabase({{"/home/me/caf\xe9.txt", {"doc"}}}));

  auto listing = make(Action::kListAny);
  listing.options.json = true;
  auto result = run(listing);
  ASSERT_OK(result);
  EXPECT_EQ(*result, 0);

  auto json = nlohmann::json::parse(out_.str());
  ASSERT_EQ(json.size(), 1u);
  EXPECT_EQ(json[0]["url"], "/home/me/caf\xEF\xBF\xBD.txt");
  EXPECT_EQ(json[0]["tags"], nlohmann::json({"doc"}));

  out_.str("");
  auto lookup = make(Action::kLookup, {"/home/me/caf\xe9.txt"});
  lookup.options.json = true;
  lookup.options.no_path_subs = true;
  ASSERT_OK(run(lookup));
  EXPECT_EQ(nlohmann::json::parse(out_.str()).size(), 1u);
}

TEST_F(DispatcherTest, JsonTagCountsReplaceInvalidUtf8) {
  seed(makeDatabase({{"u", {"r\xe9sum\xe9"}}}));
  auto request = make(Action::kTags);
  request.options.json = true;

  ASSERT_OK(run(request));

  auto json = nlohmann::json::parse(out_.str());
  ASSERT_EQ(json.size(), 1u);
}

TEST_F(DispatcherTest, AllTagMatchesEveryTag) {
  seed(makeDatabase({{"http://x", {"a", "b"}}, {"http://y", {"b"}}}));

  ASSERT_OK(run(make(Action::kListEvery, {}, {"All"})));
  EXPECT_EQ(out_.str(), "http://x\n");
}

TEST_F(DispatcherTest, RemoveAllTagDeletesUrl) {
  seed(makeDatabase({{"u", {"a", "b"}}, {"v", {"c"}}}));

  ASSERT_OK(run(make(Action::kRemove, {"u"}, {"all"})));
  EXPECT_EQ(stored(), makeDatabase({{"v", {"c"}}}));
}

TEST_F(DispatcherTest, TagCountsLeastUsedFirst) {
  seed(makeDatabase({{"http://x", {"a", "b"}}, {"http://y", {"b"}}}));

  ASSERT_OK(run(make(Action::kTags)));
  EXPECT_EQ(out_.str(), "1\ta\n2\tb\n");
}

TEST_F(DispatcherTest, TagCountsAsJson) {
  seed(makeDatabase({{"http://x", {"a", "b"}}, {"http://y", {"b"}}}));
  auto request = make(Action::kTags);
  request.options.json = true;

  ASSERT_OK(run(request));

  auto json = nlohmann::json::parse(out_.str());
  ASSERT_EQ(json.size(), 2u);
  EXPECT_EQ(json[0]["tag"], "a");
  EXPECT_EQ(json[0]["count"], 1);
  EXPECT_EQ(json[1]["tag"], "b");
  EXPECT_EQ(json[1]["count"], 2);
}

TEST_F(DispatcherTest, SearchFiltersTags) {
  seed(makeDatabase({
    {"http://1", {"apple"}},
    {"http://2", {"banana", "avocado"}},
    {"http://3", {"avocado"}},
  }));
  auto request = make(Action::kSearch);
  request.pattern = "^a";

  ASSERT_OK(run(request));
  EXPECT_EQ(out_.str(), "1\tapple\n2\tavocado\n");
}

TEST_F(DispatcherTest, SearchWithBadPatternIsPatternError) {
  seed(makeDatabase({{"u", {"a"}}}));
  auto request = make(Action::kSearch);
  request.pattern = "([";

  EXPECT_ERROR(run(request), ErrorCode::kPatternError);
}

TEST_F(DispatcherTest, ImportMergesSources) {
  seed(makeDatabase({{"u", {"a"}}}));
  auto other = (temp_dir_ / "other.db").string();
  ASSERT_OK(store_->save(makeDatabase({{"u", {"b"}}, {"w", {"c"}}}), other));
  transport_->respond("http://example.com/db", 200,
                      bm::store::codec::encode(makeDatabase({{"v", {"d"}}})));

  ASSERT_OK(run(make(Action::kImport, {other, "http://example.com/db"})));

  EXPECT_EQ(stored(), makeDatabase({{"u", {"a", "b"}}, {"v", {"d"}}, {"w", {"c"}}}));
}

TEST_F(DispatcherTest, ExistingFileUrlIsMadeAbsolute) {
  auto page = temp_dir_ / "page.html";
  ASSERT_OK(bm::util::FileSystem::writeFileAtomic(page, "<html/>"));
  auto indirect = (temp_dir_ / "." / "page.html").string();

  ASSERT_OK(run(make(Action::kAdd, {indirect}, {"local"})));

  auto db = stored();
  EXPECT_TRUE(db.contains(std::filesystem::absolute(page).lexically_normal().string()));
  EXPECT_FALSE(db.contains(indirect));
}

TEST_F(DispatcherTest, NoPathSubsKeepsArgumentVerbatim) {
  auto page = temp_dir_ / "page.html";
  ASSERT_OK(bm::util::FileSystem::writeFileAtomic(page, "<html/>"));
  auto indirect = (temp_dir_ / "." / "page.html").string();
  auto request = make(Action::kAdd, {indirect}, {"local"});
  request.options.no_path_subs = true;

  ASSERT_OK(run(request));

  EXPECT_TRUE(stored().contains(indirect));
}

TEST_F(DispatcherTest, PathSubstitutionCanBeDisabledInConfig) {
  auto page = temp_dir_ / "page.html";
  ASSERT_OK(bm::util::FileSystem::writeFileAtomic(page, "<html/>"));
  auto indirect = (temp_dir_ / "." / "page.html").string();
  config_.path_substitution = false;

  ASSERT_OK(run(make(Action::kAdd, {indirect}, {"local"})));

  EXPECT_TRUE(stored().contains(indirect));
}

TEST_F(DispatcherTest, CleanRewritesDuplicates) {
  ASSERT_OK(bm::util::FileSystem::writeFileAtomic(
    config_.database_file, "u: [b, a, b]\nv: [c]\n"));
  auto request = make(Action::kAdd, {"v"}, {"d"});
  request.options.clean = true;

  ASSERT_OK(run(request));

  auto db = stored();
  EXPECT_EQ(db.entries().at("u"), (TagList{"a", "b"}));
  EXPECT_EQ(db.entries().at("v"), (TagList{"c", "d"}));
}

TEST_F(DispatcherTest, FileOptionOverridesDatabase) {
  auto alternate = (temp_dir_ / "alternate.db").string();
  auto request = make(Action::kAdd, {"u"}, {"a"});
  request.options.file = alternate;

  ASSERT_OK(run(request));

  EXPECT_TRUE(std::filesystem::exists(alternate));
  EXPECT_FALSE(std::filesystem::exists(config_.database_file));
}

TEST_F(DispatcherTest, RemoteDatabaseIsReadOnly) {
  transport_->respond("http://example.com/db", 200,
                      bm::store::codec::encode(makeDatabase({{"http://x", {"a"}}})));
  LogCapture logs;

  auto listing = make(Action::kListAny);
  listing.options.file = "http://example.com/db";
  ASSERT_OK(run(listing));
  EXPECT_EQ(out_.str(), "http://x\n");

  auto add = make(Action::kAdd, {"u"}, {"b"});
  add.options.file = "http://example.com/db";
  auto result = run(add);
  ASSERT_OK(result);
  EXPECT_EQ(*result, 0);
  EXPECT_TRUE(logs.contains("Changes not saved"));
}

TEST_F(DispatcherTest, SaveIntoMissingDirectoryOnlyWarns) {
  config_.database_file = (temp_dir_ / "missing" / "bookmarks.db").string();
  LogCapture logs;

  auto result = run(make(Action::kAdd, {"u"}, {"a"}));

  ASSERT_OK(result);
  EXPECT_EQ(*result, 0);
  EXPECT_TRUE(logs.contains("Changes not saved"));
}

TEST_F(DispatcherTest, PermissionDeniedSaveIsFatal) {
  if (::geteuid() == 0) {
    GTEST_SKIP() << "root ignores directory permissions";
  }
  auto locked = temp_dir_ / "locked";
  std::filesystem::create_directories(locked);
  config_.database_file = (locked / "bookmarks.db").string();
  std::filesystem::permissions(locked, std::filesystem::perms::owner_read |
                                       std::filesystem::perms::owner_exec);

  EXPECT_ERROR(run(make(Action::kAdd, {"u"}, {"a"})), ErrorCode::kFilePermissionDenied);

  std::filesystem::permissions(locked, std::filesystem::perms::owner_all);
}

TEST_F(DispatcherTest, WebListingOpensBrowser) {
  seed(makeDatabase({{"http://x", {"a"}}, {"http://y", {"b"}}}));
  auto request = make(Action::kListAny, {}, {"a"});
  request.options.web = true;

  ASSERT_OK(run(request));

  EXPECT_TRUE(out_.str().empty());
  ASSERT_EQ(opened_.size(), 1u);
  EXPECT_EQ(opened_[0].first, "test-browser --new-window");
  EXPECT_EQ(opened_[0].second.string(), config_.html_file.string());

  auto page = readTestFile(config_.html_file);
  EXPECT_NE(page.find("<h1>a</h1>"), std::string::npos);
  EXPECT_NE(page.find("href=\"http://x\""), std::string::npos);
  EXPECT_EQ(page.find("href=\"http://y\""), std::string::npos);
}

TEST_F(DispatcherTest, BrowserFailureIsOnlyAWarning) {
  seed(makeDatabase({{"http://x", {"a"}}}));
  auto request = make(Action::kListAny);
  request.options.web = true;
  LogCapture logs;

  Dispatcher dispatcher(config_, *store_, out_, [](const std::string&,
                                                   const std::filesystem::path&)
                                                   -> bm::Result<void> {
    return std::unexpected(bm::makeError(ErrorCode::kProcessError, "Command not found"));
  });
  auto result = dispatcher.run(request);

  ASSERT_OK(result);
  EXPECT_EQ(*result, 0);
  EXPECT_TRUE(logs.contains("Cannot open browser"));
}

TEST_F(DispatcherTest, MutatingActions) {
  EXPECT_TRUE(Dispatcher::isMutating(Action::kAdd));
  EXPECT_TRUE(Dispatcher::isMutating(Action::kRemove));
  EXPECT_TRUE(Dispatcher::isMutating(Action::kDelete));
  EXPECT_TRUE(Dispatcher::isMutating(Action::kImport));
  EXPECT_FALSE(Dispatcher::isMutating(Action::kLookup));
  EXPECT_FALSE(Dispatcher::isMutating(Action::kListAny));
  EXPECT_FALSE(Dispatcher::isMutating(Action::kListEvery));
  EXPECT_FALSE(Dispatcher::isMutating(Action::kTags));
  EXPECT_FALSE(Dispatcher::isMutating(Action::kSearch));
}
