#include <gtest/gtest.h>
#include <fstream>
#include <sstream>
#include "cli/cli.hpp"
#include "store/file_table_store.hpp"
#include "test_utils.hpp"

using namespace mvault;

class CliTest : public ::testing::Test {
protected:
  std::unique_ptr<TempDir> test_dir;
  std::unique_ptr<store::FileTableStore> table_store;
  FakeHttpClient http;
  std::unique_ptr<engine::ChunkedAssetStore> assets;
  std::unique_ptr<cache::BlobCache> blob_cache;
  std::istringstream input;
  std::ostringstream output;
  std::unique_ptr<cli::CLI> shell;

  void SetUp() override {
    init_test_logging(boost::log::trivial::fatal);
    test_dir = std::make_unique<TempDir>("cli_test");
    table_store = std::make_unique<store::FileTableStore>((test_dir->path() / "store").string());
    assets = std::make_unique<engine::ChunkedAssetStore>(*table_store, http,
                                                         engine::ChunkedAssetStore::Options{1000});
    blob_cache = std::make_unique<cache::BlobCache>(*table_store);
    shell = std::make_unique<cli::CLI>(*assets, *blob_cache, 30, input, output);
  }

  void TearDown() override {
    shell.reset();
    blob_cache.reset();
    assets.reset();
    table_store.reset();
    test_dir.reset();
  }

  std::string run(const std::string& line) {
    output.str("");
    EXPECT_TRUE(shell->execute(line));
    return output.str();
  }

  std::string path_of(const std::string& name) const {
    return (test_dir->path() / name).string();
  }

  static std::vector<uint8_t> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    return std::vector<uint8_t>((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  }
};

TEST_F(CliTest, StreamGetAndRemove) {
  const auto body = make_pattern(2500);
  http.add_route("http://models/m.bin", FakeRoute{200, body, 400, true});

  std::string out = run("stream http://models/m.bin m");
  EXPECT_NE(out.find("[complete]"), std::string::npos);

  EXPECT_EQ(run("has m"), "yes\n");
  EXPECT_NE(run("ls").find("m  2.44 KB  3 chunks"), std::string::npos);

  run("get m " + path_of("m.out"));
  EXPECT_EQ(read_file(path_of("m.out")), body);

  EXPECT_EQ(run("rm m"), "Asset deleted successfully\n");
  EXPECT_EQ(run("has m"), "no\n");
  EXPECT_EQ(run("rm m"), "Asset not found: m\n");
}

TEST_F(CliTest, FetchReportsHttpFailure) {
  std::string out = run("fetch http://models/absent.bin absent");
  EXPECT_NE(out.find("Error fetching asset"), std::string::npos);
  EXPECT_NE(out.find("404"), std::string::npos);
}

TEST_F(CliTest, BlobCacheCommands) {
  const auto data = make_pattern(1536);
  {
    std::ofstream file(path_of("model.bin"), std::ios::binary);
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
  }

  EXPECT_EQ(run("cache tiny " + path_of("model.bin") + " local"), "Cached tiny (1.5 KB)\n");
  EXPECT_NE(run("cache-ls").find("tiny"), std::string::npos);
  EXPECT_NE(run("cache-stats").find("Models: 1"), std::string::npos);

  run("cache-get tiny " + path_of("tiny.out"));
  EXPECT_EQ(read_file(path_of("tiny.out")), data);

  EXPECT_EQ(run("cache-cleanup 30"), "Removed 0 cached models older than 30 days\n");
  EXPECT_EQ(run("cache-rm tiny"), "Removed tiny\n");
  EXPECT_EQ(run("cache-get tiny " + path_of("tiny.out")), "Not cached: tiny\n");
}

TEST_F(CliTest, GarbageCollectionCommand) {
  table_store->put(engine::ChunkedAssetStore::CHUNK_TABLE, "ghost::chunk::0", make_pattern(100));
  EXPECT_NE(run("gc --dry-run").find("orphaned: 1"), std::string::npos);
  EXPECT_NE(run("gc").find("freed: 1"), std::string::npos);
  EXPECT_NE(run("gc --force").find("Usage: gc [--dry-run]"), std::string::npos);
}

TEST_F(CliTest, RejectsBadInput) {
  EXPECT_NE(run("frobnicate").find("Unknown command"), std::string::npos);
  EXPECT_NE(run("get onlyone").find("Usage: get <id> <out_file>"), std::string::npos);
  EXPECT_NE(run("cache-cleanup soon").find("Invalid number of days"), std::string::npos);
  EXPECT_EQ(run(""), "");
  EXPECT_NE(run("help").find("Available commands"), std::string::npos);
}

TEST_F(CliTest, RunStopsAtQuit) {
  input.str("has m\nquit\nhas m\n");
  shell->run();
  std::string out = output.str();
  EXPECT_EQ(out.find("no"), out.rfind("no"));
  EXPECT_FALSE(shell->execute("exit"));
}
