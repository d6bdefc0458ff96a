#include <gtest/gtest.h>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <thread>
#include "store/file_table_store.hpp"
#include "test_utils.hpp"

using namespace mvault::store;

class StoreTest : public ::testing::Test {
protected:
  std::unique_ptr<TempDir> test_dir;
  std::unique_ptr<FileTableStore> store;

  void SetUp() override {
    init_test_logging();
    test_dir = std::make_unique<TempDir>("store_test");
    store = std::make_unique<FileTableStore>(test_dir->str());
    ASSERT_NE(store, nullptr);
  }

  void TearDown() override {
    store.reset();
    test_dir.reset();
  }

  // Helper methods to reduce repetition
  void put_and_verify(const std::string& table, const std::string& key, const Bytes& data) {
    ASSERT_NO_THROW(store->put(table, key, data)) << "Failed to store key: " << key;
    ASSERT_TRUE(store->has(table, key)) << "Key should exist after storing: " << key;

    auto value = store->get(table, key);
    ASSERT_TRUE(value.has_value()) << "Failed to retrieve key: " << key;
    ASSERT_EQ(*value, data) << "Data mismatch for key: " << key;
  }

  static Bytes bytes_of(const std::string& text) {
    return Bytes(text.begin(), text.end());
  }

  std::size_t count_files() const {
    std::size_t count = 0;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(test_dir->path())) {
      if (entry.is_regular_file()) {
        ++count;
      }
    }
    return count;
  }
};

TEST_F(StoreTest, BasicOperations) {
  put_and_verify("models", "test_key", bytes_of("Hello, Store!"));

  // Empty values are valid records
  put_and_verify("models", "empty_key", {});

  EXPECT_FALSE(store->has("models", "nonexistent_key"));
  EXPECT_FALSE(store->get("models", "nonexistent_key").has_value());
  EXPECT_FALSE(store->size_of("models", "nonexistent_key").has_value());
}

TEST_F(StoreTest, TablesAreIndependent) {
  put_and_verify("chunks", "shared", bytes_of("chunk data"));
  put_and_verify("models", "shared", bytes_of("metadata"));

  EXPECT_EQ(*store->get("chunks", "shared"), bytes_of("chunk data"));
  EXPECT_EQ(*store->get("models", "shared"), bytes_of("metadata"));

  EXPECT_TRUE(store->remove("chunks", "shared"));
  EXPECT_FALSE(store->has("chunks", "shared"));
  EXPECT_TRUE(store->has("models", "shared"));
}

TEST_F(StoreTest, OverwriteReplacesValue) {
  const Bytes large(1024 * 1024, 'X');
  put_and_verify("chunks", "advanced_test", large);
  EXPECT_EQ(store->size_of("chunks", "advanced_test"), large.size());

  const Bytes updated = bytes_of("Updated content");
  put_and_verify("chunks", "advanced_test", updated);
  EXPECT_EQ(store->size_of("chunks", "advanced_test"), updated.size());
}

TEST_F(StoreTest, RemoveReportsPresence) {
  put_and_verify("chunks", "doomed", bytes_of("bye"));
  EXPECT_TRUE(store->remove("chunks", "doomed"));
  EXPECT_FALSE(store->remove("chunks", "doomed"));
  EXPECT_FALSE(store->remove("never_created", "anything"));
  EXPECT_EQ(count_files(), 0u) << "Removing the last record should prune its directories";
}

TEST_F(StoreTest, ListKeysIsSortedAndComplete) {
  const std::vector<std::string> keys = {"gamma", "alpha", "model-1::chunk::0", "beta"};
  for (const auto& key : keys) {
    put_and_verify("chunks", key, bytes_of("v_" + key));
  }

  std::vector<std::string> expected = keys;
  std::sort(expected.begin(), expected.end());
  EXPECT_EQ(store->list_keys("chunks"), expected);
  EXPECT_TRUE(store->list_keys("models").empty());
}

TEST_F(StoreTest, ClearEmptiesOnlyThatTable) {
  put_and_verify("chunks", "a", bytes_of("1"));
  put_and_verify("chunks", "b", bytes_of("2"));
  put_and_verify("models", "a", bytes_of("3"));

  ASSERT_NO_THROW(store->clear("chunks"));
  EXPECT_TRUE(store->list_keys("chunks").empty());
  EXPECT_EQ(store->list_keys("models"), std::vector<std::string>{"a"});
}

TEST_F(StoreTest, EdgeCaseKeys) {
  const std::vector<std::string> edge_case_keys = {
    "",
    "../path/traversal",
    std::string(1024, 'a'),
    "/absolute/path",
    "\\windows\\path"
  };

  for (const auto& key : edge_case_keys) {
    put_and_verify("chunks", key, bytes_of("Test data"));
  }
  EXPECT_EQ(store->list_keys("chunks").size(), edge_case_keys.size());

  // Nothing escapes the base directory
  for (const auto& entry : std::filesystem::recursive_directory_iterator(test_dir->path())) {
    auto relative = std::filesystem::relative(entry.path(), test_dir->path());
    EXPECT_NE(relative.string().substr(0, 2), "..");
  }
}

TEST_F(StoreTest, InvalidTableNamesAreRejected) {
  EXPECT_THROW(store->put("../escape", "key", bytes_of("x")), StoreError);
  EXPECT_THROW(store->put("", "key", bytes_of("x")), StoreError);
  EXPECT_THROW(store->list_keys("a/b"), StoreError);
}

TEST_F(StoreTest, TruncatedRecordIsReportedAsCorrupt) {
  put_and_verify("chunks", "victim", bytes_of("some payload"));

  for (const auto& entry : std::filesystem::recursive_directory_iterator(test_dir->path())) {
    if (entry.is_regular_file()) {
      std::filesystem::resize_file(entry.path(), 3);
    }
  }
  EXPECT_THROW(store->get("chunks", "victim"), StoreError);
}

TEST_F(StoreTest, DataSurvivesReopen) {
  put_and_verify("models", "persistent", bytes_of("still here"));
  store = std::make_unique<FileTableStore>(test_dir->str());
  EXPECT_EQ(*store->get("models", "persistent"), bytes_of("still here"));
}

TEST_F(StoreTest, UnusableBasePathThrows) {
  EXPECT_THROW(FileTableStore(""), StoreUnavailableError);

  auto file_path = test_dir->path() / "plain_file";
  std::ofstream(file_path) << "not a directory";
  EXPECT_THROW(FileTableStore(file_path.string()), StoreUnavailableError);
}

TEST_F(StoreTest, ReportsAvailableSpace) {
  auto space = store->available_space();
  ASSERT_TRUE(space.has_value());
  EXPECT_GT(*space, 0u);
}

TEST_F(StoreTest, ConcurrentAccess) {
  const size_t num_threads = 5;
  const size_t ops_per_thread = 50;
  std::atomic<size_t> successful_ops{0};
  std::vector<std::thread> threads;

  for (size_t i = 0; i < num_threads; ++i) {
    threads.emplace_back([this, i, ops_per_thread, &successful_ops]() {
      for (size_t j = 0; j < ops_per_thread; ++j) {
        try {
          std::string key = "concurrent_" + std::to_string(i) + "_" + std::to_string(j);
          Bytes data = bytes_of("Data for " + key);
          store->put("chunks", key, data);
          auto value = store->get("chunks", key);
          if (value && *value == data) {
            successful_ops++;
          }
        } catch (const std::exception& e) {
          ADD_FAILURE() << "Thread " << i << " failed: " << e.what();
        }
      }
    });
  }

  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(successful_ops, num_threads * ops_per_thread);
  EXPECT_EQ(store->list_keys("chunks").size(), num_threads * ops_per_thread);
}
