#include <gtest/gtest.h>
#include <filesystem>
#include "dfsnode/store/node_store.hpp"
#include "test_utils.hpp"

using namespace dfsnode;
using namespace dfsnode::store;

class NodeStoreTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  logging::Logger logger = logging::make_logger("store-test");
  std::unique_ptr<NodeStore> store;

  void SetUp() override {
    test::init_test_logging();
    test_dir = test::make_temp_dir("node_store_test");
    store = std::make_unique<NodeStore>(test_dir / "storage_127.0.0.1_5000", logger);
    ASSERT_NE(store, nullptr);
  }

  void TearDown() override {
    store.reset();
    if (std::filesystem::exists(test_dir)) {
      std::filesystem::remove_all(test_dir);
    }
  }
};

TEST_F(NodeStoreTest, SanitizeKeepsOnlyTheBaseName) {
  EXPECT_EQ(NodeStore::sanitize_filename("report.txt"), "report.txt");
  EXPECT_EQ(NodeStore::sanitize_filename("dir/sub/report.txt"), "report.txt");
  EXPECT_EQ(NodeStore::sanitize_filename("../../etc/passwd"), "passwd");
  EXPECT_EQ(NodeStore::sanitize_filename("/abs/path/data.bin"), "data.bin");
}

TEST_F(NodeStoreTest, SanitizeRejectsEmptyNames) {
  EXPECT_THROW(NodeStore::sanitize_filename(""), InvalidIdentifier);
  EXPECT_THROW(NodeStore::sanitize_filename("."), InvalidIdentifier);
  EXPECT_THROW(NodeStore::sanitize_filename(".."), InvalidIdentifier);
  EXPECT_THROW(NodeStore::sanitize_filename("dir/"), InvalidIdentifier);
}

TEST_F(NodeStoreTest, ResolveStaysInsideTheStore) {
  EXPECT_EQ(store->resolve("../escape.txt"), store->base_path() / "escape.txt");
  EXPECT_EQ(store->resolve("report.txt").parent_path(), store->base_path());
}

TEST_F(NodeStoreTest, DirectoryIsCreatedLazily) {
  EXPECT_FALSE(std::filesystem::exists(store->base_path()));
  ASSERT_NO_THROW(store->ensure_directory());
  EXPECT_TRUE(std::filesystem::is_directory(store->base_path()));
  // Second call is a no-op
  EXPECT_NO_THROW(store->ensure_directory());
}

TEST_F(NodeStoreTest, HasAndSize) {
  EXPECT_FALSE(store->has("report.txt"));

  test::write_file(store->resolve("report.txt"), "hello world");
  EXPECT_TRUE(store->has("report.txt"));
  EXPECT_EQ(store->get_file_size("report.txt"), 11u);

  // A directory is not a stored file
  std::filesystem::create_directories(store->base_path() / "nested");
  EXPECT_FALSE(store->has("nested"));
}

TEST_F(NodeStoreTest, SizeOfMissingFile) {
  try {
    store->get_file_size("missing.txt");
    FAIL() << "Expected NodeError";
  } catch (const NodeError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::FILE_NOT_FOUND);
  }
}

TEST_F(NodeStoreTest, ClearRemovesEverything) {
  test::write_file(store->resolve("a.txt"), "a");
  test::write_file(store->resolve("b.txt"), "b");
  ASSERT_TRUE(store->has("a.txt"));

  ASSERT_NO_THROW(store->clear());
  EXPECT_FALSE(store->has("a.txt"));
  EXPECT_FALSE(store->has("b.txt"));
  EXPECT_TRUE(std::filesystem::is_directory(store->base_path()));
  EXPECT_TRUE(std::filesystem::is_empty(store->base_path()));
}
