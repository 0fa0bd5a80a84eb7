#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "dfsnode/integrity/digest.hpp"
#include "test_utils.hpp"

using namespace dfsnode;
using ::testing::HasSubstr;

class DigestTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir;

    void SetUp() override {
        test_dir = test::make_temp_dir("digest_test");
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
    }

    std::filesystem::path make_file(const std::string& name, const std::string& content) {
        std::filesystem::path path = test_dir / name;
        test::write_file(path, content);
        return path;
    }
};

TEST_F(DigestTest, KnownDigests) {
    EXPECT_EQ(integrity::digest(make_file("hello.txt", "hello world")), "5eb63bbbe01eeed093cb22bb8f5acdc3");
    EXPECT_EQ(integrity::digest(make_file("empty.txt", "")), "d41d8cd98f00b204e9800998ecf8427e");
    EXPECT_EQ(integrity::digest_bytes("The quick brown fox jumps over the lazy dog"),
              "9e107d9d372bb6826bd81d3542a419d6");
}

TEST_F(DigestTest, FileSpanningSeveralBlocks) {
    std::string data = test::make_payload(3 * integrity::DIGEST_BLOCK_SIZE + 17);
    auto path = make_file("blocks.bin", data);

    EXPECT_EQ(integrity::digest(path), integrity::digest_bytes(data));
    // Same content gives the same digest
    EXPECT_EQ(integrity::digest(path), integrity::digest(path));
}

TEST_F(DigestTest, VerifyAcceptsAnyHexCase) {
    auto path = make_file("hello.txt", "hello world");
    EXPECT_TRUE(integrity::verify(path, "5eb63bbbe01eeed093cb22bb8f5acdc3"));
    EXPECT_TRUE(integrity::verify(path, "5EB63BBBE01EEED093CB22BB8F5ACDC3"));
}

TEST_F(DigestTest, VerifyThrowsOnMismatch) {
    auto path = make_file("hello.txt", "hello world");

    try {
        integrity::verify(path, "00000000000000000000000000000000");
        FAIL() << "Expected IntegrityMismatch";
    } catch (const IntegrityMismatch& e) {
        EXPECT_EQ(e.kind(), ErrorKind::INTEGRITY_MISMATCH);
        EXPECT_THAT(e.what(), HasSubstr("File integrity check failed"));
        EXPECT_THAT(e.what(), HasSubstr("hello.txt"));
    }

    // The file is left alone
    EXPECT_TRUE(std::filesystem::exists(path));
}

TEST_F(DigestTest, MissingFileIsAnIOFailure) {
    EXPECT_THROW(integrity::digest(test_dir / "missing.bin"), IOFailure);
    EXPECT_THROW(integrity::verify(test_dir / "missing.bin", "d41d8cd98f00b204e9800998ecf8427e"), IOFailure);
}
