#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "dfsnode/client/node_client.hpp"
#include "dfsnode/integrity/digest.hpp"
#include "test_utils.hpp"

using namespace dfsnode;
using namespace dfsnode::client;
using ::testing::HasSubstr;

class NodeClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        test::init_test_logging();
        test_dir = test::make_temp_dir("node_client_test");
        node = std::make_unique<test::NodeHarness>(test_dir / "storage");
        ASSERT_TRUE(node->start());
        client = std::make_unique<NodeClient>("127.0.0.1", node->port(), logger);
    }

    void TearDown() override {
        client.reset();
        node.reset();
        std::filesystem::remove_all(test_dir);
    }

    std::filesystem::path test_dir;
    logging::Logger logger = logging::make_logger("client-test");
    std::unique_ptr<test::NodeHarness> node;
    std::unique_ptr<NodeClient> client;
};

TEST_F(NodeClientTest, StatusOfRunningNode) {
    Response response = client->status();
    EXPECT_TRUE(response.success);
    EXPECT_EQ(response.message, "200");
}

TEST_F(NodeClientTest, StatusOfStoppedNode) {
    node->server().shutdown();

    Response response = client->status();
    EXPECT_FALSE(response.success);
    EXPECT_THAT(response.message, HasSubstr("Connection failed"));
}

TEST_F(NodeClientTest, PutFile) {
    std::filesystem::path src = test_dir / "report.txt";
    test::write_file(src, "hello world");

    Response response = client->put_file(src);
    EXPECT_TRUE(response.success) << response.message;
    EXPECT_EQ(response.message, network::TRANSFER_SUCCESSFUL_CODE);
    EXPECT_EQ(test::read_file(node->store().resolve("report.txt")), "hello world");
}

TEST_F(NodeClientTest, PutMissingFile) {
    Response response = client->put_file(test_dir / "missing.txt");
    EXPECT_FALSE(response.success);
    EXPECT_THAT(response.message, HasSubstr("File not valid"));
}

TEST_F(NodeClientTest, PutWithoutWaitingForVerdict) {
    std::filesystem::path src = test_dir / "fire.bin";
    std::string content = test::make_payload(10000);
    test::write_file(src, content);

    Response response = client->put_file(src, false);
    EXPECT_TRUE(response.success) << response.message;
    EXPECT_THAT(response.message, HasSubstr("sent."));

    // The node finishes on its own
    ASSERT_TRUE(test::wait_until([this, &content]() {
        return node->store().has("fire.bin") &&
               test::read_file(node->store().resolve("fire.bin")) == content;
    }));
}

TEST_F(NodeClientTest, GetRoundTrip) {
    std::filesystem::path src = test_dir / "outgoing" / "data.bin";
    std::string content = test::make_payload(3 * network::BUFFER_SIZE + 11);
    test::write_file(src, content);
    ASSERT_TRUE(client->put_file(src).success);

    std::filesystem::path dest = test_dir / "received_files" / "data.bin";
    Response response = client->get_file("data.bin", dest);
    EXPECT_TRUE(response.success) << response.message;
    EXPECT_THAT(response.message, HasSubstr("saved successfully on"));
    EXPECT_THAT(response.message, HasSubstr("Integrity check passed."));
    EXPECT_EQ(test::read_file(dest), content);
}

TEST_F(NodeClientTest, GetMissingFile) {
    std::filesystem::path dest = test_dir / "received_files" / "nope.txt";
    Response response = client->get_file("nope.txt", dest);

    EXPECT_FALSE(response.success);
    EXPECT_EQ(response.message, "File not found: nope.txt");
    EXPECT_FALSE(std::filesystem::exists(dest));
}

TEST_F(NodeClientTest, GetOfParentDirectoryIsRefused) {
    std::filesystem::path dest = test_dir / "received_files" / "parent";
    Response response = client->get_file("..", dest);

    EXPECT_FALSE(response.success);
    EXPECT_THAT(response.message, HasSubstr("Invalid identifier"));
    EXPECT_FALSE(std::filesystem::exists(dest));
}

TEST_F(NodeClientTest, GetUsesOnlyTheBaseName) {
    test::write_file(node->store().resolve("notes.md"), "# notes");

    std::filesystem::path dest = test_dir / "received_files" / "notes.md";
    Response response = client->get_file("some/dir/notes.md", dest);
    EXPECT_TRUE(response.success) << response.message;
    EXPECT_EQ(test::read_file(dest), "# notes");
}
