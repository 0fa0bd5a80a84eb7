#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <thread>
#include "dfsnode/network/connection.hpp"
#include "dfsnode/network/protocol.hpp"
#include "test_utils.hpp"

namespace dfsnode {
namespace network {
namespace test {

using dfsnode::test::LoopbackPair;
using dfsnode::test::make_loopback_pair;
using ::testing::HasSubstr;

class ConnectionTest : public ::testing::Test {
protected:
    void SetUp() override {
        dfsnode::test::init_test_logging();
        pair_ = make_loopback_pair(std::chrono::milliseconds(500));
        ASSERT_TRUE(pair_.client->is_open());
        ASSERT_TRUE(pair_.server->is_open());
    }

    LoopbackPair pair_;
};

TEST_F(ConnectionTest, EndpointsMatch) {
    EXPECT_EQ(pair_.client->remote_endpoint(), pair_.server->local_endpoint());
    EXPECT_EQ(pair_.server->remote_endpoint(), pair_.client->local_endpoint());
}

TEST_F(ConnectionTest, FramesKeepTheirBoundaries) {
    pair_.client->write_frame("<STATUS_REQUEST>");
    pair_.client->write_frame("");
    pair_.client->write_frame("<GET_REQUEST><>a.txt");

    EXPECT_EQ(pair_.server->read_frame(), "<STATUS_REQUEST>");
    EXPECT_EQ(pair_.server->read_frame(), "");
    EXPECT_EQ(pair_.server->read_frame(), "<GET_REQUEST><>a.txt");
}

TEST_F(ConnectionTest, RawBytesFollowAFrame) {
    pair_.client->write_frame("header");
    pair_.client->write_all("payload", 7);

    EXPECT_EQ(pair_.server->read_frame(), "header");
    char buffer[7];
    pair_.server->read_exact(buffer, sizeof(buffer));
    EXPECT_EQ(std::string(buffer, sizeof(buffer)), "payload");
}

TEST_F(ConnectionTest, ReadSomeReturnsZeroAfterPeerClose) {
    pair_.client->write_all("abc", 3);
    pair_.client->close();
    EXPECT_FALSE(pair_.client->is_open());

    char buffer[16];
    std::size_t total = 0;
    std::size_t bytes_read;
    while ((bytes_read = pair_.server->read_some(buffer + total, sizeof(buffer) - total)) > 0) {
        total += bytes_read;
    }
    EXPECT_EQ(std::string(buffer, total), "abc");
    EXPECT_EQ(pair_.server->read_some(buffer, sizeof(buffer)), 0u);
}

TEST_F(ConnectionTest, ReadExactThrowsOnEarlyClose) {
    pair_.client->write_all("abc", 3);
    pair_.client->shutdown_send();

    char buffer[10];
    try {
        pair_.server->read_exact(buffer, sizeof(buffer));
        FAIL() << "Expected TransferTruncated";
    } catch (const TransferTruncated& e) {
        EXPECT_THAT(e.what(), HasSubstr("3 of 10"));
    }
}

TEST_F(ConnectionTest, StalledReadTimesOut) {
    char buffer[4];
    auto started = std::chrono::steady_clock::now();
    EXPECT_THROW(pair_.server->read_exact(buffer, sizeof(buffer)), TransferTimeout);
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_GE(elapsed, std::chrono::milliseconds(450));
    // The connection stays usable after a timeout
    pair_.client->write_frame("late");
    EXPECT_EQ(pair_.server->read_frame(), "late");
}

TEST_F(ConnectionTest, OversizedFrameIsRejected) {
    std::vector<uint8_t> prefix = encode_frame_length(MAX_FRAME_SIZE + 1);
    pair_.client->write_all(prefix.data(), prefix.size());

    EXPECT_THROW(pair_.server->read_frame(), MalformedRequest);
    EXPECT_THROW(pair_.client->write_frame(std::string(MAX_FRAME_SIZE + 1, 'x')), MalformedRequest);
}

TEST_F(ConnectionTest, StopInterruptsABlockedRead) {
    pair_.server->set_timeout(Connection::Duration::zero());

    std::thread stopper([this]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        pair_.server->stop();
    });

    char buffer[4];
    EXPECT_THROW(pair_.server->read_exact(buffer, sizeof(buffer)), NodeError);
    stopper.join();
    EXPECT_FALSE(pair_.server->is_open());
}

TEST(ConnectionSetupTest, ConnectToClosedPortFails) {
    // Grab a free port, then release it
    uint16_t port;
    {
        boost::asio::io_context io_context;
        boost::asio::ip::tcp::acceptor acceptor(
            io_context, boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
        port = acceptor.local_endpoint().port();
    }

    Connection connection;
    EXPECT_THROW(connection.connect("127.0.0.1", port), ConnectionFailed);
    EXPECT_EQ(connection.remote_endpoint(), "<disconnected>");
}

} // namespace test
} // namespace network
} // namespace dfsnode
