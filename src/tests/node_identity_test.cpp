#include <gtest/gtest.h>
#include "dfsnode/node/node_identity.hpp"

using namespace dfsnode;
using namespace dfsnode::node;

TEST(NodeIdentityTest, StorageDirNamesHostAndPort) {
    NodeIdentity identity{"0.0.0.0", 5000};
    EXPECT_EQ(identity.storage_dir(), std::filesystem::path("storage_0.0.0.0_5000"));
    EXPECT_EQ(storage_dir_name("127.0.0.1", 5001), "storage_127.0.0.1_5001");
}

TEST(NodeIdentityTest, RegistryTableReplacesDots) {
    EXPECT_EQ(registry_table("0.0.0.0", 5000), "sn__0_0_0_0__5000");
    EXPECT_EQ(NodeIdentity({"127.0.0.1", 5001}).registry_table(), "sn__127_0_0_1__5001");
    EXPECT_EQ(registry_table("node-a.cluster", 7000), "sn__node-a_cluster__7000");
}

TEST(NodeIdentityTest, EndpointFormatting) {
    NodeIdentity identity{"10.1.2.3", 6000};
    EXPECT_EQ(identity.endpoint(), "10.1.2.3:6000");
    EXPECT_EQ(table_name_to_endpoint("sn__0_0_0_0__5000"), "0.0.0.0:5000");
}

TEST(NodeIdentityTest, TableNameRecoversIdentity) {
    const NodeIdentity identities[] = {
        {"0.0.0.0", 5000},
        {"192.168.10.20", 65535},
        {"storage-1.local", 0},
        {"localhost", 8080}
    };

    for (const auto& identity : identities) {
        EXPECT_EQ(parse_registry_table(identity.registry_table()), identity)
            << "Round trip failed for " << identity.endpoint();
    }
}

TEST(NodeIdentityTest, RejectsMalformedTableNames) {
    EXPECT_THROW(parse_registry_table(""), InvalidIdentifier);
    EXPECT_THROW(parse_registry_table("xx__0_0_0_0__5000"), InvalidIdentifier);
    EXPECT_THROW(parse_registry_table("sn__0_0_0_0"), InvalidIdentifier);
    EXPECT_THROW(parse_registry_table("sn____5000"), InvalidIdentifier);
    EXPECT_THROW(parse_registry_table("sn__a__b__5000"), InvalidIdentifier);
    EXPECT_THROW(parse_registry_table("sn__0_0_0_0__50a0"), InvalidIdentifier);
    EXPECT_THROW(parse_registry_table("sn__0_0_0_0__70000"), InvalidIdentifier);
    EXPECT_THROW(parse_registry_table("sn__0_0_0_0___5000"), InvalidIdentifier);
}

TEST(NodeIdentityTest, RejectsHostsThatBreakTheTableName) {
    EXPECT_THROW(registry_table("", 5000), InvalidIdentifier);
    EXPECT_THROW(registry_table("bad host", 5000), InvalidIdentifier);
    EXPECT_THROW(registry_table("under_score", 5000), InvalidIdentifier);
    EXPECT_THROW(registry_table("a..b", 5000), InvalidIdentifier);
    EXPECT_THROW(registry_table("trailing.", 5000), InvalidIdentifier);

    try {
        registry_table("bad host", 5000);
        FAIL() << "Expected InvalidIdentifier";
    } catch (const NodeError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::INVALID_IDENTIFIER);
    }
}

TEST(NodeIdentityTest, ParsesEndpoints) {
    NodeIdentity identity = parse_endpoint("127.0.0.1:5000");
    EXPECT_EQ(identity.host, "127.0.0.1");
    EXPECT_EQ(identity.port, 5000);

    EXPECT_THROW(parse_endpoint("localhost"), InvalidIdentifier);
    EXPECT_THROW(parse_endpoint(":5000"), InvalidIdentifier);
    EXPECT_THROW(parse_endpoint("localhost:"), InvalidIdentifier);
    EXPECT_THROW(parse_endpoint("localhost:99999"), InvalidIdentifier);
}

TEST(NodeIdentityTest, PortRange) {
    EXPECT_EQ(parse_port("0"), 0);
    EXPECT_EQ(parse_port("65535"), 65535);
    EXPECT_THROW(parse_port("65536"), InvalidIdentifier);
    EXPECT_THROW(parse_port("-1"), InvalidIdentifier);
    EXPECT_THROW(parse_port(""), InvalidIdentifier);
    EXPECT_THROW(parse_port("123456"), InvalidIdentifier);
}
