#include <gtest/gtest.h>
#include "cluster/topology_discovery.h"
#include "client/errors.h"
#include "fake_transport.h"

#include <memory>
#include <string>
#include <vector>

using namespace searchlink;
using namespace searchlink::cluster;
using searchlink::fakes::FakeTransport;

TEST(TopologyDiscoveryTest, GetNodesKeepsOnlyDataNodes) {
    auto transport = std::make_shared<FakeTransport>();
    transport->respond("GET", "/_nodes/http", 200, fakes::kThreeNodesResponse);

    TopologyDiscovery discovery(transport);
    auto nodes = discovery.getNodes();

    ASSERT_EQ(nodes.size(), 2u);
    EXPECT_EQ(nodes.at("node-a"), (ClusterNode{"node-a", "10.0.0.1:9200"}));
    EXPECT_EQ(nodes.at("node-b"), (ClusterNode{"node-b", "es-b.local:9201"}));
    EXPECT_EQ(nodes.count("node-c"), 0u);
}

TEST(TopologyDiscoveryTest, SnapshotKeepsResponseOrder) {
    auto transport = std::make_shared<FakeTransport>();
    transport->respond("GET", "/_nodes/http", 200, R"({"nodes": {
        "zeta": {"roles": ["data"], "http": {"publish_address": "z:9200"}},
        "master-1": {"roles": ["master"], "http": {"publish_address": "m:9200"}},
        "alpha": {"roles": ["data"], "http": {"publish_address": "a:9200"}}
    }})");

    auto nodes = TopologyDiscovery(transport).getNodes();
    std::vector<std::string> ids;
    for (const auto& [id, node] : nodes) {
        ids.push_back(id);
    }
    EXPECT_EQ(ids, (std::vector<std::string>{"zeta", "alpha"}));
}

TEST(TopologyDiscoveryTest, EveryCallQueriesTheCluster) {
    auto transport = std::make_shared<FakeTransport>();
    transport->respond("GET", "/_nodes/http", 200, fakes::kThreeNodesResponse);

    TopologyDiscovery discovery(transport);
    discovery.getNodes();
    discovery.getNodes();
    EXPECT_EQ(transport->requests().size(), 2u);
}

TEST(TopologyDiscoveryTest, DataNodeWithoutHttpAddressIsSkipped) {
    std::vector<NodeInfo> infos = {
        NodeInfo{"x", {"data"}, std::nullopt},
        NodeInfo{"y", {"data"}, std::string("h:9200")},
    };
    auto nodes = TopologyDiscovery::selectDataNodes(infos);
    ASSERT_EQ(nodes.size(), 1u);
    EXPECT_EQ(nodes.begin()->first, "y");
}

TEST(TopologyDiscoveryTest, NormalizeAddress) {
    EXPECT_EQ(TopologyDiscovery::normalizeAddress("10.0.0.1:9200"), "10.0.0.1:9200");
    EXPECT_EQ(TopologyDiscovery::normalizeAddress("es1.local/10.0.0.1:9200"), "es1.local:9200");
    EXPECT_EQ(TopologyDiscovery::normalizeAddress("/10.0.0.1:9200"), "10.0.0.1:9200");
}

TEST(TopologyDiscoveryTest, SeedReplacesTransportHosts) {
    auto transport = std::make_shared<FakeTransport>();
    transport->respond("GET", "/_nodes/http", 200, fakes::kThreeNodesResponse);

    TopologyDiscovery discovery(transport);
    auto hosts = discovery.seedTransportHosts("https");

    ASSERT_EQ(hosts.size(), 2u);
    EXPECT_EQ(hosts[0], (transport::HttpHost{"https", "10.0.0.1", 9200}));
    EXPECT_EQ(hosts[1], (transport::HttpHost{"https", "es-b.local", 9201}));
    EXPECT_EQ(transport->hosts(), hosts);
    EXPECT_EQ(transport->setHostsCalls(), 1);
}

TEST(TopologyDiscoveryTest, SeedKeepsConfiguredHostWhenNoDataNode) {
    auto transport = std::make_shared<FakeTransport>();
    transport->respond("GET", "/_nodes/http", 200,
                       R"({"nodes": {"c": {"roles": ["master"], "http": {"publish_address": "1.2.3.4:9200"}}}})");

    TopologyDiscovery discovery(transport);
    auto hosts = discovery.seedTransportHosts("http");

    ASSERT_EQ(hosts.size(), 1u);
    EXPECT_EQ(hosts[0].host, "localhost");
    EXPECT_EQ(transport->setHostsCalls(), 0);
}

TEST(TopologyDiscoveryTest, TransportFailureIsConnectionError) {
    auto transport = std::make_shared<FakeTransport>();
    transport->fail("GET", "/_nodes/http");

    TopologyDiscovery discovery(transport);
    try {
        discovery.getNodes();
        FAIL() << "expected ConnectionException";
    } catch (const ConnectionException& e) {
        EXPECT_EQ(e.code(), ErrorCode::CONNECTION_ERROR);
        EXPECT_THROW(std::rethrow_if_nested(e), transport::TransportException);
    }
}

TEST(TopologyDiscoveryTest, GarbageBodyIsInvalidResponse) {
    auto transport = std::make_shared<FakeTransport>();
    transport->respond("GET", "/_nodes/http", 200, "<html>proxy error</html>");

    TopologyDiscovery discovery(transport);
    EXPECT_THROW(discovery.getNodes(), InvalidResponseException);
}
