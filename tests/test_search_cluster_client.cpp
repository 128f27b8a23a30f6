#include <gtest/gtest.h>
#include "client/search_cluster_client.h"
#include "client/errors.h"
#include "fake_transport.h"

#include <memory>

using namespace searchlink;
using namespace searchlink::client;
using searchlink::fakes::FakeTransport;

namespace {

std::shared_ptr<FakeTransport> clusterWithTwoDataNodes() {
    auto transport = std::make_shared<FakeTransport>();
    transport->respond("GET", "/_nodes/http", 200, fakes::kThreeNodesResponse);
    return transport;
}

} // namespace

TEST(SearchClusterClientTest, ConstructionSeedsDiscoveredHosts) {
    auto transport = clusterWithTwoDataNodes();
    ClientConfig config;
    config.tls_enabled = true;

    SearchClusterClient client(config, transport);

    auto hosts = client.hosts();
    ASSERT_EQ(hosts.size(), 2u);
    EXPECT_EQ(hosts[0].toString(), "https://10.0.0.1:9200");
    EXPECT_EQ(hosts[1].toString(), "https://es-b.local:9201");
}

TEST(SearchClusterClientTest, InvalidConfigurationIsRejected) {
    ClientConfig config;
    config.port = 0;
    EXPECT_THROW(SearchClusterClient(config, clusterWithTwoDataNodes()), std::invalid_argument);
    EXPECT_THROW(SearchClusterClient{config}, std::invalid_argument);
}

TEST(SearchClusterClientTest, BrokenKeyStoreFailsConstruction) {
    ClientConfig config;
    config.tls_enabled = true;
    config.keystore_path = "/nonexistent/client.p12";
    EXPECT_THROW(SearchClusterClient{config}, SslInitializationException);
}

TEST(SearchClusterClientTest, DiscoveryFailureFailsConstruction) {
    auto transport = std::make_shared<FakeTransport>();
    transport->fail("GET", "/_nodes/http");
    EXPECT_THROW(SearchClusterClient(ClientConfig{}, transport), ConnectionException);
}

TEST(SearchClusterClientTest, CatalogOperations) {
    auto transport = clusterWithTwoDataNodes();
    transport->respond("GET", "/_cat/indices?h=index&format=json&s=index:asc", 200,
                       R"([{"index": "a"}, {"index": "b"}])");
    transport->respond("GET", "/a/_mappings", 200,
                       R"({"a": {"mappings": {"properties": {"x": {"type": "long"}}}}})");

    SearchClusterClient client(ClientConfig{}, transport);

    EXPECT_EQ(client.getIndexes(), (std::vector<std::string>{"a", "b"}));

    auto metadata = client.getIndexMetadata("a");
    ASSERT_EQ(metadata.schema.fields.size(), 1u);
    EXPECT_EQ(metadata.schema.fields[0], (cluster::Field{"x", cluster::PrimitiveType{"long"}}));
}

TEST(SearchClusterClientTest, RoutesAndScrollsOneShard) {
    auto transport = clusterWithTwoDataNodes();
    transport->respond("GET", "/idx/_search_shards", 200, R"({"shards": [
        [{"shard": 0, "primary": true, "node": "node-c"}, {"shard": 0, "primary": false, "node": "node-b"}]
    ]})");

    ClientConfig config;
    config.scroll_size = 2;
    config.scroll_timeout = std::chrono::seconds(30);
    transport->respond("POST", "/idx/_search?search_type=query_then_fetch&preference=_shards:0&scroll=30000ms", 200,
                       R"({"_scroll_id": "c1", "hits": {"total": {"value": 1}, "hits": [{"_id": "1", "_source": {}}]}})");
    transport->respond("POST", "/_search/scroll", 200,
                       R"({"_scroll_id": "c2", "hits": {"total": {"value": 1}, "hits": []}})");
    transport->respond("DELETE", "/_search/scroll", 200, R"({"succeeded": true})");

    SearchClusterClient client(config, transport);

    auto assignments = client.getSearchShards("idx");
    ASSERT_EQ(assignments.size(), 1u);
    EXPECT_EQ(assignments[0], (cluster::ShardAssignment{0, "es-b.local:9201"}));

    auto first = client.beginSearch("idx", assignments[0].shard, json{{"match_all", json::object()}},
                                    std::vector<std::string>{}, {});
    ASSERT_EQ(first.hits.size(), 1u);
    EXPECT_EQ(json::parse(*transport->lastRequest().body).at("size"), 2);
    EXPECT_EQ(json::parse(*transport->lastRequest().body).at("_source"), false);

    auto second = client.nextPage(first.scroll_id);
    EXPECT_TRUE(second.hits.empty());
    EXPECT_NO_THROW(client.clearScroll(second.scroll_id));
}

TEST(SearchClusterClientTest, OpenScrollClearsOnScopeExit) {
    auto transport = clusterWithTwoDataNodes();
    transport->respond("POST", "/idx/_search?search_type=query_then_fetch&preference=_shards:1&scroll=60000ms", 200,
                       R"({"_scroll_id": "c1", "hits": {"total": 0, "hits": []}})");
    transport->respond("DELETE", "/_search/scroll", 200, "{}");

    SearchClusterClient client(ClientConfig{}, transport);
    {
        search::SearchRequestOptions options;
        options.index = "idx";
        options.shard = 1;
        auto session = client.openScroll(options);
        EXPECT_TRUE(session.next().empty());
    }
    EXPECT_EQ(transport->lastRequest().method, "DELETE");
}

TEST(SearchClusterClientTest, CloseReleasesTransport) {
    auto transport = clusterWithTwoDataNodes();
    SearchClusterClient client(ClientConfig{}, transport);

    client.close();
    EXPECT_TRUE(transport->isClosed());
    EXPECT_THROW(client.getNodes(), ConnectionException);
}
