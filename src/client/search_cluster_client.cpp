#include "client/search_cluster_client.h"
#include "cluster/index_catalog.h"
#include "cluster/shard_router.h"
#include "cluster/topology_discovery.h"
#include "security/tls_context_builder.h"
#include "transport/beast_transport.h"
#include "utils/logger.h"

#include <stdexcept>

namespace searchlink::client {

namespace {
    void requireValid(const ClientConfig& config) {
        auto problems = config.validate();
        if (problems.empty()) {
            return;
        }
        std::string message = "invalid client configuration:";
        for (const auto& problem : problems) {
            message += " " + problem + ";";
        }
        throw std::invalid_argument(message);
    }

    std::shared_ptr<transport::Transport> createTransport(const ClientConfig& config) {
        std::shared_ptr<boost::asio::ssl::context> ssl_context;
        if (config.tls_enabled) {
            auto tls = security::TlsContextBuilder::build(security::SecurityMaterial{
                config.keystore_path,
                config.keystore_password,
                config.truststore_path,
                config.truststore_password
            });
            if (tls) {
                ssl_context = tls->context;
            }
        }

        transport::BeastTransport::Config transport_config;
        transport_config.hosts = {
            transport::HttpHost{config.scheme(), config.host, static_cast<uint16_t>(config.port)}
        };
        transport_config.connect_timeout = config.connect_timeout;
        transport_config.request_timeout = config.request_timeout;
        transport_config.max_retry_time = config.max_retry_time;
        transport_config.max_connections_per_host = config.max_connections_per_host;
        transport_config.verify_hostnames = config.verify_hostnames;

        return std::make_shared<transport::BeastTransport>(transport_config, std::move(ssl_context));
    }
}

SearchClusterClient::SearchClusterClient(const ClientConfig& config)
    : config_(config) {
    requireValid(config_);
    transport_ = createTransport(config_);
    initialize();
}

SearchClusterClient::SearchClusterClient(const ClientConfig& config, std::shared_ptr<transport::Transport> transport)
    : config_(config),
      transport_(std::move(transport)) {
    requireValid(config_);
    if (!transport_) {
        throw std::invalid_argument("SearchClusterClient requires a transport");
    }
    initialize();
}

SearchClusterClient::~SearchClusterClient() = default;

void SearchClusterClient::initialize() {
    discovery_ = std::make_shared<cluster::TopologyDiscovery>(transport_);
    router_ = std::make_unique<cluster::ShardRouter>(transport_, discovery_);
    catalog_ = std::make_unique<cluster::IndexCatalog>(transport_);
    protocol_ = std::make_shared<search::ScrollSearchProtocol>(
        transport_, search::ScrollSearchProtocol::Config{config_.scroll_size, config_.scroll_timeout});

    // Discover the data nodes and talk to them directly from now on
    auto hosts = discovery_->seedTransportHosts(config_.scheme());
    SEARCHLINK_INFO("Search cluster client ready ({}:{}, tls: {}, {} host(s))",
                    config_.host, config_.port, config_.tls_enabled, hosts.size());
}

cluster::NodeMap SearchClusterClient::getNodes() const {
    return discovery_->getNodes();
}

std::vector<cluster::ShardAssignment> SearchClusterClient::getSearchShards(const std::string& index) const {
    return router_->getSearchShards(index);
}

std::vector<std::string> SearchClusterClient::getIndexes() const {
    return catalog_->getIndexes();
}

cluster::IndexMetadata SearchClusterClient::getIndexMetadata(const std::string& index) const {
    return catalog_->getIndexMetadata(index);
}

search::SearchResponse SearchClusterClient::beginSearch(const search::SearchRequestOptions& options) const {
    return protocol_->beginSearch(options);
}

search::SearchResponse SearchClusterClient::beginSearch(
    const std::string& index,
    int shard,
    const search::json& query,
    const std::optional<std::vector<std::string>>& fields,
    const std::vector<std::string>& doc_value_fields) const {
    return protocol_->beginSearch(search::SearchRequestOptions{index, shard, query, fields, doc_value_fields});
}

search::SearchResponse SearchClusterClient::nextPage(const std::string& scroll_id) const {
    return protocol_->nextPage(scroll_id);
}

void SearchClusterClient::clearScroll(const std::string& scroll_id) const {
    protocol_->clearScroll(scroll_id);
}

search::ScrollSession SearchClusterClient::openScroll(const search::SearchRequestOptions& options) const {
    return search::ScrollSession(protocol_, options);
}

void SearchClusterClient::close() {
    transport_->close();
    SEARCHLINK_INFO("Search cluster client closed");
}

std::vector<transport::HttpHost> SearchClusterClient::hosts() const {
    return transport_->hosts();
}

} // namespace searchlink::client
