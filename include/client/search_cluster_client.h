#pragma once

#include "client/client_config.h"
#include "cluster/cluster_types.h"
#include "cluster/index_metadata.h"
#include "search/scroll_search.h"
#include "search/scroll_session.h"
#include "transport/transport.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace searchlink::cluster {
class TopologyDiscovery;
class ShardRouter;
class IndexCatalog;
}

namespace searchlink::client {

/**
 * @brief Client of a distributed search cluster
 *
 * Construction builds the TLS context (when enabled), opens the transport
 * on the configured seed host and replaces it with the discovered data nodes.
 * Afterwards the client holds no per-query state and can be shared by
 * concurrent callers; scroll cursors belong to whoever opened them.
 */
class SearchClusterClient {
public:
    /**
     * @throws std::invalid_argument if the configuration does not validate
     * @throws SslInitializationException, CertificateValidityException
     * @throws ConnectionException, InvalidResponseException if discovery fails
     */
    explicit SearchClusterClient(const ClientConfig& config);

    /**
     * Use an existing transport (TLS settings of `config` are ignored)
     */
    SearchClusterClient(const ClientConfig& config, std::shared_ptr<transport::Transport> transport);

    ~SearchClusterClient();

    SearchClusterClient(const SearchClusterClient&) = delete;
    SearchClusterClient& operator=(const SearchClusterClient&) = delete;

    // Topology
    cluster::NodeMap getNodes() const;
    std::vector<cluster::ShardAssignment> getSearchShards(const std::string& index) const;

    // Catalog
    std::vector<std::string> getIndexes() const;
    cluster::IndexMetadata getIndexMetadata(const std::string& index) const;

    // Scroll search
    search::SearchResponse beginSearch(const search::SearchRequestOptions& options) const;
    search::SearchResponse beginSearch(const std::string& index,
                                       int shard,
                                       const search::json& query,
                                       const std::optional<std::vector<std::string>>& fields,
                                       const std::vector<std::string>& doc_value_fields) const;
    search::SearchResponse nextPage(const std::string& scroll_id) const;
    void clearScroll(const std::string& scroll_id) const;

    /**
     * beginSearch wrapped in a session that clears its cursor on destruction
     */
    search::ScrollSession openScroll(const search::SearchRequestOptions& options) const;

    /**
     * Release the connection pool; later calls fail with ConnectionException
     */
    void close();

    const ClientConfig& getConfig() const { return config_; }
    std::vector<transport::HttpHost> hosts() const;

private:
    ClientConfig config_;
    std::shared_ptr<transport::Transport> transport_;
    std::shared_ptr<cluster::TopologyDiscovery> discovery_;
    std::unique_ptr<cluster::ShardRouter> router_;
    std::unique_ptr<cluster::IndexCatalog> catalog_;
    std::shared_ptr<const search::ScrollSearchProtocol> protocol_;

    void initialize();
};

} // namespace searchlink::client
