#pragma once

#include "cluster/cluster_types.h"
#include "transport/transport.h"

#include <memory>
#include <string>
#include <vector>

namespace searchlink::cluster {

/**
 * Topology Discovery
 *
 * Lists the cluster nodes and keeps the ones holding data. Every call
 * performs a fresh query; nothing is cached between calls.
 */
class TopologyDiscovery {
public:
    static constexpr const char* kDataRole = "data";

    explicit TopologyDiscovery(std::shared_ptr<transport::Transport> transport);

    /**
     * Data-holding nodes keyed by node id
     * @throws ConnectionException, InvalidResponseException
     */
    NodeMap getNodes() const;

    /**
     * Point the transport at the discovered data nodes.
     * Each node address becomes "<scheme>://<address>". When no data node is
     * discovered the transport keeps its current hosts.
     * @param scheme "http" or "https"
     * @return hosts now used by the transport
     */
    std::vector<transport::HttpHost> seedTransportHosts(const std::string& scheme) const;

    /**
     * Keep data nodes with an HTTP address (pure filtering step of getNodes)
     */
    static NodeMap selectDataNodes(const std::vector<NodeInfo>& nodes);

    /**
     * "es1.local/10.0.0.1:9200" -> "es1.local:9200"; plain "host:port" is returned unchanged
     */
    static std::string normalizeAddress(const std::string& publish_address);

private:
    std::shared_ptr<transport::Transport> transport_;
};

} // namespace searchlink::cluster
