#include "cluster/topology_discovery.h"
#include "cluster/response_decoder.h"
#include "client/errors.h"
#include "transport/rest_calls.h"
#include "utils/logger.h"

#include <exception>
#include <stdexcept>

namespace searchlink::cluster {

TopologyDiscovery::TopologyDiscovery(std::shared_ptr<transport::Transport> transport)
    : transport_(std::move(transport)) {
    if (!transport_) {
        throw std::invalid_argument("TopologyDiscovery requires a transport");
    }
}

std::string TopologyDiscovery::normalizeAddress(const std::string& publish_address) {
    // "hostname/ip:port" when the node has a host name: keep host name and port
    size_t slash = publish_address.find('/');
    if (slash == std::string::npos) {
        return publish_address;
    }
    size_t colon = publish_address.rfind(':');
    if (slash == 0) {
        return publish_address.substr(1);
    }
    if (colon == std::string::npos || colon < slash) {
        return publish_address.substr(0, slash);
    }
    return publish_address.substr(0, slash) + publish_address.substr(colon);
}

NodeMap TopologyDiscovery::getNodes() const {
    auto body = transport::getBody(*transport_, "/_nodes/http");
    return selectDataNodes(ResponseDecoder::decodeNodes(body));
}

NodeMap TopologyDiscovery::selectDataNodes(const std::vector<NodeInfo>& nodes) {
    NodeMap result;
    for (const auto& node : nodes) {
        if (!node.hasRole(kDataRole)) {
            continue;
        }
        if (!node.http_address) {
            SEARCHLINK_WARN("Data node {} has no HTTP publish address, ignoring it", node.id);
            continue;
        }
        result.emplace(node.id, ClusterNode{node.id, normalizeAddress(*node.http_address)});
    }
    return result;
}

std::vector<transport::HttpHost> TopologyDiscovery::seedTransportHosts(const std::string& scheme) const {
    auto nodes = getNodes();
    if (nodes.empty()) {
        auto current = transport_->hosts();
        SEARCHLINK_WARN("No data nodes discovered, keeping {} configured host(s)", current.size());
        return current;
    }

    std::vector<transport::HttpHost> hosts;
    hosts.reserve(nodes.size());
    for (const auto& [id, node] : nodes) {
        try {
            hosts.push_back(transport::HttpHost::create(scheme + "://" + node.address));
        } catch (const std::invalid_argument& e) {
            std::throw_with_nested(InvalidResponseException(
                "node " + id + " advertises unusable address '" + node.address + "'"));
        }
    }

    transport_->setHosts(hosts);
    for (const auto& host : hosts) {
        SEARCHLINK_INFO("Discovered data node {}", host.toString());
    }
    return hosts;
}

} // namespace searchlink::cluster
