#include "cluster/shard_router.h"
#include "cluster/response_decoder.h"
#include "transport/rest_calls.h"
#include "utils/logger.h"

#include <algorithm>
#include <stdexcept>

namespace searchlink::cluster {

ShardRouter::ShardRouter(
    std::shared_ptr<transport::Transport> transport,
    std::shared_ptr<TopologyDiscovery> discovery)
    : transport_(std::move(transport)),
      discovery_(std::move(discovery)) {
    if (!transport_ || !discovery_) {
        throw std::invalid_argument("ShardRouter requires a transport and a topology discovery");
    }
}

std::vector<ShardAssignment> ShardRouter::getSearchShards(const std::string& index) const {
    // Snapshot first: assignments only ever reference nodes of this snapshot
    NodeMap nodes = discovery_->getNodes();

    auto body = transport::getBody(*transport_, "/" + transport::encodePathSegment(index) + "/_search_shards");
    auto groups = ResponseDecoder::decodeSearchShards(body);

    auto assignments = assignShards(groups, nodes);
    SEARCHLINK_DEBUG("Routed {} shard(s) of index {} across {} data node(s)",
                     assignments.size(), index, nodes.size());
    return assignments;
}

std::vector<ShardAssignment> ShardRouter::assignShards(const std::vector<ShardGroup>& groups,
                                                       const NodeMap& nodes) {
    std::vector<const ClusterNode*> known_nodes;
    known_nodes.reserve(nodes.size());
    for (const auto& [id, node] : nodes) {
        known_nodes.push_back(&node);
    }

    std::vector<ShardAssignment> result;
    result.reserve(groups.size());
    for (const auto& group : groups) {
        result.push_back(assignShard(group, nodes, known_nodes));
    }
    return result;
}

std::vector<ShardCandidate> ShardRouter::orderByPreference(const ShardGroup& group) {
    std::vector<ShardCandidate> ordered(group.begin(), group.end());
    // Favor non-primary shards
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const ShardCandidate& left, const ShardCandidate& right) {
                         return !left.primary && right.primary;
                     });
    return ordered;
}

ShardAssignment ShardRouter::assignShard(const ShardGroup& group,
                                         const NodeMap& nodes,
                                         const std::vector<const ClusterNode*>& known_nodes) {
    if (group.empty()) {
        throw std::invalid_argument("shard group without copies");
    }

    auto preferred = orderByPreference(group);

    auto candidate = std::find_if(preferred.begin(), preferred.end(), [&](const ShardCandidate& shard) {
        return shard.node_id && nodes.count(*shard.node_id) > 0;
    });
    if (candidate != preferred.end()) {
        return ShardAssignment{candidate->shard, nodes.at(*candidate->node_id).address};
    }

    // No copy lives on a known data node: pick the most preferred copy and an arbitrary node
    const ShardCandidate& chosen = preferred.front();
    if (known_nodes.empty()) {
        throw std::logic_error("cannot assign shard " + std::to_string(chosen.shard) +
                               ": topology snapshot holds no data nodes");
    }
    size_t slot = static_cast<size_t>(chosen.shard) % known_nodes.size();
    const ClusterNode& node = *known_nodes[slot];

    SEARCHLINK_WARN("Shard {} has no copy on a known data node, assigning it to node {} ({})",
                    chosen.shard, node.id, node.address);
    return ShardAssignment{chosen.shard, node.address};
}

} // namespace searchlink::cluster
