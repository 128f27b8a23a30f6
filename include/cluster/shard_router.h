#pragma once

#include "cluster/cluster_types.h"
#include "cluster/topology_discovery.h"
#include "transport/transport.h"

#include <memory>
#include <string>
#include <vector>

namespace searchlink::cluster {

/**
 * Shard Router - assigns every logical shard of an index to a node
 *
 * Per shard group:
 * 1. Replica copies are preferred over the primary (stable otherwise)
 * 2. The first copy whose node is in the topology snapshot wins
 * 3. Without such a copy, the most preferred copy is sent to
 *    nodes[shard % nodes.size()] of the same snapshot, counting nodes
 *    in the order the nodes API listed them
 */
class ShardRouter {
public:
    ShardRouter(std::shared_ptr<transport::Transport> transport,
                std::shared_ptr<TopologyDiscovery> discovery);

    /**
     * One assignment per logical shard of `index`, using a fresh topology snapshot
     * @throws ConnectionException, InvalidResponseException
     */
    std::vector<ShardAssignment> getSearchShards(const std::string& index) const;

    /**
     * Assign all shard groups against one topology snapshot
     * @throws std::logic_error if a fallback is needed and `nodes` is empty
     */
    static std::vector<ShardAssignment> assignShards(const std::vector<ShardGroup>& groups,
                                                     const NodeMap& nodes);

    /**
     * Candidates in preference order: replicas first, original order within each class
     */
    static std::vector<ShardCandidate> orderByPreference(const ShardGroup& group);

private:
    std::shared_ptr<transport::Transport> transport_;
    std::shared_ptr<TopologyDiscovery> discovery_;

    static ShardAssignment assignShard(const ShardGroup& group,
                                       const NodeMap& nodes,
                                       const std::vector<const ClusterNode*>& known_nodes);
};

} // namespace searchlink::cluster
