#pragma once

#include <nlohmann/json.hpp>

#include <algorithm>
#include <optional>
#include <string>
#include <vector>

namespace searchlink::cluster {

/**
 * Data-holding node of the search cluster
 */
struct ClusterNode {
    std::string id;         // Node id as reported by the cluster
    std::string address;    // HTTP publish address (host:port)

    bool operator==(const ClusterNode& other) const {
        return id == other.id && address == other.address;
    }
};

/**
 * Node as listed by the nodes API, before role filtering
 */
struct NodeInfo {
    std::string id;
    std::vector<std::string> roles;             // master, data, ingest, ...
    std::optional<std::string> http_address;    // Missing when HTTP is disabled on the node

    bool hasRole(const std::string& role) const {
        return std::find(roles.begin(), roles.end(), role) != roles.end();
    }
};

/**
 * One copy (primary or replica) of a logical shard
 */
struct ShardCandidate {
    int shard = 0;
    bool primary = false;
    std::optional<std::string> node_id;         // Unassigned copies have no node
};

/**
 * All copies of one logical shard, in response order
 */
using ShardGroup = std::vector<ShardCandidate>;

/**
 * Routing decision: query shard `shard` on the node at `node_address`
 */
struct ShardAssignment {
    int shard = 0;
    std::string node_address;

    bool operator==(const ShardAssignment& other) const {
        return shard == other.shard && node_address == other.node_address;
    }
};

/**
 * Topology snapshot: data nodes keyed by node id, in nodes API response order
 */
using NodeMap = nlohmann::ordered_map<std::string, ClusterNode>;

} // namespace searchlink::cluster
