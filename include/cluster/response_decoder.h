#pragma once

#include "cluster/cluster_types.h"
#include "cluster/index_metadata.h"

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace searchlink::cluster {

/**
 * Decodes cluster API payloads into typed structures
 *
 * Stateless; every method throws InvalidResponseException (with the parse
 * error nested) when the payload does not have the expected shape.
 * Objects are parsed order-preserving so that node, field and shard order
 * follow the response.
 */
class ResponseDecoder {
public:
    /**
     * GET /_nodes/http
     * {"nodes": {"<id>": {"roles": [...], "http": {"publish_address": "host:port"}}}}
     */
    static std::vector<NodeInfo> decodeNodes(const std::string& body);

    /**
     * GET /<index>/_search_shards
     * {"shards": [[{"shard": 0, "primary": true, "node": "<id>"}, ...], ...]}
     */
    static std::vector<ShardGroup> decodeSearchShards(const std::string& body);

    /**
     * GET /_cat/indices?format=json
     * [{"index": "<name>"}, ...]
     */
    static std::vector<std::string> decodeIndexList(const std::string& body);

    /**
     * GET /<index>/_mappings
     * {"<index>": {"mappings": {"properties": {...}}}}, or with one legacy
     * type level between "mappings" and "properties"
     */
    static IndexMetadata decodeIndexMetadata(const std::string& index, const std::string& body);

    /**
     * Walk a "properties" object into an ObjectType.
     * A field with "type" is primitive (or date); a field with only
     * "properties" is an object; anything else is skipped.
     */
    static ObjectType decodeProperties(const nlohmann::ordered_json& properties);

    /**
     * Parse a payload, mapping parse errors to InvalidResponseException
     */
    static nlohmann::ordered_json parse(const std::string& body, const std::string& what);
};

} // namespace searchlink::cluster
