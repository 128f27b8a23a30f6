#include "cluster/response_decoder.h"
#include "client/errors.h"

#include <exception>

namespace searchlink::cluster {

using ordered_json = nlohmann::ordered_json;

namespace {
    [[noreturn]] void rethrowMalformed(const std::string& what, const nlohmann::json::exception& e) {
        std::throw_with_nested(InvalidResponseException("malformed " + what + " response: " + e.what()));
    }
}

ordered_json ResponseDecoder::parse(const std::string& body, const std::string& what) {
    try {
        return ordered_json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        rethrowMalformed(what, e);
    }
}

std::vector<NodeInfo> ResponseDecoder::decodeNodes(const std::string& body) {
    auto root = parse(body, "nodes");

    try {
        const auto& nodes = root.at("nodes");
        if (!nodes.is_object()) {
            throw InvalidResponseException("\"nodes\" is not an object");
        }

        std::vector<NodeInfo> result;
        result.reserve(nodes.size());
        for (auto it = nodes.begin(); it != nodes.end(); ++it) {
            const auto& node = it.value();

            NodeInfo info;
            info.id = it.key();
            if (node.contains("roles")) {
                info.roles = node.at("roles").get<std::vector<std::string>>();
            }
            if (node.contains("http") && node.at("http").contains("publish_address")) {
                info.http_address = node.at("http").at("publish_address").get<std::string>();
            }
            result.push_back(std::move(info));
        }
        return result;
    } catch (const nlohmann::json::exception& e) {
        rethrowMalformed("nodes", e);
    }
}

std::vector<ShardGroup> ResponseDecoder::decodeSearchShards(const std::string& body) {
    auto root = parse(body, "search shards");

    try {
        const auto& shards = root.at("shards");
        if (!shards.is_array()) {
            throw InvalidResponseException("\"shards\" is not an array");
        }

        std::vector<ShardGroup> result;
        result.reserve(shards.size());
        for (const auto& group : shards) {
            if (!group.is_array() || group.empty()) {
                throw InvalidResponseException("shard group without copies");
            }

            ShardGroup copies;
            copies.reserve(group.size());
            for (const auto& copy : group) {
                ShardCandidate candidate;
                candidate.shard = copy.at("shard").get<int>();
                candidate.primary = copy.at("primary").get<bool>();
                if (copy.contains("node") && !copy.at("node").is_null()) {
                    candidate.node_id = copy.at("node").get<std::string>();
                }
                copies.push_back(std::move(candidate));
            }
            result.push_back(std::move(copies));
        }
        return result;
    } catch (const nlohmann::json::exception& e) {
        rethrowMalformed("search shards", e);
    }
}

std::vector<std::string> ResponseDecoder::decodeIndexList(const std::string& body) {
    auto root = parse(body, "index list");

    try {
        if (!root.is_array()) {
            throw InvalidResponseException("index list is not an array");
        }

        std::vector<std::string> result;
        result.reserve(root.size());
        for (const auto& entry : root) {
            result.push_back(entry.at("index").get<std::string>());
        }
        return result;
    } catch (const nlohmann::json::exception& e) {
        rethrowMalformed("index list", e);
    }
}

IndexMetadata ResponseDecoder::decodeIndexMetadata(const std::string& index, const std::string& body) {
    auto root = parse(body, "index mappings");

    try {
        if (!root.is_object()) {
            throw InvalidResponseException("mappings response is not an object");
        }

        // Requests through an alias answer with the concrete index name
        const ordered_json* entry = nullptr;
        if (root.contains(index)) {
            entry = &root.at(index);
        } else if (root.size() == 1) {
            entry = &root.begin().value();
        } else {
            throw InvalidResponseException("mappings response does not contain index " + index);
        }

        const ordered_json* mappings = &entry->at("mappings");
        if (mappings->is_object() && !mappings->contains("properties") && !mappings->empty()) {
            // Older clusters allowed several mapping types per index and expose
            // the single remaining one as an extra level; skip it
            mappings = &mappings->begin().value();
        }

        if (!mappings->is_object() || !mappings->contains("properties")) {
            return IndexMetadata{};
        }
        return IndexMetadata{decodeProperties(mappings->at("properties"))};
    } catch (const nlohmann::json::exception& e) {
        rethrowMalformed("index mappings", e);
    }
}

ObjectType ResponseDecoder::decodeProperties(const ordered_json& properties) {
    if (!properties.is_object()) {
        throw InvalidResponseException("\"properties\" is not an object");
    }

    ObjectType result;
    try {
        for (auto it = properties.begin(); it != properties.end(); ++it) {
            const std::string& name = it.key();
            const auto& value = it.value();

            if (value.contains("type")) {
                std::string type = value.at("type").get<std::string>();
                if (type == "date") {
                    std::vector<std::string> formats;
                    if (value.contains("format")) {
                        formats = splitDateFormats(value.at("format").get<std::string>());
                    }
                    result.fields.push_back(Field{name, DateTimeType{std::move(formats)}});
                } else {
                    result.fields.push_back(Field{name, PrimitiveType{std::move(type)}});
                }
            } else if (value.contains("properties")) {
                result.fields.push_back(Field{name, decodeProperties(value.at("properties"))});
            }
        }
    } catch (const nlohmann::json::exception& e) {
        rethrowMalformed("field properties", e);
    }
    return result;
}

} // namespace searchlink::cluster
