#pragma once

#include "transport/transport.h"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace searchlink::search {

using json = nlohmann::json;

/**
 * One single-shard scroll search
 */
struct SearchRequestOptions {
    std::string index;
    int shard = 0;
    json query = json::object();                        // Query DSL, sent verbatim
    std::optional<std::vector<std::string>> fields;     // nullopt: all source, empty: no source
    std::vector<std::string> doc_value_fields;          // Always requested as given
};

struct SearchHit {
    std::string index;
    std::string id;
    std::optional<double> score;
    json source;            // "_source", null when not fetched
    json fields;            // "fields" (doc values), null when absent
};

struct SearchResponse {
    std::string scroll_id;
    uint64_t total_hits = 0;
    std::vector<SearchHit> hits;    // Empty batch: scroll exhausted
};

/**
 * Outcome of decoding the body of a failed search request
 */
struct SearchFailure {
    enum class Kind { QUERY_FAILURE, CONNECTION_ERROR };

    Kind kind = Kind::CONNECTION_ERROR;
    std::string message;    // Cluster reason for QUERY_FAILURE
};

/**
 * Look for error.root_cause[0].reason in an error body.
 * Any other shape (or no JSON at all) classifies as CONNECTION_ERROR.
 */
SearchFailure classifySearchFailure(const std::string& body);

/**
 * Scroll Search Protocol
 *
 * NotStarted -> Open (beginSearch) -> Paging (nextPage)* -> Cleared (clearScroll)
 *
 * Holds no per-query state: cursors belong to the caller. Page size and
 * lease duration are fixed at construction.
 */
class ScrollSearchProtocol {
public:
    struct Config {
        size_t scroll_size = 1000;
        std::chrono::milliseconds scroll_timeout{60000};
    };

    ScrollSearchProtocol(std::shared_ptr<transport::Transport> transport, Config config);

    /**
     * Initial search on one shard
     * @throws QueryFailureException if the cluster rejects the query
     * @throws ConnectionException, InvalidResponseException
     */
    SearchResponse beginSearch(const SearchRequestOptions& options) const;

    /**
     * Next batch for a cursor; the returned scroll_id supersedes the given one
     * @throws QueryFailureException, ConnectionException, InvalidResponseException
     */
    SearchResponse nextPage(const std::string& scroll_id) const;

    /**
     * Release a cursor. An unknown (already expired) cursor is not an error.
     * @throws ConnectionException on any other failure
     */
    void clearScroll(const std::string& scroll_id) const;

    const Config& getConfig() const { return config_; }

    // Request assembly
    static std::string buildSearchTarget(const SearchRequestOptions& options,
                                         std::chrono::milliseconds scroll_timeout);
    static json buildSearchBody(const SearchRequestOptions& options, size_t scroll_size);
    static json buildScrollBody(const std::string& scroll_id, std::chrono::milliseconds scroll_timeout);
    static json buildClearScrollBody(const std::string& scroll_id);

    /**
     * Decode a search or scroll response
     * @throws InvalidResponseException
     */
    static SearchResponse decodeSearchResponse(const std::string& body);

private:
    std::shared_ptr<transport::Transport> transport_;
    Config config_;

    SearchResponse execute(const transport::HttpRequest& request) const;
};

} // namespace searchlink::search
