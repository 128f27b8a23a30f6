#include "search/scroll_search.h"
#include "client/errors.h"
#include "transport/rest_calls.h"
#include "utils/logger.h"

#include <exception>

namespace searchlink::search {

namespace {
    std::string leaseDuration(std::chrono::milliseconds timeout) {
        return std::to_string(timeout.count()) + "ms";
    }
}

SearchFailure classifySearchFailure(const std::string& body) {
    SearchFailure failure;
    failure.message = body;

    json root = json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (root.is_discarded() || !root.is_object()) {
        return failure;
    }

    auto error = root.find("error");
    if (error == root.end() || !error->is_object()) {
        return failure;
    }
    auto root_cause = error->find("root_cause");
    if (root_cause == error->end() || !root_cause->is_array() || root_cause->empty()) {
        return failure;
    }
    const json& first = root_cause->front();
    if (!first.is_object()) {
        return failure;
    }
    auto reason = first.find("reason");
    if (reason == first.end()) {
        return failure;
    }

    // Any reason value counts; non-strings keep their JSON text
    failure.kind = SearchFailure::Kind::QUERY_FAILURE;
    failure.message = reason->is_string() ? reason->get<std::string>() : reason->dump();
    return failure;
}

ScrollSearchProtocol::ScrollSearchProtocol(std::shared_ptr<transport::Transport> transport, Config config)
    : transport_(std::move(transport)),
      config_(config) {
    if (!transport_) {
        throw std::invalid_argument("ScrollSearchProtocol requires a transport");
    }
    if (config_.scroll_size == 0) {
        throw std::invalid_argument("scroll size must be positive");
    }
}

SearchResponse ScrollSearchProtocol::beginSearch(const SearchRequestOptions& options) const {
    transport::HttpRequest request{
        "POST",
        buildSearchTarget(options, config_.scroll_timeout),
        buildSearchBody(options, config_.scroll_size).dump()
    };
    auto response = execute(request);
    SEARCHLINK_DEBUG("Scroll opened on {} shard {}: {} hit(s) of {}",
                     options.index, options.shard, response.hits.size(), response.total_hits);
    return response;
}

SearchResponse ScrollSearchProtocol::nextPage(const std::string& scroll_id) const {
    transport::HttpRequest request{
        "POST",
        "/_search/scroll",
        buildScrollBody(scroll_id, config_.scroll_timeout).dump()
    };
    return execute(request);
}

void ScrollSearchProtocol::clearScroll(const std::string& scroll_id) const {
    transport::HttpRequest request{"DELETE", "/_search/scroll", buildClearScrollBody(scroll_id).dump()};
    auto response = transport::performRequest(*transport_, request);

    if (response.status == 404) {
        // Cursor already expired or released on the cluster side
        SEARCHLINK_DEBUG("Scroll to clear was not found on {}", response.host.toString());
        return;
    }
    if (!response.isSuccess()) {
        throw ConnectionException("clear scroll failed: " + transport::describeResponse(response));
    }
}

SearchResponse ScrollSearchProtocol::execute(const transport::HttpRequest& request) const {
    auto response = transport::performRequest(*transport_, request);
    if (response.isSuccess()) {
        return decodeSearchResponse(response.body);
    }

    auto failure = classifySearchFailure(response.body);
    if (failure.kind == SearchFailure::Kind::QUERY_FAILURE) {
        throw QueryFailureException(failure.message);
    }
    throw ConnectionException(request.method + " " + request.target + " returned " +
                              transport::describeResponse(response));
}

std::string ScrollSearchProtocol::buildSearchTarget(const SearchRequestOptions& options,
                                                    std::chrono::milliseconds scroll_timeout) {
    return "/" + transport::encodePathSegment(options.index) +
           "/_search?search_type=query_then_fetch" +
           "&preference=_shards:" + std::to_string(options.shard) +
           "&scroll=" + leaseDuration(scroll_timeout);
}

json ScrollSearchProtocol::buildSearchBody(const SearchRequestOptions& options, size_t scroll_size) {
    json body = {
        {"query", options.query},
        {"size", scroll_size}
    };

    if (options.fields) {
        if (options.fields->empty()) {
            body["_source"] = false;
        } else {
            body["_source"] = *options.fields;
        }
    }

    if (!options.doc_value_fields.empty()) {
        body["docvalue_fields"] = options.doc_value_fields;
    }
    return body;
}

json ScrollSearchProtocol::buildScrollBody(const std::string& scroll_id, std::chrono::milliseconds scroll_timeout) {
    return json{
        {"scroll", leaseDuration(scroll_timeout)},
        {"scroll_id", scroll_id}
    };
}

json ScrollSearchProtocol::buildClearScrollBody(const std::string& scroll_id) {
    return json{{"scroll_id", json::array({scroll_id})}};
}

SearchResponse ScrollSearchProtocol::decodeSearchResponse(const std::string& body) {
    try {
        json root = json::parse(body);

        SearchResponse result;
        result.scroll_id = root.at("_scroll_id").get<std::string>();

        const auto& hits = root.at("hits");
        if (hits.contains("total")) {
            const auto& total = hits.at("total");
            // 7.x reports {"value": n, "relation": "eq"}, older clusters a plain number
            result.total_hits = total.is_object() ? total.at("value").get<uint64_t>()
                                                  : total.get<uint64_t>();
        }

        for (const auto& hit : hits.at("hits")) {
            SearchHit decoded;
            decoded.index = hit.value("_index", "");
            decoded.id = hit.at("_id").get<std::string>();
            if (hit.contains("_score") && hit.at("_score").is_number()) {
                decoded.score = hit.at("_score").get<double>();
            }
            if (hit.contains("_source")) {
                decoded.source = hit.at("_source");
            }
            if (hit.contains("fields")) {
                decoded.fields = hit.at("fields");
            }
            result.hits.push_back(std::move(decoded));
        }
        return result;
    } catch (const json::exception& e) {
        std::throw_with_nested(InvalidResponseException(std::string("malformed search response: ") + e.what()));
    }
}

} // namespace searchlink::search
