#include "cluster/index_catalog.h"
#include "cluster/response_decoder.h"
#include "transport/rest_calls.h"
#include "utils/logger.h"

#include <stdexcept>

namespace searchlink::cluster {

IndexCatalog::IndexCatalog(std::shared_ptr<transport::Transport> transport)
    : transport_(std::move(transport)) {
    if (!transport_) {
        throw std::invalid_argument("IndexCatalog requires a transport");
    }
}

std::vector<std::string> IndexCatalog::getIndexes() const {
    auto body = transport::getBody(*transport_, "/_cat/indices?h=index&format=json&s=index:asc");
    return ResponseDecoder::decodeIndexList(body);
}

IndexMetadata IndexCatalog::getIndexMetadata(const std::string& index) const {
    auto body = transport::getBody(*transport_, "/" + transport::encodePathSegment(index) + "/_mappings");
    auto metadata = ResponseDecoder::decodeIndexMetadata(index, body);
    SEARCHLINK_DEBUG("Index {} maps {} top-level field(s)", index, metadata.schema.fields.size());
    return metadata;
}

} // namespace searchlink::cluster
