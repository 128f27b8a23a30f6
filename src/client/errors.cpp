#include "client/errors.h"

namespace searchlink {

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::CONNECTION_ERROR: return "ELASTICSEARCH_CONNECTION_ERROR";
        case ErrorCode::INVALID_RESPONSE: return "ELASTICSEARCH_INVALID_RESPONSE";
        case ErrorCode::QUERY_FAILURE: return "ELASTICSEARCH_QUERY_FAILURE";
        case ErrorCode::SSL_INITIALIZATION_FAILURE: return "ELASTICSEARCH_SSL_INITIALIZATION_FAILURE";
    }
    return "ELASTICSEARCH_UNKNOWN_ERROR";
}

} // namespace searchlink
