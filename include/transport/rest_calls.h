#pragma once

#include "transport/transport.h"

#include <string>

namespace searchlink::transport {

/**
 * Execute a request, converting TransportException into ConnectionException
 * (the transport failure is attached as nested exception)
 */
HttpResponse performRequest(Transport& transport, const HttpRequest& request);

/**
 * GET a path and return the body of a 2xx response.
 * Any other status is reported as ConnectionException.
 */
std::string getBody(Transport& transport, const std::string& target);

/**
 * Percent-encode one path segment (index names, aliases)
 */
std::string encodePathSegment(const std::string& segment);

/**
 * Short human-readable summary of a failed response: status and truncated body
 */
std::string describeResponse(const HttpResponse& response);

} // namespace searchlink::transport
