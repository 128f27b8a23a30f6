#include "transport/rest_calls.h"
#include "client/errors.h"

#include <cctype>
#include <exception>

namespace searchlink::transport {

namespace {
constexpr size_t kMaxBodyInMessage = 512;
}

HttpResponse performRequest(Transport& transport, const HttpRequest& request) {
    try {
        return transport.perform(request);
    } catch (const TransportException& e) {
        std::throw_with_nested(ConnectionException(e.what()));
    }
}

std::string getBody(Transport& transport, const std::string& target) {
    auto response = performRequest(transport, HttpRequest{"GET", target, std::nullopt});
    if (!response.isSuccess()) {
        throw ConnectionException("GET " + target + " returned " + describeResponse(response));
    }
    return std::move(response.body);
}

std::string encodePathSegment(const std::string& segment) {
    static const char* kHex = "0123456789ABCDEF";
    std::string out;
    out.reserve(segment.size());
    for (unsigned char c : segment) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == ',' || c == '*') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

std::string describeResponse(const HttpResponse& response) {
    std::string result = "HTTP " + std::to_string(response.status) + " from " + response.host.toString();
    if (!response.body.empty()) {
        if (response.body.size() > kMaxBodyInMessage) {
            result += ": " + response.body.substr(0, kMaxBodyInMessage) + "...";
        } else {
            result += ": " + response.body;
        }
    }
    return result;
}

} // namespace searchlink::transport
