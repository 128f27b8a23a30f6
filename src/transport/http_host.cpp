#include "transport/transport.h"

#include <charconv>
#include <stdexcept>

namespace searchlink::transport {

HttpHost HttpHost::create(const std::string& url) {
    HttpHost result;
    std::string rest = url;

    // Remove protocol if present
    size_t proto_pos = rest.find("://");
    if (proto_pos != std::string::npos) {
        result.scheme = rest.substr(0, proto_pos);
        rest = rest.substr(proto_pos + 3);
    } else {
        result.scheme = "http";
    }
    if (result.scheme != "http" && result.scheme != "https") {
        throw std::invalid_argument("unsupported scheme in '" + url + "'");
    }

    // Strip any trailing path
    size_t slash_pos = rest.find('/');
    if (slash_pos != std::string::npos) {
        rest = rest.substr(0, slash_pos);
    }

    uint16_t default_port = result.scheme == "https" ? 443 : 80;

    std::string host;
    std::string port;
    if (!rest.empty() && rest.front() == '[') {
        // IPv6 literal: [::1]:9200
        size_t close_pos = rest.find(']');
        if (close_pos == std::string::npos) {
            throw std::invalid_argument("unterminated IPv6 literal in '" + url + "'");
        }
        host = rest.substr(1, close_pos - 1);
        if (close_pos + 1 < rest.size()) {
            if (rest[close_pos + 1] != ':') {
                throw std::invalid_argument("malformed host in '" + url + "'");
            }
            port = rest.substr(close_pos + 2);
        }
    } else {
        size_t colon_pos = rest.find_last_of(':');
        if (colon_pos != std::string::npos) {
            host = rest.substr(0, colon_pos);
            port = rest.substr(colon_pos + 1);
        } else {
            host = rest;
        }
    }

    if (host.empty()) {
        throw std::invalid_argument("missing host in '" + url + "'");
    }
    result.host = host;

    if (port.empty()) {
        result.port = default_port;
        return result;
    }

    unsigned value = 0;
    auto [ptr, ec] = std::from_chars(port.data(), port.data() + port.size(), value);
    if (ec != std::errc() || ptr != port.data() + port.size() || value == 0 || value > 65535) {
        throw std::invalid_argument("invalid port '" + port + "' in '" + url + "'");
    }
    result.port = static_cast<uint16_t>(value);
    return result;
}

std::string HttpHost::toString() const {
    bool ipv6 = host.find(':') != std::string::npos;
    return scheme + "://" + (ipv6 ? "[" + host + "]" : host) + ":" + std::to_string(port);
}

} // namespace searchlink::transport
