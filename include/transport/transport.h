#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace searchlink::transport {

/**
 * Cluster endpoint: scheme, host name (or IP) and port
 */
struct HttpHost {
    std::string scheme = "http";
    std::string host;
    uint16_t port = 9200;

    /**
     * Parse "scheme://host:port", "host:port" or "host".
     * Scheme defaults to http; port defaults to 443 for https and 80 otherwise.
     * @throws std::invalid_argument on an empty host or malformed port
     */
    static HttpHost create(const std::string& url);

    bool isSecure() const { return scheme == "https"; }

    std::string toString() const;

    bool operator==(const HttpHost& other) const {
        return scheme == other.scheme && host == other.host && port == other.port;
    }
    bool operator!=(const HttpHost& other) const { return !(*this == other); }
};

struct HttpRequest {
    std::string method;                 // GET, POST, DELETE
    std::string target;                 // Path including query string, e.g. "/_nodes/http"
    std::optional<std::string> body;    // JSON body, if any
};

struct HttpResponse {
    unsigned status = 0;
    std::string body;
    HttpHost host;                      // Host that served the request

    bool isSuccess() const { return status >= 200 && status < 300; }
};

/**
 * I/O level failure: no response could be obtained from any host
 */
class TransportException : public std::runtime_error {
public:
    explicit TransportException(const std::string& message)
        : std::runtime_error(message)
    {}
};

/**
 * Request/response executor over HTTP(S)
 *
 * Implementations must be safe for concurrent perform() calls.
 * A non-2xx status is a response, not a failure: perform() only throws
 * TransportException when no response was received.
 */
class Transport {
public:
    virtual ~Transport() = default;

    virtual HttpResponse perform(const HttpRequest& request) = 0;

    /**
     * Replace the set of hosts requests are balanced across
     */
    virtual void setHosts(std::vector<HttpHost> hosts) = 0;

    virtual std::vector<HttpHost> hosts() const = 0;

    /**
     * Release pooled connections; later perform() calls fail
     */
    virtual void close() = 0;
};

} // namespace searchlink::transport
