#pragma once

#include "transport/transport.h"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

// Forward declarations to avoid pulling in Boost headers
namespace boost {
namespace asio {
    namespace ssl {
        class context;
    }
}
}

namespace searchlink::transport {

/**
 * HTTP/1.1 keep-alive client for the search cluster (Boost.Beast)
 *
 * Features:
 * - Plain and TLS connections, chosen per host scheme
 * - Round-robin balancing across the configured hosts
 * - Per-host idle connection pool
 * - Connect and request deadlines
 * - Failover to the next host while the retry budget lasts
 *
 * Every connect, handshake and request deadline is clamped to the time left
 * in the retry budget. A request is only resent on a fresh connection when
 * the pooled one turns out to have been closed by the server.
 */
class BeastTransport : public Transport {
public:
    /**
     * Configuration for BeastTransport
     */
    struct Config {
        std::vector<HttpHost> hosts;                        // Initial hosts (must not be empty)
        std::chrono::milliseconds connect_timeout{1000};    // Connect + TLS handshake deadline
        std::chrono::milliseconds request_timeout{10000};   // Write + read deadline
        std::chrono::milliseconds max_retry_time{30000};    // Total budget of one perform(), failover included
        size_t max_connections_per_host = 10;               // Idle connections kept per host
        bool verify_hostnames = true;                       // Verify host name against certificate
        std::string user_agent = "searchlink/1.0";
    };

    /**
     * @param config Transport configuration
     * @param ssl_context TLS context for https hosts; when null a default
     *        context trusting the system CA store is created on demand
     * @throws std::invalid_argument if no host is configured
     */
    BeastTransport(const Config& config, std::shared_ptr<boost::asio::ssl::context> ssl_context);

    ~BeastTransport() override;

    BeastTransport(const BeastTransport&) = delete;
    BeastTransport& operator=(const BeastTransport&) = delete;

    HttpResponse perform(const HttpRequest& request) override;

    void setHosts(std::vector<HttpHost> hosts) override;

    std::vector<HttpHost> hosts() const override;

    void close() override;

    /**
     * Number of idle pooled connections to a host (for diagnostics)
     */
    size_t idleConnections(const HttpHost& host) const;

    const Config& getConfig() const { return config_; }

private:
    Config config_;

    // Boost.Asio state (PIMPL to hide Boost headers)
    struct Connection;
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace searchlink::transport
