#include "transport/beast_transport.h"
#include "utils/logger.h"

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/err.h>

#include <algorithm>
#include <atomic>
#include <limits>
#include <map>
#include <mutex>
#include <stdexcept>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace searchlink::transport {

namespace {

using Clock = std::chrono::steady_clock;

// Beast deadlines only apply to asynchronous operations, so every blocking
// step runs one async operation to completion on the connection's own io_context.
template <typename Initiate>
void runOperation(net::io_context& ioc, Initiate&& initiate) {
    beast::error_code result = net::error::would_block;
    initiate([&result](beast::error_code ec, auto&&...) { result = ec; });
    ioc.restart();
    ioc.run();
    if (result) {
        throw beast::system_error(result);
    }
}

// Step timeout cut short by what is left of the request's retry budget
std::chrono::milliseconds boundedTimeout(std::chrono::milliseconds step, Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    if (left <= std::chrono::milliseconds::zero()) {
        throw beast::system_error(make_error_code(beast::error::timeout), "retry budget exhausted");
    }
    return (std::min)(step, left);
}

// Errors showing the peer closed an idle keep-alive connection before reading the request
bool isStaleConnection(const beast::error_code& ec) {
    return ec == http::error::end_of_stream ||
           ec == net::error::eof ||
           ec == net::error::connection_reset ||
           ec == net::error::broken_pipe;
}

std::shared_ptr<ssl::context> makeDefaultContext() {
    auto ctx = std::make_shared<ssl::context>(ssl::context::tls_client);
    ctx->set_options(
        ssl::context::default_workarounds |
        ssl::context::no_sslv2 |
        ssl::context::no_sslv3 |
        ssl::context::no_tlsv1 |
        ssl::context::no_tlsv1_1
    );
    ctx->set_default_verify_paths();
    ctx->set_verify_mode(ssl::verify_peer);
    return ctx;
}

} // namespace

struct BeastTransport::Connection {
    explicit Connection(HttpHost h) : host(std::move(h)) {}

    HttpHost host;
    net::io_context ioc;    // Declared first: outlives the streams bound to it
    std::unique_ptr<beast::tcp_stream> plain;
    std::unique_ptr<beast::ssl_stream<beast::tcp_stream>> secure;
    beast::flat_buffer buffer;
    bool reusable = false;

    beast::tcp_stream& lowest() {
        return secure ? beast::get_lowest_layer(*secure) : *plain;
    }
};

struct BeastTransport::Impl {
    explicit Impl(const Config& cfg, std::shared_ptr<ssl::context> ctx)
        : config(cfg), ssl_ctx(std::move(ctx)), hosts(cfg.hosts) {}

    const Config& config;
    std::shared_ptr<ssl::context> ssl_ctx;

    mutable std::mutex mutex;
    std::vector<HttpHost> hosts;
    std::map<std::string, std::vector<std::unique_ptr<Connection>>> idle;
    std::atomic<size_t> next_host{0};
    bool closed = false;

    std::vector<HttpHost> snapshotHosts() {
        std::lock_guard<std::mutex> lock(mutex);
        if (closed) {
            throw TransportException("transport is closed");
        }
        if (hosts.empty()) {
            throw TransportException("no hosts configured");
        }
        return hosts;
    }

    std::unique_ptr<Connection> acquire(const HttpHost& host) {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = idle.find(host.toString());
        if (it == idle.end() || it->second.empty()) {
            return nullptr;
        }
        auto conn = std::move(it->second.back());
        it->second.pop_back();
        return conn;
    }

    void release(std::unique_ptr<Connection> conn) {
        if (!conn->reusable) {
            return;
        }
        std::lock_guard<std::mutex> lock(mutex);
        if (closed) {
            return;
        }
        auto& pool = idle[conn->host.toString()];
        if (pool.size() < config.max_connections_per_host) {
            pool.push_back(std::move(conn));
        }
    }

    ssl::context& tlsContext() {
        std::lock_guard<std::mutex> lock(mutex);
        if (!ssl_ctx) {
            ssl_ctx = makeDefaultContext();
        }
        return *ssl_ctx;
    }

    std::unique_ptr<Connection> connect(const HttpHost& host, Clock::time_point deadline) {
        auto conn = std::make_unique<Connection>(host);

        tcp::resolver resolver(conn->ioc);
        auto const results = resolver.resolve(host.host, std::to_string(host.port));

        if (host.isSecure()) {
            conn->secure = std::make_unique<beast::ssl_stream<beast::tcp_stream>>(conn->ioc, tlsContext());

            // Set SNI (Server Name Indication)
            if (!SSL_set_tlsext_host_name(conn->secure->native_handle(), host.host.c_str())) {
                throw beast::system_error(
                    beast::error_code(static_cast<int>(::ERR_get_error()),
                                      net::error::get_ssl_category()),
                    "Failed to set SNI"
                );
            }
            if (config.verify_hostnames) {
                conn->secure->set_verify_callback(ssl::host_name_verification(host.host));
            }
        } else {
            conn->plain = std::make_unique<beast::tcp_stream>(conn->ioc);
        }

        auto& stream = conn->lowest();
        stream.expires_after(boundedTimeout(config.connect_timeout, deadline));
        runOperation(conn->ioc, [&](auto handler) {
            stream.async_connect(results, std::move(handler));
        });

        if (conn->secure) {
            stream.expires_after(boundedTimeout(config.connect_timeout, deadline));
            runOperation(conn->ioc, [&](auto handler) {
                conn->secure->async_handshake(ssl::stream_base::client, std::move(handler));
            });
        }

        SEARCHLINK_DEBUG("Opened connection to {}", host.toString());
        return conn;
    }

    template <typename Stream>
    void roundTrip(Connection& conn, Stream& stream,
                   http::request<http::string_body>& req,
                   http::response_parser<http::string_body>& parser) {
        runOperation(conn.ioc, [&](auto handler) {
            http::async_write(stream, req, std::move(handler));
        });
        runOperation(conn.ioc, [&](auto handler) {
            http::async_read(stream, conn.buffer, parser, std::move(handler));
        });
    }

    HttpResponse exchange(Connection& conn, const HttpRequest& request, Clock::time_point deadline) {
        http::request<http::string_body> req;
        auto verb = http::string_to_verb(request.method);
        if (verb == http::verb::unknown) {
            throw std::invalid_argument("unsupported HTTP method: " + request.method);
        }
        req.method(verb);
        req.target(request.target);
        req.version(11); // HTTP/1.1
        req.set(http::field::host, conn.host.host + ":" + std::to_string(conn.host.port));
        req.set(http::field::user_agent, config.user_agent);
        req.set(http::field::accept, "application/json");
        req.keep_alive(true);
        if (request.body) {
            req.body() = *request.body;
            req.set(http::field::content_type, "application/json");
        }
        req.prepare_payload();

        // Scroll pages can be large; the default 8 MB response limit is too small
        http::response_parser<http::string_body> parser;
        parser.body_limit((std::numeric_limits<std::uint64_t>::max)());

        conn.lowest().expires_after(boundedTimeout(config.request_timeout, deadline));
        if (conn.secure) {
            roundTrip(conn, *conn.secure, req, parser);
        } else {
            roundTrip(conn, *conn.plain, req, parser);
        }

        auto res = parser.release();
        conn.reusable = res.keep_alive();

        HttpResponse response;
        response.status = res.result_int();
        response.body = std::move(res.body());
        response.host = conn.host;

        SEARCHLINK_TRACE("{} {} -> {} ({} bytes) via {}",
                         request.method, request.target, response.status,
                         response.body.size(), conn.host.toString());
        return response;
    }

    HttpResponse performOnHost(const HttpHost& host, const HttpRequest& request, Clock::time_point deadline) {
        if (auto pooled = acquire(host)) {
            try {
                auto response = exchange(*pooled, request, deadline);
                release(std::move(pooled));
                return response;
            } catch (const beast::system_error& e) {
                // Timeouts and other errors may follow a request the server already received
                if (!isStaleConnection(e.code())) {
                    throw;
                }
                SEARCHLINK_DEBUG("Pooled connection to {} was closed ({}), reconnecting",
                                 host.toString(), e.what());
            }
        }

        auto conn = connect(host, deadline);
        auto response = exchange(*conn, request, deadline);
        release(std::move(conn));
        return response;
    }
};

BeastTransport::BeastTransport(const Config& config, std::shared_ptr<boost::asio::ssl::context> ssl_context)
    : config_(config), impl_(std::make_unique<Impl>(config_, std::move(ssl_context))) {
    if (config_.hosts.empty()) {
        throw std::invalid_argument("BeastTransport requires at least one host");
    }
}

BeastTransport::~BeastTransport() = default;

HttpResponse BeastTransport::perform(const HttpRequest& request) {
    auto hosts = impl_->snapshotHosts();
    auto start = Clock::now();
    auto deadline = start + config_.max_retry_time;
    size_t offset = impl_->next_host.fetch_add(1, std::memory_order_relaxed);

    std::string last_error;
    for (size_t attempt = 0; attempt < hosts.size(); ++attempt) {
        const HttpHost& host = hosts[(offset + attempt) % hosts.size()];

        if (attempt > 0) {
            if (Clock::now() >= deadline) {
                SEARCHLINK_WARN("Retry budget of {} ms exhausted after {} attempt(s)",
                                config_.max_retry_time.count(), attempt);
                break;
            }
        }

        try {
            return impl_->performOnHost(host, request, deadline);
        } catch (const beast::system_error& e) {
            last_error = host.toString() + ": " + e.what();
            if (hosts.size() > 1) {
                SEARCHLINK_WARN("Request {} {} failed on {}, trying next host",
                                request.method, request.target, last_error);
            }
        }
    }

    throw TransportException("request " + request.method + " " + request.target +
                             " failed: " + last_error);
}

void BeastTransport::setHosts(std::vector<HttpHost> hosts) {
    if (hosts.empty()) {
        throw std::invalid_argument("host list must not be empty");
    }
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->hosts = std::move(hosts);
}

std::vector<HttpHost> BeastTransport::hosts() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->hosts;
}

void BeastTransport::close() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->closed = true;
    impl_->idle.clear();
}

size_t BeastTransport::idleConnections(const HttpHost& host) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->idle.find(host.toString());
    return it == impl_->idle.end() ? 0 : it->second.size();
}

} // namespace searchlink::transport
