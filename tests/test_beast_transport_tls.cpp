#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include "transport/beast_transport.h"
#include "security/tls_context_builder.h"

#include "test_certificates.h"

#include <sys/socket.h>

#include <atomic>
#include <filesystem>
#include <random>
#include <thread>

using namespace searchlink::transport;
using namespace searchlink::security;
using namespace searchlink::fakes;
using boost::asio::ip::tcp;
namespace beast = boost::beast;
namespace http = beast::http;
namespace ssl = boost::asio::ssl;

// In-process HTTPS server presenting one self-signed certificate.
// Each response echoes the target and the SNI name the client sent.
class TlsEchoServer {
public:
    TlsEchoServer(const std::string& cert_pem, const std::string& key_pem)
        : ctx_(ssl::context::tls_server), acceptor_(ioc_) {
        ctx_.use_certificate_chain(boost::asio::buffer(cert_pem));
        ctx_.use_private_key(boost::asio::buffer(key_pem), ssl::context::pem);

        tcp::endpoint ep(boost::asio::ip::make_address("127.0.0.1"), 0);
        acceptor_.open(ep.protocol());
        acceptor_.set_option(boost::asio::socket_base::reuse_address(true));
        acceptor_.bind(ep);
        acceptor_.listen();
        port_ = acceptor_.local_endpoint().port();
        thr_ = std::thread([this] { run(); });
    }

    ~TlsEchoServer() {
        boost::system::error_code ec;
        // close() alone does not wake a thread blocked in accept() on Linux
        ::shutdown(acceptor_.native_handle(), SHUT_RDWR);
        acceptor_.close(ec);
        if (thr_.joinable()) thr_.join();
    }

    uint16_t port() const { return port_; }
    int handshakes() const { return handshakes_.load(); }
    int failedHandshakes() const { return failed_handshakes_.load(); }

private:
    void run() {
        while (true) {
            tcp::socket sock(ioc_);
            boost::system::error_code ec;
            acceptor_.accept(sock, ec);
            if (ec) break;
            serve(std::move(sock));
        }
    }

    void serve(tcp::socket sock) {
        ssl::stream<tcp::socket> stream(std::move(sock), ctx_);
        boost::system::error_code ec;
        stream.handshake(ssl::stream_base::server, ec);
        if (ec) {
            ++failed_handshakes_;
            return;
        }
        ++handshakes_;

        const char* sni = SSL_get_servername(stream.native_handle(), TLSEXT_NAMETYPE_host_name);
        beast::flat_buffer buffer;
        while (true) {
            http::request<http::string_body> req;
            http::read(stream, buffer, req, ec);
            if (ec) break;

            http::response<http::string_body> res{http::status::ok, 11};
            res.set(http::field::content_type, "application/json");
            res.body() = nlohmann::json{
                {"target", std::string(req.target())},
                {"sni", sni ? sni : ""}
            }.dump();
            res.keep_alive(req.keep_alive());
            res.prepare_payload();
            http::write(stream, res, ec);
            if (ec) break;
        }
    }

    boost::asio::io_context ioc_;
    ssl::context ctx_;
    tcp::acceptor acceptor_;
    std::thread thr_;
    uint16_t port_ = 0;
    std::atomic<int> handshakes_{0};
    std::atomic<int> failed_handshakes_{0};
};

namespace {

class BeastTransportTlsTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        std::random_device rd;
        dir_ = std::filesystem::temp_directory_path() / ("searchlink_https_" + std::to_string(rd()));
        std::filesystem::create_directories(dir_);

        server_identity_ = new Identity(makeIdentity("localhost", 0, 365 * kDay, {"localhost"}));
        ASSERT_TRUE(server_identity_->cert);
        ASSERT_TRUE(writePem(truststorePath(), *server_identity_, false));
    }

    static void TearDownTestSuite() {
        delete server_identity_;
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    void SetUp() override {
        server_ = std::make_unique<TlsEchoServer>(certificatePem(*server_identity_),
                                                  privateKeyPem(*server_identity_));
    }

    static std::string truststorePath() {
        return (dir_ / "server_cert.pem").string();
    }

    // Client context trusting only the server's self-signed certificate
    static std::shared_ptr<ssl::context> trustingContext() {
        SecurityMaterial material;
        material.truststore_path = truststorePath();
        auto tls = TlsContextBuilder::build(material);
        return tls ? tls->context : nullptr;
    }

    BeastTransport::Config configFor(const std::string& host_name, bool verify_hostnames) const {
        BeastTransport::Config config;
        config.hosts = {HttpHost{"https", host_name, server_->port()}};
        config.connect_timeout = std::chrono::milliseconds(2000);
        config.request_timeout = std::chrono::milliseconds(2000);
        config.max_retry_time = std::chrono::milliseconds(5000);
        config.verify_hostnames = verify_hostnames;
        return config;
    }

    std::unique_ptr<TlsEchoServer> server_;

    static std::filesystem::path dir_;
    static Identity* server_identity_;
};

std::filesystem::path BeastTransportTlsTest::dir_;
Identity* BeastTransportTlsTest::server_identity_ = nullptr;

} // namespace

TEST_F(BeastTransportTlsTest, MatchingHostNameIsAccepted) {
    auto context = trustingContext();
    ASSERT_NE(context, nullptr);
    BeastTransport transport(configFor("localhost", true), context);

    auto response = transport.perform(HttpRequest{"GET", "/_nodes/http", std::nullopt});
    EXPECT_EQ(response.status, 200u);
    auto echoed = nlohmann::json::parse(response.body);
    EXPECT_EQ(echoed["target"], "/_nodes/http");
    EXPECT_EQ(echoed["sni"], "localhost");

    // Keep-alive over TLS: the second request reuses the session
    transport.perform(HttpRequest{"GET", "/", std::nullopt});
    EXPECT_EQ(server_->handshakes(), 1);
}

TEST_F(BeastTransportTlsTest, MismatchedHostNameIsRejected) {
    BeastTransport transport(configFor("127.0.0.1", true), trustingContext());

    EXPECT_THROW(transport.perform(HttpRequest{"GET", "/", std::nullopt}), TransportException);
    EXPECT_EQ(server_->handshakes(), 0);
}

TEST_F(BeastTransportTlsTest, MismatchAcceptedWithoutHostNameVerification) {
    BeastTransport transport(configFor("127.0.0.1", false), trustingContext());

    auto response = transport.perform(HttpRequest{"GET", "/", std::nullopt});
    EXPECT_EQ(response.status, 200u);
    EXPECT_EQ(server_->handshakes(), 1);
}

TEST_F(BeastTransportTlsTest, SystemTrustStoreRejectsSelfSignedServer) {
    // No context given: the default one trusts only the system CA store
    BeastTransport transport(configFor("localhost", false), nullptr);

    EXPECT_THROW(transport.perform(HttpRequest{"GET", "/", std::nullopt}), TransportException);
    EXPECT_EQ(server_->handshakes(), 0);
}
