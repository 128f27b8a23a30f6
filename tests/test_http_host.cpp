#include <gtest/gtest.h>
#include "transport/transport.h"
#include "transport/rest_calls.h"
#include "client/errors.h"
#include "fake_transport.h"

using namespace searchlink;
using namespace searchlink::transport;
using searchlink::fakes::FakeTransport;

// ============================================================================
// HttpHost
// ============================================================================

TEST(HttpHostTest, ParseFullUrl) {
    auto host = HttpHost::create("https://es1.example.com:9243");
    EXPECT_EQ(host.scheme, "https");
    EXPECT_EQ(host.host, "es1.example.com");
    EXPECT_EQ(host.port, 9243);
    EXPECT_TRUE(host.isSecure());
}

TEST(HttpHostTest, DefaultsBySchemeAndBareHost) {
    EXPECT_EQ(HttpHost::create("https://secure.local").port, 443);
    EXPECT_EQ(HttpHost::create("http://plain.local").port, 80);

    auto bare = HttpHost::create("10.1.2.3:9200");
    EXPECT_EQ(bare.scheme, "http");
    EXPECT_EQ(bare.host, "10.1.2.3");
    EXPECT_EQ(bare.port, 9200);
}

TEST(HttpHostTest, TrailingPathIsIgnored) {
    auto host = HttpHost::create("http://proxy:8080/es/");
    EXPECT_EQ(host.host, "proxy");
    EXPECT_EQ(host.port, 8080);
}

TEST(HttpHostTest, Ipv6Literal) {
    auto host = HttpHost::create("http://[::1]:9200");
    EXPECT_EQ(host.host, "::1");
    EXPECT_EQ(host.port, 9200);
    EXPECT_EQ(host.toString(), "http://[::1]:9200");
}

TEST(HttpHostTest, RejectsMalformedInput) {
    EXPECT_THROW(HttpHost::create(""), std::invalid_argument);
    EXPECT_THROW(HttpHost::create("ftp://host:21"), std::invalid_argument);
    EXPECT_THROW(HttpHost::create("http://:9200"), std::invalid_argument);
    EXPECT_THROW(HttpHost::create("http://host:0"), std::invalid_argument);
    EXPECT_THROW(HttpHost::create("http://host:70000"), std::invalid_argument);
    EXPECT_THROW(HttpHost::create("http://host:92a0"), std::invalid_argument);
    EXPECT_THROW(HttpHost::create("http://[::1"), std::invalid_argument);
}

TEST(HttpHostTest, ToStringRoundTrip) {
    HttpHost host{"https", "node-3", 9201};
    EXPECT_EQ(host.toString(), "https://node-3:9201");
    EXPECT_EQ(HttpHost::create(host.toString()), host);
}

// ============================================================================
// REST helpers
// ============================================================================

TEST(RestCallsTest, EncodePathSegment) {
    EXPECT_EQ(encodePathSegment("logs-2024.01"), "logs-2024.01");
    EXPECT_EQ(encodePathSegment("a,b*"), "a,b*");
    EXPECT_EQ(encodePathSegment("my index/x"), "my%20index%2Fx");
    EXPECT_EQ(encodePathSegment("\xC3\xBC"), "%C3%BC");
}

TEST(RestCallsTest, DescribeResponseTruncatesBody) {
    HttpResponse response{500, std::string(2000, 'x'), HttpHost{"http", "h", 9200}};
    auto text = describeResponse(response);
    EXPECT_EQ(text.rfind("HTTP 500 from http://h:9200: ", 0), 0u);
    EXPECT_LT(text.size(), 600u);
}

TEST(RestCallsTest, GetBodyReturnsSuccessfulBody) {
    FakeTransport transport;
    transport.respond("GET", "/_cat/indices", 200, "[]");
    EXPECT_EQ(getBody(transport, "/_cat/indices"), "[]");
}

TEST(RestCallsTest, GetBodyRejectsErrorStatus) {
    FakeTransport transport;
    transport.respond("GET", "/x", 500, "boom");
    try {
        getBody(transport, "/x");
        FAIL() << "expected ConnectionException";
    } catch (const ConnectionException& e) {
        EXPECT_NE(std::string(e.what()).find("HTTP 500"), std::string::npos);
    }
}

TEST(RestCallsTest, TransportFailureBecomesNestedConnectionError) {
    FakeTransport transport;
    transport.fail("GET", "/x");
    try {
        performRequest(transport, HttpRequest{"GET", "/x", std::nullopt});
        FAIL() << "expected ConnectionException";
    } catch (const ConnectionException& e) {
        EXPECT_NE(std::string(e.what()).find("ELASTICSEARCH_CONNECTION_ERROR"), std::string::npos);
        EXPECT_THROW(std::rethrow_if_nested(e), TransportException);
    }
}
