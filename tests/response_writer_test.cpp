/**
 * PORTICO - Embedded HTTP/1.x Server Core
 * Response writer tests
 */

#include "http/errors.hpp"
#include "server/response_writer.hpp"
#include "test_support/memory_transport.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace portico;
using portico::test::MemoryTransport;
using portico::test::count_of;

namespace {

class ResponseWriterTest : public ::testing::Test {
protected:
    explicit ResponseWriterTest(std::string input = "")
        : transport(std::move(input))
        , stream(transport)
        , writer(stream, config)
    {
        config.server_software = "Portico/test";
        config.keep_alive_timeout = std::chrono::seconds(10);
        request.method = "GET";
        request.target = "/";
        request.version = http::http_1_1;
        request.response_version = http::http_1_1;
        request.body = std::make_unique<http::EmptyBody>();
    }

    void use_version(http::HttpVersion version) {
        request.version = version;
        request.response_version = version;
    }

    const std::string& out() const { return transport.output(); }

    server::ServerConfig config;
    MemoryTransport transport;
    net::BufferedStream stream;
    server::ResponseWriter writer;
    http::Request request;
};

} // anonymous namespace

TEST_F(ResponseWriterTest, FixedLengthResponseKeepsAlive) {
    writer.prepare(request, true, false);
    writer(http::status::ok, http::Headers{{"Content-Length", "5"}});
    writer.write("hello");
    writer.finish();

    EXPECT_EQ(out().rfind("HTTP/1.1 200 OK\r\n", 0), 0u);
    EXPECT_NE(out().find("Content-Length: 5\r\n"), std::string::npos);
    EXPECT_NE(out().find("Server: Portico/test\r\n"), std::string::npos);
    EXPECT_NE(out().find("GMT\r\n"), std::string::npos);
    EXPECT_EQ(out().find("Connection:"), std::string::npos);
    EXPECT_EQ(out().substr(out().size() - 9), "\r\n\r\nhello");
    EXPECT_FALSE(writer.close_connection());
    EXPECT_EQ(writer.body_bytes(), 5u);
    EXPECT_EQ(writer.status_code(), 200);
}

TEST_F(ResponseWriterTest, UnknownLengthIsChunkedOnHttp11) {
    writer.prepare(request, true, false);
    writer(http::status::ok, http::Headers{{"Content-Type", "text/plain"}});
    writer.write("abc");
    writer.write("de");
    writer.finish();

    EXPECT_NE(out().find("Transfer-Encoding: chunked\r\n"), std::string::npos);
    EXPECT_EQ(out().substr(out().size() - 20), "3\r\nabc\r\n2\r\nde\r\n0\r\n\r\n");
    EXPECT_FALSE(writer.close_connection());
}

TEST_F(ResponseWriterTest, UnknownLengthClosesOnHttp10) {
    use_version(http::http_1_0);
    writer.prepare(request, true, false);
    writer(http::status::ok, http::Headers{});
    writer.write("abc");
    writer.finish();

    EXPECT_EQ(out().find("Transfer-Encoding"), std::string::npos);
    EXPECT_EQ(out().find("Keep-Alive"), std::string::npos);
    EXPECT_TRUE(writer.close_connection());
    EXPECT_EQ(out().substr(out().size() - 3), "abc");
}

TEST_F(ResponseWriterTest, Http10KeepAliveIsAnnounced) {
    use_version(http::http_1_0);
    writer.prepare(request, true, false);
    writer(http::status::ok, http::Headers{{"Content-Length", "0"}});
    writer.finish();

    EXPECT_NE(out().find("Connection: Keep-Alive\r\n"), std::string::npos);
    EXPECT_NE(out().find("Keep-Alive: timeout=10\r\n"), std::string::npos);
    EXPECT_FALSE(writer.close_connection());
}

TEST_F(ResponseWriterTest, ClosingHttp11ResponseSaysSo) {
    writer.prepare(request, false, false);
    writer(http::status::ok, http::Headers{{"Content-Length", "0"}});
    writer.finish();

    EXPECT_NE(out().find("Connection: close\r\n"), std::string::npos);
    EXPECT_TRUE(writer.close_connection());
}

TEST_F(ResponseWriterTest, GatewayConnectionCloseWins) {
    writer.prepare(request, true, false);
    writer(http::status::ok, http::Headers{{"Content-Length", "0"}, {"Connection", "close"}});
    writer.finish();

    EXPECT_TRUE(writer.close_connection());
    EXPECT_EQ(count_of(out(), "Connection:"), 1u);
}

TEST_F(ResponseWriterTest, HeadSuppressesBody) {
    request.method = "HEAD";
    writer.prepare(request, true, false);
    writer(http::status::ok, http::Headers{{"Content-Length", "5"}});
    writer.write("hello");
    writer.finish();

    EXPECT_EQ(out().find("hello"), std::string::npos);
    EXPECT_EQ(out().substr(out().size() - 4), "\r\n\r\n");
    EXPECT_FALSE(writer.close_connection());
}

TEST_F(ResponseWriterTest, NoContentHasNoFraming) {
    writer.prepare(request, true, false);
    writer(http::status::no_content, http::Headers{});
    writer.finish();

    EXPECT_EQ(out().rfind("HTTP/1.1 204 No Content\r\n", 0), 0u);
    EXPECT_EQ(out().find("Transfer-Encoding"), std::string::npos);
    EXPECT_FALSE(writer.close_connection());
}

TEST_F(ResponseWriterTest, PayloadTooLargeAlwaysCloses) {
    writer.prepare(request, true, false);
    writer(http::status::payload_too_large, http::Headers{{"Content-Length", "0"}});
    writer.finish();
    EXPECT_TRUE(writer.close_connection());
}

TEST_F(ResponseWriterTest, OverrunBeforeHeadersLeavesRoomFor500) {
    writer.prepare(request, true, false);
    writer(http::status::ok, http::Headers{{"Content-Length", "2"}});
    EXPECT_THROW(writer.write("abc"), http::ProtocolViolation);
    EXPECT_FALSE(writer.headers_sent());
    EXPECT_TRUE(out().empty());
}

TEST_F(ResponseWriterTest, OverrunAfterHeadersTruncatesAndCloses) {
    writer.prepare(request, true, false);
    writer(http::status::ok, http::Headers{{"Content-Length", "4"}});
    writer.write("ab");
    EXPECT_THROW(writer.write("cdef"), http::ProtocolViolation);
    EXPECT_EQ(out().substr(out().size() - 4), "abcd");
    EXPECT_TRUE(writer.close_connection());
}

TEST_F(ResponseWriterTest, ShortBodyForcesClose) {
    writer.prepare(request, true, false);
    writer(http::status::ok, http::Headers{{"Content-Length", "10"}});
    writer.write("abc");
    writer.finish();
    EXPECT_TRUE(writer.close_connection());
}

TEST_F(ResponseWriterTest, StartResponseGuards) {
    writer.prepare(request, true, false);
    EXPECT_THROW(writer.write("early"), http::ProtocolViolation);
    EXPECT_THROW(writer.finish(), http::ProtocolViolation);

    writer(http::status::ok, http::Headers{});
    EXPECT_THROW(writer(http::status::ok, http::Headers{}), http::ProtocolViolation);

    // A replacement with error info is allowed until the headers go out
    auto error = std::make_exception_ptr(std::runtime_error("boom"));
    writer(http::status::internal_server_error, http::Headers{{"Content-Length", "0"}}, error);
    EXPECT_EQ(writer.status_code(), 500);

    writer.finish();
    EXPECT_THROW(writer(http::status::bad_gateway, http::Headers{}, error), std::runtime_error);
}

TEST_F(ResponseWriterTest, RejectsHeaderInjection) {
    writer.prepare(request, true, false);
    EXPECT_THROW(writer(http::status::ok, http::Headers{{"X-Bad", "a\r\nSet-Cookie: x"}}),
                 http::ProtocolViolation);
    EXPECT_THROW(writer(http::status::ok, http::Headers{{"Content-Length", "12abc"}}),
                 http::ProtocolViolation);
}

TEST_F(ResponseWriterTest, SimpleResponseCloses) {
    writer.prepare(request, true, false);
    writer.simple_response(http::status::bad_request, "Bad request");

    EXPECT_EQ(out().rfind("HTTP/1.1 400 Bad Request\r\n", 0), 0u);
    EXPECT_NE(out().find("Content-Length: 11\r\n"), std::string::npos);
    EXPECT_NE(out().find("Content-Type: text/plain\r\n"), std::string::npos);
    EXPECT_NE(out().find("Connection: close\r\n"), std::string::npos);
    EXPECT_EQ(out().substr(out().size() - 11), "Bad request");
    EXPECT_TRUE(writer.close_connection());
    EXPECT_TRUE(writer.headers_sent());
}

TEST_F(ResponseWriterTest, ContinueIsSentOnce) {
    writer.prepare(request, true, true);
    writer.send_continue();
    writer.send_continue();
    EXPECT_EQ(count_of(out(), "HTTP/1.1 100 Continue\r\n\r\n"), 1u);
}

class UnreadBodyTest : public ResponseWriterTest {
protected:
    UnreadBodyTest() : ResponseWriterTest("hello") {
        request.method = "POST";
        request.body = std::make_unique<http::LengthBodyReader>(stream, 5);
    }
};

TEST_F(UnreadBodyTest, UnreadBodyIsDrainedToKeepAlive) {
    writer.prepare(request, true, false);
    writer(http::status::ok, http::Headers{{"Content-Length", "0"}});
    writer.finish();

    EXPECT_TRUE(request.body->finished());
    EXPECT_FALSE(writer.close_connection());
}

TEST_F(UnreadBodyTest, UnreadBodyAfterExpectContinueCloses) {
    writer.prepare(request, true, true);
    writer(http::status::ok, http::Headers{{"Content-Length", "0"}});
    writer.finish();

    EXPECT_FALSE(request.body->started());
    EXPECT_TRUE(writer.close_connection());
    EXPECT_EQ(out().find("100 Continue"), std::string::npos);
    EXPECT_NE(out().find("Connection: close\r\n"), std::string::npos);
}

TEST_F(UnreadBodyTest, DiscardedBodyCloses) {
    request.body->discard();
    writer.prepare(request, true, false);
    writer(http::status::ok, http::Headers{{"Content-Length", "0"}});
    writer.finish();
    EXPECT_TRUE(writer.close_connection());
}

TEST(HttpDate, Rfc1123Format) {
    auto date = server::http_date();
    ASSERT_EQ(date.size(), 29u);
    EXPECT_EQ(date.substr(date.size() - 4), " GMT");
    EXPECT_EQ(date[3], ',');
}
