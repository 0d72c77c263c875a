/**
 * PORTICO - Embedded HTTP/1.x Server Core
 * Request parser tests
 */

#include "http/errors.hpp"
#include "http/request_parser.hpp"
#include "test_support/memory_transport.hpp"

#include <gtest/gtest.h>

#include <functional>

using namespace portico::http;
using portico::net::BufferedStream;
using portico::test::MemoryTransport;

namespace {

struct ParserHarness {
    explicit ParserHarness(std::string input, ParserLimits limits = {})
        : transport(std::move(input), 7)
        , stream(transport)
        , parser(stream, limits)
    {}

    MemoryTransport transport;
    BufferedStream stream;
    RequestParser parser;
};

status error_code_of(const std::function<void()>& action) {
    try {
        action();
    } catch (const HttpError& e) {
        return e.code();
    }
    return status::unknown;
}

} // anonymous namespace

TEST(RequestParser, ParsesRequestLineAndHeaders) {
    ParserHarness h("GET /p%20q?x=1 HTTP/1.1\r\n"
                    "Host: example.com\r\n"
                    "X-Folded: one\r\n"
                    "  two\r\n"
                    "\r\n");

    auto line = h.parser.parse_request_line();
    ASSERT_TRUE(line.has_value());
    EXPECT_EQ(line->method, "GET");
    EXPECT_EQ(line->target, "/p%20q?x=1");
    EXPECT_EQ(line->version, http_1_1);
    EXPECT_EQ(line->parsed.path, "/p q");
    EXPECT_EQ(line->parsed.query, "x=1");

    auto headers = h.parser.parse_headers();
    EXPECT_EQ(*headers.get("host"), "example.com");
    EXPECT_EQ(*headers.get("X-Folded"), "one two");
}

TEST(RequestParser, SkipsOneLeadingEmptyLine) {
    ParserHarness h("\r\nGET / HTTP/1.0\r\n\r\n");
    auto line = h.parser.parse_request_line();
    ASSERT_TRUE(line.has_value());
    EXPECT_EQ(line->version, http_1_0);
}

TEST(RequestParser, EndOfStreamBeforeRequest) {
    ParserHarness h("");
    EXPECT_FALSE(h.parser.parse_request_line().has_value());
}

TEST(RequestParser, MalformedRequestLines) {
    EXPECT_THROW(ParserHarness("GET / HTTP/1.1\n\n").parser.parse_request_line(), BadRequest);
    EXPECT_THROW(ParserHarness("GET /\r\n\r\n").parser.parse_request_line(), BadRequest);
    EXPECT_THROW(ParserHarness("GET  / HTTP/1.1\r\n\r\n").parser.parse_request_line(), BadRequest);
    EXPECT_THROW(ParserHarness("GET / FTP/1.1\r\n\r\n").parser.parse_request_line(), BadRequest);
    EXPECT_THROW(ParserHarness("G(T / HTTP/1.1\r\n\r\n").parser.parse_request_line(), BadRequest);
}

TEST(RequestParser, UnsupportedVersions) {
    EXPECT_EQ(error_code_of([] { ParserHarness("GET / HTTP/2.0\r\n\r\n").parser.parse_request_line(); }),
              status::http_version_not_supported);
    EXPECT_EQ(error_code_of([] { ParserHarness("GET / HTTP/1.2\r\n\r\n").parser.parse_request_line(); }),
              status::http_version_not_supported);
}

TEST(RequestParser, StrictModeRequiresUppercaseMethods) {
    EXPECT_THROW(ParserHarness("get / HTTP/1.1\r\n\r\n").parser.parse_request_line(), BadRequest);

    ParserLimits lenient;
    lenient.strict_mode = false;
    ParserHarness h("get / HTTP/1.1\r\n\r\n", lenient);
    EXPECT_EQ(h.parser.parse_request_line()->method, "get");
}

TEST(RequestParser, LimitsRequestLineAndHeaderBlock) {
    ParserLimits limits;
    limits.max_header_size = 32;

    EXPECT_EQ(error_code_of([&] {
                  ParserHarness("GET /" + std::string(64, 'a') + " HTTP/1.1\r\n\r\n", limits)
                      .parser.parse_request_line();
              }),
              status::uri_too_long);

    ParserHarness h("GET / HTTP/1.1\r\nX-Big: " + std::string(64, 'b') + "\r\n\r\n", limits);
    ASSERT_TRUE(h.parser.parse_request_line().has_value());
    EXPECT_THROW(h.parser.parse_headers(), HeaderFieldsTooLarge);
}

TEST(RequestParser, MalformedHeaders) {
    {
        ParserHarness h("GET / HTTP/1.1\r\nNoColonHere\r\n\r\n");
        h.parser.parse_request_line();
        EXPECT_THROW(h.parser.parse_headers(), BadRequest);
    }
    {
        ParserHarness h("GET / HTTP/1.1\r\n continuation first\r\n\r\n");
        h.parser.parse_request_line();
        EXPECT_THROW(h.parser.parse_headers(), BadRequest);
    }
    {
        ParserHarness h("GET / HTTP/1.1\r\nHost: x\r\n");
        h.parser.parse_request_line();
        EXPECT_THROW(h.parser.parse_headers(), BadRequest);
    }
}

TEST(BodyFraming, ContentLength) {
    auto framing = determine_framing(Headers{{"Content-Length", "10"}}, http_1_1, 0);
    EXPECT_EQ(framing.kind, BodyFraming::Kind::Length);
    EXPECT_EQ(framing.length, 10u);

    EXPECT_EQ(determine_framing(Headers{{"Content-Length", "0"}}, http_1_1, 0).kind, BodyFraming::Kind::None);
    EXPECT_EQ(determine_framing(Headers{}, http_1_1, 0).kind, BodyFraming::Kind::None);
    EXPECT_EQ(determine_framing(Headers{{"Content-Length", "7"}, {"Content-Length", "7"}}, http_1_1, 0).length, 7u);
}

TEST(BodyFraming, ChunkedOnlyForHttp11) {
    EXPECT_EQ(determine_framing(Headers{{"Transfer-Encoding", "chunked"}}, http_1_1, 0).kind,
              BodyFraming::Kind::Chunked);
    EXPECT_EQ(determine_framing(Headers{{"Transfer-Encoding", "chunked"}}, http_1_0, 0).kind,
              BodyFraming::Kind::None);
}

TEST(BodyFraming, RejectsAmbiguousOrUnsupportedFraming) {
    EXPECT_THROW(determine_framing(Headers{{"Content-Length", "abc"}}, http_1_1, 0), BadRequest);
    EXPECT_THROW(determine_framing(Headers{{"Content-Length", "5"}, {"Content-Length", "6"}}, http_1_1, 0),
                 BadRequest);
    EXPECT_THROW(determine_framing(Headers{{"Transfer-Encoding", "chunked"}, {"Content-Length", "5"}},
                                   http_1_1, 0),
                 BadRequest);
    EXPECT_EQ(error_code_of([] { determine_framing(Headers{{"Transfer-Encoding", "gzip"}}, http_1_1, 0); }),
              status::not_implemented);
    EXPECT_THROW(determine_framing(Headers{{"Content-Length", "101"}}, http_1_1, 100), PayloadTooLarge);
}

TEST(Persistence, KeepAliveDefaultsByVersion) {
    EXPECT_TRUE(wants_keep_alive(Headers{}, http_1_1));
    EXPECT_FALSE(wants_keep_alive(Headers{{"Connection", "close"}}, http_1_1));
    EXPECT_FALSE(wants_keep_alive(Headers{}, http_1_0));
    EXPECT_TRUE(wants_keep_alive(Headers{{"Connection", "Keep-Alive"}}, http_1_0));
}

TEST(Persistence, ExpectContinue) {
    EXPECT_TRUE(expects_continue(Headers{{"Expect", "100-continue"}}, http_1_1));
    EXPECT_FALSE(expects_continue(Headers{{"Expect", "100-continue"}}, http_1_0));
    EXPECT_FALSE(expects_continue(Headers{}, http_1_1));
}
