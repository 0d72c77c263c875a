/**
 * PORTICO - Embedded HTTP/1.x Server Core
 * Buffered stream tests
 */

#include "net/buffered_stream.hpp"
#include "test_support/memory_transport.hpp"

#include <gtest/gtest.h>

using namespace std::chrono_literals;
using portico::net::BufferedStream;
using portico::test::MemoryTransport;
namespace http = portico::http;

TEST(BufferedStream, ReadLineAcrossSegments) {
    MemoryTransport transport("GET / HTTP/1.1\r\nHost: x\r\n", 3);
    BufferedStream stream(transport);

    EXPECT_EQ(stream.read_line(100), "GET / HTTP/1.1\r\n");
    EXPECT_EQ(stream.read_line(100), "Host: x\r\n");
    EXPECT_EQ(stream.read_line(100), "");
    EXPECT_EQ(stream.bytes_read(), 25u);
}

TEST(BufferedStream, ReadLineStopsAtLimit) {
    MemoryTransport transport("abcdefgh\nrest");
    BufferedStream stream(transport);

    EXPECT_EQ(stream.read_line(4), "abcd");
    EXPECT_EQ(stream.read_line(100), "efgh\n");
    EXPECT_EQ(stream.read_line(100), "rest");
}

TEST(BufferedStream, PeekDoesNotConsume) {
    MemoryTransport transport("hello");
    BufferedStream stream(transport);

    EXPECT_EQ(stream.peek(), 5u);
    EXPECT_EQ(stream.buffered(), 5u);
    EXPECT_EQ(stream.read(100), "hello");
    EXPECT_EQ(stream.peek(), 0u);
}

TEST(BufferedStream, ReadExactFailsOnShortInput) {
    MemoryTransport transport("abc", 1);
    BufferedStream stream(transport);

    EXPECT_EQ(stream.read_exact(2), "ab");
    EXPECT_THROW(stream.read_exact(2), http::UnexpectedEof);
}

TEST(BufferedStream, WritesAreBufferedUntilFlush) {
    MemoryTransport transport("");
    BufferedStream stream(transport);

    stream.write("abc");
    EXPECT_TRUE(transport.output().empty());
    stream.flush();
    EXPECT_EQ(transport.output(), "abc");
    EXPECT_EQ(stream.bytes_written(), 3u);

    stream.write(std::string(BufferedStream::block_size, 'x'));
    EXPECT_EQ(transport.output().size(), 3u + BufferedStream::block_size);
}

TEST(BufferedStream, ExpiredDeadlineTimesOut) {
    MemoryTransport transport("data");
    BufferedStream stream(transport);

    stream.set_deadline(portico::net::Clock::now() - 1s);
    EXPECT_THROW(stream.read(10), http::TimeoutError);

    stream.set_deadline(std::nullopt);
    EXPECT_EQ(stream.read(10), "data");
}

TEST(BufferedStream, TransportTimeoutPropagates) {
    MemoryTransport transport("", 0, true);
    BufferedStream stream(transport);
    EXPECT_THROW(stream.peek(), http::TimeoutError);
}
