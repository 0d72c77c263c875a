/**
 * PORTICO - Embedded HTTP/1.x Server Core
 * Bind address tests
 */

#include "net/bind_address.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using portico::net::BindAddress;

TEST(BindAddress, ParsesIpv4) {
    auto addr = BindAddress::parse("127.0.0.1:8080");
    EXPECT_EQ(addr.kind, BindAddress::Kind::Tcp);
    EXPECT_EQ(addr.host, "127.0.0.1");
    EXPECT_EQ(addr.port, 8080);
    EXPECT_FALSE(addr.is_unix());
    EXPECT_EQ(addr.to_string(), "127.0.0.1:8080");
}

TEST(BindAddress, ParsesBracketedIpv6) {
    auto addr = BindAddress::parse("[::1]:9000");
    EXPECT_EQ(addr.kind, BindAddress::Kind::Tcp);
    EXPECT_EQ(addr.host, "::1");
    EXPECT_EQ(addr.port, 9000);
    EXPECT_EQ(addr.to_string(), "[::1]:9000");
}

TEST(BindAddress, ParsesUnixPaths) {
    auto addr = BindAddress::parse("/tmp/portico.sock");
    EXPECT_EQ(addr.kind, BindAddress::Kind::Unix);
    EXPECT_EQ(addr.path, "/tmp/portico.sock");
    EXPECT_TRUE(addr.is_unix());

    EXPECT_EQ(BindAddress::parse("relative.sock").kind, BindAddress::Kind::Unix);
}

TEST(BindAddress, ParsesAbstractNames) {
    auto addr = BindAddress::parse("@portico");
    EXPECT_EQ(addr.kind, BindAddress::Kind::Abstract);
    ASSERT_EQ(addr.path.size(), 8u);
    EXPECT_EQ(addr.path[0], '\0');
    EXPECT_EQ(addr.to_string(), "@portico");
}

TEST(BindAddress, RejectsMalformedInput) {
    EXPECT_THROW(BindAddress::parse(""), std::invalid_argument);
    EXPECT_THROW(BindAddress::parse("@"), std::invalid_argument);
    EXPECT_THROW(BindAddress::parse("localhost:99999"), std::invalid_argument);
    EXPECT_THROW(BindAddress::parse("localhost:"), std::invalid_argument);
    EXPECT_THROW(BindAddress::parse("localhost:http"), std::invalid_argument);
    EXPECT_THROW(BindAddress::parse("::1:80"), std::invalid_argument);
    EXPECT_THROW(BindAddress::parse("[::1]80"), std::invalid_argument);
}
