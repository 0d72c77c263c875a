/**
 * PORTICO - Embedded HTTP/1.x Server Core
 * Bind address parsing
 */

#include "net/bind_address.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace portico::net {

namespace {

std::uint16_t parse_port(std::string_view text, std::string_view whole) {
    if (text.empty() || text.size() > 5 ||
        !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
        throw std::invalid_argument("Invalid port in bind address: " + std::string(whole));
    }
    auto value = std::stoul(std::string(text));
    if (value > 65535) {
        throw std::invalid_argument("Port out of range in bind address: " + std::string(whole));
    }
    return static_cast<std::uint16_t>(value);
}

} // anonymous namespace

BindAddress BindAddress::parse(std::string_view text) {
    if (text.empty()) {
        throw std::invalid_argument("Bind address cannot be empty");
    }

    if (text.front() == '@') {
        if (text.size() == 1) {
            throw std::invalid_argument("Abstract socket name cannot be empty");
        }
        BindAddress addr;
        addr.kind = Kind::Abstract;
        addr.host.clear();
        addr.port = 0;
        addr.path = std::string(1, '\0') + std::string(text.substr(1));
        return addr;
    }

    if (text.front() == '[') {
        auto close = text.find(']');
        if (close == std::string_view::npos || close + 1 >= text.size() || text[close + 1] != ':') {
            throw std::invalid_argument("Malformed IPv6 bind address: " + std::string(text));
        }
        return tcp(std::string(text.substr(1, close - 1)), parse_port(text.substr(close + 2), text));
    }

    auto colon = text.rfind(':');
    bool looks_like_path = text.find('/') != std::string_view::npos || colon == std::string_view::npos;
    if (looks_like_path) {
        return unix_path(std::string(text));
    }

    auto host = text.substr(0, colon);
    if (host.empty() || host.find(':') != std::string_view::npos) {
        throw std::invalid_argument("Malformed bind address (IPv6 hosts need brackets): " + std::string(text));
    }
    return tcp(std::string(host), parse_port(text.substr(colon + 1), text));
}

BindAddress BindAddress::tcp(std::string host, std::uint16_t port) {
    BindAddress addr;
    addr.kind = Kind::Tcp;
    addr.host = std::move(host);
    addr.port = port;
    return addr;
}

BindAddress BindAddress::unix_path(std::string path) {
    BindAddress addr;
    addr.kind = Kind::Unix;
    addr.host.clear();
    addr.port = 0;
    addr.path = std::move(path);
    return addr;
}

std::string BindAddress::to_string() const {
    switch (kind) {
        case Kind::Unix:
            return path;
        case Kind::Abstract:
            return "@" + path.substr(1);
        case Kind::Tcp:
        default:
            if (host.find(':') != std::string::npos) {
                return "[" + host + "]:" + std::to_string(port);
            }
            return host + ":" + std::to_string(port);
    }
}

} // namespace portico::net
