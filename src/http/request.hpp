/**
 * PORTICO - Embedded HTTP/1.x Server Core
 * Request - Parsed request as seen by the gateway
 */

#ifndef PORTICO_HTTP_REQUEST_HPP
#define PORTICO_HTTP_REQUEST_HPP

#include "http/body_reader.hpp"
#include "http/headers.hpp"
#include "net/peer_info.hpp"

#include <compare>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace portico::http {

struct HttpVersion {
    int major{1};
    int minor{1};

    auto operator<=>(const HttpVersion&) const = default;

    std::string to_string() const {
        return "HTTP/" + std::to_string(major) + "." + std::to_string(minor);
    }
};

inline constexpr HttpVersion http_1_0{1, 0};
inline constexpr HttpVersion http_1_1{1, 1};

/**
 * One HTTP request
 *
 * `path` is what remains below `script_name` once a dispatcher has mounted
 * the request; before dispatch `script_name` is empty and `path` is the
 * whole decoded path.
 */
struct Request {
    std::string method;
    std::string target;            // Raw request-target from the request line
    std::string path;              // Percent-decoded, "%2F" preserved
    std::string query;             // Raw query string, no '?'
    std::string script_name;

    HttpVersion version;           // As sent by the client
    HttpVersion response_version;  // min(version, HTTP/1.1)

    std::string scheme{"http"};
    std::string server_name;
    std::uint16_t server_port{0};

    Headers headers;
    std::unique_ptr<BodyReader> body;

    net::PeerInfo peer;
    std::optional<net::TlsInfo> tls;

    bool is_secure() const noexcept { return tls.has_value(); }
};

} // namespace portico::http

#endif // PORTICO_HTTP_REQUEST_HPP
