/**
 * PORTICO - Embedded HTTP/1.x Server Core
 * Bind address - TCP host:port, Unix-domain socket path or Linux abstract socket name
 */

#ifndef PORTICO_NET_BIND_ADDRESS_HPP
#define PORTICO_NET_BIND_ADDRESS_HPP

#include <cstdint>
#include <string>
#include <string_view>

namespace portico::net {

/**
 * Where the listener binds
 *
 * Accepted textual forms:
 *   "127.0.0.1:8080", "localhost:8080", "[::1]:8080"  TCP
 *   "/run/portico.sock", "portico.sock"               Unix-domain socket path
 *   "@portico"                                        abstract socket "\0portico"
 */
struct BindAddress {
    enum class Kind {
        Tcp,
        Unix,
        Abstract
    };

    Kind kind{Kind::Tcp};
    std::string host{"127.0.0.1"};
    std::uint16_t port{8080};
    std::string path;  // Unix path, or abstract name including its leading NUL

    /**
     * Parse a bind location
     * @throws std::invalid_argument on malformed input
     */
    static BindAddress parse(std::string_view text);

    static BindAddress tcp(std::string host, std::uint16_t port);
    static BindAddress unix_path(std::string path);

    bool is_unix() const noexcept { return kind != Kind::Tcp; }

    /**
     * Inverse of parse() ("@name" for abstract sockets)
     */
    std::string to_string() const;

    bool operator==(const BindAddress&) const = default;
};

} // namespace portico::net

#endif // PORTICO_NET_BIND_ADDRESS_HPP
