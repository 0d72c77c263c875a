/**
 * PORTICO - Embedded HTTP/1.x Server Core
 * Peer information - Remote endpoint, Unix peer credentials and TLS session details
 */

#ifndef PORTICO_NET_PEER_INFO_HPP
#define PORTICO_NET_PEER_INFO_HPP

#include <sys/types.h>

#include <cstdint>
#include <optional>
#include <string>

namespace portico::net {

/**
 * Credentials of the process on the other end of a Unix-domain socket
 */
struct PeerCredentials {
    pid_t pid{0};
    uid_t uid{0};
    gid_t gid{0};
    std::string user;   // Resolved only when name resolution is enabled
    std::string group;
};

/**
 * Remote endpoint of an accepted connection
 */
struct PeerInfo {
    std::string address;  // IP address text; empty for unnamed Unix peers
    std::uint16_t port{0};
    bool is_unix{false};
    std::optional<PeerCredentials> credentials;

    /**
     * Printable form for logs ("10.0.0.1:51234", "[::1]:8080", "unix")
     */
    std::string to_string() const {
        if (is_unix) {
            return address.empty() ? std::string("unix") : "unix:" + address;
        }
        if (address.find(':') != std::string::npos) {
            return "[" + address + "]:" + std::to_string(port);
        }
        return address + ":" + std::to_string(port);
    }
};

/**
 * Negotiated TLS session details exposed to the gateway
 */
struct TlsInfo {
    std::string protocol;       // e.g. "TLSv1.3"
    std::string cipher;         // e.g. "TLS_AES_256_GCM_SHA384"
    int cipher_bits{0};
    std::string server_name;    // SNI host name sent by the client, if any
    std::string client_verify;  // "NONE", "SUCCESS" or "FAILED:<reason>"
    std::string client_subject; // Client certificate subject, if one was presented
};

} // namespace portico::net

#endif // PORTICO_NET_PEER_INFO_HPP
