/**
 * PORTICO - Embedded HTTP/1.x Server Core
 * TLS adapter - Server-side TLS context and TLS-wrapped transports
 */

#ifndef PORTICO_NET_TLS_ADAPTER_HPP
#define PORTICO_NET_TLS_ADAPTER_HPP

#include "net/transport.hpp"

#include <utility>  // Boost.Asio awaitable.hpp uses std::exchange without including it
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace portico::net {

namespace ssl = asio::ssl;

/**
 * Client certificate policy
 */
enum class ClientVerify {
    None,      // Never request a client certificate
    Optional,  // Request one; verify it if presented
    Required   // Reject clients without a valid certificate
};

/**
 * Parse "none", "optional" or "required" (case-insensitive)
 */
std::optional<ClientVerify> parse_client_verify(std::string_view text);

std::string_view to_string(ClientVerify verify);

/**
 * TLS configuration
 */
struct TlsConfig {
    std::filesystem::path cert_file;        // Server certificate chain (PEM)
    std::filesystem::path key_file;         // Private key (PEM)
    std::filesystem::path ca_file;          // Optional: CA bundle for client verification
    std::string key_password;               // Optional: password for an encrypted key

    bool enable_tls_1_2{true};
    bool enable_tls_1_3{true};

    std::string cipher_list;                // TLS 1.2 cipher string
    std::string ciphersuites;               // TLS 1.3 suites

    bool enable_session_cache{true};
    std::size_t session_cache_size{20480};

    ClientVerify verify_client{ClientVerify::None};
};

/**
 * Transport running TLS over an accepted socket
 *
 * The handshake is deferred to handshake(), which runs on the worker that
 * owns the connection so a slow client never stalls the accept loop.
 */
class TlsTransport final : public StreamTransport {
public:
    TlsTransport(AcceptedSocket accepted, ssl::context& context);
    ~TlsTransport() override;

    /**
     * Server-side handshake
     * @throws http::NoSslError if the client spoke plain HTTP (a 400 has been sent)
     * @throws http::TlsHandshakeError on any other failure
     */
    void handshake(Clock::duration timeout) override;

    std::size_t read_some(asio::mutable_buffer buffer, Clock::duration timeout) override;
    void write(asio::const_buffer buffer, Clock::duration timeout) override;
    void close() noexcept override;
    bool is_secure() const noexcept override { return true; }
    std::optional<TlsInfo> tls_info() const override { return info_; }

private:
    void collect_session_info();
    void reject_plain_http(Clock::duration timeout);

    ssl::stream<socket_type> stream_;
    bool handshake_complete_{false};
    std::optional<TlsInfo> info_;
};

/**
 * TLS adapter - owns the server context and wraps accepted sockets
 *
 * Built from explicit configuration; there is no process-wide registry.
 */
class TlsAdapter {
public:
    /**
     * @throws std::runtime_error if the certificate or key cannot be loaded
     */
    explicit TlsAdapter(const TlsConfig& config);

    TlsAdapter(const TlsAdapter&) = delete;
    TlsAdapter& operator=(const TlsAdapter&) = delete;

    /**
     * Wrap an accepted socket. No I/O happens here; the handshake runs on
     * the first Transport::handshake() call.
     */
    std::unique_ptr<Transport> wrap(AcceptedSocket accepted);

    ssl::context& context() noexcept { return context_; }

    /**
     * Subject of the loaded server certificate
     */
    std::string certificate_subject();

    /**
     * notAfter of the loaded server certificate
     */
    std::string certificate_expiry();

private:
    void configure_tls_versions();
    void load_certificate();
    void configure_ciphers();
    void configure_verification();

    TlsConfig config_;
    ssl::context context_;
};

} // namespace portico::net

#endif // PORTICO_NET_TLS_ADAPTER_HPP
