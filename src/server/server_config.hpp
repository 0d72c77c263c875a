/**
 * PORTICO - Embedded HTTP/1.x Server Core
 * Server configuration - Runtime settings for one HttpServer instance
 */

#ifndef PORTICO_SERVER_SERVER_CONFIG_HPP
#define PORTICO_SERVER_SERVER_CONFIG_HPP

#include "net/bind_address.hpp"
#include "net/tls_adapter.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace portico::config {
struct Config;
}

namespace portico::server {

using Duration = std::chrono::steady_clock::duration;

/**
 * Immutable once the server is constructed
 */
struct ServerConfig {
    net::BindAddress bind;

    std::size_t min_workers{10};
    std::size_t max_workers{10};

    Duration timeout{std::chrono::seconds(10)};              // Per socket operation
    Duration keep_alive_timeout{std::chrono::seconds(10)};   // Waiting for the next request
    Duration header_timeout{std::chrono::seconds(10)};       // Whole request head
    Duration shutdown_timeout{std::chrono::seconds(5)};
    Duration idle_worker_timeout{std::chrono::seconds(60)};

    std::size_t max_header_size{65536};     // 0 = unlimited
    std::uint64_t max_request_body_size{0}; // 0 = unlimited

    int backlog{128};
    std::size_t accepted_queue_size{0};     // 0 = unbounded
    Duration accepted_queue_timeout{std::chrono::seconds(10)};

    std::string server_software{"Portico/0.1.0"};  // Server header
    std::string server_name;                        // Empty = host name

    bool nodelay{true};
    bool reuse_port{false};
    bool strict_mode{true};
    bool peercreds_enabled{false};
    bool peercreds_resolve_enabled{false};

    std::optional<net::TlsConfig> tls;
};

/**
 * Build the runtime configuration from validated application settings
 * @throws std::runtime_error on invalid settings
 */
ServerConfig make_server_config(const config::Config& config);

} // namespace portico::server

#endif // PORTICO_SERVER_SERVER_CONFIG_HPP
