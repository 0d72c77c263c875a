/**
 * PORTICO - Embedded HTTP/1.x Server Core
 * Server configuration implementation
 */

#include "server/server_config.hpp"

#include "config/config.hpp"

#include <stdexcept>

namespace portico::server {

namespace {

Duration seconds(double value) {
    return std::chrono::duration_cast<Duration>(std::chrono::duration<double>(value));
}

} // anonymous namespace

ServerConfig make_server_config(const config::Config& config) {
    const auto& s = config.server;

    ServerConfig result;
    try {
        result.bind = net::BindAddress::parse(s.bind);
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error("Configuration error: server.bind: " + std::string(e.what()));
    }

    result.min_workers = s.threads;
    result.max_workers = s.max_threads;
    result.timeout = seconds(s.timeout);
    result.keep_alive_timeout = seconds(s.keep_alive_timeout);
    result.header_timeout = seconds(s.header_timeout);
    result.shutdown_timeout = seconds(s.shutdown_timeout);
    result.idle_worker_timeout = seconds(s.idle_worker_timeout);
    result.max_header_size = s.max_header_size;
    result.max_request_body_size = s.max_body_size;
    result.backlog = static_cast<int>(s.request_queue_size);
    result.accepted_queue_size = s.accepted_queue_size;
    result.accepted_queue_timeout = seconds(s.accepted_queue_timeout);
    result.server_software = s.server_software;
    result.server_name = s.server_name;
    result.nodelay = s.nodelay;
    result.reuse_port = s.reuse_port;
    result.strict_mode = s.strict_mode;
    result.peercreds_enabled = s.peercreds_enabled;
    result.peercreds_resolve_enabled = s.peercreds_resolve_enabled;

    if (config.ssl.enabled) {
        const auto& ssl = config.ssl;
        net::TlsConfig tls;
        tls.cert_file = ssl.cert_file;
        tls.key_file = ssl.key_file;
        tls.ca_file = ssl.chain_file;
        tls.key_password = ssl.key_password;
        tls.enable_tls_1_2 = ssl.enable_tls_1_2;
        tls.enable_tls_1_3 = ssl.enable_tls_1_3;
        tls.cipher_list = ssl.cipher_list;
        tls.ciphersuites = ssl.ciphersuites;
        tls.enable_session_cache = ssl.enable_session_cache;
        tls.session_cache_size = ssl.session_cache_size;

        auto verify = net::parse_client_verify(ssl.verify_client);
        if (!verify) {
            throw std::runtime_error("Configuration error: ssl.verify_client must be none, optional or required");
        }
        tls.verify_client = *verify;
        result.tls = std::move(tls);
    }

    return result;
}

} // namespace portico::server
