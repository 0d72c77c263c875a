/**
 * PORTICO - Embedded HTTP/1.x Server Core
 * TLS adapter implementation
 */

#include "net/tls_adapter.hpp"

#include "util/logger.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace portico::net {

namespace {

constexpr auto shutdown_timeout = std::chrono::milliseconds(500);

constexpr std::string_view plain_http_message =
    "The client sent a plain HTTP request, but this server only speaks HTTPS on this port.";

std::string get_ssl_error_string() {
    char buf[256];
    ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
    return std::string(buf);
}

bool file_readable(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return false;
    }
    std::ifstream file(path);
    return file.good();
}

/**
 * OpenSSL recognised an HTTP method where a ClientHello should be
 */
bool is_plain_http(const boost::system::error_code& ec) {
    if (ec.category() != asio::error::get_ssl_category()) {
        return false;
    }
    return ERR_GET_REASON(static_cast<unsigned long>(ec.value())) == SSL_R_HTTP_REQUEST;
}

std::string x509_name(X509_NAME* name) {
    if (!name) {
        return {};
    }
    char buf[256];
    X509_NAME_oneline(name, buf, sizeof(buf));
    return std::string(buf);
}

} // anonymous namespace

std::optional<ClientVerify> parse_client_verify(std::string_view text) {
    std::string lower;
    lower.reserve(text.size());
    for (char c : text) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lower == "none") return ClientVerify::None;
    if (lower == "optional") return ClientVerify::Optional;
    if (lower == "required") return ClientVerify::Required;
    return std::nullopt;
}

std::string_view to_string(ClientVerify verify) {
    switch (verify) {
        case ClientVerify::Optional: return "optional";
        case ClientVerify::Required: return "required";
        case ClientVerify::None:
        default:                     return "none";
    }
}

// TlsTransport

TlsTransport::TlsTransport(AcceptedSocket accepted, ssl::context& context)
    : StreamTransport(std::move(accepted.io_context), std::move(accepted.peer),
                      accepted.socket.native_handle())
    , stream_(std::move(accepted.socket), context)
{
}

TlsTransport::~TlsTransport() {
    close();
}

void TlsTransport::handshake(Clock::duration timeout) {
    boost::system::error_code result;
    stream_.async_handshake(ssl::stream_base::server, [&](const boost::system::error_code& ec) {
        result = ec;
    });

    bool completed = run_for(timeout, stream_.next_layer());
    if (!completed && result == asio::error::operation_aborted) {
        throw http::TlsHandshakeError("TLS handshake timed out");
    }
    if (result) {
        if (is_plain_http(result)) {
            reject_plain_http(timeout);
            throw http::NoSslError("Client sent plain HTTP to a TLS port");
        }
        throw http::TlsHandshakeError("TLS handshake failed: " + result.message());
    }

    handshake_complete_ = true;
    collect_session_info();
}

std::size_t TlsTransport::read_some(asio::mutable_buffer buffer, Clock::duration timeout) {
    return read_with_timeout(stream_, stream_.next_layer(), buffer, timeout);
}

void TlsTransport::write(asio::const_buffer buffer, Clock::duration timeout) {
    write_with_timeout(stream_, stream_.next_layer(), buffer, timeout);
}

void TlsTransport::close() noexcept {
    if (!mark_closed()) {
        return;
    }

    if (handshake_complete_) {
        // close_notify is best effort; a vanished peer must not hold the worker
        stream_.async_shutdown([](const boost::system::error_code&) {});
        run_for(shutdown_timeout, stream_.next_layer());
    }
    lingering_close(stream_.next_layer());
}

void TlsTransport::collect_session_info() {
    SSL* ssl = stream_.native_handle();
    TlsInfo info;

    if (const char* version = SSL_get_version(ssl)) {
        info.protocol = version;
    }
    if (const SSL_CIPHER* cipher = SSL_get_current_cipher(ssl)) {
        info.cipher = SSL_CIPHER_get_name(cipher);
        info.cipher_bits = SSL_CIPHER_get_bits(cipher, nullptr);
    }
    if (const char* sni = SSL_get_servername(ssl, TLSEXT_NAMETYPE_host_name)) {
        info.server_name = sni;
    }

#if OPENSSL_VERSION_NUMBER >= 0x30000000L
    X509* cert = SSL_get1_peer_certificate(ssl);
#else
    X509* cert = SSL_get_peer_certificate(ssl);
#endif
    if (!cert) {
        info.client_verify = "NONE";
    } else {
        long verify = SSL_get_verify_result(ssl);
        info.client_verify = verify == X509_V_OK
            ? std::string("SUCCESS")
            : std::string("FAILED:") + X509_verify_cert_error_string(verify);
        info.client_subject = x509_name(X509_get_subject_name(cert));
        X509_free(cert);
    }

    info_ = std::move(info);
}

void TlsTransport::reject_plain_http(Clock::duration timeout) {
    std::string response = fmt::format(
        "HTTP/1.1 400 Bad Request\r\n"
        "Content-Type: text/plain\r\n"
        "Content-Length: {}\r\n"
        "Connection: close\r\n"
        "\r\n"
        "{}",
        plain_http_message.size(), plain_http_message);

    try {
        // The TLS layer is unusable; answer on the raw socket
        write_with_timeout(stream_.next_layer(), stream_.next_layer(), asio::buffer(response), timeout);
    } catch (const http::ConnectionError& e) {
        PORTICO_LOG_DEBUG(util::log_component::TLS, "Could not answer plain HTTP client {}: {}",
                          peer_.to_string(), e.what());
    }
}

// TlsAdapter

TlsAdapter::TlsAdapter(const TlsConfig& config)
    : config_(config)
    , context_(ssl::context::tls_server)
{
    try {
        configure_tls_versions();
        load_certificate();
        configure_ciphers();
        configure_verification();

        SSL_CTX* ctx = context_.native_handle();
        if (config_.enable_session_cache) {
            SSL_CTX_set_session_cache_mode(ctx, SSL_SESS_CACHE_SERVER);
            SSL_CTX_sess_set_cache_size(ctx, static_cast<long>(config_.session_cache_size));
            PORTICO_LOG_DEBUG(util::log_component::TLS, "Session cache enabled (size={})",
                              config_.session_cache_size);
        } else {
            SSL_CTX_set_session_cache_mode(ctx, SSL_SESS_CACHE_OFF);
        }

        static constexpr unsigned char session_id_context[] = "portico";
        SSL_CTX_set_session_id_context(ctx, session_id_context, sizeof(session_id_context) - 1);

        PORTICO_LOG_INFO(util::log_component::TLS, "TLS context initialized ({})", certificate_subject());
    } catch (const std::exception& e) {
        PORTICO_LOG_ERROR(util::log_component::TLS, "Failed to initialize TLS context: {}", e.what());
        throw;
    }
}

std::unique_ptr<Transport> TlsAdapter::wrap(AcceptedSocket accepted) {
    return std::make_unique<TlsTransport>(std::move(accepted), context_);
}

std::string TlsAdapter::certificate_subject() {
    X509* cert = SSL_CTX_get0_certificate(context_.native_handle());
    if (!cert) {
        return "(no certificate loaded)";
    }
    return x509_name(X509_get_subject_name(cert));
}

std::string TlsAdapter::certificate_expiry() {
    X509* cert = SSL_CTX_get0_certificate(context_.native_handle());
    if (!cert) {
        return "(no certificate loaded)";
    }

    const ASN1_TIME* not_after = X509_get0_notAfter(cert);
    if (!not_after) {
        return "(unknown)";
    }

    BIO* bio = BIO_new(BIO_s_mem());
    if (!bio) {
        return "(error)";
    }

    ASN1_TIME_print(bio, not_after);
    char* data = nullptr;
    long len = BIO_get_mem_data(bio, &data);
    std::string result(data, static_cast<std::size_t>(len));
    BIO_free(bio);

    return result;
}

void TlsAdapter::configure_tls_versions() {
    SSL_CTX* ctx = context_.native_handle();

    if (config_.enable_tls_1_2 && config_.enable_tls_1_3) {
        SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);
    } else if (config_.enable_tls_1_3) {
        SSL_CTX_set_min_proto_version(ctx, TLS1_3_VERSION);
    } else if (config_.enable_tls_1_2) {
        SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);
        SSL_CTX_set_max_proto_version(ctx, TLS1_2_VERSION);
    } else {
        throw std::runtime_error("At least one TLS version must be enabled");
    }

    context_.set_options(ssl::context::default_workarounds |
                         ssl::context::no_sslv2 |
                         ssl::context::no_sslv3 |
                         ssl::context::no_tlsv1 |
                         ssl::context::no_tlsv1_1 |
                         ssl::context::single_dh_use);
}

void TlsAdapter::load_certificate() {
    if (config_.cert_file.empty()) {
        throw std::runtime_error("TLS certificate file path is empty");
    }
    if (config_.key_file.empty()) {
        throw std::runtime_error("TLS private key file path is empty");
    }
    if (!file_readable(config_.cert_file)) {
        throw std::runtime_error("Cannot read TLS certificate file: " + config_.cert_file.string());
    }
    if (!file_readable(config_.key_file)) {
        throw std::runtime_error("Cannot read TLS private key file: " + config_.key_file.string());
    }

    if (!config_.key_password.empty()) {
        context_.set_password_callback(
            [password = config_.key_password](std::size_t max_length, ssl::context::password_purpose) {
                return password.length() > max_length ? password.substr(0, max_length) : password;
            });
    }

    boost::system::error_code ec;
    context_.use_certificate_chain_file(config_.cert_file.string(), ec);
    if (ec) {
        throw std::runtime_error("Failed to load certificate: " + config_.cert_file.string() +
                                 " - " + ec.message() + " (" + get_ssl_error_string() + ")");
    }

    context_.use_private_key_file(config_.key_file.string(), ssl::context::pem, ec);
    if (ec) {
        throw std::runtime_error("Failed to load private key: " + config_.key_file.string() +
                                 " - " + ec.message() + " (" + get_ssl_error_string() + ")");
    }

    if (SSL_CTX_check_private_key(context_.native_handle()) != 1) {
        throw std::runtime_error("Private key does not match certificate: " + config_.key_file.string());
    }

    PORTICO_LOG_DEBUG(util::log_component::TLS, "Loaded certificate {} and key {}",
                      config_.cert_file.string(), config_.key_file.string());
}

void TlsAdapter::configure_ciphers() {
    SSL_CTX* ctx = context_.native_handle();

    std::string cipher_list = config_.cipher_list;
    if (cipher_list.empty()) {
        cipher_list = "ECDHE+AESGCM:DHE+AESGCM:ECDHE+CHACHA20:DHE+CHACHA20:"
                      "ECDHE+AES256:DHE+AES256:ECDHE+AES128:DHE+AES128:"
                      "!aNULL:!eNULL:!EXPORT:!DES:!RC4:!3DES:!MD5:!PSK";
    }
    if (SSL_CTX_set_cipher_list(ctx, cipher_list.c_str()) != 1) {
        throw std::runtime_error("Invalid TLS 1.2 cipher list: " + cipher_list);
    }

    if (!config_.ciphersuites.empty() &&
        SSL_CTX_set_ciphersuites(ctx, config_.ciphersuites.c_str()) != 1) {
        throw std::runtime_error("Invalid TLS 1.3 ciphersuites: " + config_.ciphersuites);
    }
}

void TlsAdapter::configure_verification() {
    if (!config_.ca_file.empty()) {
        if (!file_readable(config_.ca_file)) {
            throw std::runtime_error("Cannot read CA file: " + config_.ca_file.string());
        }
        boost::system::error_code ec;
        context_.load_verify_file(config_.ca_file.string(), ec);
        if (ec) {
            throw std::runtime_error("Failed to load CA file: " + config_.ca_file.string() +
                                     " - " + ec.message());
        }
    }

    switch (config_.verify_client) {
        case ClientVerify::None:
            context_.set_verify_mode(ssl::verify_none);
            break;
        case ClientVerify::Optional:
            context_.set_verify_mode(ssl::verify_peer);
            break;
        case ClientVerify::Required:
            context_.set_verify_mode(ssl::verify_peer | ssl::verify_fail_if_no_peer_cert);
            break;
    }

    if (config_.verify_client != ClientVerify::None && config_.ca_file.empty()) {
        PORTICO_LOG_WARN(util::log_component::TLS,
                         "Client verification '{}' without a CA file; only default trust roots apply",
                         to_string(config_.verify_client));
    }
}

} // namespace portico::net
