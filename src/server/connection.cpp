/**
 * PORTICO - Embedded HTTP/1.x Server Core
 * Connection implementation
 */

#include "server/connection.hpp"

#include "http/errors.hpp"
#include "http/request_parser.hpp"
#include "util/logger.hpp"

#include <algorithm>

namespace portico::server {

namespace {

// Chunk-size lines are bounded separately from the header block
constexpr std::size_t max_chunk_line = 65536;

} // anonymous namespace

std::string_view to_string(ConnectionState state) noexcept {
    switch (state) {
        case ConnectionState::AwaitingRequest: return "awaiting-request";
        case ConnectionState::ReadingHeaders:  return "reading-headers";
        case ConnectionState::ReadingBody:     return "reading-body";
        case ConnectionState::Dispatching:     return "dispatching";
        case ConnectionState::WritingResponse: return "writing-response";
        case ConnectionState::KeepAlive:       return "keep-alive";
        case ConnectionState::Closed:          return "closed";
    }
    return "unknown";
}

Connection::Connection(std::unique_ptr<net::Transport> transport,
                       const ServerConfig& config,
                       http::Gateway& gateway,
                       util::ServerStats& stats,
                       std::uint16_t server_port)
    : transport_(std::move(transport))
    , stream_(*transport_)
    , writer_(stream_, config)
    , config_(config)
    , gateway_(gateway)
    , stats_(stats)
    , server_port_(server_port)
{
}

Connection::~Connection() {
    if (!closed_) {
        transport_->close();
    }
}

void Connection::run(std::stop_token stop) noexcept {
    stats_.connection_opened();
    const auto& peer = transport_->peer();
    PORTICO_LOG_DEBUG(util::log_component::Connection, "Connection from {}", peer.to_string());

    try {
        transport_->handshake(config_.timeout);
        while (!stop.stop_requested() && serve_request(stop)) {
            set_state(ConnectionState::KeepAlive);
        }
    } catch (const http::NoSslError&) {
        stats_.tls_handshake_failed();
        PORTICO_LOG_DEBUG(util::log_component::TLS, "Plain HTTP from {} on a TLS port", peer.to_string());
    } catch (const http::TlsHandshakeError& e) {
        stats_.tls_handshake_failed();
        PORTICO_LOG_DEBUG(util::log_component::TLS, "Handshake with {} failed: {}", peer.to_string(), e.what());
    } catch (const http::ConnectionError& e) {
        PORTICO_LOG_DEBUG(util::log_component::Connection, "Connection {} ended: {}", peer.to_string(), e.what());
    } catch (const std::exception& e) {
        PORTICO_LOG_ERROR(util::log_component::Connection, "Connection {} failed: {}", peer.to_string(), e.what());
    }

    set_state(ConnectionState::Closed);
    stream_.close();
    closed_ = true;
    stats_.connection_closed(stream_.bytes_read(), stream_.bytes_written());
}

void Connection::interrupt() noexcept {
    transport_->interrupt();
}

bool Connection::is_idle() const noexcept {
    auto current = state();
    return current == ConnectionState::AwaitingRequest || current == ConnectionState::KeepAlive;
}

void Connection::abandon() noexcept {
    set_state(ConnectionState::Closed);
    transport_->close();
    closed_ = true;
}

bool Connection::serve_request(std::stop_token stop) {
    bool first_request = requests_served_.load(std::memory_order_relaxed) == 0;

    stream_.set_deadline(std::nullopt);
    stream_.set_timeout(first_request ? config_.timeout : config_.keep_alive_timeout);
    try {
        if (stream_.peek() == 0) {
            return false;
        }
    } catch (const http::TimeoutError&) {
        PORTICO_LOG_TRACE(util::log_component::Connection, "Idle connection {} timed out",
                          transport_->peer().to_string());
        return false;
    }

    request_start_ = net::Clock::now();
    set_state(ConnectionState::ReadingHeaders);
    stream_.set_timeout(config_.timeout);
    stream_.set_deadline(request_start_ + config_.header_timeout);

    http::Request request;
    request.peer = transport_->peer();
    writer_.prepare(request, false, false);

    http::ParserLimits limits;
    limits.max_header_size = config_.max_header_size;
    limits.strict_mode = config_.strict_mode;
    http::RequestParser parser(stream_, limits);

    try {
        auto line = parser.parse_request_line();
        if (!line) {
            return false;
        }
        request.method = std::move(line->method);
        request.target = std::move(line->target);
        request.path = std::move(line->parsed.path);
        request.query = std::move(line->parsed.query);
        request.version = line->version;
        request.response_version = std::min(line->version, http::http_1_1);
        writer_.prepare(request, false, false);

        request.headers = parser.parse_headers();
    } catch (const http::HttpError& e) {
        reject(e.code(), e.what(), request);
        return false;
    } catch (const http::TimeoutError&) {
        reject(http::status::request_timeout,
               "The server timed out while waiting for the request.", request);
        return false;
    }
    stream_.set_deadline(std::nullopt);

    request.scheme = transport_->is_secure() ? "https" : "http";
    request.server_name = config_.server_name;
    request.server_port = server_port_;
    request.tls = transport_->tls_info();

    http::BodyFraming framing;
    try {
        framing = http::determine_framing(request.headers, request.version, config_.max_request_body_size);
    } catch (const http::HttpError& e) {
        reject(e.code(), e.what(), request);
        return false;
    }

    switch (framing.kind) {
        case http::BodyFraming::Kind::None:
            request.body = std::make_unique<http::EmptyBody>();
            break;
        case http::BodyFraming::Kind::Length:
            request.body = std::make_unique<http::LengthBodyReader>(stream_, framing.length);
            break;
        case http::BodyFraming::Kind::Chunked:
            request.body = std::make_unique<http::ChunkedBodyReader>(
                stream_, config_.max_request_body_size, max_chunk_line);
            break;
    }

    bool keep_alive = http::wants_keep_alive(request.headers, request.version);
    bool expect_continue = http::expects_continue(request.headers, request.version) &&
                           !request.body->finished();

    // 100 Continue goes out lazily, when the gateway first asks for the body
    request.body->on_first_read([this, expect_continue]() {
        set_state(ConnectionState::ReadingBody);
        if (expect_continue) {
            writer_.send_continue();
        }
    });

    writer_.prepare(request, keep_alive, expect_continue);
    set_state(ConnectionState::Dispatching);

    try {
        http::Body body = gateway_.handle(request, writer_);
        set_state(ConnectionState::WritingResponse);
        writer_.send_body(body);
        writer_.finish();
    } catch (const http::ConnectionError&) {
        throw;
    } catch (const http::HttpError& e) {
        // Raised by the body reader while the gateway consumed the request
        PORTICO_LOG_DEBUG(util::log_component::Connection, "{} {} rejected: {}",
                          request.method, request.target, e.what());
        if (!writer_.headers_sent()) {
            writer_.simple_response(e.code(), e.what());
        } else {
            writer_.force_close();
        }
    } catch (const std::exception& e) {
        PORTICO_LOG_ERROR(util::log_component::Gateway, "Error serving {} {}: {}",
                          request.method, request.target, e.what());
        if (!writer_.headers_sent()) {
            writer_.simple_response(http::status::internal_server_error,
                                    "The server encountered an unexpected condition "
                                    "which prevented it from fulfilling the request.");
        } else {
            writer_.force_close();
        }
    }

    // The gateway may have started on the body after the headers went out
    if (!writer_.close_connection() && !request.body->finished()) {
        if (request.body->failed() || request.body->discard_requested()) {
            writer_.force_close();
        } else {
            try {
                request.body->drain();
            } catch (const http::HttpError& e) {
                PORTICO_LOG_DEBUG(util::log_component::Connection, "Unread body rejected: {}", e.what());
                writer_.force_close();
            }
        }
    }

    finish_request(request);
    return !writer_.close_connection() && !stop.stop_requested();
}

void Connection::reject(http::Status status, std::string_view message, const http::Request& request) {
    PORTICO_LOG_DEBUG(util::log_component::Connection, "Rejecting request from {}: {} {}",
                      transport_->peer().to_string(), status.code, message);
    writer_.simple_response(std::move(status), message);
    finish_request(request);
}

void Connection::finish_request(const http::Request& request) {
    requests_served_.fetch_add(1, std::memory_order_relaxed);
    stats_.request_completed();

    util::AccessLogEntry entry;
    entry.client = request.peer.to_string();
    entry.method = request.method;
    entry.target = request.target;
    entry.protocol = request.method.empty() ? std::string() : request.version.to_string();
    entry.status_code = writer_.status_code();
    entry.response_size = writer_.body_bytes();
    entry.latency = std::chrono::duration_cast<std::chrono::microseconds>(net::Clock::now() - request_start_);
    util::Logger::instance().access(entry);
}

} // namespace portico::server
