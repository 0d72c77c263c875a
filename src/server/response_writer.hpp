/**
 * PORTICO - Embedded HTTP/1.x Server Core
 * Response writer - start_response implementation and response framing
 */

#ifndef PORTICO_SERVER_RESPONSE_WRITER_HPP
#define PORTICO_SERVER_RESPONSE_WRITER_HPP

#include "http/gateway.hpp"
#include "http/request.hpp"
#include "net/buffered_stream.hpp"
#include "server/server_config.hpp"

#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <string_view>

namespace portico::server {

/**
 * Writes one response at a time onto a connection
 *
 * Decides framing when the headers go out: Content-Length as declared by
 * the gateway, else chunked for HTTP/1.1, else close-delimited. Adds the
 * Connection, Keep-Alive, Date and Server headers.
 */
class ResponseWriter final : public http::StartResponse {
public:
    ResponseWriter(net::BufferedStream& stream, const ServerConfig& config);

    /**
     * Reset for a new request
     * @param keep_alive Whether the request allows the connection to persist
     */
    void prepare(const http::Request& request, bool keep_alive, bool expect_continue);

    void start(http::Status status, http::Headers headers, std::exception_ptr error) override;
    void write(std::string_view data) override;

    /**
     * Write every piece of a gateway body
     */
    void send_body(http::Body& body);

    /**
     * Complete the response: headers if still pending, the last chunk, flush
     * @throws http::ProtocolViolation if start_response was never called
     */
    void finish();

    /**
     * Plain-text error response; always closes the connection afterwards
     */
    void simple_response(http::Status status, std::string_view message);

    /**
     * Send "100 Continue" (at most once per request)
     */
    void send_continue();

    bool started() const noexcept { return started_; }
    bool headers_sent() const noexcept { return headers_sent_; }
    bool close_connection() const noexcept { return close_connection_; }
    void force_close() noexcept { close_connection_ = true; }

    int status_code() const noexcept { return status_.code; }
    std::uint64_t body_bytes() const noexcept { return written_; }

private:
    void send_headers();

    /**
     * Settle the unread request body before the response goes out
     */
    void settle_request_body();

    net::BufferedStream& stream_;
    const ServerConfig& config_;

    http::BodyReader* request_body_{nullptr};
    http::HttpVersion response_version_;
    bool head_request_{false};
    bool expect_continue_{false};

    http::Status status_;
    http::Headers headers_;
    std::optional<std::uint64_t> content_length_;
    std::uint64_t written_{0};

    bool started_{false};
    bool headers_sent_{false};
    bool chunked_{false};
    bool continue_sent_{false};
    bool close_connection_{false};
};

/**
 * Current time as an RFC 1123 date ("Sun, 06 Nov 1994 08:49:37 GMT")
 */
std::string http_date();

} // namespace portico::server

#endif // PORTICO_SERVER_RESPONSE_WRITER_HPP
