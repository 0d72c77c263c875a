/**
 * PORTICO - Embedded HTTP/1.x Server Core
 * Errors - Exception taxonomy shared by the parser, body readers and connection loop
 *
 * HttpError and its subclasses carry the status the connection answers with.
 * ConnectionError and its subclasses mean the peer is gone or unresponsive:
 * the connection is closed without a response.
 */

#ifndef PORTICO_HTTP_ERRORS_HPP
#define PORTICO_HTTP_ERRORS_HPP

#include <boost/beast/http/status.hpp>

#include <stdexcept>
#include <string>

namespace portico::http {

namespace beast = boost::beast;
using status = beast::http::status;

/**
 * Request-level failure that maps onto an error response
 */
class HttpError : public std::runtime_error {
public:
    HttpError(status code, const std::string& message)
        : std::runtime_error(message)
        , status_(code)
    {}

    status code() const noexcept { return status_; }

private:
    status status_;
};

/**
 * Malformed request line, header block or chunk framing (400)
 */
class BadRequest : public HttpError {
public:
    explicit BadRequest(const std::string& message)
        : HttpError(status::bad_request, message)
    {}
};

/**
 * Request body larger than the configured maximum (413)
 */
class PayloadTooLarge : public HttpError {
public:
    explicit PayloadTooLarge(const std::string& message)
        : HttpError(status::payload_too_large, message)
    {}
};

/**
 * Request line larger than the header budget (414)
 */
class UriTooLong : public HttpError {
public:
    explicit UriTooLong(const std::string& message)
        : HttpError(status::uri_too_long, message)
    {}
};

/**
 * Header block larger than the header budget (431)
 */
class HeaderFieldsTooLarge : public HttpError {
public:
    explicit HeaderFieldsTooLarge(const std::string& message)
        : HttpError(status::request_header_fields_too_large, message)
    {}
};

/**
 * Gateway broke the start_response contract
 */
class ProtocolViolation : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Transport failure: reset, broken pipe, closed socket
 */
class ConnectionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * A read or write did not complete before its deadline
 */
class TimeoutError : public ConnectionError {
public:
    using ConnectionError::ConnectionError;
};

/**
 * Peer closed the stream in the middle of a framed body
 */
class UnexpectedEof : public ConnectionError {
public:
    using ConnectionError::ConnectionError;
};

/**
 * TLS handshake did not complete
 */
class TlsHandshakeError : public ConnectionError {
public:
    using ConnectionError::ConnectionError;
};

/**
 * Client spoke plain HTTP to a TLS listener
 */
class NoSslError : public TlsHandshakeError {
public:
    using TlsHandshakeError::TlsHandshakeError;
};

} // namespace portico::http

#endif // PORTICO_HTTP_ERRORS_HPP
