/**
 * PORTICO - Embedded HTTP/1.x Server Core
 * Request parser - Request line, header block and body framing
 */

#ifndef PORTICO_HTTP_REQUEST_PARSER_HPP
#define PORTICO_HTTP_REQUEST_PARSER_HPP

#include "http/headers.hpp"
#include "http/request.hpp"
#include "http/uri.hpp"
#include "net/buffered_stream.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace portico::http {

struct RequestLine {
    std::string method;
    std::string target;
    HttpVersion version;
    RequestTarget parsed;
};

struct ParserLimits {
    std::size_t max_header_size{65536};  // Request line plus headers; 0 for unlimited
    bool strict_mode{true};              // Method must be upper case
};

/**
 * Reads one request head from a buffered stream
 *
 * One parser is used per request: the header budget covers the request
 * line and the header block together.
 */
class RequestParser {
public:
    RequestParser(net::BufferedStream& stream, const ParserLimits& limits);

    /**
     * @return nullopt if the peer closed the connection before sending anything
     * @throws HttpError (400, 405, 414, 505)
     */
    std::optional<RequestLine> parse_request_line();

    /**
     * Read header lines up to and including the blank line
     * @throws BadRequest, HeaderFieldsTooLarge
     */
    Headers parse_headers();

    std::size_t bytes_consumed() const noexcept { return consumed_; }

private:
    /**
     * Read one line against the remaining header budget
     * @return Line including its terminator; empty only at end of stream
     */
    std::string read_line(bool request_line);

    net::BufferedStream& stream_;
    ParserLimits limits_;
    std::size_t consumed_{0};
};

/**
 * How the request body is delimited
 */
struct BodyFraming {
    enum class Kind {
        None,
        Length,
        Chunked
    };

    Kind kind{Kind::None};
    std::uint64_t length{0};
};

/**
 * Decide body framing from the request headers
 *
 * @param max_body_size 0 for unlimited
 * @throws BadRequest for malformed or conflicting framing headers
 * @throws PayloadTooLarge if Content-Length exceeds the limit
 * @throws HttpError 501 for a transfer coding other than chunked
 */
BodyFraming determine_framing(const Headers& headers, HttpVersion version, std::uint64_t max_body_size);

/**
 * Persistent-connection default for the request
 */
bool wants_keep_alive(const Headers& headers, HttpVersion version);

/**
 * True for an HTTP/1.1 request carrying "Expect: 100-continue"
 */
bool expects_continue(const Headers& headers, HttpVersion version);

} // namespace portico::http

#endif // PORTICO_HTTP_REQUEST_PARSER_HPP
