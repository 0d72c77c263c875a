/**
 * PORTICO - Embedded HTTP/1.x Server Core
 * Response - Status line, headers and body source
 */

#ifndef PORTICO_HTTP_RESPONSE_HPP
#define PORTICO_HTTP_RESPONSE_HPP

#include "http/errors.hpp"
#include "http/headers.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace portico::http {

/**
 * Status code with its reason phrase
 */
struct Status {
    int code{200};
    std::string reason{"OK"};

    Status() = default;
    Status(status s);  // NOLINT: implicit by intent, Status{status::ok}
    Status(int code, std::string reason);

    /**
     * Parse "200 OK" (the reason may be empty; an unknown reason is kept)
     * @throws std::invalid_argument if the code is not three digits
     */
    static Status parse(std::string_view text);

    /**
     * "200 OK"
     */
    std::string to_string() const;

    bool operator==(const Status& other) const noexcept { return code == other.code; }
};

/**
 * Produces the next piece of a streamed body, or nullopt at the end
 */
using BodyProducer = std::function<std::optional<std::string>()>;

/**
 * Response body: a fixed byte string or a lazy producer
 */
class Body {
public:
    Body() = default;
    Body(std::string data);          // NOLINT: implicit by intent
    Body(const char* data);          // NOLINT
    Body(BodyProducer producer);     // NOLINT

    bool is_streaming() const noexcept { return static_cast<bool>(producer_); }

    /**
     * Next piece of the body; a fixed body yields its bytes once
     */
    std::optional<std::string> next();

    /**
     * Size of a fixed body; nullopt for a producer
     */
    std::optional<std::size_t> size() const noexcept;

private:
    std::string data_;
    bool consumed_{false};
    BodyProducer producer_;
};

/**
 * Complete response, used by HandlerGateway
 */
struct Response {
    Status status;
    Headers headers;
    Body body;

    /**
     * text/plain response with Content-Length set
     */
    static Response text(Status status, std::string body);
};

} // namespace portico::http

#endif // PORTICO_HTTP_RESPONSE_HPP
