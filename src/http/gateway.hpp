/**
 * PORTICO - Embedded HTTP/1.x Server Core
 * Gateway - Application boundary and the start_response contract
 *
 * The connection calls Gateway::handle() once per request. The gateway must
 * call start_response exactly once before any body bytes are produced; the
 * returned Body is written after the status and headers. Bytes passed to
 * StartResponse::write() go out immediately, ahead of the returned Body.
 */

#ifndef PORTICO_HTTP_GATEWAY_HPP
#define PORTICO_HTTP_GATEWAY_HPP

#include "http/headers.hpp"
#include "http/request.hpp"
#include "http/response.hpp"

#include <exception>
#include <functional>
#include <string_view>

namespace portico::http {

/**
 * The start_response callable handed to the gateway
 */
class StartResponse {
public:
    virtual ~StartResponse() = default;

    /**
     * Record the status and headers of the response.
     *
     * A second call is only legal with `error` set: it replaces the pending
     * response if nothing has been sent yet, otherwise it rethrows `error`.
     * @throws ProtocolViolation on a second call without an error
     */
    virtual void start(Status status, Headers headers, std::exception_ptr error) = 0;

    /**
     * Write body bytes immediately, sending the headers first if needed
     * @throws ProtocolViolation if start() has not been called
     */
    virtual void write(std::string_view data) = 0;

    void operator()(Status status, Headers headers, std::exception_ptr error = nullptr) {
        start(std::move(status), std::move(headers), std::move(error));
    }
};

/**
 * Application interface
 */
class Gateway {
public:
    virtual ~Gateway() = default;

    virtual Body handle(Request& request, StartResponse& start_response) = 0;
};

/**
 * Adapts a plain `Request -> Response` function to the gateway contract
 */
class HandlerGateway final : public Gateway {
public:
    using Handler = std::function<Response(Request&)>;

    explicit HandlerGateway(Handler handler);

    Body handle(Request& request, StartResponse& start_response) override;

private:
    Handler handler_;
};

} // namespace portico::http

#endif // PORTICO_HTTP_GATEWAY_HPP
