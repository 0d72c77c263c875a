/**
 * PORTICO - Embedded HTTP/1.x Server Core
 * Gateway implementation
 */

#include "http/gateway.hpp"

namespace portico::http {

HandlerGateway::HandlerGateway(Handler handler)
    : handler_(std::move(handler))
{
}

Body HandlerGateway::handle(Request& request, StartResponse& start_response) {
    Response response = handler_(request);
    start_response(std::move(response.status), std::move(response.headers));
    return std::move(response.body);
}

} // namespace portico::http
