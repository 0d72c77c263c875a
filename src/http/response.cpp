/**
 * PORTICO - Embedded HTTP/1.x Server Core
 * Response implementation
 */

#include "http/response.hpp"

#include <boost/beast/http/status.hpp>

#include <cctype>
#include <stdexcept>

namespace portico::http {

Status::Status(status s)
    : code(static_cast<int>(s))
    , reason(std::string(beast::http::obsolete_reason(s)))
{
}

Status::Status(int code, std::string reason)
    : code(code)
    , reason(std::move(reason))
{
}

Status Status::parse(std::string_view text) {
    if (text.size() < 3 || !std::isdigit(static_cast<unsigned char>(text[0])) ||
        !std::isdigit(static_cast<unsigned char>(text[1])) ||
        !std::isdigit(static_cast<unsigned char>(text[2])) ||
        (text.size() > 3 && text[3] != ' ')) {
        throw std::invalid_argument("Invalid status line: " + std::string(text));
    }
    int code = (text[0] - '0') * 100 + (text[1] - '0') * 10 + (text[2] - '0');
    if (code < 100) {
        throw std::invalid_argument("Invalid status code: " + std::string(text));
    }
    std::string reason = text.size() > 4 ? std::string(text.substr(4)) : std::string();
    if (reason.empty()) {
        auto known = beast::http::int_to_status(static_cast<unsigned>(code));
        reason = known == status::unknown ? std::string("Unknown") : std::string(beast::http::obsolete_reason(known));
    }
    return Status(code, std::move(reason));
}

std::string Status::to_string() const {
    return std::to_string(code) + " " + reason;
}

Body::Body(std::string data)
    : data_(std::move(data))
{
}

Body::Body(const char* data)
    : data_(data)
{
}

Body::Body(BodyProducer producer)
    : producer_(std::move(producer))
{
}

std::optional<std::string> Body::next() {
    if (producer_) {
        return producer_();
    }
    if (consumed_) {
        return std::nullopt;
    }
    consumed_ = true;
    return std::move(data_);
}

std::optional<std::size_t> Body::size() const noexcept {
    if (producer_) {
        return std::nullopt;
    }
    return data_.size();
}

Response Response::text(Status status, std::string body) {
    Response response;
    response.status = std::move(status);
    response.headers.add("Content-Type", "text/plain");
    response.headers.add("Content-Length", std::to_string(body.size()));
    response.body = Body(std::move(body));
    return response;
}

} // namespace portico::http
