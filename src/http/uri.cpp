/**
 * PORTICO - Embedded HTTP/1.x Server Core
 * Request target implementation
 */

#include "http/uri.hpp"

#include "http/errors.hpp"

#include <cctype>

namespace portico::http {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

/**
 * "scheme://..." per RFC 3986: ALPHA *( ALPHA / DIGIT / "+" / "-" / "." ) ":"
 */
bool has_scheme(std::string_view target) {
    auto colon = target.find("://");
    if (colon == std::string_view::npos || colon == 0) {
        return false;
    }
    if (!std::isalpha(static_cast<unsigned char>(target[0]))) {
        return false;
    }
    for (std::size_t i = 1; i < colon; ++i) {
        auto c = static_cast<unsigned char>(target[i]);
        if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') {
            return false;
        }
    }
    return true;
}

} // anonymous namespace

std::string decode_path(std::string_view path) {
    std::string out;
    out.reserve(path.size());

    for (std::size_t i = 0; i < path.size(); ++i) {
        if (path[i] != '%' || i + 2 >= path.size()) {
            out.push_back(path[i]);
            continue;
        }
        int hi = hex_value(path[i + 1]);
        int lo = hex_value(path[i + 2]);
        if (hi < 0 || lo < 0) {
            out.push_back(path[i]);
            continue;
        }
        char decoded = static_cast<char>((hi << 4) | lo);
        if (decoded == '/') {
            out.append("%2F");
        } else {
            out.push_back(decoded);
        }
        i += 2;
    }
    return out;
}

RequestTarget parse_target(std::string_view method, std::string_view target) {
    if (method == "CONNECT") {
        throw HttpError(status::method_not_allowed, "CONNECT method is not supported.");
    }
    if (target.empty()) {
        throw BadRequest("Missing Request-URI.");
    }
    if (target == "*") {
        if (method != "OPTIONS") {
            throw BadRequest("Invalid path in Request-URI.");
        }
        return RequestTarget{"*", ""};
    }
    if (target.find('#') != std::string_view::npos) {
        throw BadRequest("Illegal #fragment in Request-URI.");
    }
    if (has_scheme(target)) {
        throw BadRequest("Absolute URI not allowed if server is not a proxy.");
    }
    if (target.front() != '/') {
        throw BadRequest("Invalid path in Request-URI.");
    }

    RequestTarget result;
    auto question = target.find('?');
    if (question != std::string_view::npos) {
        result.query = std::string(target.substr(question + 1));
        target = target.substr(0, question);
    }
    result.path = decode_path(target);
    return result;
}

} // namespace portico::http
