/**
 * PORTICO - Embedded HTTP/1.x Server Core
 * Request parser implementation
 */

#include "http/request_parser.hpp"

#include "http/errors.hpp"

#include <boost/beast/core/string.hpp>

#include <algorithm>
#include <cctype>
#include <limits>

namespace portico::http {

namespace {

bool ends_with_crlf(std::string_view line) {
    return line.size() >= 2 && line.substr(line.size() - 2) == "\r\n";
}

bool all_digits(std::string_view text) {
    return !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char c) {
        return std::isdigit(c);
    });
}

/**
 * tchar per RFC 7230 section 3.2.6
 */
bool is_token_char(unsigned char c) {
    if (std::isalnum(c)) {
        return true;
    }
    switch (c) {
        case '!': case '#': case '$': case '%': case '&': case '\'': case '*':
        case '+': case '-': case '.': case '^': case '_': case '`': case '|': case '~':
            return true;
        default:
            return false;
    }
}

HttpVersion parse_protocol(std::string_view protocol) {
    if (protocol.substr(0, 5) != "HTTP/") {
        throw BadRequest("Malformed Request-Line: bad protocol");
    }
    auto numbers = protocol.substr(5);
    auto dot = numbers.find('.');
    if (dot == std::string_view::npos) {
        throw BadRequest("Malformed Request-Line: bad version");
    }
    auto major = numbers.substr(0, dot);
    auto minor = numbers.substr(dot + 1);
    if (!all_digits(major) || !all_digits(minor) || major.size() > 3 || minor.size() > 3) {
        throw BadRequest("Malformed Request-Line: bad version");
    }
    return HttpVersion{std::stoi(std::string(major)), std::stoi(std::string(minor))};
}

} // anonymous namespace

RequestParser::RequestParser(net::BufferedStream& stream, const ParserLimits& limits)
    : stream_(stream)
    , limits_(limits)
{
}

std::string RequestParser::read_line(bool request_line) {
    if (limits_.max_header_size == 0) {
        auto line = stream_.read_line(std::numeric_limits<std::size_t>::max());
        consumed_ += line.size();
        return line;
    }

    std::size_t remaining = limits_.max_header_size > consumed_ ? limits_.max_header_size - consumed_ : 0;
    auto line = stream_.read_line(remaining + 1);
    if (line.size() > remaining) {
        if (request_line) {
            throw UriTooLong("The Request-URI sent with the request exceeds the maximum allowed bytes.");
        }
        throw HeaderFieldsTooLarge("The entire request header exceeds the maximum allowed bytes.");
    }
    consumed_ += line.size();
    return line;
}

std::optional<RequestLine> RequestParser::parse_request_line() {
    std::string line = read_line(true);
    if (line.empty()) {
        return std::nullopt;
    }
    if (line == "\r\n") {
        // Tolerate one stray CRLF left behind by a previous request
        line = read_line(true);
        if (line.empty()) {
            return std::nullopt;
        }
    }
    if (!ends_with_crlf(line)) {
        throw BadRequest("HTTP requires CRLF terminators");
    }

    std::string_view content(line.data(), line.size() - 2);
    auto first = content.find(' ');
    auto second = first == std::string_view::npos ? first : content.find(' ', first + 1);
    if (first == std::string_view::npos || second == std::string_view::npos ||
        content.find(' ', second + 1) != std::string_view::npos ||
        first == 0 || second == first + 1 || second + 1 == content.size()) {
        throw BadRequest("Malformed Request-Line");
    }

    RequestLine result;
    result.method = std::string(content.substr(0, first));
    result.target = std::string(content.substr(first + 1, second - first - 1));
    result.version = parse_protocol(content.substr(second + 1));

    if (result.version.major != 1 || result.version > http_1_1) {
        throw HttpError(status::http_version_not_supported, "Cannot fulfill request");
    }

    if (!std::all_of(result.method.begin(), result.method.end(),
                     [](unsigned char c) { return is_token_char(c); })) {
        throw BadRequest("Malformed method name");
    }
    if (limits_.strict_mode &&
        std::any_of(result.method.begin(), result.method.end(),
                    [](unsigned char c) { return std::islower(c); })) {
        throw BadRequest("Malformed method name: method names are case-sensitive and uppercase.");
    }

    result.parsed = parse_target(result.method, result.target);
    return result;
}

Headers RequestParser::parse_headers() {
    Headers headers;
    while (true) {
        std::string line = read_line(false);
        if (line.empty() || line.back() != '\n') {
            throw BadRequest("Illegal end of headers.");
        }
        if (line == "\r\n") {
            return headers;
        }
        if (!ends_with_crlf(line)) {
            throw BadRequest("HTTP requires CRLF terminators");
        }

        std::string_view content(line.data(), line.size() - 2);
        if (content.front() == ' ' || content.front() == '\t') {
            if (!headers.extend_last(trim_ows(content))) {
                throw BadRequest("Illegal header line.");
            }
            continue;
        }

        auto colon = content.find(':');
        if (colon == std::string_view::npos) {
            throw BadRequest("Illegal header line.");
        }
        auto name = content.substr(0, colon);
        if (name.empty() || !std::all_of(name.begin(), name.end(),
                                         [](unsigned char c) { return is_token_char(c); })) {
            throw BadRequest("Illegal header line.");
        }
        headers.add(std::string(name), std::string(trim_ows(content.substr(colon + 1))));
    }
}

BodyFraming determine_framing(const Headers& headers, HttpVersion version, std::uint64_t max_body_size) {
    bool chunked = false;
    if (version >= http_1_1) {
        if (auto te = headers.get_combined("Transfer-Encoding")) {
            std::string_view codings(*te);
            while (!codings.empty()) {
                auto comma = codings.find(',');
                auto coding = trim_ows(codings.substr(0, comma));
                codings = comma == std::string_view::npos ? std::string_view{} : codings.substr(comma + 1);
                if (coding.empty()) {
                    continue;
                }
                if (!boost::beast::iequals(coding, "chunked")) {
                    throw HttpError(status::not_implemented,
                                    "Unknown transfer encoding: " + std::string(coding));
                }
                chunked = true;
            }
        }
    }

    auto lengths = headers.get_all("Content-Length");
    std::optional<std::uint64_t> length;
    for (auto value : lengths) {
        value = trim_ows(value);
        if (!all_digits(value) || value.size() > 19) {
            throw BadRequest("Malformed Content-Length Header.");
        }
        auto parsed = std::stoull(std::string(value));
        if (length && *length != parsed) {
            throw BadRequest("Conflicting Content-Length headers.");
        }
        length = parsed;
    }

    if (chunked) {
        if (length) {
            throw BadRequest("Both Content-Length and chunked Transfer-Encoding present.");
        }
        return BodyFraming{BodyFraming::Kind::Chunked, 0};
    }

    if (!length || *length == 0) {
        return BodyFraming{};
    }
    if (max_body_size > 0 && *length > max_body_size) {
        throw PayloadTooLarge("The entity sent with the request exceeds the maximum allowed bytes.");
    }
    return BodyFraming{BodyFraming::Kind::Length, *length};
}

bool wants_keep_alive(const Headers& headers, HttpVersion version) {
    if (version >= http_1_1) {
        return !headers.has_token("Connection", "close");
    }
    return headers.has_token("Connection", "keep-alive");
}

bool expects_continue(const Headers& headers, HttpVersion version) {
    if (version < http_1_1) {
        return false;
    }
    auto expect = headers.get("Expect");
    return expect && boost::beast::iequals(trim_ows(*expect), "100-continue");
}

} // namespace portico::http
