/**
 * PORTICO - Embedded HTTP/1.x Server Core
 * Chunked transfer coding implementation
 */

#include "http/chunked.hpp"

#include "http/headers.hpp"

#include <fmt/format.h>

namespace portico::http {

std::optional<std::uint64_t> parse_chunk_size(std::string_view line) {
    if (line.size() >= 2 && line.substr(line.size() - 2) == "\r\n") {
        line.remove_suffix(2);
    }
    if (auto semicolon = line.find(';'); semicolon != std::string_view::npos) {
        line = line.substr(0, semicolon);
    }
    line = trim_ows(line);

    if (line.empty() || line.size() > 16) {
        return std::nullopt;
    }

    std::uint64_t size = 0;
    for (char c : line) {
        std::uint64_t digit;
        if (c >= '0' && c <= '9') {
            digit = static_cast<std::uint64_t>(c - '0');
        } else if (c >= 'a' && c <= 'f') {
            digit = static_cast<std::uint64_t>(c - 'a' + 10);
        } else if (c >= 'A' && c <= 'F') {
            digit = static_cast<std::uint64_t>(c - 'A' + 10);
        } else {
            return std::nullopt;
        }
        size = (size << 4) | digit;
    }
    return size;
}

std::string encode_chunk(std::string_view data) {
    if (data.empty()) {
        return {};
    }
    return fmt::format("{:x}\r\n{}\r\n", data.size(), data);
}

} // namespace portico::http
