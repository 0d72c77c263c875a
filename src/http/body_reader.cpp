/**
 * PORTICO - Embedded HTTP/1.x Server Core
 * Body reader implementation
 */

#include "http/body_reader.hpp"

#include "http/chunked.hpp"
#include "http/errors.hpp"

#include <algorithm>

namespace portico::http {

// BodyReader

std::string BodyReader::read(std::size_t max_bytes) {
    if (failed_) {
        throw ConnectionError("Request body is unusable after an earlier error");
    }
    if (max_bytes == 0 || finished()) {
        return {};
    }

    if (!started_) {
        started_ = true;
        if (first_read_hook_) {
            first_read_hook_();
        }
    }

    try {
        std::string data = do_read(max_bytes);
        consumed_ += data.size();
        return data;
    } catch (...) {
        failed_ = true;
        throw;
    }
}

std::string BodyReader::read_all() {
    std::string body;
    while (!finished()) {
        body += read(default_read_size);
    }
    return body;
}

void BodyReader::drain() {
    while (!finished()) {
        read(default_read_size);
    }
}

const Headers& BodyReader::trailers() const noexcept {
    static const Headers none;
    return none;
}

// LengthBodyReader

LengthBodyReader::LengthBodyReader(net::BufferedStream& stream, std::uint64_t length)
    : stream_(stream)
    , remaining_(length)
{
}

std::string LengthBodyReader::do_read(std::size_t max_bytes) {
    auto wanted = static_cast<std::size_t>(std::min<std::uint64_t>(max_bytes, remaining_));
    std::string data = stream_.read(wanted);
    if (data.empty()) {
        throw UnexpectedEof("Connection closed with " + std::to_string(remaining_) +
                            " body bytes outstanding");
    }
    remaining_ -= data.size();
    return data;
}

// ChunkedBodyReader

ChunkedBodyReader::ChunkedBodyReader(net::BufferedStream& stream, std::uint64_t max_body_size,
                                     std::size_t max_line_size)
    : stream_(stream)
    , max_body_size_(max_body_size)
    , max_line_size_(max_line_size)
{
}

std::string ChunkedBodyReader::do_read(std::size_t max_bytes) {
    if (chunk_remaining_ == 0 && !next_chunk()) {
        return {};
    }

    auto wanted = static_cast<std::size_t>(std::min<std::uint64_t>(max_bytes, chunk_remaining_));
    std::string data = stream_.read(wanted);
    if (data.empty()) {
        throw UnexpectedEof("Connection closed inside a chunk");
    }
    chunk_remaining_ -= data.size();
    if (chunk_remaining_ == 0) {
        expect_crlf();
    }
    return data;
}

bool ChunkedBodyReader::next_chunk() {
    std::string line = stream_.read_line(max_line_size_);
    if (line.empty()) {
        throw UnexpectedEof("Connection closed before the next chunk size");
    }
    if (line.back() != '\n') {
        if (line.size() >= max_line_size_) {
            throw BadRequest("Chunk size line too long");
        }
        throw UnexpectedEof("Connection closed inside a chunk size line");
    }
    if (line.size() < 2 || line[line.size() - 2] != '\r') {
        throw BadRequest("HTTP requires CRLF terminators");
    }

    auto size = parse_chunk_size(line);
    if (!size) {
        throw BadRequest("Bad chunked transfer size: " + line.substr(0, line.size() - 2));
    }

    if (*size == 0) {
        read_trailers();
        done_ = true;
        return false;
    }

    // Checked on the declared size so an oversized chunk is refused before any of it is read.
    // declared_total_ never exceeds the limit, so the subtraction cannot wrap.
    if (max_body_size_ > 0 && *size > max_body_size_ - declared_total_) {
        throw PayloadTooLarge("Chunked request body exceeds " + std::to_string(max_body_size_) + " bytes");
    }
    declared_total_ += *size;
    chunk_remaining_ = *size;
    return true;
}

void ChunkedBodyReader::expect_crlf() {
    if (stream_.read_exact(2) != "\r\n") {
        throw BadRequest("Bad chunked transfer coding (expected CRLF after chunk data)");
    }
}

void ChunkedBodyReader::read_trailers() {
    std::size_t total = 0;
    while (true) {
        std::string line = stream_.read_line(max_line_size_);
        if (line.empty()) {
            throw UnexpectedEof("Connection closed inside the chunked trailer");
        }
        total += line.size();
        if (line.back() != '\n' || total > max_line_size_) {
            if (line.back() != '\n' && line.size() < max_line_size_) {
                throw UnexpectedEof("Connection closed inside the chunked trailer");
            }
            throw BadRequest("Chunked trailer section too large");
        }
        if (line.size() < 2 || line[line.size() - 2] != '\r') {
            throw BadRequest("HTTP requires CRLF terminators");
        }
        std::string_view content(line.data(), line.size() - 2);
        if (content.empty()) {
            return;
        }

        if (content.front() == ' ' || content.front() == '\t') {
            if (!trailers_.extend_last(trim_ows(content))) {
                throw BadRequest("Illegal trailer line.");
            }
            continue;
        }

        auto colon = content.find(':');
        if (colon == std::string_view::npos) {
            throw BadRequest("Illegal trailer line.");
        }
        auto name = trim_ows(content.substr(0, colon));
        if (name.empty()) {
            throw BadRequest("Illegal trailer line.");
        }
        trailers_.add(std::string(name), std::string(trim_ows(content.substr(colon + 1))));
    }
}

} // namespace portico::http
