/**
 * PORTICO - Embedded HTTP/1.x Server Core
 * Buffered stream implementation
 */

#include "net/buffered_stream.hpp"

#include <algorithm>
#include <array>

namespace portico::net {

BufferedStream::BufferedStream(Transport& transport)
    : transport_(transport)
{
}

std::size_t BufferedStream::peek() {
    if (buffered() == 0) {
        fill();
    }
    return buffered();
}

std::string BufferedStream::read(std::size_t max_bytes) {
    if (max_bytes == 0) {
        return {};
    }
    if (buffered() == 0 && fill() == 0) {
        return {};
    }
    return take(std::min(max_bytes, buffered()));
}

std::string BufferedStream::read_line(std::size_t limit) {
    std::size_t scanned = 0;
    while (true) {
        auto view = std::string_view(rbuf_).substr(rpos_);
        auto newline = view.find('\n', scanned);
        if (newline != std::string_view::npos) {
            return take(std::min(newline + 1, limit));
        }
        if (view.size() >= limit) {
            return take(limit);
        }
        scanned = view.size();
        if (fill() == 0) {
            return take(buffered());
        }
    }
}

std::string BufferedStream::read_exact(std::size_t count) {
    while (buffered() < count) {
        if (fill() == 0) {
            throw http::UnexpectedEof("Connection closed after " + std::to_string(buffered()) +
                                      " of " + std::to_string(count) + " expected bytes");
        }
    }
    return take(count);
}

void BufferedStream::write(std::string_view data) {
    wbuf_.append(data);
    if (wbuf_.size() >= block_size) {
        flush();
    }
}

void BufferedStream::flush() {
    if (wbuf_.empty()) {
        return;
    }
    std::string pending;
    pending.swap(wbuf_);
    transport_.write(asio::buffer(pending), timeout_);
    bytes_written_.fetch_add(pending.size(), std::memory_order_relaxed);
}

void BufferedStream::close() noexcept {
    wbuf_.clear();
    transport_.close();
}

std::size_t BufferedStream::fill() {
    // Compact once the consumed prefix dominates the buffer
    if (rpos_ > 0 && rpos_ >= rbuf_.size() / 2) {
        rbuf_.erase(0, rpos_);
        rpos_ = 0;
    }

    std::array<char, block_size> block;
    auto n = transport_.read_some(asio::buffer(block), read_timeout());
    rbuf_.append(block.data(), n);
    bytes_read_.fetch_add(n, std::memory_order_relaxed);
    return n;
}

Clock::duration BufferedStream::read_timeout() const {
    if (!deadline_) {
        return timeout_;
    }
    auto remaining = *deadline_ - Clock::now();
    if (remaining <= Clock::duration::zero()) {
        throw http::TimeoutError("Read deadline expired");
    }
    return std::min(timeout_, remaining);
}

std::string BufferedStream::take(std::size_t count) {
    std::string out = rbuf_.substr(rpos_, count);
    rpos_ += out.size();
    if (rpos_ == rbuf_.size()) {
        rbuf_.clear();
        rpos_ = 0;
    }
    return out;
}

} // namespace portico::net
