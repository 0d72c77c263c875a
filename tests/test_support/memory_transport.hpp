/**
 * PORTICO - Embedded HTTP/1.x Server Core
 * Test support - scripted in-memory transport
 */

#ifndef PORTICO_TESTS_MEMORY_TRANSPORT_HPP
#define PORTICO_TESTS_MEMORY_TRANSPORT_HPP

#include "http/errors.hpp"
#include "net/transport.hpp"

#include <algorithm>
#include <atomic>
#include <cstring>
#include <string>

namespace portico::test {

/**
 * Transport fed from a fixed input string
 *
 * Reads hand out at most `segment` bytes at a time (0 = as much as fits).
 * At the end of the input a read reports EOF, or a timeout when
 * `hang_at_end` is set. Everything written is captured in output().
 */
class MemoryTransport final : public net::Transport {
public:
    explicit MemoryTransport(std::string input, std::size_t segment = 0, bool hang_at_end = false)
        : input_(std::move(input))
        , segment_(segment)
        , hang_at_end_(hang_at_end)
    {
        peer_.address = "127.0.0.1";
        peer_.port = 40000;
    }

    void handshake(net::Clock::duration) override {}

    std::size_t read_some(boost::asio::mutable_buffer buffer, net::Clock::duration) override {
        ++reads_;
        if (closed_ || interrupted_) {
            return 0;
        }
        if (pos_ == input_.size()) {
            if (hang_at_end_) {
                throw http::TimeoutError("Read timed out");
            }
            return 0;
        }
        std::size_t n = std::min(buffer.size(), input_.size() - pos_);
        if (segment_ > 0) {
            n = std::min(n, segment_);
        }
        std::memcpy(buffer.data(), input_.data() + pos_, n);
        pos_ += n;
        return n;
    }

    void write(boost::asio::const_buffer buffer, net::Clock::duration) override {
        if (fail_writes_) {
            throw http::ConnectionError("Write failed: broken pipe");
        }
        output_.append(static_cast<const char*>(buffer.data()), buffer.size());
        ++writes_;
    }

    void close() noexcept override { closed_ = true; }
    void interrupt() noexcept override { interrupted_ = true; }
    bool is_secure() const noexcept override { return false; }
    const net::PeerInfo& peer() const noexcept override { return peer_; }

    void fail_writes() noexcept { fail_writes_ = true; }

    const std::string& output() const noexcept { return output_; }
    std::size_t consumed() const noexcept { return pos_; }
    std::size_t reads() const noexcept { return reads_; }
    std::size_t writes() const noexcept { return writes_; }
    bool closed() const noexcept { return closed_; }
    bool interrupted() const noexcept { return interrupted_; }

private:
    std::string input_;
    std::size_t segment_;
    bool hang_at_end_;
    std::size_t pos_{0};
    std::size_t reads_{0};
    std::size_t writes_{0};
    std::string output_;
    std::atomic<bool> closed_{false};
    std::atomic<bool> interrupted_{false};
    bool fail_writes_{false};
    net::PeerInfo peer_;
};

/**
 * Count non-overlapping occurrences of `needle`
 */
inline std::size_t count_of(std::string_view haystack, std::string_view needle) {
    std::size_t count = 0;
    for (auto pos = haystack.find(needle); pos != std::string_view::npos;
         pos = haystack.find(needle, pos + needle.size())) {
        ++count;
    }
    return count;
}

} // namespace portico::test

#endif // PORTICO_TESTS_MEMORY_TRANSPORT_HPP
