/**
 * PORTICO - Embedded HTTP/1.x Server Core
 * Buffered stream - Block-buffered reads and writes over a Transport
 */

#ifndef PORTICO_NET_BUFFERED_STREAM_HPP
#define PORTICO_NET_BUFFERED_STREAM_HPP

#include "net/transport.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace portico::net {

/**
 * Buffered socket wrapper
 *
 * Reads are served from an internal buffer refilled in `block_size` pieces.
 * Writes accumulate until flush() or until a block is full. Every socket
 * operation uses the current timeout, shortened to the deadline if one is set.
 *
 * All errors surface as exceptions: http::ConnectionError for I/O failures,
 * http::TimeoutError when the timeout or deadline expires. Nothing is retried.
 */
class BufferedStream {
public:
    static constexpr std::size_t block_size = 8192;

    explicit BufferedStream(Transport& transport);

    BufferedStream(const BufferedStream&) = delete;
    BufferedStream& operator=(const BufferedStream&) = delete;

    /**
     * Timeout applied to each individual socket operation
     */
    void set_timeout(Clock::duration timeout) noexcept { timeout_ = timeout; }

    /**
     * Absolute limit for reads, regardless of the per-operation timeout
     */
    void set_deadline(std::optional<Clock::time_point> deadline) noexcept { deadline_ = deadline; }

    /**
     * Make sure at least one byte is buffered
     * @return Buffered byte count, 0 on clean end of stream
     */
    std::size_t peek();

    /**
     * Read up to `max_bytes`; blocks until at least one byte is available
     * @return Empty string only on clean end of stream
     */
    std::string read(std::size_t max_bytes);

    /**
     * Read through the next LF, stopping early after `limit` bytes or at end of stream
     */
    std::string read_line(std::size_t limit);

    /**
     * Read exactly `count` bytes
     * @throws http::UnexpectedEof if the stream ends first
     */
    std::string read_exact(std::size_t count);

    /**
     * Queue bytes for sending; flushes when a block is full
     */
    void write(std::string_view data);

    /**
     * Send everything queued
     */
    void flush();

    /**
     * Close the underlying transport
     */
    void close() noexcept;

    std::size_t buffered() const noexcept { return rbuf_.size() - rpos_; }

    std::uint64_t bytes_read() const noexcept { return bytes_read_.load(std::memory_order_relaxed); }
    std::uint64_t bytes_written() const noexcept { return bytes_written_.load(std::memory_order_relaxed); }

    Transport& transport() noexcept { return transport_; }

private:
    /**
     * Pull one block from the transport
     * @return Bytes added, 0 on end of stream
     */
    std::size_t fill();

    Clock::duration read_timeout() const;
    std::string take(std::size_t count);

    Transport& transport_;
    Clock::duration timeout_{std::chrono::seconds(10)};
    std::optional<Clock::time_point> deadline_;

    std::string rbuf_;
    std::size_t rpos_{0};
    std::string wbuf_;

    // Read by statistics from other threads
    std::atomic<std::uint64_t> bytes_read_{0};
    std::atomic<std::uint64_t> bytes_written_{0};
};

} // namespace portico::net

#endif // PORTICO_NET_BUFFERED_STREAM_HPP
