/**
 * PORTICO - Embedded HTTP/1.x Server Core
 * Transport - Blocking byte stream over an accepted socket, with per-operation timeouts
 *
 * Every accepted socket is bound to a private io_context. Blocking calls start
 * the matching asynchronous operation and run that io_context for at most the
 * requested timeout; an operation still pending afterwards is cancelled and
 * reported as a TimeoutError. This keeps timeouts inside the I/O call itself,
 * with no watchdog thread, and works identically for plain and TLS streams.
 */

#ifndef PORTICO_NET_TRANSPORT_HPP
#define PORTICO_NET_TRANSPORT_HPP

#include "http/errors.hpp"
#include "net/peer_info.hpp"

#include <utility>  // Boost.Asio awaitable.hpp uses std::exchange without including it
#include <boost/asio.hpp>
#include <boost/asio/ssl/error.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>

namespace portico::net {

namespace asio = boost::asio;
using stream_protocol = asio::generic::stream_protocol;
using socket_type = stream_protocol::socket;
using Clock = std::chrono::steady_clock;

/**
 * A socket fresh from accept(), still owned by its private io_context
 *
 * The io_context must outlive the socket, so it is declared first.
 */
struct AcceptedSocket {
    std::unique_ptr<asio::io_context> io_context;
    socket_type socket;
    PeerInfo peer;

    AcceptedSocket()
        : io_context(std::make_unique<asio::io_context>(1))
        , socket(*io_context)
    {}

    AcceptedSocket(AcceptedSocket&&) = default;
    AcceptedSocket& operator=(AcceptedSocket&&) = delete;
};

/**
 * Abstract byte stream used by the buffered stream and the connection loop
 */
class Transport {
public:
    virtual ~Transport() = default;

    /**
     * Complete any protocol handshake (no-op for plain sockets)
     * @throws http::TlsHandshakeError on failure
     */
    virtual void handshake(Clock::duration timeout) = 0;

    /**
     * Read at least one byte into `buffer`
     * @return Bytes read, 0 on clean end of stream
     * @throws http::TimeoutError, http::ConnectionError
     */
    virtual std::size_t read_some(asio::mutable_buffer buffer, Clock::duration timeout) = 0;

    /**
     * Write the whole buffer
     * @throws http::TimeoutError, http::ConnectionError
     */
    virtual void write(asio::const_buffer buffer, Clock::duration timeout) = 0;

    /**
     * Graceful close; idempotent
     */
    virtual void close() noexcept = 0;

    /**
     * Shut the socket down from another thread so a blocked operation returns.
     * Safe to call concurrently with any other member.
     */
    virtual void interrupt() noexcept = 0;

    virtual bool is_secure() const noexcept = 0;

    virtual std::optional<TlsInfo> tls_info() const { return std::nullopt; }

    virtual const PeerInfo& peer() const noexcept = 0;
};

/**
 * Shared machinery for transports backed by an Asio stream
 */
class StreamTransport : public Transport {
public:
    ~StreamTransport() override = default;

    StreamTransport(const StreamTransport&) = delete;
    StreamTransport& operator=(const StreamTransport&) = delete;

    void interrupt() noexcept override;

    const PeerInfo& peer() const noexcept override { return peer_; }

protected:
    StreamTransport(std::unique_ptr<asio::io_context> io_context, PeerInfo peer, int native_handle);

    /**
     * Run the private io_context until the pending operation finishes or the
     * timeout elapses. On timeout the socket's operations are cancelled and
     * their handlers run before returning.
     * @return false if the timeout elapsed
     */
    bool run_for(Clock::duration timeout, socket_type& socket);

    /**
     * Read with timeout from any Asio stream layered on `socket`
     */
    template<typename AsyncStream>
    std::size_t read_with_timeout(AsyncStream& stream, socket_type& socket,
                                  asio::mutable_buffer buffer, Clock::duration timeout);

    /**
     * Write the whole buffer with timeout to any Asio stream layered on `socket`
     */
    template<typename AsyncStream>
    void write_with_timeout(AsyncStream& stream, socket_type& socket,
                            asio::const_buffer buffer, Clock::duration timeout);

    /**
     * Half-close our side, discard what the peer still sends for a short
     * while, then close. Avoids a reset destroying the last response when
     * unread request bytes remain in the receive buffer.
     */
    void lingering_close(socket_type& socket) noexcept;

    /**
     * Mark the socket closed so interrupt() no longer touches the descriptor
     * @return false if it was already closed
     */
    bool mark_closed() noexcept;

    std::unique_ptr<asio::io_context> io_context_;
    PeerInfo peer_;

private:
    std::mutex close_mutex_;
    int native_handle_;
    bool closed_{false};
};

/**
 * Plain TCP or Unix-domain socket
 */
class PlainTransport final : public StreamTransport {
public:
    explicit PlainTransport(AcceptedSocket accepted);
    ~PlainTransport() override;

    void handshake(Clock::duration) override {}
    std::size_t read_some(asio::mutable_buffer buffer, Clock::duration timeout) override;
    void write(asio::const_buffer buffer, Clock::duration timeout) override;
    void close() noexcept override;
    bool is_secure() const noexcept override { return false; }

private:
    socket_type socket_;
};

template<typename AsyncStream>
std::size_t StreamTransport::read_with_timeout(AsyncStream& stream, socket_type& socket,
                                               asio::mutable_buffer buffer,
                                               Clock::duration timeout) {
    boost::system::error_code result;
    std::size_t transferred = 0;

    stream.async_read_some(buffer, [&](const boost::system::error_code& ec, std::size_t n) {
        result = ec;
        transferred = n;
    });

    bool completed = run_for(timeout, socket);
    if (!completed && result == asio::error::operation_aborted) {
        throw http::TimeoutError("Read timed out");
    }
    if (result == asio::error::eof || result == asio::ssl::error::stream_truncated) {
        return 0;
    }
    if (result) {
        throw http::ConnectionError("Read failed: " + result.message());
    }
    return transferred;
}

template<typename AsyncStream>
void StreamTransport::write_with_timeout(AsyncStream& stream, socket_type& socket,
                                         asio::const_buffer buffer, Clock::duration timeout) {
    boost::system::error_code result;

    asio::async_write(stream, buffer, [&](const boost::system::error_code& ec, std::size_t) {
        result = ec;
    });

    bool completed = run_for(timeout, socket);
    if (!completed && result == asio::error::operation_aborted) {
        throw http::TimeoutError("Write timed out");
    }
    if (result) {
        throw http::ConnectionError("Write failed: " + result.message());
    }
}

} // namespace portico::net

#endif // PORTICO_NET_TRANSPORT_HPP
