/**
 * PORTICO - Embedded HTTP/1.x Server Core
 * Transport implementation
 */

#include "net/transport.hpp"

#include <sys/socket.h>

#include <array>

namespace portico::net {

namespace {

constexpr auto linger_timeout = std::chrono::milliseconds(250);
constexpr std::size_t linger_max_bytes = 64 * 1024;

} // anonymous namespace

StreamTransport::StreamTransport(std::unique_ptr<asio::io_context> io_context,
                                 PeerInfo peer, int native_handle)
    : io_context_(std::move(io_context))
    , peer_(std::move(peer))
    , native_handle_(native_handle)
{
}

void StreamTransport::interrupt() noexcept {
    std::lock_guard<std::mutex> lock(close_mutex_);
    if (closed_ || native_handle_ < 0) {
        return;
    }
    // Wakes the owning worker's pending operation with end-of-stream
    ::shutdown(native_handle_, SHUT_RDWR);
}

bool StreamTransport::mark_closed() noexcept {
    std::lock_guard<std::mutex> lock(close_mutex_);
    if (closed_) {
        return false;
    }
    closed_ = true;
    return true;
}

bool StreamTransport::run_for(Clock::duration timeout, socket_type& socket) {
    io_context_->restart();
    io_context_->run_for(timeout);
    if (io_context_->stopped()) {
        return true;
    }

    boost::system::error_code ignored;
    socket.cancel(ignored);
    io_context_->restart();
    io_context_->run();
    return false;
}

void StreamTransport::lingering_close(socket_type& socket) noexcept {
    boost::system::error_code ec;
    if (!socket.is_open()) {
        return;
    }

    socket.shutdown(asio::socket_base::shutdown_send, ec);
    if (!ec) {
        std::array<char, 4096> scratch{};
        std::size_t discarded = 0;
        auto deadline = Clock::now() + linger_timeout;

        while (discarded < linger_max_bytes) {
            auto remaining = deadline - Clock::now();
            if (remaining <= Clock::duration::zero()) {
                break;
            }

            boost::system::error_code read_ec;
            std::size_t n = 0;
            socket.async_read_some(asio::buffer(scratch),
                [&](const boost::system::error_code& e, std::size_t bytes) {
                    read_ec = e;
                    n = bytes;
                });
            if (!run_for(remaining, socket) || read_ec || n == 0) {
                break;
            }
            discarded += n;
        }
    }

    socket.close(ec);
}

PlainTransport::PlainTransport(AcceptedSocket accepted)
    : StreamTransport(std::move(accepted.io_context), std::move(accepted.peer),
                      accepted.socket.native_handle())
    , socket_(std::move(accepted.socket))
{
}

PlainTransport::~PlainTransport() {
    close();
}

std::size_t PlainTransport::read_some(asio::mutable_buffer buffer, Clock::duration timeout) {
    return read_with_timeout(socket_, socket_, buffer, timeout);
}

void PlainTransport::write(asio::const_buffer buffer, Clock::duration timeout) {
    write_with_timeout(socket_, socket_, buffer, timeout);
}

void PlainTransport::close() noexcept {
    if (!mark_closed()) {
        return;
    }
    lingering_close(socket_);
}

} // namespace portico::net
