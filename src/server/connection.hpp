/**
 * PORTICO - Embedded HTTP/1.x Server Core
 * Connection - per-socket request loop run by a pool worker
 */

#ifndef PORTICO_SERVER_CONNECTION_HPP
#define PORTICO_SERVER_CONNECTION_HPP

#include "http/gateway.hpp"
#include "net/buffered_stream.hpp"
#include "net/transport.hpp"
#include "server/response_writer.hpp"
#include "server/server_config.hpp"
#include "server/worker_pool.hpp"
#include "util/server_stats.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <stop_token>
#include <string_view>

namespace portico::server {

enum class ConnectionState {
    AwaitingRequest,
    ReadingHeaders,
    ReadingBody,
    Dispatching,
    WritingResponse,
    KeepAlive,
    Closed
};

std::string_view to_string(ConnectionState state) noexcept;

/**
 * Connection - serves requests on one accepted socket until it closes
 *
 * Runs entirely on the worker that picked it up. Every socket operation
 * blocks with a timeout; the first request waits for the socket timeout,
 * later ones for the keep-alive timeout. Idle waits end silently.
 */
class Connection final : public PoolTask {
public:
    Connection(std::unique_ptr<net::Transport> transport,
               const ServerConfig& config,
               http::Gateway& gateway,
               util::ServerStats& stats,
               std::uint16_t server_port);
    ~Connection() override;

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    void run(std::stop_token stop) noexcept override;

    /**
     * Unblock the worker; called from the shutdown path
     */
    void interrupt() noexcept override;

    /**
     * Waiting for a request that has not started to arrive
     */
    bool is_idle() const noexcept override;

    /**
     * Close without serving; the pool refused or dropped the connection
     */
    void abandon() noexcept override;

    std::uint64_t bytes_read() const noexcept override { return stream_.bytes_read(); }
    std::uint64_t bytes_written() const noexcept override { return stream_.bytes_written(); }
    std::uint64_t requests_served() const noexcept override {
        return requests_served_.load(std::memory_order_relaxed);
    }

    ConnectionState state() const noexcept { return state_.load(std::memory_order_acquire); }

private:
    /**
     * Serve one request
     * @return true if the connection may carry another request
     */
    bool serve_request(std::stop_token stop);

    /**
     * Answer an error found before the gateway ran; the connection closes
     */
    void reject(http::Status status, std::string_view message, const http::Request& request);

    void finish_request(const http::Request& request);

    void set_state(ConnectionState state) noexcept { state_.store(state, std::memory_order_release); }

    std::unique_ptr<net::Transport> transport_;
    net::BufferedStream stream_;
    ResponseWriter writer_;

    const ServerConfig& config_;
    http::Gateway& gateway_;
    util::ServerStats& stats_;
    std::uint16_t server_port_;

    std::atomic<ConnectionState> state_{ConnectionState::AwaitingRequest};
    std::atomic<std::uint64_t> requests_served_{0};
    net::Clock::time_point request_start_;
    bool closed_{false};
};

} // namespace portico::server

#endif // PORTICO_SERVER_CONNECTION_HPP
