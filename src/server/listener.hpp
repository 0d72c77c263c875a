/**
 * PORTICO - Embedded HTTP/1.x Server Core
 * Listener - binds the server socket and hands accepted sockets to the pool
 */

#ifndef PORTICO_SERVER_LISTENER_HPP
#define PORTICO_SERVER_LISTENER_HPP

#include "net/bind_address.hpp"
#include "net/transport.hpp"
#include "server/server_config.hpp"
#include "server/worker_pool.hpp"
#include "util/server_stats.hpp"

#include <utility>  // Boost.Asio awaitable.hpp uses std::exchange without including it
#include <boost/asio.hpp>

#include <chrono>
#include <functional>
#include <memory>

namespace portico::server {

namespace asio = boost::asio;

/**
 * Listener - accept loop on the server io_context
 *
 * TCP (IPv4 or IPv6), Unix domain and Linux abstract sockets share one
 * generic acceptor. Each accepted socket gets its own io_context so the
 * worker that serves it can run blocking operations with timeouts.
 */
class Listener {
public:
    using ConnectionFactory = std::function<std::unique_ptr<PoolTask>(net::AcceptedSocket)>;

    Listener(asio::io_context& io_context,
             const ServerConfig& config,
             WorkerPool& pool,
             util::ServerStats& stats,
             ConnectionFactory factory);
    ~Listener();

    Listener(const Listener&) = delete;
    Listener& operator=(const Listener&) = delete;

    /**
     * Bind and listen
     * @throws std::runtime_error if the address cannot be bound
     */
    void bind();

    /**
     * Begin the accept loop; runs on the io_context
     */
    void start_accepting();

    /**
     * Stop accepting and release the address. Call on the io_context thread
     * or while it is not running.
     */
    void stop() noexcept;

    bool is_open() const noexcept { return acceptor_.is_open(); }

    /**
     * The bound address, with the real port when port 0 was requested
     */
    net::BindAddress local_address() const;

private:
    void bind_tcp();
    void bind_unix();
    void do_accept();
    void on_accept(const boost::system::error_code& ec);

    /**
     * Offer waiting_task_ to the pool, retrying on a timer until the
     * accepted-queue timeout passes
     */
    void hand_off();
    void prepare_socket(net::AcceptedSocket& accepted);

    asio::io_context& io_context_;
    const ServerConfig& config_;
    WorkerPool& pool_;
    util::ServerStats& stats_;
    ConnectionFactory factory_;

    asio::basic_socket_acceptor<net::stream_protocol> acceptor_;
    asio::steady_timer retry_timer_;
    asio::steady_timer queue_timer_;

    std::unique_ptr<net::AcceptedSocket> pending_;
    std::unique_ptr<PoolTask> waiting_task_;
    std::chrono::steady_clock::time_point queue_deadline_;
    net::stream_protocol::endpoint peer_endpoint_;
    net::BindAddress bound_;
    bool unlink_on_stop_{false};
};

} // namespace portico::server

#endif // PORTICO_SERVER_LISTENER_HPP
