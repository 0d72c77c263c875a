/**
 * PORTICO - Embedded HTTP/1.x Server Core
 * HTTP server - listener, worker pool and TLS adapter behind one facade
 */

#ifndef PORTICO_SERVER_HTTP_SERVER_HPP
#define PORTICO_SERVER_HTTP_SERVER_HPP

#include "http/gateway.hpp"
#include "net/tls_adapter.hpp"
#include "server/listener.hpp"
#include "server/server_config.hpp"
#include "server/worker_pool.hpp"
#include "util/server_stats.hpp"

#include <utility>  // Boost.Asio awaitable.hpp uses std::exchange without including it
#include <boost/asio.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>

namespace portico::server {

/**
 * Main server class - owns the accept thread, the worker pool and the gateway
 *
 * start() binds synchronously so bind errors reach the caller. The accept
 * loop runs on a std::jthread driving the server io_context; requests are
 * served on pool workers. stop() stops accepting, then gives in-flight
 * requests the shutdown timeout before interrupting them.
 */
class HttpServer {
public:
    HttpServer(ServerConfig config, std::shared_ptr<http::Gateway> gateway);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;
    HttpServer(HttpServer&&) = delete;
    HttpServer& operator=(HttpServer&&) = delete;

    /**
     * Bind, start the workers and begin accepting
     * @throws std::runtime_error if the server cannot bind
     */
    void start();

    /**
     * Graceful shutdown; safe to call more than once and from any thread
     */
    void stop();

    /**
     * Block until the server has stopped
     */
    void wait();

    /**
     * Stop on SIGINT or SIGTERM; call before start()
     */
    void enable_signal_handling();

    bool is_running() const noexcept { return running_.load(); }

    net::BindAddress local_address() const;
    std::uint16_t port() const noexcept { return port_; }

    util::StatsSnapshot stats() const;

    const ServerConfig& config() const noexcept { return config_; }

private:
    std::unique_ptr<PoolTask> make_connection(net::AcceptedSocket accepted);
    void run_io_context(std::stop_token stop_token);

    ServerConfig config_;
    std::shared_ptr<http::Gateway> gateway_;
    util::ServerStats stats_;

    asio::io_context io_context_;
    asio::executor_work_guard<asio::io_context::executor_type> work_guard_;
    asio::signal_set signals_;

    std::optional<net::TlsAdapter> tls_;
    WorkerPool pool_;
    Listener listener_;

    std::jthread listener_thread_;
    std::mutex lifecycle_mutex_;
    std::atomic<bool> running_{false};
    bool started_{false};
    bool signals_enabled_{false};
    std::uint16_t port_{0};
};

} // namespace portico::server

#endif // PORTICO_SERVER_HTTP_SERVER_HPP
