/**
 * PORTICO - Embedded HTTP/1.x Server Core
 * HTTP server implementation
 */

#include "server/http_server.hpp"

#include "server/connection.hpp"
#include "util/logger.hpp"

#include <csignal>
#include <stdexcept>

namespace portico::server {

namespace {

WorkerPoolConfig make_pool_config(const ServerConfig& config) {
    WorkerPoolConfig pool;
    pool.min_workers = config.min_workers;
    pool.max_workers = config.max_workers;
    pool.queue_capacity = config.accepted_queue_size;
    pool.queue_put_timeout = config.accepted_queue_timeout;
    pool.idle_timeout = config.idle_worker_timeout;
    return pool;
}

ServerConfig with_server_name(ServerConfig config) {
    if (config.server_name.empty()) {
        boost::system::error_code ec;
        config.server_name = asio::ip::host_name(ec);
        if (ec || config.server_name.empty()) {
            config.server_name = "localhost";
        }
    }
    return config;
}

} // anonymous namespace

HttpServer::HttpServer(ServerConfig config, std::shared_ptr<http::Gateway> gateway)
    : config_(with_server_name(std::move(config)))
    , gateway_(std::move(gateway))
    , work_guard_(asio::make_work_guard(io_context_))
    , signals_(io_context_)
    , pool_(make_pool_config(config_))
    , listener_(io_context_, config_, pool_, stats_,
                [this](net::AcceptedSocket accepted) { return make_connection(std::move(accepted)); })
{
    if (!gateway_) {
        throw std::invalid_argument("HttpServer requires a gateway");
    }
    if (config_.tls) {
        tls_.emplace(*config_.tls);
    }
    PORTICO_LOG_DEBUG(util::log_component::Server, "Initializing with {}-{} workers on {}",
                      config_.min_workers, config_.max_workers, config_.bind.to_string());
}

HttpServer::~HttpServer() {
    stop();
    wait();
}

void HttpServer::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (started_) {
        PORTICO_LOG_WARN(util::log_component::Server, "Already started, ignoring start request");
        return;
    }

    listener_.bind();
    auto bound = listener_.local_address();
    port_ = bound.is_unix() ? 0 : bound.port;

    pool_.start();
    listener_.start_accepting();

    started_ = true;
    running_ = true;
    listener_thread_ = std::jthread([this](std::stop_token st) { run_io_context(st); });

    PORTICO_LOG_INFO(util::log_component::Server, "Serving on {}{} with {} workers",
                     tls_ ? "https://" : "http://", bound.to_string(), config_.min_workers);
}

void HttpServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    PORTICO_LOG_INFO(util::log_component::Server, "Initiating graceful shutdown...");

    auto close_listener = [this]() {
        listener_.stop();
        boost::system::error_code ec;
        signals_.cancel(ec);
    };
    if (io_context_.get_executor().running_in_this_thread()) {
        close_listener();
    } else {
        asio::post(io_context_, close_listener);
    }
    work_guard_.reset();

    pool_.shutdown(config_.shutdown_timeout);
    PORTICO_LOG_INFO(util::log_component::Server, "Shutdown complete");
}

void HttpServer::wait() {
    if (listener_thread_.joinable() && listener_thread_.get_id() != std::this_thread::get_id()) {
        listener_thread_.join();
    }
}

void HttpServer::enable_signal_handling() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (signals_enabled_) {
        return;
    }
    signals_enabled_ = true;

    signals_.add(SIGINT);
    signals_.add(SIGTERM);
    signals_.async_wait([this](const boost::system::error_code& ec, int signal_number) {
        if (ec) {
            if (ec != asio::error::operation_aborted) {
                PORTICO_LOG_DEBUG(util::log_component::Server, "Signal handler error: {}", ec.message());
            }
            return;
        }
        PORTICO_LOG_INFO(util::log_component::Server, "Received signal {} - initiating shutdown", signal_number);
        stop();
    });
}

net::BindAddress HttpServer::local_address() const {
    return listener_.local_address();
}

util::StatsSnapshot HttpServer::stats() const {
    auto snapshot = stats_.snapshot();
    snapshot.pool = pool_.snapshot();
    return snapshot;
}

std::unique_ptr<PoolTask> HttpServer::make_connection(net::AcceptedSocket accepted) {
    std::unique_ptr<net::Transport> transport;
    if (tls_) {
        transport = tls_->wrap(std::move(accepted));
    } else {
        transport = std::make_unique<net::PlainTransport>(std::move(accepted));
    }
    return std::make_unique<Connection>(std::move(transport), config_, *gateway_, stats_, port_);
}

void HttpServer::run_io_context(std::stop_token stop_token) {
    PORTICO_LOG_DEBUG(util::log_component::Server, "Listener thread started");

    while (!stop_token.stop_requested()) {
        try {
            io_context_.run();
            break;  // Out of work: the listener is closed
        } catch (const std::exception& e) {
            PORTICO_LOG_ERROR(util::log_component::Server, "Exception in listener thread: {}", e.what());
        }
    }

    PORTICO_LOG_DEBUG(util::log_component::Server, "Listener thread exiting");
}

} // namespace portico::server
