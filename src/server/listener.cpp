/**
 * PORTICO - Embedded HTTP/1.x Server Core
 * Listener implementation
 */

#include "server/listener.hpp"

#include "util/logger.hpp"

#include <grp.h>
#include <pwd.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <optional>
#include <stdexcept>
#include <vector>

namespace portico::server {

namespace {

using reuse_port = asio::detail::socket_option::boolean<SOL_SOCKET, SO_REUSEPORT>;

constexpr auto queue_retry_interval = std::chrono::milliseconds(10);

/**
 * SO_PEERCRED as a gettable Asio socket option
 */
class PeerCredOption {
public:
    template<typename Protocol>
    int level(const Protocol&) const { return SOL_SOCKET; }

    template<typename Protocol>
    int name(const Protocol&) const { return SO_PEERCRED; }

    template<typename Protocol>
    ucred* data(const Protocol&) { return &value_; }

    template<typename Protocol>
    const ucred* data(const Protocol&) const { return &value_; }

    template<typename Protocol>
    std::size_t size(const Protocol&) const { return sizeof(value_); }

    template<typename Protocol>
    void resize(const Protocol&, std::size_t s) {
        if (s != sizeof(value_)) {
            throw std::length_error("SO_PEERCRED returned an unexpected size");
        }
    }

    const ucred& value() const noexcept { return value_; }

private:
    ucred value_{};
};

std::string user_name(uid_t uid) {
    passwd pwd{};
    passwd* result = nullptr;
    std::vector<char> buf(4096);
    if (getpwuid_r(uid, &pwd, buf.data(), buf.size(), &result) != 0 || !result) {
        return {};
    }
    return result->pw_name;
}

std::string group_name(gid_t gid) {
    group grp{};
    group* result = nullptr;
    std::vector<char> buf(4096);
    if (getgrgid_r(gid, &grp, buf.data(), buf.size(), &result) != 0 || !result) {
        return {};
    }
    return result->gr_name;
}

/**
 * Interpret a generic endpoint as an IP endpoint, if it is one
 */
std::optional<asio::ip::tcp::endpoint> to_tcp(const net::stream_protocol::endpoint& endpoint) {
    int family = endpoint.data()->sa_family;
    if (family != AF_INET && family != AF_INET6) {
        return std::nullopt;
    }
    asio::ip::tcp::endpoint result;
    if (endpoint.size() > result.capacity()) {
        return std::nullopt;
    }
    std::memcpy(result.data(), endpoint.data(), endpoint.size());
    result.resize(endpoint.size());
    return result;
}

} // anonymous namespace

Listener::Listener(asio::io_context& io_context,
                   const ServerConfig& config,
                   WorkerPool& pool,
                   util::ServerStats& stats,
                   ConnectionFactory factory)
    : io_context_(io_context)
    , config_(config)
    , pool_(pool)
    , stats_(stats)
    , factory_(std::move(factory))
    , acceptor_(io_context)
    , retry_timer_(io_context)
    , queue_timer_(io_context)
    , bound_(config.bind)
{
}

Listener::~Listener() {
    stop();
}

void Listener::bind() {
    if (config_.bind.is_unix()) {
        bind_unix();
    } else {
        bind_tcp();
    }

    boost::system::error_code ec;
    acceptor_.listen(config_.backlog, ec);
    if (ec) {
        auto message = ec.message();
        acceptor_.close(ec);
        throw std::runtime_error("Failed to listen on " + config_.bind.to_string() + ": " + message);
    }

    bound_ = local_address();
    PORTICO_LOG_INFO(util::log_component::Listener, "Listening on {}", bound_.to_string());
}

void Listener::bind_tcp() {
    asio::ip::tcp::resolver resolver(io_context_);
    boost::system::error_code ec;
    auto results = resolver.resolve(config_.bind.host, std::to_string(config_.bind.port),
                                    asio::ip::tcp::resolver::passive |
                                    asio::ip::tcp::resolver::numeric_service, ec);
    if (ec) {
        throw std::runtime_error("Cannot resolve bind address " + config_.bind.to_string() + ": " + ec.message());
    }

    // First endpoint that binds wins
    std::string last_error = "no addresses";
    for (const auto& entry : results) {
        asio::ip::tcp::endpoint tcp_endpoint = entry.endpoint();
        net::stream_protocol::endpoint endpoint(tcp_endpoint);

        acceptor_.open(endpoint.protocol(), ec);
        if (ec) {
            last_error = ec.message();
            continue;
        }
        if (config_.bind.port != 0) {
            acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
            if (ec) {
                PORTICO_LOG_WARN(util::log_component::Listener, "Failed to set SO_REUSEADDR: {}", ec.message());
            }
        }
        if (config_.reuse_port) {
            acceptor_.set_option(reuse_port(true), ec);
            if (ec) {
                PORTICO_LOG_WARN(util::log_component::Listener, "Failed to set SO_REUSEPORT: {}", ec.message());
            }
        }
        if (tcp_endpoint.address().is_v6() && tcp_endpoint.address().is_unspecified()) {
            // "::" also accepts IPv4 clients
            acceptor_.set_option(asio::ip::v6_only(false), ec);
        }

        acceptor_.bind(endpoint, ec);
        if (!ec) {
            return;
        }
        last_error = ec.message();
        acceptor_.close(ec);
    }
    throw std::runtime_error("Failed to bind to " + config_.bind.to_string() + ": " + last_error);
}

void Listener::bind_unix() {
    const auto& path = config_.bind.path;
    bool abstract = config_.bind.kind == net::BindAddress::Kind::Abstract;

    if (!abstract) {
        // A stale socket file from an earlier run blocks bind()
        struct stat st{};
        if (::lstat(path.c_str(), &st) == 0 && S_ISSOCK(st.st_mode)) {
            ::unlink(path.c_str());
        }
    }

    net::stream_protocol::endpoint endpoint{asio::local::stream_protocol::endpoint(path)};
    boost::system::error_code ec;
    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) {
        acceptor_.bind(endpoint, ec);
    }
    if (ec) {
        auto message = ec.message();
        acceptor_.close(ec);
        throw std::runtime_error("Failed to bind to " + config_.bind.to_string() + ": " + message);
    }

    if (!abstract) {
        unlink_on_stop_ = true;
        if (::chmod(path.c_str(), 0777) != 0) {
            PORTICO_LOG_WARN(util::log_component::Listener, "Failed to chmod {}: {}",
                             path, std::strerror(errno));
        }
    }
}

void Listener::start_accepting() {
    do_accept();
}

void Listener::stop() noexcept {
    boost::system::error_code ec;
    retry_timer_.cancel();
    queue_timer_.cancel();
    if (waiting_task_) {
        waiting_task_->abandon();
        waiting_task_.reset();
    }
    if (acceptor_.is_open()) {
        acceptor_.close(ec);
        if (ec) {
            PORTICO_LOG_WARN(util::log_component::Listener, "Error closing acceptor: {}", ec.message());
        }
        PORTICO_LOG_INFO(util::log_component::Listener, "Stopped listening on {}", bound_.to_string());
    }
    if (unlink_on_stop_) {
        ::unlink(config_.bind.path.c_str());
        unlink_on_stop_ = false;
    }
}

net::BindAddress Listener::local_address() const {
    if (config_.bind.is_unix() || !acceptor_.is_open()) {
        return bound_;
    }
    boost::system::error_code ec;
    auto endpoint = to_tcp(acceptor_.local_endpoint(ec));
    if (ec || !endpoint) {
        return bound_;
    }
    return net::BindAddress::tcp(endpoint->address().to_string(), endpoint->port());
}

void Listener::do_accept() {
    if (!acceptor_.is_open()) {
        return;
    }
    pending_ = std::make_unique<net::AcceptedSocket>();
    acceptor_.async_accept(pending_->socket, peer_endpoint_,
                           [this](const boost::system::error_code& ec) { on_accept(ec); });
}

void Listener::on_accept(const boost::system::error_code& ec) {
    if (ec == asio::error::operation_aborted || !acceptor_.is_open()) {
        pending_.reset();
        return;
    }

    if (ec) {
        // EMFILE and friends: back off instead of spinning
        stats_.socket_error();
        PORTICO_LOG_WARN(util::log_component::Listener, "Accept error: {}", ec.message());
        pending_.reset();
        retry_timer_.expires_after(std::chrono::milliseconds(100));
        retry_timer_.async_wait([this](const boost::system::error_code& wait_ec) {
            if (!wait_ec) {
                do_accept();
            }
        });
        return;
    }

    stats_.accepted();
    auto accepted = std::move(pending_);
    prepare_socket(*accepted);
    PORTICO_LOG_TRACE(util::log_component::Listener, "Accepted {}", accepted->peer.to_string());

    std::unique_ptr<PoolTask> task;
    try {
        task = factory_(std::move(*accepted));
    } catch (const std::exception& e) {
        stats_.socket_error();
        PORTICO_LOG_ERROR(util::log_component::Listener, "Failed to set up connection: {}", e.what());
    }
    accepted.reset();

    if (!task) {
        do_accept();
        return;
    }
    waiting_task_ = std::move(task);
    queue_deadline_ = std::chrono::steady_clock::now() + config_.accepted_queue_timeout;
    hand_off();
}

void Listener::hand_off() {
    auto result = pool_.try_submit(waiting_task_);
    if (result == WorkerPool::SubmitResult::Full) {
        if (std::chrono::steady_clock::now() < queue_deadline_) {
            // Accepting pauses while the queue is full; the io thread stays free for stop and signals
            queue_timer_.expires_after(queue_retry_interval);
            queue_timer_.async_wait([this](const boost::system::error_code& ec) {
                if (!ec && waiting_task_) {
                    hand_off();
                }
            });
            return;
        }
        waiting_task_->abandon();
        waiting_task_.reset();
        stats_.queue_rejected();
        PORTICO_LOG_WARN(util::log_component::Listener, "Worker queue full, dropped connection");
    } else if (result == WorkerPool::SubmitResult::Stopped) {
        stats_.queue_rejected();
        PORTICO_LOG_DEBUG(util::log_component::Listener, "Worker pool stopped, dropped connection");
    }

    do_accept();
}

void Listener::prepare_socket(net::AcceptedSocket& accepted) {
    boost::system::error_code ec;

    if (auto tcp_endpoint = to_tcp(peer_endpoint_)) {
        accepted.peer.address = tcp_endpoint->address().to_string();
        accepted.peer.port = tcp_endpoint->port();
        if (config_.nodelay) {
            accepted.socket.set_option(asio::ip::tcp::no_delay(true), ec);
        }
        return;
    }

    accepted.peer.is_unix = true;
    if (!config_.peercreds_enabled) {
        return;
    }

    PeerCredOption option;
    accepted.socket.get_option(option, ec);
    if (ec) {
        PORTICO_LOG_DEBUG(util::log_component::Listener, "SO_PEERCRED failed: {}", ec.message());
        return;
    }

    net::PeerCredentials credentials;
    credentials.pid = option.value().pid;
    credentials.uid = option.value().uid;
    credentials.gid = option.value().gid;
    if (config_.peercreds_resolve_enabled) {
        credentials.user = user_name(credentials.uid);
        credentials.group = group_name(credentials.gid);
    }
    accepted.peer.credentials = std::move(credentials);
}

} // namespace portico::server
