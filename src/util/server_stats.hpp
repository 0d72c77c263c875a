/**
 * PORTICO - Embedded HTTP/1.x Server Core
 * Server statistics - Thread-safe counters for monitoring
 *
 * Provides:
 * - Listener counters (accepts, socket errors, queue rejections)
 * - TLS handshake failures
 * - Request, byte and connection counters
 * - Worker pool gauges and per-worker records in snapshots
 * - JSON serialization
 */

#ifndef PORTICO_UTIL_SERVER_STATS_HPP
#define PORTICO_UTIL_SERVER_STATS_HPP

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace portico::util {

/**
 * One worker thread as seen at snapshot time
 */
struct WorkerSnapshot {
    std::size_t id{0};
    bool busy{false};
    std::uint64_t connections_handled{0};
    std::uint64_t requests_served{0};
    std::uint64_t bytes_read{0};       // Finished connections plus the current one
    std::uint64_t bytes_written{0};
    double busy_seconds{0.0};
};

/**
 * Worker pool gauges
 */
struct PoolSnapshot {
    std::size_t size{0};
    std::size_t min_workers{0};
    std::size_t max_workers{0};
    std::size_t idle{0};
    std::size_t busy{0};
    std::size_t queued{0};
    std::size_t peak_busy{0};
    std::size_t queue_capacity{0};  // 0 for unbounded
    std::vector<WorkerSnapshot> workers;
};

/**
 * Server statistics snapshot
 */
struct StatsSnapshot {
    std::uint64_t accepts{0};
    std::uint64_t socket_errors{0};
    std::uint64_t tls_handshake_failures{0};
    std::uint64_t queue_rejections{0};

    std::uint64_t requests_total{0};
    std::uint64_t bytes_read{0};
    std::uint64_t bytes_written{0};

    std::uint64_t connections_active{0};
    std::uint64_t connections_total{0};

    std::uint64_t uptime_seconds{0};

    PoolSnapshot pool;
};

void to_json(nlohmann::json& j, const WorkerSnapshot& w);
void to_json(nlohmann::json& j, const PoolSnapshot& p);
void to_json(nlohmann::json& j, const StatsSnapshot& s);

/**
 * Statistics collector owned by one server instance
 *
 * Lock-free: every counter is a relaxed atomic.
 */
class ServerStats {
public:
    ServerStats();

    ServerStats(const ServerStats&) = delete;
    ServerStats& operator=(const ServerStats&) = delete;

    // Listener
    void accepted() noexcept { accepts_.fetch_add(1, std::memory_order_relaxed); }
    void socket_error() noexcept { socket_errors_.fetch_add(1, std::memory_order_relaxed); }
    void queue_rejected() noexcept { queue_rejections_.fetch_add(1, std::memory_order_relaxed); }

    // TLS
    void tls_handshake_failed() noexcept { tls_handshake_failures_.fetch_add(1, std::memory_order_relaxed); }

    // Connections
    void connection_opened() noexcept;
    void connection_closed(std::uint64_t bytes_read, std::uint64_t bytes_written) noexcept;
    void request_completed() noexcept { requests_total_.fetch_add(1, std::memory_order_relaxed); }

    /**
     * Counters only; the pool section is filled in by the server
     */
    StatsSnapshot snapshot() const;

    std::uint64_t uptime_seconds() const;

private:
    std::atomic<std::uint64_t> accepts_{0};
    std::atomic<std::uint64_t> socket_errors_{0};
    std::atomic<std::uint64_t> tls_handshake_failures_{0};
    std::atomic<std::uint64_t> queue_rejections_{0};

    std::atomic<std::uint64_t> requests_total_{0};
    std::atomic<std::uint64_t> bytes_read_{0};
    std::atomic<std::uint64_t> bytes_written_{0};

    std::atomic<std::uint64_t> connections_active_{0};
    std::atomic<std::uint64_t> connections_total_{0};

    std::chrono::steady_clock::time_point start_time_;
};

} // namespace portico::util

#endif // PORTICO_UTIL_SERVER_STATS_HPP
