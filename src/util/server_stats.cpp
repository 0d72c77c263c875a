/**
 * PORTICO - Embedded HTTP/1.x Server Core
 * Server statistics implementation
 */

#include "util/server_stats.hpp"

namespace portico::util {

ServerStats::ServerStats()
    : start_time_(std::chrono::steady_clock::now())
{
}

void ServerStats::connection_opened() noexcept {
    connections_total_.fetch_add(1, std::memory_order_relaxed);
    connections_active_.fetch_add(1, std::memory_order_relaxed);
}

void ServerStats::connection_closed(std::uint64_t bytes_read, std::uint64_t bytes_written) noexcept {
    connections_active_.fetch_sub(1, std::memory_order_relaxed);
    bytes_read_.fetch_add(bytes_read, std::memory_order_relaxed);
    bytes_written_.fetch_add(bytes_written, std::memory_order_relaxed);
}

std::uint64_t ServerStats::uptime_seconds() const {
    auto elapsed = std::chrono::steady_clock::now() - start_time_;
    return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(elapsed).count());
}

StatsSnapshot ServerStats::snapshot() const {
    StatsSnapshot snap;
    snap.accepts = accepts_.load(std::memory_order_relaxed);
    snap.socket_errors = socket_errors_.load(std::memory_order_relaxed);
    snap.tls_handshake_failures = tls_handshake_failures_.load(std::memory_order_relaxed);
    snap.queue_rejections = queue_rejections_.load(std::memory_order_relaxed);

    snap.requests_total = requests_total_.load(std::memory_order_relaxed);
    snap.bytes_read = bytes_read_.load(std::memory_order_relaxed);
    snap.bytes_written = bytes_written_.load(std::memory_order_relaxed);

    snap.connections_active = connections_active_.load(std::memory_order_relaxed);
    snap.connections_total = connections_total_.load(std::memory_order_relaxed);

    snap.uptime_seconds = uptime_seconds();
    return snap;
}

void to_json(nlohmann::json& j, const WorkerSnapshot& w) {
    j = nlohmann::json{
        {"id", w.id},
        {"busy", w.busy},
        {"connections_handled", w.connections_handled},
        {"requests_served", w.requests_served},
        {"bytes_read", w.bytes_read},
        {"bytes_written", w.bytes_written},
        {"busy_seconds", w.busy_seconds}
    };
}

void to_json(nlohmann::json& j, const PoolSnapshot& p) {
    j = nlohmann::json{
        {"size", p.size},
        {"min_workers", p.min_workers},
        {"max_workers", p.max_workers},
        {"idle", p.idle},
        {"busy", p.busy},
        {"queued", p.queued},
        {"peak_busy", p.peak_busy},
        {"queue_capacity", p.queue_capacity},
        {"workers", p.workers}
    };
}

void to_json(nlohmann::json& j, const StatsSnapshot& s) {
    j = nlohmann::json{
        {"listener", {
            {"accepts", s.accepts},
            {"socket_errors", s.socket_errors},
            {"queue_rejections", s.queue_rejections}
        }},
        {"tls", {
            {"handshake_failures", s.tls_handshake_failures}
        }},
        {"requests", {
            {"total", s.requests_total}
        }},
        {"traffic", {
            {"bytes_read", s.bytes_read},
            {"bytes_written", s.bytes_written}
        }},
        {"connections", {
            {"active", s.connections_active},
            {"total", s.connections_total}
        }},
        {"uptime_seconds", s.uptime_seconds},
        {"pool", s.pool}
    };
}

} // namespace portico::util
