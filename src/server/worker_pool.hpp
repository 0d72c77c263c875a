/**
 * PORTICO - Embedded HTTP/1.x Server Core
 * Worker pool - Bounded set of threads running accepted connections
 *
 * Provides:
 * - Dynamic sizing between a minimum and a maximum number of workers
 * - Optional bounded hand-off queue with a put timeout
 * - Cooperative shutdown with a grace period, then forced interruption
 * - Busy/idle/queued/peak counters and per-worker records
 */

#ifndef PORTICO_SERVER_WORKER_POOL_HPP
#define PORTICO_SERVER_WORKER_POOL_HPP

#include "util/server_stats.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <list>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>

namespace portico::server {

/**
 * Unit of work owned by the pool: one accepted connection
 */
class PoolTask {
public:
    virtual ~PoolTask() = default;

    /**
     * Serve until done. Runs on exactly one worker; must not throw.
     * `stop` is requested when the pool shuts down.
     */
    virtual void run(std::stop_token stop) noexcept = 0;

    /**
     * Unblock run() from another thread
     */
    virtual void interrupt() noexcept = 0;

    /**
     * True while waiting for the next request with nothing in flight
     */
    virtual bool is_idle() const noexcept = 0;

    /**
     * Release resources of a task that will never run
     */
    virtual void abandon() noexcept = 0;

    virtual std::uint64_t bytes_read() const noexcept = 0;
    virtual std::uint64_t bytes_written() const noexcept = 0;
    virtual std::uint64_t requests_served() const noexcept = 0;
};

struct WorkerPoolConfig {
    std::size_t min_workers{10};
    std::size_t max_workers{10};
    std::size_t queue_capacity{0};  // 0 = unbounded
    std::chrono::steady_clock::duration queue_put_timeout{std::chrono::seconds(10)};
    std::chrono::steady_clock::duration idle_timeout{std::chrono::seconds(60)};
};

/**
 * Worker pool
 *
 * All bookkeeping is guarded by one mutex; the gauges are mirrored in
 * relaxed atomics so they can be read without locking.
 */
class WorkerPool {
public:
    using Clock = std::chrono::steady_clock;

    explicit WorkerPool(const WorkerPoolConfig& config);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * Spawn the minimum number of workers and start accepting tasks
     */
    void start();

    /**
     * Queue a task. Blocks up to the put timeout while a bounded queue is full.
     * @return false if the task was refused (queue full or pool stopped);
     *         the task has then been abandoned
     */
    bool submit(std::unique_ptr<PoolTask> task);

    enum class SubmitResult {
        Queued,
        Full,     // Bounded queue at capacity; the task is left with the caller
        Stopped   // Pool shut down; the task has been abandoned
    };

    /**
     * Queue a task without waiting for queue space
     */
    SubmitResult try_submit(std::unique_ptr<PoolTask>& task);

    /**
     * Add up to `count` workers, never exceeding the maximum
     */
    void grow(std::size_t count);

    /**
     * Retire up to `count` idle workers, never going below the minimum
     */
    void shrink(std::size_t count);

    /**
     * Stop accepting, abandon queued tasks, let running tasks finish their
     * current request for up to `grace`, then interrupt them and join every
     * worker. Idempotent.
     */
    void shutdown(Clock::duration grace);

    std::size_t size() const;
    std::size_t idle() const noexcept { return idle_.load(std::memory_order_relaxed); }
    std::size_t busy() const noexcept { return busy_.load(std::memory_order_relaxed); }
    std::size_t queued() const noexcept { return queued_.load(std::memory_order_relaxed); }
    std::size_t peak_busy() const noexcept { return peak_busy_.load(std::memory_order_relaxed); }

    util::PoolSnapshot snapshot() const;

private:
    struct Worker {
        std::size_t id{0};
        PoolTask* current{nullptr};  // Non-owning; valid while set
        bool retiring{false};
        bool exited{false};
        std::uint64_t connections_handled{0};
        std::uint64_t requests_served{0};
        std::uint64_t bytes_read{0};
        std::uint64_t bytes_written{0};
        Clock::duration busy_time{};
        std::jthread thread;  // Last: joined before the fields above are destroyed
    };

    void spawn_locked();
    std::vector<std::unique_ptr<Worker>> push_locked(std::unique_ptr<PoolTask> task);
    void worker_loop(std::stop_token stop, Worker& worker);

    /**
     * Detach records of exited workers; the caller joins them unlocked
     */
    std::vector<std::unique_ptr<Worker>> take_exited_locked();

    void interrupt_idle_locked();

    WorkerPoolConfig config_;

    mutable std::mutex mutex_;
    std::condition_variable_any work_available_;
    std::condition_variable_any space_available_;
    std::condition_variable_any worker_exited_;

    std::deque<std::unique_ptr<PoolTask>> queue_;
    std::list<std::unique_ptr<Worker>> workers_;
    std::size_t live_{0};       // Workers neither exited nor retiring
    std::size_t starting_{0};   // Spawned, not yet waiting for work
    std::size_t next_id_{0};
    bool accepting_{false};
    bool shut_down_{false};

    std::atomic<std::size_t> idle_{0};
    std::atomic<std::size_t> busy_{0};
    std::atomic<std::size_t> queued_{0};
    std::atomic<std::size_t> peak_busy_{0};
};

} // namespace portico::server

#endif // PORTICO_SERVER_WORKER_POOL_HPP
