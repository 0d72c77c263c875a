/**
 * PORTICO - Embedded HTTP/1.x Server Core
 * Worker pool implementation
 */

#include "server/worker_pool.hpp"

#include "util/logger.hpp"

#include <algorithm>
#include <iterator>

namespace portico::server {

namespace {

constexpr auto shutdown_poll_interval = std::chrono::milliseconds(100);

} // anonymous namespace

WorkerPool::WorkerPool(const WorkerPoolConfig& config)
    : config_(config)
{
    if (config_.min_workers == 0) {
        config_.min_workers = 1;
    }
    config_.max_workers = std::max(config_.max_workers, config_.min_workers);
}

WorkerPool::~WorkerPool() {
    shutdown(Clock::duration::zero());
}

void WorkerPool::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (accepting_ || shut_down_) {
        return;
    }
    accepting_ = true;
    for (std::size_t i = 0; i < config_.min_workers; ++i) {
        spawn_locked();
    }
    PORTICO_LOG_DEBUG(util::log_component::Pool, "Started {} workers (max {}, queue {})",
                      config_.min_workers, config_.max_workers,
                      config_.queue_capacity == 0 ? std::string("unbounded")
                                                  : std::to_string(config_.queue_capacity));
}

bool WorkerPool::submit(std::unique_ptr<PoolTask> task) {
    std::vector<std::unique_ptr<Worker>> exited;
    {
        std::unique_lock<std::mutex> lock(mutex_);

        if (accepting_ && config_.queue_capacity > 0 && queue_.size() >= config_.queue_capacity) {
            space_available_.wait_for(lock, config_.queue_put_timeout, [this] {
                return !accepting_ || queue_.size() < config_.queue_capacity;
            });
        }

        bool refused = !accepting_ ||
                       (config_.queue_capacity > 0 && queue_.size() >= config_.queue_capacity);
        if (refused) {
            lock.unlock();
            task->abandon();
            return false;
        }

        exited = push_locked(std::move(task));
    }
    work_available_.notify_one();
    return true;
}

WorkerPool::SubmitResult WorkerPool::try_submit(std::unique_ptr<PoolTask>& task) {
    std::vector<std::unique_ptr<Worker>> exited;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!accepting_) {
            lock.unlock();
            task->abandon();
            task.reset();
            return SubmitResult::Stopped;
        }
        if (config_.queue_capacity > 0 && queue_.size() >= config_.queue_capacity) {
            return SubmitResult::Full;
        }
        exited = push_locked(std::move(task));
    }
    work_available_.notify_one();
    return SubmitResult::Queued;
}

std::vector<std::unique_ptr<WorkerPool::Worker>> WorkerPool::push_locked(std::unique_ptr<PoolTask> task) {
    queue_.push_back(std::move(task));
    queued_.store(queue_.size(), std::memory_order_relaxed);

    auto exited = take_exited_locked();
    if (idle_.load(std::memory_order_relaxed) + starting_ < queue_.size() &&
        live_ < config_.max_workers) {
        spawn_locked();
    }
    return exited;
}

void WorkerPool::grow(std::size_t count) {
    std::vector<std::unique_ptr<Worker>> exited;
    std::lock_guard<std::mutex> lock(mutex_);
    if (!accepting_) {
        return;
    }
    exited = take_exited_locked();
    auto budget = config_.max_workers > live_ ? config_.max_workers - live_ : 0;
    for (std::size_t i = 0; i < std::min(count, budget); ++i) {
        spawn_locked();
    }
}

void WorkerPool::shrink(std::size_t count) {
    std::size_t retired = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& worker : workers_) {
            if (retired == count || live_ <= config_.min_workers) {
                break;
            }
            if (worker->exited || worker->retiring || worker->current != nullptr) {
                continue;
            }
            worker->retiring = true;
            --live_;
            ++retired;
        }
    }
    if (retired > 0) {
        work_available_.notify_all();
        PORTICO_LOG_DEBUG(util::log_component::Pool, "Retiring {} idle workers", retired);
    }
}

void WorkerPool::shutdown(Clock::duration grace) {
    std::deque<std::unique_ptr<PoolTask>> abandoned;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_) {
            return;
        }
        shut_down_ = true;
        accepting_ = false;

        abandoned.swap(queue_);
        queued_.store(0, std::memory_order_relaxed);

        for (auto& worker : workers_) {
            worker->thread.request_stop();
        }
        interrupt_idle_locked();
    }
    space_available_.notify_all();

    if (!abandoned.empty()) {
        PORTICO_LOG_INFO(util::log_component::Pool, "Closing {} queued connections", abandoned.size());
    }
    for (auto& task : abandoned) {
        task->abandon();
    }
    abandoned.clear();

    std::vector<std::unique_ptr<Worker>> finished;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        auto all_exited = [this] {
            return std::all_of(workers_.begin(), workers_.end(),
                               [](const auto& w) { return w->exited; });
        };

        auto deadline = Clock::now() + grace;
        while (!all_exited()) {
            auto now = Clock::now();
            if (now >= deadline) {
                std::size_t forced = 0;
                for (auto& worker : workers_) {
                    if (worker->current) {
                        worker->current->interrupt();
                        ++forced;
                    }
                }
                if (forced > 0) {
                    PORTICO_LOG_WARN(util::log_component::Pool,
                                     "Grace period expired, interrupted {} connections", forced);
                }
                break;
            }
            Clock::duration slice = std::min<Clock::duration>(deadline - now, shutdown_poll_interval);
            worker_exited_.wait_for(lock, slice, all_exited);
            // Connections that went idle after the first sweep
            interrupt_idle_locked();
        }

        finished.reserve(workers_.size());
        std::move(workers_.begin(), workers_.end(), std::back_inserter(finished));
        workers_.clear();
    }

    // jthread destructors join here, outside the lock
    auto joined = finished.size();
    finished.clear();
    PORTICO_LOG_DEBUG(util::log_component::Pool, "Joined {} workers", joined);
}

std::size_t WorkerPool::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return live_;
}

util::PoolSnapshot WorkerPool::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);

    util::PoolSnapshot snap;
    snap.size = live_;
    snap.min_workers = config_.min_workers;
    snap.max_workers = config_.max_workers;
    snap.idle = idle_.load(std::memory_order_relaxed);
    snap.busy = busy_.load(std::memory_order_relaxed);
    snap.queued = queue_.size();
    snap.peak_busy = peak_busy_.load(std::memory_order_relaxed);
    snap.queue_capacity = config_.queue_capacity;

    for (const auto& worker : workers_) {
        if (worker->exited) {
            continue;
        }
        util::WorkerSnapshot w;
        w.id = worker->id;
        w.busy = worker->current != nullptr;
        w.connections_handled = worker->connections_handled;
        w.requests_served = worker->requests_served;
        w.bytes_read = worker->bytes_read;
        w.bytes_written = worker->bytes_written;
        if (worker->current) {
            w.requests_served += worker->current->requests_served();
            w.bytes_read += worker->current->bytes_read();
            w.bytes_written += worker->current->bytes_written();
        }
        w.busy_seconds = std::chrono::duration<double>(worker->busy_time).count();
        snap.workers.push_back(w);
    }
    return snap;
}

void WorkerPool::spawn_locked() {
    auto worker = std::make_unique<Worker>();
    worker->id = next_id_++;
    Worker& ref = *worker;
    workers_.push_back(std::move(worker));
    ++live_;
    ++starting_;
    ref.thread = std::jthread([this, &ref](std::stop_token stop) {
        worker_loop(std::move(stop), ref);
    });
}

void WorkerPool::worker_loop(std::stop_token stop, Worker& worker) {
    std::unique_lock<std::mutex> lock(mutex_);
    --starting_;

    while (!stop.stop_requested() && !worker.retiring) {
        idle_.fetch_add(1, std::memory_order_relaxed);
        bool has_work = work_available_.wait_for(lock, stop, config_.idle_timeout, [this, &worker] {
            return !queue_.empty() || worker.retiring;
        });
        idle_.fetch_sub(1, std::memory_order_relaxed);

        if (stop.stop_requested() || worker.retiring) {
            break;
        }
        if (!has_work) {
            if (live_ > config_.min_workers) {
                worker.retiring = true;
                --live_;
                PORTICO_LOG_DEBUG(util::log_component::Pool, "Worker {} idle, exiting", worker.id);
            }
            continue;
        }

        auto task = std::move(queue_.front());
        queue_.pop_front();
        queued_.store(queue_.size(), std::memory_order_relaxed);
        space_available_.notify_one();

        worker.current = task.get();
        auto now_busy = busy_.fetch_add(1, std::memory_order_relaxed) + 1;
        if (now_busy > peak_busy_.load(std::memory_order_relaxed)) {
            peak_busy_.store(now_busy, std::memory_order_relaxed);
        }
        lock.unlock();

        auto started = Clock::now();
        task->run(stop);
        auto elapsed = Clock::now() - started;

        lock.lock();
        worker.current = nullptr;
        busy_.fetch_sub(1, std::memory_order_relaxed);
        worker.connections_handled += 1;
        worker.requests_served += task->requests_served();
        worker.bytes_read += task->bytes_read();
        worker.bytes_written += task->bytes_written();
        worker.busy_time += elapsed;
        lock.unlock();

        // Releasing the connection closes its socket; keep that outside the lock
        task.reset();
        lock.lock();
    }

    if (!worker.retiring) {
        --live_;
    }
    worker.exited = true;
    worker_exited_.notify_all();
}

std::vector<std::unique_ptr<WorkerPool::Worker>> WorkerPool::take_exited_locked() {
    std::vector<std::unique_ptr<Worker>> exited;
    for (auto it = workers_.begin(); it != workers_.end();) {
        if ((*it)->exited) {
            exited.push_back(std::move(*it));
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
    return exited;
}

void WorkerPool::interrupt_idle_locked() {
    for (auto& worker : workers_) {
        if (worker->current && worker->current->is_idle()) {
            worker->current->interrupt();
        }
    }
}

} // namespace portico::server
