/**
 * PORTICO - Embedded HTTP/1.x Server Core
 * Worker pool tests
 */

#include "server/worker_pool.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>

using namespace std::chrono_literals;
using portico::server::PoolTask;
using portico::server::WorkerPool;
using portico::server::WorkerPoolConfig;

namespace {

struct Probe {
    std::atomic<int> started{0};
    std::atomic<int> finished{0};
    std::atomic<int> abandoned{0};
    std::atomic<int> interrupted{0};
};

/**
 * Timed tasks sleep for their work time; Busy and Idle tasks block until
 * interrupted, Idle ones reporting themselves as idle to the pool
 */
class FakeTask final : public PoolTask {
public:
    enum class Mode { Timed, Busy, Idle };

    FakeTask(std::shared_ptr<Probe> probe, Mode mode, std::chrono::milliseconds work = 0ms)
        : probe_(std::move(probe)), mode_(mode), work_(work) {}

    void run(std::stop_token) noexcept override {
        ++probe_->started;
        std::unique_lock<std::mutex> lock(mutex_);
        if (mode_ == Mode::Timed) {
            cv_.wait_for(lock, work_, [this] { return interrupted_; });
        } else {
            cv_.wait(lock, [this] { return interrupted_; });
        }
        ++probe_->finished;
    }

    void interrupt() noexcept override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!interrupted_) {
                interrupted_ = true;
                ++probe_->interrupted;
            }
        }
        cv_.notify_all();
    }

    bool is_idle() const noexcept override { return mode_ == Mode::Idle; }
    void abandon() noexcept override { ++probe_->abandoned; }

    std::uint64_t bytes_read() const noexcept override { return 10; }
    std::uint64_t bytes_written() const noexcept override { return 20; }
    std::uint64_t requests_served() const noexcept override { return 1; }

private:
    std::shared_ptr<Probe> probe_;
    Mode mode_;
    std::chrono::milliseconds work_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool interrupted_{false};
};

bool wait_until(const std::function<bool()>& condition, std::chrono::milliseconds limit = 5000ms) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(5ms);
    }
    return condition();
}

WorkerPoolConfig pool_config(std::size_t min, std::size_t max, std::size_t queue = 0) {
    WorkerPoolConfig config;
    config.min_workers = min;
    config.max_workers = max;
    config.queue_capacity = queue;
    config.queue_put_timeout = 50ms;
    config.idle_timeout = 60s;
    return config;
}

std::unique_ptr<FakeTask> task(const std::shared_ptr<Probe>& probe, FakeTask::Mode mode,
                               std::chrono::milliseconds work = 0ms) {
    return std::make_unique<FakeTask>(probe, mode, work);
}

} // anonymous namespace

TEST(WorkerPool, RunsSubmittedTasks) {
    auto probe = std::make_shared<Probe>();
    WorkerPool pool(pool_config(2, 2));
    pool.start();
    EXPECT_EQ(pool.size(), 2u);

    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(pool.submit(task(probe, FakeTask::Mode::Timed, 10ms)));
    }
    ASSERT_TRUE(wait_until([&] { return probe->finished == 5; }));
    ASSERT_TRUE(wait_until([&] { return pool.busy() == 0; }));

    auto snap = pool.snapshot();
    EXPECT_EQ(snap.size, 2u);
    EXPECT_EQ(snap.queued, 0u);
    std::uint64_t handled = 0;
    std::uint64_t bytes_read = 0;
    for (const auto& worker : snap.workers) {
        handled += worker.connections_handled;
        bytes_read += worker.bytes_read;
    }
    EXPECT_EQ(handled, 5u);
    EXPECT_EQ(bytes_read, 50u);
    EXPECT_LE(pool.peak_busy(), 2u);
}

TEST(WorkerPool, GrowsUpToMaximumUnderLoad) {
    auto probe = std::make_shared<Probe>();
    WorkerPool pool(pool_config(1, 3));
    pool.start();

    for (int i = 0; i < 6; ++i) {
        ASSERT_TRUE(pool.submit(task(probe, FakeTask::Mode::Timed, 100ms)));
    }
    EXPECT_LE(pool.size(), 3u);
    ASSERT_TRUE(wait_until([&] { return probe->finished == 6; }));
    EXPECT_GE(pool.peak_busy(), 2u);
    EXPECT_LE(pool.peak_busy(), 3u);
}

TEST(WorkerPool, FullQueueRefusesAfterTimeout) {
    auto probe = std::make_shared<Probe>();
    WorkerPool pool(pool_config(1, 1, 1));
    pool.start();

    ASSERT_TRUE(pool.submit(task(probe, FakeTask::Mode::Busy)));
    ASSERT_TRUE(wait_until([&] { return probe->started == 1; }));
    ASSERT_TRUE(pool.submit(task(probe, FakeTask::Mode::Busy)));
    EXPECT_EQ(pool.queued(), 1u);

    auto before = std::chrono::steady_clock::now();
    EXPECT_FALSE(pool.submit(task(probe, FakeTask::Mode::Busy)));
    EXPECT_GE(std::chrono::steady_clock::now() - before, 40ms);
    EXPECT_EQ(probe->abandoned, 1);

    pool.shutdown(0ms);
    EXPECT_EQ(probe->abandoned, 2);
}

TEST(WorkerPool, TrySubmitNeverWaitsForQueueSpace) {
    auto probe = std::make_shared<Probe>();
    auto config = pool_config(1, 1, 1);
    config.queue_put_timeout = 10s;
    WorkerPool pool(config);
    pool.start();

    std::unique_ptr<PoolTask> running = task(probe, FakeTask::Mode::Busy);
    ASSERT_EQ(pool.try_submit(running), WorkerPool::SubmitResult::Queued);
    EXPECT_FALSE(running);
    ASSERT_TRUE(wait_until([&] { return probe->started == 1; }));

    std::unique_ptr<PoolTask> queued = task(probe, FakeTask::Mode::Busy);
    ASSERT_EQ(pool.try_submit(queued), WorkerPool::SubmitResult::Queued);

    std::unique_ptr<PoolTask> extra = task(probe, FakeTask::Mode::Busy);
    auto before = std::chrono::steady_clock::now();
    EXPECT_EQ(pool.try_submit(extra), WorkerPool::SubmitResult::Full);
    EXPECT_LT(std::chrono::steady_clock::now() - before, 1s);
    ASSERT_TRUE(extra);
    EXPECT_EQ(probe->abandoned, 0);

    pool.shutdown(0ms);
    EXPECT_EQ(pool.try_submit(extra), WorkerPool::SubmitResult::Stopped);
    EXPECT_FALSE(extra);
    // The queued task and the refused one
    EXPECT_EQ(probe->abandoned, 2);
}

TEST(WorkerPool, ShutdownInterruptsIdleTasksImmediately) {
    auto probe = std::make_shared<Probe>();
    WorkerPool pool(pool_config(2, 2));
    pool.start();

    ASSERT_TRUE(pool.submit(task(probe, FakeTask::Mode::Idle)));
    ASSERT_TRUE(wait_until([&] { return probe->started == 1; }));

    auto before = std::chrono::steady_clock::now();
    pool.shutdown(10s);
    EXPECT_LT(std::chrono::steady_clock::now() - before, 2s);
    EXPECT_EQ(probe->interrupted, 1);
    EXPECT_EQ(probe->finished, 1);
    EXPECT_EQ(pool.size(), 0u);
}

TEST(WorkerPool, ShutdownWaitsGraceThenInterruptsBusyTasks) {
    auto probe = std::make_shared<Probe>();
    WorkerPool pool(pool_config(1, 1));
    pool.start();

    ASSERT_TRUE(pool.submit(task(probe, FakeTask::Mode::Busy)));
    ASSERT_TRUE(wait_until([&] { return probe->started == 1; }));

    auto before = std::chrono::steady_clock::now();
    pool.shutdown(200ms);
    EXPECT_GE(std::chrono::steady_clock::now() - before, 200ms);
    EXPECT_EQ(probe->interrupted, 1);
    EXPECT_EQ(probe->finished, 1);
}

TEST(WorkerPool, ShutdownLetsShortTasksFinish) {
    auto probe = std::make_shared<Probe>();
    WorkerPool pool(pool_config(1, 1));
    pool.start();

    ASSERT_TRUE(pool.submit(task(probe, FakeTask::Mode::Timed, 50ms)));
    ASSERT_TRUE(wait_until([&] { return probe->started == 1; }));
    pool.shutdown(5s);
    EXPECT_EQ(probe->finished, 1);
    EXPECT_EQ(probe->interrupted, 0);
}

TEST(WorkerPool, SubmitAfterShutdownIsRefused) {
    auto probe = std::make_shared<Probe>();
    WorkerPool pool(pool_config(1, 1));
    pool.start();
    pool.shutdown(0ms);
    pool.shutdown(0ms);

    EXPECT_FALSE(pool.submit(task(probe, FakeTask::Mode::Timed)));
    EXPECT_EQ(probe->abandoned, 1);
    EXPECT_EQ(probe->started, 0);
}

TEST(WorkerPool, GrowAndShrinkWithinBounds) {
    WorkerPool pool(pool_config(1, 3));
    pool.start();

    pool.grow(5);
    EXPECT_EQ(pool.size(), 3u);

    pool.shrink(5);
    EXPECT_EQ(pool.size(), 1u);
    ASSERT_TRUE(wait_until([&] { return pool.snapshot().workers.size() == 1; }));
}

TEST(WorkerPool, SurplusIdleWorkersRetire) {
    auto config = pool_config(1, 3);
    config.idle_timeout = 100ms;
    WorkerPool pool(config);
    pool.start();

    pool.grow(2);
    EXPECT_EQ(pool.size(), 3u);
    EXPECT_TRUE(wait_until([&] { return pool.size() == 1; }, 3000ms));
}

TEST(WorkerPool, SnapshotReportsConfiguration) {
    WorkerPool pool(pool_config(2, 4, 16));
    pool.start();

    auto snap = pool.snapshot();
    EXPECT_EQ(snap.min_workers, 2u);
    EXPECT_EQ(snap.max_workers, 4u);
    EXPECT_EQ(snap.queue_capacity, 16u);
    EXPECT_EQ(snap.workers.size(), 2u);
}
