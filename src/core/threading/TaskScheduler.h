#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

/**
 * TaskGroup allows waiting for a group of related tasks to complete.
 */
class TaskGroup {
public:
    TaskGroup() : pendingCount_(0) {}

    void increment() {
        ++pendingCount_;
    }

    void decrement() {
        // Under the lock: the waiter may destroy the group as soon as it sees zero
        std::lock_guard<std::mutex> lock(mutex_);
        if (--pendingCount_ == 0) {
            cv_.notify_all();
        }
    }

    void wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return pendingCount_.load() == 0; });
    }

    bool isComplete() const {
        return pendingCount_.load() == 0;
    }

private:
    std::atomic<uint32_t> pendingCount_;
    std::mutex mutex_;
    std::condition_variable cv_;
};

/**
 * Worker pool for data-parallel host work.
 *
 * Usage:
 *   TaskScheduler scheduler;
 *   scheduler.initialize(4);
 *
 *   TaskGroup group;
 *   scheduler.submit([&]{ doWork(); }, &group);
 *   group.wait();
 *
 *   scheduler.parallelFor(count, 256, [&](uint32_t begin, uint32_t end) { ... });
 */
class TaskScheduler {
public:
    TaskScheduler() = default;
    ~TaskScheduler();

    TaskScheduler(const TaskScheduler&) = delete;
    TaskScheduler& operator=(const TaskScheduler&) = delete;

    // Initialize with specified thread count (0 = hardware concurrency - 1)
    void initialize(uint32_t numThreads = 0);
    void shutdown();

    // Submit a task for parallel execution (FIFO). Runs synchronously if not initialized.
    void submit(std::function<void()> task, TaskGroup* group = nullptr);

    // Split [0, count) into batches of batchSize and block until all have run.
    // func receives a half-open range [begin, end).
    void parallelFor(uint32_t count, uint32_t batchSize,
                     const std::function<void(uint32_t, uint32_t)>& func);

    // Get thread ID for current worker (0 to threadCount-1, or -1 if not a worker thread)
    int32_t getCurrentThreadId() const;

    uint32_t getThreadCount() const { return static_cast<uint32_t>(workers_.size()); }

    bool isRunning() const { return running_.load(); }

private:
    struct Task {
        std::function<void()> func;
        TaskGroup* group = nullptr;
    };

    void workerThread(uint32_t threadId);

    std::vector<std::thread> workers_;

    std::queue<Task> taskQueue_;
    std::mutex queueMutex_;
    std::condition_variable queueCondition_;

    std::atomic<bool> running_{false};

    static thread_local int32_t currentThreadId_;
};
