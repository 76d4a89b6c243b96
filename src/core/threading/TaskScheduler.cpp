#include "TaskScheduler.h"
#include <SDL3/SDL_log.h>
#include <algorithm>

thread_local int32_t TaskScheduler::currentThreadId_ = -1;

TaskScheduler::~TaskScheduler() {
    shutdown();
}

void TaskScheduler::initialize(uint32_t numThreads) {
    if (running_.load()) {
        return; // Already initialized
    }

    running_.store(true);

    // Reserve one hardware thread for the caller, keep at least 2 workers
    if (numThreads == 0) {
        uint32_t hwThreads = std::thread::hardware_concurrency();
        numThreads = hwThreads > 2 ? hwThreads - 1 : 2;
    }

    workers_.reserve(numThreads);
    for (uint32_t i = 0; i < numThreads; ++i) {
        workers_.emplace_back(&TaskScheduler::workerThread, this, i);
    }

    SDL_Log("TaskScheduler: Initialized with %u worker threads", numThreads);
}

void TaskScheduler::shutdown() {
    if (!running_.load()) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        running_.store(false);
    }
    queueCondition_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();

    SDL_Log("TaskScheduler: Shutdown complete");
}

void TaskScheduler::submit(std::function<void()> task, TaskGroup* group) {
    if (!running_.load()) {
        if (group) group->increment();
        task();
        if (group) group->decrement();
        return;
    }

    if (group) {
        group->increment();
    }

    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        taskQueue_.push(Task{std::move(task), group});
    }
    queueCondition_.notify_one();
}

void TaskScheduler::parallelFor(uint32_t count, uint32_t batchSize,
                                const std::function<void(uint32_t, uint32_t)>& func) {
    if (count == 0) {
        return;
    }
    batchSize = std::max(batchSize, 1u);

    TaskGroup group;
    for (uint32_t begin = 0; begin < count; begin += batchSize) {
        uint32_t end = std::min(count, begin + batchSize);
        submit([&func, begin, end] { func(begin, end); }, &group);
    }
    group.wait();
}

int32_t TaskScheduler::getCurrentThreadId() const {
    return currentThreadId_;
}

void TaskScheduler::workerThread(uint32_t threadId) {
    currentThreadId_ = static_cast<int32_t>(threadId);

    while (true) {
        Task task;

        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            queueCondition_.wait(lock, [this] {
                return !taskQueue_.empty() || !running_.load();
            });

            // Drain remaining work before exiting so no TaskGroup waits forever
            if (!running_.load() && taskQueue_.empty()) {
                break;
            }

            task = std::move(taskQueue_.front());
            taskQueue_.pop();
        }

        if (task.func) {
            task.func();
            if (task.group) {
                task.group->decrement();
            }
        }
    }

    currentThreadId_ = -1;
}
