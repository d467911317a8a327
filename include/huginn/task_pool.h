#pragma once

#include "export.h"
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace huginn {

/**
 * @brief Fixed-size worker pool for fire-and-forget side work (translation)
 *
 * post() never blocks: when the queue is full or the pool is stopping the
 * task is rejected and the caller decides what a rejection means. Tasks that
 * throw are logged and do not take a worker down.
 */
class HUGINN_API TaskPool {
public:
    using Task = std::function<void()>;

    /**
     * @param threads Worker count (at least 1)
     * @param max_queued Pending tasks accepted before post() starts rejecting
     */
    explicit TaskPool(std::size_t threads = 2, std::size_t max_queued = 64);

    /// Runs queued tasks to completion, then joins the workers
    ~TaskPool();

    TaskPool(const TaskPool&) = delete;
    TaskPool& operator=(const TaskPool&) = delete;

    /// @return false if the task was rejected
    bool post(Task task);

    /// Stop accepting tasks and join the workers (idempotent)
    void shutdown();

    std::size_t pending() const;
    std::size_t threads() const { return workers_.size(); }

private:
    void worker_loop();

    std::size_t max_queued_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<Task> tasks_;
    bool stopping_ = false;
    std::vector<std::thread> workers_;
};

} // namespace huginn
