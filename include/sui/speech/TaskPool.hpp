/**
 * TaskPool.hpp - Bounded worker pool for recognition requests
 */

#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>

namespace sui::speech {

/**
 * Shared cancellation flag. Copies observe the same flag.
 */
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() const { flag_->store(true, std::memory_order_release); }
    bool isCancelled() const { return flag_->load(std::memory_order_acquire); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

class TaskPool {
public:
    using Task = std::function<void(const CancellationToken&)>;

    TaskPool(size_t workers, size_t queue_capacity);
    ~TaskPool();

    TaskPool(const TaskPool&) = delete;
    TaskPool& operator=(const TaskPool&) = delete;

    /**
     * Queue a task. Every accepted task is eventually invoked, possibly
     * with a cancelled token; tasks check the token themselves.
     *
     * @return false if the queue is full or the pool is shutting down
     */
    bool submit(Task task, CancellationToken token = CancellationToken{});

    /**
     * Stop intake, wait up to timeout for queued and running work, cancel
     * what is left, then join the workers. A worker still inside a task
     * after a second wait of the same length is detached; it keeps the
     * pool state alive until its task returns. Idempotent.
     *
     * @return true if everything finished before the timeout
     */
    bool shutdown(std::chrono::milliseconds timeout);

    /**
     * Workers detached by shutdown() whose task has not returned yet.
     */
    size_t detachedWorkers() const;

    size_t pending() const;
    size_t active() const;
    size_t workerCount() const;
    bool isAccepting() const;

private:
    struct Impl;
    std::shared_ptr<Impl> pImpl_;
};

} // namespace sui::speech
