/**
 * TaskPool.cpp - Bounded worker pool for recognition requests
 */

#include "sui/speech/TaskPool.hpp"

#include <algorithm>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <exception>
#include <iostream>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

namespace sui::speech {

namespace {

// Workers that wake up idle need a moment to leave even with a zero timeout
constexpr std::chrono::milliseconds MIN_EXIT_WAIT{200};

} // namespace

struct TaskPool::Impl {
    struct Entry {
        Task task;
        CancellationToken token;
    };

    size_t capacity;
    std::vector<std::thread> workers;
    std::vector<bool> exited;

    mutable std::mutex mutex;
    std::condition_variable workAvailable;
    std::condition_variable idle;
    std::condition_variable workerExited;
    std::deque<Entry> queue;
    std::map<uint64_t, CancellationToken> running;
    uint64_t nextTaskId = 0;
    size_t activeCount = 0;
    size_t exitedCount = 0;
    bool accepting = true;
    bool stopping = false;
    bool joined = false;

    void workerLoop(size_t index) {
        while (true) {
            Entry entry;
            uint64_t taskId = 0;
            {
                std::unique_lock<std::mutex> lock(mutex);
                workAvailable.wait(lock, [this] { return stopping || !queue.empty(); });
                if (queue.empty()) {
                    exited[index] = true;
                    ++exitedCount;
                    break;  // stopping and nothing left
                }
                entry = std::move(queue.front());
                queue.pop_front();
                ++activeCount;
                taskId = nextTaskId++;
                running.emplace(taskId, entry.token);
            }

            try {
                entry.task(entry.token);
            } catch (const std::exception& e) {
                std::cerr << "[TaskPool] Task failed: " << e.what() << std::endl;
            }

            {
                std::lock_guard<std::mutex> lock(mutex);
                --activeCount;
                running.erase(taskId);
            }
            idle.notify_all();
        }
        workerExited.notify_all();
    }

    bool isIdle() const { return queue.empty() && activeCount == 0; }
};

TaskPool::TaskPool(size_t workers, size_t queue_capacity)
    : pImpl_(std::make_shared<Impl>())
{
    pImpl_->capacity = queue_capacity == 0 ? 1 : queue_capacity;
    const size_t count = workers == 0 ? 1 : workers;
    pImpl_->exited.assign(count, false);
    pImpl_->workers.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        // Workers share the state so one stuck in a task can outlive the pool
        std::shared_ptr<Impl> impl = pImpl_;
        pImpl_->workers.emplace_back([impl, i] { impl->workerLoop(i); });
    }
}

TaskPool::~TaskPool() {
    shutdown(std::chrono::milliseconds(0));
}

bool TaskPool::submit(Task task, CancellationToken token) {
    {
        std::lock_guard<std::mutex> lock(pImpl_->mutex);
        if (!pImpl_->accepting || pImpl_->queue.size() >= pImpl_->capacity) {
            return false;
        }
        pImpl_->queue.push_back({std::move(task), std::move(token)});
    }
    pImpl_->workAvailable.notify_one();
    return true;
}

bool TaskPool::shutdown(std::chrono::milliseconds timeout) {
    bool clean = true;
    size_t detached = 0;
    {
        std::unique_lock<std::mutex> lock(pImpl_->mutex);
        if (pImpl_->joined) {
            return true;
        }
        pImpl_->accepting = false;

        clean = pImpl_->idle.wait_for(lock, timeout, [this] { return pImpl_->isIdle(); });
        if (!clean) {
            std::cerr << "[TaskPool] Shutdown timeout, cancelling " << pImpl_->queue.size()
                      << " queued and " << pImpl_->activeCount << " running tasks" << std::endl;
            for (auto& entry : pImpl_->queue) {
                entry.token.cancel();
            }
            for (auto& [id, token] : pImpl_->running) {
                token.cancel();
            }
        }
        pImpl_->stopping = true;
        pImpl_->joined = true;
        pImpl_->workAvailable.notify_all();

        const size_t total = pImpl_->workers.size();
        pImpl_->workerExited.wait_for(lock, std::max(timeout, MIN_EXIT_WAIT),
                                      [this, total] { return pImpl_->exitedCount == total; });

        for (size_t i = 0; i < total; ++i) {
            if (!pImpl_->exited[i]) {
                pImpl_->workers[i].detach();
                ++detached;
            }
        }
    }

    for (auto& worker : pImpl_->workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    if (detached > 0) {
        std::cerr << "[TaskPool] Detached " << detached
                  << " workers still inside a task" << std::endl;
        return false;
    }
    return clean;
}

size_t TaskPool::detachedWorkers() const {
    std::lock_guard<std::mutex> lock(pImpl_->mutex);
    if (!pImpl_->joined) {
        return 0;
    }
    size_t count = 0;
    for (size_t i = 0; i < pImpl_->workers.size(); ++i) {
        if (!pImpl_->workers[i].joinable() && !pImpl_->exited[i]) {
            ++count;
        }
    }
    return count;
}

size_t TaskPool::pending() const {
    std::lock_guard<std::mutex> lock(pImpl_->mutex);
    return pImpl_->queue.size();
}

size_t TaskPool::active() const {
    std::lock_guard<std::mutex> lock(pImpl_->mutex);
    return pImpl_->activeCount;
}

size_t TaskPool::workerCount() const {
    return pImpl_->workers.size();
}

bool TaskPool::isAccepting() const {
    std::lock_guard<std::mutex> lock(pImpl_->mutex);
    return pImpl_->accepting;
}

} // namespace sui::speech
