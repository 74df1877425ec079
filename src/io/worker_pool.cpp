// =============================================================================
// objfs - Worker Pool Implementation
// =============================================================================

#include "objfs/io/worker_pool.h"

#include "objfs/common/config.h"
#include "objfs/common/logger.h"

namespace objfs::io {

WorkerPool::WorkerPool(std::size_t workerCount) {
    if (workerCount == 0) {
        workerCount = defaultWorkerCount();
    }
    workers_.reserve(workerCount);
    for (std::size_t i = 0; i < workerCount; ++i) {
        workers_.emplace_back([this]() { workerLoop(); });
    }
    OBJFS_LOG_DEBUG("Worker pool started with {} threads", workerCount);
}

WorkerPool::~WorkerPool() {
    // One stop marker per worker, queued behind any pending task
    for (std::size_t i = 0; i < workers_.size(); ++i) {
        tasks_.push(std::function<void()>{});
    }
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

std::size_t WorkerPool::pendingTasks() const noexcept {
    // size() counts blocked consumers as negative entries
    const auto size = tasks_.size();
    return size > 0 ? static_cast<std::size_t>(size) : 0;
}

void WorkerPool::enqueue(std::function<void()> task) {
    tasks_.push(std::move(task));
}

void WorkerPool::workerLoop() {
    while (true) {
        std::function<void()> task;
        tasks_.pop(task);
        if (!task) {
            return;
        }
        // packaged_task stores exceptions in the future
        task();
    }
}

}  // namespace objfs::io
