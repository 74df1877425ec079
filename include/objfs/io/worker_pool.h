// =============================================================================
// objfs - Worker Pool
// =============================================================================
// Bounded thread pool executing asynchronous backend calls for one stream.
//
// Key features:
// - Fixed number of worker threads, created on construction
// - Strict FIFO task order (tbb::concurrent_bounded_queue), so a task never
//   waits on work queued behind it
// - submit() returns a std::future carrying the result or the exception
// - Destruction drains queued tasks and joins the workers; submitted work is
//   never cancelled
//
// PrefetchedSequence runs the first step of a generator on the pool and
// continues synchronously afterwards, overlapping the first (slowest) call
// with other work.
// =============================================================================

#ifndef OBJFS_IO_WORKER_POOL_H
#define OBJFS_IO_WORKER_POOL_H

#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#include <tbb/concurrent_queue.h>

namespace objfs::io {

// =============================================================================
// WorkerPool
// =============================================================================

class WorkerPool {
public:
    /// @brief Start a pool.
    /// @param workerCount Number of threads; 0 selects defaultWorkerCount().
    explicit WorkerPool(std::size_t workerCount = 0);

    /// @brief Drain queued tasks and join all workers.
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;
    WorkerPool(WorkerPool&&) = delete;
    WorkerPool& operator=(WorkerPool&&) = delete;

    /// @brief Queue a callable for execution on a worker thread.
    /// @return Future resolving to the callable's result (or exception).
    template <typename F>
    [[nodiscard]] auto submit(F&& func) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using ResultType = std::invoke_result_t<std::decay_t<F>>;
        auto task =
            std::make_shared<std::packaged_task<ResultType()>>(std::forward<F>(func));
        auto future = task->get_future();
        enqueue([task]() { (*task)(); });
        return future;
    }

    /// @brief Number of worker threads.
    [[nodiscard]] std::size_t workerCount() const noexcept { return workers_.size(); }

    /// @brief Number of tasks waiting for a worker.
    [[nodiscard]] std::size_t pendingTasks() const noexcept;

private:
    void enqueue(std::function<void()> task);
    void workerLoop();

    /// @brief Task queue; an empty function stops one worker.
    tbb::concurrent_bounded_queue<std::function<void()>> tasks_;
    std::vector<std::thread> workers_;
};

// =============================================================================
// PrefetchedSequence
// =============================================================================

/// @brief Lazy sequence whose first element is computed on a worker pool.
/// @tparam T Element type; the generator returns std::nullopt when exhausted.
template <typename T>
class PrefetchedSequence {
public:
    using Generator = std::function<std::optional<T>()>;

    PrefetchedSequence(WorkerPool& pool, Generator next)
        : next_(std::make_shared<Generator>(std::move(next))) {
        auto generator = next_;
        first_ = pool.submit([generator]() { return (*generator)(); });
    }

    /// @brief Next element, or std::nullopt once the generator is exhausted.
    /// @throws Whatever the generator throws, including from the prefetched call.
    [[nodiscard]] std::optional<T> next() {
        if (exhausted_) {
            return std::nullopt;
        }
        std::optional<T> value = first_.valid() ? first_.get() : (*next_)();
        if (!value.has_value()) {
            exhausted_ = true;
        }
        return value;
    }

private:
    std::shared_ptr<Generator> next_;
    std::future<std::optional<T>> first_;
    bool exhausted_ = false;
};

/// @brief Submit the first step of a generator to the pool.
template <typename T>
[[nodiscard]] PrefetchedSequence<T> generateAsync(WorkerPool& pool,
                                                  std::function<std::optional<T>()> next) {
    return PrefetchedSequence<T>(pool, std::move(next));
}

}  // namespace objfs::io

#endif  // OBJFS_IO_WORKER_POOL_H
