#pragma once

#include "strata/utils/ErrorHandling.hh"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace strata {

// Fixed-size worker pool for data-parallel stages. Tasks are independent and
// never wait on each other; parallelFor() blocks the calling thread until all
// batches finish and rethrows the first task exception.
//
// parallelFor() must not be called from inside a pool task: the caller would
// wait on batches queued behind itself.
class WorkerPool {
  public:
    using Task = std::function<void()>;

    // threadCount 0 uses std::thread::hardware_concurrency().
    explicit WorkerPool(size_t threadCount = 0);
    ~WorkerPool();

    // Workers capture `this`; moving would leave them dangling.
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;
    WorkerPool(WorkerPool&&) = delete;
    WorkerPool& operator=(WorkerPool&&) = delete;

    template <typename F> auto submit(F&& fn) -> std::future<std::invoke_result_t<F>> {
        using R = std::invoke_result_t<F>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
        std::future<R> result = task->get_future();
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            if (shutdown_) {
                throwError("WorkerPool::submit called after shutdown");
            }
            taskQueue_.emplace([task]() { (*task)(); });
        }
        queueCondition_.notify_one();
        return result;
    }

    // Runs body(begin, end) over [0, count) in slices of at most batchSize.
    void parallelFor(size_t count, size_t batchSize, const std::function<void(size_t, size_t)>& body);

    // Stop accepting work and join workers. Returns false if some worker did
    // not finish within the timeout and had to be detached.
    bool shutdown(std::chrono::milliseconds timeout = std::chrono::milliseconds(1000));

    bool isShutdown() const { return shutdown_; }
    size_t threadCount() const { return workers_.size(); }
    size_t queuedTaskCount() const;

  private:
    void workerThread();

    std::vector<std::thread> workers_;
    std::queue<Task> taskQueue_;
    mutable std::mutex queueMutex_;
    std::condition_variable queueCondition_;
    std::atomic<bool> shutdown_{false};
};

} // namespace strata
