#include "strata/utils/WorkerPool.hh"

#include "strata/core/Log.hh"
#include "strata/utils/Profiler.hh"

#include <algorithm>
#include <exception>

namespace strata {

WorkerPool::WorkerPool(size_t threadCount) {
    size_t count = threadCount > 0 ? threadCount : std::max<size_t>(1, std::thread::hardware_concurrency());
    workers_.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        workers_.emplace_back(&WorkerPool::workerThread, this);
    }

    STRATA_LOG_DEBUG("WorkerPool created with {} threads", count);
}

WorkerPool::~WorkerPool() {
    if (!shutdown_) {
        shutdown(std::chrono::milliseconds(200));
    }
}

void WorkerPool::parallelFor(size_t count, size_t batchSize, const std::function<void(size_t, size_t)>& body) {
    STRATA_ZONE_SCOPED;

    if (count == 0) {
        return;
    }
    batchSize = std::max<size_t>(batchSize, 1);

    std::vector<std::future<void>> pending;
    pending.reserve((count + batchSize - 1) / batchSize);
    for (size_t begin = 0; begin < count; begin += batchSize) {
        size_t end = std::min(count, begin + batchSize);
        pending.push_back(submit([&body, begin, end]() {
            STRATA_ZONE_BATCH(begin, end);
            body(begin, end);
        }));
    }

    // Wait for every batch before rethrowing so no task outlives `body`.
    std::exception_ptr firstError;
    for (auto& f : pending) {
        try {
            f.get();
        } catch (const std::exception& e) {
            STRATA_LOG_ERROR("WorkerPool batch failed: {}", e.what());
            if (!firstError) {
                firstError = std::current_exception();
            }
        } catch (...) {
            STRATA_LOG_ERROR("WorkerPool batch failed with a non-standard exception");
            if (!firstError) {
                firstError = std::current_exception();
            }
        }
    }
    if (firstError) {
        std::rethrow_exception(firstError);
    }
}

bool WorkerPool::shutdown(std::chrono::milliseconds timeout) {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        shutdown_ = true;
    }
    queueCondition_.notify_all();

    // Workers drain the queue before exiting, so join() normally returns once
    // the last task completes. The timeout is a safety net for stuck tasks.
    auto startTime = std::chrono::steady_clock::now();
    bool allJoined = true;

    for (auto& thread : workers_) {
        if (!thread.joinable()) {
            continue;
        }
        auto elapsed =
            std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - startTime);
        if (elapsed >= timeout) {
            allJoined = false;
            break;
        }
        thread.join();
    }

    for (auto& thread : workers_) {
        if (thread.joinable()) {
            thread.detach();
            allJoined = false;
        }
    }

    if (!allJoined) {
        STRATA_LOG_WARN("WorkerPool shutdown: some threads detached after timeout");
    } else {
        STRATA_LOG_DEBUG("WorkerPool shut down successfully");
    }
    return allJoined;
}

size_t WorkerPool::queuedTaskCount() const {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return taskQueue_.size();
}

void WorkerPool::workerThread() {
    STRATA_SET_THREAD_NAME("StrataWorker");

    for (;;) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            queueCondition_.wait(lock, [this] { return !taskQueue_.empty() || shutdown_; });
            if (taskQueue_.empty()) {
                return; // shutdown with nothing left to run
            }
            task = std::move(taskQueue_.front());
            taskQueue_.pop();
        }

        // Exceptions are captured by the packaged_task and surface through
        // the future returned from submit().
        task();
    }
}

} // namespace strata
