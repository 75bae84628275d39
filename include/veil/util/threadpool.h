// VEIL - Thread Pool
// Copyright (c) 2024 VEIL Developers
// MIT License
//
// Fixed-size worker pool behind the accelerated backend. Batches of
// encryptions and range proofs are cut into chunks and each chunk runs as one
// task; a task's result or exception is delivered through its future.

#ifndef VEIL_UTIL_THREADPOOL_H
#define VEIL_UTIL_THREADPOOL_H

#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace veil {
namespace util {

class ThreadPool {
public:
    struct Config {
        size_t numThreads{0};        // 0 = hardware concurrency
        size_t maxQueueSize{10000};
        std::string name{"pool"};
    };

    ThreadPool() : ThreadPool(Config{}) {}
    explicit ThreadPool(size_t numThreads);
    explicit ThreadPool(const Config& config);

    /// Runs whatever is still queued, then joins
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Block until nothing is queued or running
    void Wait();

    /// Refuse new tasks, drain the queue, join the workers. Idempotent.
    void Shutdown();

    bool IsRunning() const;
    size_t ThreadCount() const { return workers_.size(); }
    size_t PendingTasks() const;
    const std::string& Name() const { return config_.name; }

    /**
     * Queue a callable.
     *
     * @throws std::runtime_error if the pool is stopping or the queue is full
     */
    template<typename F>
    auto Submit(F&& f) -> std::future<typename std::invoke_result<F>::type> {
        using Result = typename std::invoke_result<F>::type;

        auto job = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(f));
        std::future<Result> future = job->get_future();
        Enqueue([job]() { (*job)(); });
        return future;
    }

private:
    void Enqueue(std::function<void()> task);
    void Run();

    Config config_;
    std::vector<std::thread> workers_;

    mutable std::mutex mutex_;
    std::condition_variable workReady_;
    std::condition_variable drained_;
    std::deque<std::function<void()>> queue_;
    size_t busy_{0};
    bool stopping_{false};
};

/**
 * Run func(i) for every i in [begin, end) on the pool and wait for all of
 * them. The first exception thrown by any invocation is rethrown once every
 * task has finished.
 *
 * Queued tasks reference func, so nothing returns or throws while one of
 * them may still run. If Submit refuses a task, the tasks already queued are
 * waited for before the submission error is rethrown.
 */
template<typename Func>
void ParallelForIndex(ThreadPool& pool, size_t begin, size_t end, Func func) {
    std::vector<std::future<void>> pending;
    pending.reserve(end > begin ? end - begin : 0);
    try {
        for (size_t i = begin; i < end; ++i) {
            pending.push_back(pool.Submit([&func, i]() { func(i); }));
        }
    } catch (const std::exception&) {
        for (auto& f : pending) {
            f.wait();
        }
        throw;
    }

    std::exception_ptr failure;
    for (auto& f : pending) {
        try {
            f.get();
        } catch (const std::exception&) {
            if (!failure) failure = std::current_exception();
        }
    }
    if (failure) {
        std::rethrow_exception(failure);
    }
}

/**
 * Split [0, count) into runs of at most chunkSize and call func(first, last)
 * for each run on the pool.
 *
 * @throws std::invalid_argument if chunkSize is zero
 */
template<typename Func>
void ParallelForChunks(ThreadPool& pool, size_t count, size_t chunkSize, Func func) {
    if (chunkSize == 0) {
        throw std::invalid_argument("ParallelForChunks: chunk size must be positive");
    }
    const size_t chunks = (count + chunkSize - 1) / chunkSize;
    ParallelForIndex(pool, 0, chunks, [&](size_t c) {
        const size_t first = c * chunkSize;
        func(first, std::min(count, first + chunkSize));
    });
}

} // namespace util
} // namespace veil

#endif // VEIL_UTIL_THREADPOOL_H
