// VEIL - Thread Pool Implementation
// Copyright (c) 2024 VEIL Developers
// MIT License

#include "veil/util/threadpool.h"

#include <utility>

namespace veil {
namespace util {

ThreadPool::ThreadPool(size_t numThreads) : ThreadPool(Config{numThreads, 10000, "pool"}) {}

ThreadPool::ThreadPool(const Config& config) : config_(config) {
    size_t count = config_.numThreads;
    if (count == 0) {
        count = std::max(2u, std::thread::hardware_concurrency());
    }
    workers_.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        workers_.emplace_back([this]() { Run(); });
    }
}

ThreadPool::~ThreadPool() {
    Shutdown();
}

bool ThreadPool::IsRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !stopping_;
}

size_t ThreadPool::PendingTasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void ThreadPool::Enqueue(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw std::runtime_error("ThreadPool '" + config_.name + "' is shut down");
        }
        if (queue_.size() >= config_.maxQueueSize) {
            throw std::runtime_error("ThreadPool '" + config_.name + "' queue full");
        }
        queue_.push_back(std::move(task));
    }
    workReady_.notify_one();
}

void ThreadPool::Wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    drained_.wait(lock, [this] { return queue_.empty() && busy_ == 0; });
}

void ThreadPool::Shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
    }
    workReady_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
}

void ThreadPool::Run() {
    std::unique_lock<std::mutex> lock(mutex_);
    for (;;) {
        workReady_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
        if (queue_.empty()) {
            return;  // stopping and drained
        }

        std::function<void()> task = std::move(queue_.front());
        queue_.pop_front();
        ++busy_;

        lock.unlock();
        task();  // packaged_task: exceptions land in the future
        lock.lock();

        --busy_;
        if (queue_.empty() && busy_ == 0) {
            drained_.notify_all();
        }
    }
}

} // namespace util
} // namespace veil
