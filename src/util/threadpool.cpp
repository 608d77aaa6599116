// ETHLEDGER - Thread Pool Implementation
// Copyright (c) 2024 ETHLEDGER Developers
// MIT License

#include <ethledger/util/threadpool.h>
#include <ethledger/util/logging.h>

namespace ethledger {
namespace util {

ThreadPool::ThreadPool(const Config& config) : config_(config) {
    if (config_.numThreads == 0) {
        config_.numThreads = 1;
    }
    workers_.reserve(config_.numThreads);
    for (size_t i = 0; i < config_.numThreads; ++i) {
        workers_.emplace_back(&ThreadPool::Run, this, i);
    }
    LOG_DEBUG(LogCategory::DEFAULT) << "Pool '" << config_.name << "' running "
                                    << config_.numThreads << " workers";
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

void ThreadPool::Wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_.wait(lock, [this] { return queue_.empty() && running_ == 0; });
}

void ThreadPool::Shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
    }
    workAvailable_.notify_all();
    for (auto& worker : workers_) {
        worker.join();
    }
    workers_.clear();
    LOG_DEBUG(LogCategory::DEFAULT) << "Pool '" << config_.name << "' stopped";
}

void ThreadPool::Enqueue(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw PoolRejectedError("Pool '" + config_.name + "' is shut down");
        }
        if (queue_.size() >= config_.maxQueueSize) {
            throw PoolRejectedError("Pool '" + config_.name + "' queue is full");
        }
        queue_.push_back(std::move(task));
    }
    workAvailable_.notify_one();
}

void ThreadPool::Run(size_t index) {
    std::unique_lock<std::mutex> lock(mutex_);
    for (;;) {
        workAvailable_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
        // Queued work is finished even after Shutdown
        if (queue_.empty()) {
            return;
        }
        std::function<void()> task = std::move(queue_.front());
        queue_.pop_front();
        ++running_;

        lock.unlock();
        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR(LogCategory::DEFAULT) << "Worker " << config_.name << "-" << index
                                            << " task failed: " << e.what();
        }
        lock.lock();

        --running_;
        if (queue_.empty() && running_ == 0) {
            idle_.notify_all();
        }
    }
}

} // namespace util
} // namespace ethledger
