// ETHLEDGER - Thread Pool
// Copyright (c) 2024 ETHLEDGER Developers
// MIT License
//
// Fixed-size worker pool with future-based result retrieval. The signing
// subprovider uses one to run device operations off the caller's thread.

#ifndef ETHLEDGER_UTIL_THREADPOOL_H
#define ETHLEDGER_UTIL_THREADPOOL_H

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace ethledger {
namespace util {

/// Thrown by Submit when the pool is stopped or its queue is full
class PoolRejectedError : public std::runtime_error {
public:
    explicit PoolRejectedError(const std::string& msg)
        : std::runtime_error(msg) {}
};

/**
 * Workers take tasks in submission order. Shutdown stops intake, lets the
 * workers finish what is already queued and joins them.
 */
class ThreadPool {
public:
    struct Config {
        size_t numThreads{2};
        size_t maxQueueSize{256};
        std::string name{"pool"};
    };

    explicit ThreadPool(const Config& config);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Block until nothing is queued or running
    void Wait();

    void Shutdown();

    bool IsRunning() const;
    size_t ThreadCount() const { return workers_.size(); }
    size_t PendingTasks() const;
    const std::string& GetName() const { return config_.name; }

    /**
     * Queue `f` and return its result through a future. Exceptions thrown
     * by `f` are stored in the future.
     *
     * @throws PoolRejectedError if the pool is stopped or the queue is full
     */
    template<typename F>
    auto Submit(F&& f) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using Result = std::invoke_result_t<std::decay_t<F>>;
        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(f));
        std::future<Result> future = task->get_future();
        Enqueue([task]() { (*task)(); });
        return future;
    }

private:
    void Enqueue(std::function<void()> task);
    void Run(size_t index);

    Config config_;
    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> queue_;

    mutable std::mutex mutex_;
    std::condition_variable workAvailable_;
    std::condition_variable idle_;

    bool stopping_{false};
    size_t running_{0};
};

} // namespace util
} // namespace ethledger

#endif // ETHLEDGER_UTIL_THREADPOOL_H
