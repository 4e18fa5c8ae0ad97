#pragma once
#include <vector>
#include <thread>
#include <queue>
#include <functional>
#include <mutex>
#include <condition_variable>
#include <atomic>

// Fixed set of worker threads draining a FIFO task queue. Request handlers
// run here so ledger appends and window queries proceed in parallel.
class ThreadPool
{
public:
    // A thread count of 0 falls back to the hardware concurrency (at least 1).
    explicit ThreadPool(std::size_t threadCount);
    ~ThreadPool();

    ThreadPool(const ThreadPool &) = delete;
    ThreadPool &operator=(const ThreadPool &) = delete;

    // Enqueues a task; returns false when the pool is shutting down and the
    // task was not accepted.
    bool post(std::function<void()> task);
    // Blocks until all queued tasks are finished.
    void wait();
    // Stops accepting work and joins the workers after the queue drains.
    void shutdown();

    std::size_t size() const { return workers_.size(); }
    std::size_t pending() const;

private:
    void workerLoop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<bool> stopping_{false};
    std::condition_variable done_cv_;
    std::size_t active_ = 0;
};
