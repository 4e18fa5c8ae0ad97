#include "ThreadPool.hpp"

#include <exception>

#include "Logging.hpp"

ThreadPool::ThreadPool(std::size_t threadCount)
{
    if (threadCount == 0)
        threadCount = std::thread::hardware_concurrency();
    if (threadCount == 0)
        threadCount = 1;

    for (std::size_t i = 0; i < threadCount; ++i)
    {
        workers_.emplace_back([this]()
                              { workerLoop(); });
    }
}

ThreadPool::~ThreadPool()
{
    shutdown();
}

void ThreadPool::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_.store(true, std::memory_order_release);
    }
    cv_.notify_all();

    for (auto &t : workers_)
    {
        if (t.joinable())
            t.join();
    }
}

bool ThreadPool::post(std::function<void()> task)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (stopping_.load(std::memory_order_acquire))
            return false;

        tasks_.push(std::move(task));
    }
    cv_.notify_one();
    return true;
}

void ThreadPool::wait()
{
    std::unique_lock<std::mutex> lock(mutex_);
    done_cv_.wait(lock, [this]()
                  { return tasks_.empty() && active_ == 0; });
}

std::size_t ThreadPool::pending() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void ThreadPool::workerLoop()
{
    while (true)
    {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]()
                     { return stopping_.load(std::memory_order_acquire) || !tasks_.empty(); });

            if (stopping_.load(std::memory_order_acquire) && tasks_.empty())
                return;

            task = std::move(tasks_.front());
            tasks_.pop();
            ++active_;
        }

        // A throwing task must not take the worker down with it.
        try
        {
            task();
        }
        catch (const std::exception &e)
        {
            Logger::log_event(LogLevel::Error, "worker_task_error", "Task threw an exception", {{"detail", e.what()}});
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            --active_;
            if (tasks_.empty() && active_ == 0)
                done_cv_.notify_all();
        }
    }
}
