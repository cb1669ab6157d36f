#include "Thread/ThreadPool.hpp"

ThreadPool::ThreadPool(size_t threadCount)
{
    if (threadCount == 0) {
        threadCount = std::thread::hardware_concurrency();
        if (threadCount == 0) threadCount = 1;
    }

    workers_.reserve(threadCount);
    for (size_t i = 0; i < threadCount; ++i) {
        workers_.emplace_back([this] { workerLoop(); });
    }
}

ThreadPool::~ThreadPool()
{
    shutdown();
}

size_t ThreadPool::size() const noexcept
{
    return workers_.size();
}

size_t ThreadPool::pending() const
{
    std::lock_guard<std::mutex> lock(mtx_);
    return pending_;
}

void ThreadPool::waitIdle()
{
    std::unique_lock<std::mutex> lock(mtx_);
    idleCv_.wait(lock, [&] { return pending_ == 0; });
}

void ThreadPool::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (stop_) return;
        stop_ = true;
    }
    cv_.notify_all();

    // workers keep draining jobs_ until it is empty
    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
    workers_.clear();
}

void ThreadPool::workerLoop()
{
    for (;;) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(mtx_);
            cv_.wait(lock, [&] { return stop_ || !jobs_.empty(); });

            if (stop_ && jobs_.empty()) return;

            job = std::move(jobs_.front());
            jobs_.pop();
        }

        // packaged_task stores the job's exception in its future
        job();

        {
            std::lock_guard<std::mutex> lock(mtx_);
            --pending_;
        }
        idleCv_.notify_all();
    }
}
