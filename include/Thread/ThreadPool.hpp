#pragma once
#include "core/Common.hpp"

#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>

// Runs maze jobs off the window thread. Exceptions thrown by a job are
// rethrown from the returned future's get().
class ThreadPool final {
public:
    explicit ThreadPool(size_t threadCount = 1);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    size_t size() const noexcept;

    // queued + running
    size_t pending() const;

    // Blocks until no job is queued or running.
    void waitIdle();

    // Finishes queued jobs, then joins the workers. Further submits throw.
    void shutdown();

    template <class F>
    auto submit(F&& f) -> std::future<std::invoke_result_t<std::decay_t<F>>>
    {
        using R = std::invoke_result_t<std::decay_t<F>>;

        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(f));
        std::future<R> fut = task->get_future();
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (stop_) {
                throw std::runtime_error("ThreadPool is stopped");
            }
            jobs_.emplace([task]() { (*task)(); });
            ++pending_;
        }
        cv_.notify_one();
        return fut;
    }

private:
    void workerLoop();

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::condition_variable idleCv_;
    bool stop_{false};
    size_t pending_{0};

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> jobs_;
};
