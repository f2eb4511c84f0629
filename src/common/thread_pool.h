#pragma once

/// @file thread_pool.h
/// @brief Fixed-size worker pool used to fan out batch classification

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace promptguard {

/// @brief A simple thread pool for executing tasks in parallel
class ThreadPool {
public:
    /// @brief Create a thread pool with the specified number of threads
    /// @param num_threads Number of worker threads (0 = hardware concurrency)
    explicit ThreadPool(size_t num_threads = 0);

    /// @brief Destructor - drains queued tasks, then joins the workers
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    /// @brief Submit a task for execution
    /// @return Future containing the result (or the exception the task threw)
    /// @throws std::runtime_error if the pool is stopping
    template <typename F, typename... Args>
    auto Submit(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>>;

    /// @brief Number of worker threads
    size_t Size() const { return workers_.size(); }

    bool IsStopped() const { return stop_.load(std::memory_order_acquire); }

private:
    void WorkerLoop();
    void Enqueue(std::function<void()> task);

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;

    std::mutex mutex_;
    std::condition_variable condition_;

    std::atomic<bool> stop_{false};
};

template <typename F, typename... Args>
auto ThreadPool::Submit(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>> {
    using return_type = std::invoke_result_t<F, Args...>;

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );

    std::future<return_type> result = task->get_future();
    Enqueue([task]() { (*task)(); });
    return result;
}

}  // namespace promptguard
