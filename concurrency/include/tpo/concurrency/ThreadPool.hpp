/**
 * @file ThreadPool.hpp
 * @brief Fixed-size thread pool with std::future-based task submission.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TPO_CONCURRENCY_THREAD_POOL_HPP
    #define TPO_CONCURRENCY_THREAD_POOL_HPP

    #include <tpo/core/Expected.hpp>
    #include <tpo/core/NonCopyable.hpp>
    #include <tpo/core/Types.hpp>

    #include <atomic>
    #include <condition_variable>
    #include <deque>
    #include <functional>
    #include <future>
    #include <memory>
    #include <mutex>
    #include <thread>
    #include <type_traits>
    #include <vector>

namespace tpo::concurrency {

/**
 * @class ThreadPool
 * @brief Fixed thread count, shared FIFO queue.
 *
 * Workers pull tasks from a queue protected by a mutex and condition
 * variable. @ref shutdown drains everything already queued before joining;
 * submissions after that are refused with kInvalidState.
 */
class ThreadPool final : public core::NonCopyable<ThreadPool>
{
public:
    /**
     * @brief Creates the pool with @p threadCount workers; zero means
     *        @c std::thread::hardware_concurrency().
     */
    explicit ThreadPool(core::u32 threadCount = 0);

    /** @brief Drains pending tasks and joins all workers. */
    ~ThreadPool();

    /**
     * @brief Enqueues a callable and returns its future.
     *
     * An exception thrown by @p func is delivered through the future.
     */
    template <typename F, typename... Args>
    [[nodiscard]] auto enqueue(F &&func, Args &&...args)
        -> core::Expected<std::future<std::invoke_result_t<F, Args...>>>;

    /** @brief Signals workers to finish and blocks until the queue is empty. */
    void shutdown();

    [[nodiscard]] core::u32 threadCount() const noexcept;

    /** @brief Tasks queued but not yet picked up by a worker. */
    [[nodiscard]] core::usize pendingCount() const;

    [[nodiscard]] bool isStopping() const noexcept;

private:
    void workerLoop();

    std::vector<std::thread>          _workers;
    std::deque<std::function<void()>> _tasks;
    mutable std::mutex                _mutex;
    std::condition_variable           _cv;
    std::atomic<bool>                 _stopping{false};
};

template <typename F, typename... Args>
auto ThreadPool::enqueue(F &&func, Args &&...args)
    -> core::Expected<std::future<std::invoke_result_t<F, Args...>>>
{
    using ReturnType = std::invoke_result_t<F, Args...>;

    auto task = std::make_shared<std::packaged_task<ReturnType()>>(
        std::bind(std::forward<F>(func), std::forward<Args>(args)...));
    std::future<ReturnType> future = task->get_future();

    {
        std::lock_guard<std::mutex> lock{_mutex};
        if (_stopping.load(std::memory_order_relaxed))
            return core::makeError(core::ErrorCode::kInvalidState, "thread pool is shutting down");
        _tasks.emplace_back([task]() { (*task)(); });
    }
    _cv.notify_one();

    return future;
}

} // namespace tpo::concurrency

#endif // TPO_CONCURRENCY_THREAD_POOL_HPP
