/**
 * @file ThreadPool.cpp
 * @brief Implementation of the fixed-size thread pool.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#include <tpo/concurrency/ThreadPool.hpp>

#include <tpo/core/Log.hpp>

#include <format>

namespace tpo::concurrency {

ThreadPool::ThreadPool(core::u32 threadCount)
{
    core::u32 count = threadCount == 0 ? static_cast<core::u32>(std::thread::hardware_concurrency()) : threadCount;
    if (count == 0)
        count = 1;

    _workers.reserve(count);
    for (core::u32 i = 0; i < count; ++i)
        _workers.emplace_back(&ThreadPool::workerLoop, this);

    core::Log::debug("ThreadPool", std::format("started {} workers", count));
}

ThreadPool::~ThreadPool() { shutdown(); }

void ThreadPool::shutdown()
{
    {
        std::lock_guard<std::mutex> lock{_mutex};
        if (_stopping.exchange(true, std::memory_order_acq_rel))
            return;
    }
    _cv.notify_all();

    for (auto &worker : _workers)
    {
        if (worker.joinable())
            worker.join();
    }
}

core::u32 ThreadPool::threadCount() const noexcept { return static_cast<core::u32>(_workers.size()); }

core::usize ThreadPool::pendingCount() const
{
    std::lock_guard<std::mutex> lock{_mutex};
    return _tasks.size();
}

bool ThreadPool::isStopping() const noexcept { return _stopping.load(std::memory_order_acquire); }

void ThreadPool::workerLoop()
{
    for (;;)
    {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock{_mutex};
            _cv.wait(lock, [this] { return _stopping.load(std::memory_order_relaxed) || !_tasks.empty(); });

            if (_tasks.empty())
                return;

            task = std::move(_tasks.front());
            _tasks.pop_front();
        }
        task();
    }
}

} // namespace tpo::concurrency
