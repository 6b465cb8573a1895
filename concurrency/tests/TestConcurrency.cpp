/**
 * @file TestConcurrency.cpp
 * @brief Unit tests for the thread pool and the per-athlete lock table.
 */

#include <catch2/catch_test_macros.hpp>

#include "tpo/concurrency/AthleteLockTable.hpp"
#include "tpo/concurrency/ThreadPool.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <vector>

namespace tpo::concurrency {

TEST_CASE("thread pool runs tasks and returns results", "[concurrency][pool]")
{
    ThreadPool pool{4};
    REQUIRE(pool.threadCount() == 4);

    std::vector<std::future<int>> futures;
    for (int i = 0; i < 32; ++i)
    {
        auto f = pool.enqueue([](int x) { return x * x; }, i);
        REQUIRE(f.has_value());
        futures.push_back(std::move(*f));
    }

    int sum = 0;
    for (auto &f : futures)
        sum += f.get();
    REQUIRE(sum == 10416);
}

TEST_CASE("exceptions travel through the future", "[concurrency][pool]")
{
    ThreadPool pool{1};
    auto f = pool.enqueue([]() -> int { throw std::runtime_error("boom"); });
    REQUIRE(f.has_value());
    REQUIRE_THROWS_AS(f->get(), std::runtime_error);
}

TEST_CASE("shutdown drains the queue and refuses new work", "[concurrency][pool]")
{
    ThreadPool pool{2};
    std::atomic<int> done{0};
    for (int i = 0; i < 16; ++i)
    {
        auto f = pool.enqueue([&done] {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            done.fetch_add(1);
        });
        REQUIRE(f.has_value());
    }

    pool.shutdown();
    REQUIRE(done.load() == 16);
    REQUIRE(pool.isStopping());
    REQUIRE(pool.pendingCount() == 0);

    auto late = pool.enqueue([] { return 1; });
    REQUIRE_FALSE(late.has_value());
    REQUIRE(late.error().code() == core::ErrorCode::kInvalidState);

    pool.shutdown();
}

TEST_CASE("one athlete at a time, athletes in parallel", "[concurrency][locks]")
{
    AthleteLockTable table;

    SECTION("same athlete is exclusive")
    {
        auto held = table.lock("ath-1");
        REQUIRE(held.ownsLock());
        REQUIRE(held.athleteId() == "ath-1");
        REQUIRE_FALSE(table.tryLock("ath-1").has_value());
        REQUIRE(table.tryLock("ath-2").has_value());
    }

    SECTION("released on destruction and movable")
    {
        {
            auto held  = table.lock("ath-1");
            auto moved = std::move(held);
            REQUIRE(moved.ownsLock());
            REQUIRE_FALSE(table.tryLock("ath-1").has_value());
        }
        REQUIRE(table.tryLock("ath-1").has_value());
    }

    SECTION("prune keeps held entries")
    {
        auto held = table.lock("ath-1");
        { auto other = table.lock("ath-2"); }
        REQUIRE(table.size() == 2);
        REQUIRE(table.prune() == 1);
        REQUIRE(table.size() == 1);
        REQUIRE_FALSE(table.tryLock("ath-1").has_value());
    }

    SECTION("serialises concurrent work on one athlete")
    {
        ThreadPool pool{4};
        std::atomic<int> inside{0};
        std::atomic<int> maxInside{0};
        std::vector<std::future<void>> futures;

        for (int i = 0; i < 40; ++i)
        {
            auto f = pool.enqueue([&] {
                auto guard = table.lock("ath-1");
                const int now = inside.fetch_add(1) + 1;
                int seen = maxInside.load();
                while (now > seen && !maxInside.compare_exchange_weak(seen, now)) {}
                std::this_thread::sleep_for(std::chrono::microseconds(200));
                inside.fetch_sub(1);
            });
            REQUIRE(f.has_value());
            futures.push_back(std::move(*f));
        }
        for (auto &f : futures)
            f.get();

        REQUIRE(maxInside.load() == 1);
    }
}

} // namespace tpo::concurrency
