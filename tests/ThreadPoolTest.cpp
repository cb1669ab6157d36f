#include <gtest/gtest.h>

#include <atomic>

#include "Thread/ThreadPool.hpp"
#include "core/Grid.hpp"
#include "core/Solver.hpp"

TEST(ThreadPoolTest, ReturnsJobResult)
{
    ThreadPool pool(1);
    auto fut = pool.submit([] { return 6 * 7; });
    EXPECT_EQ(fut.get(), 42);
}

TEST(ThreadPoolTest, SolvesOffThread)
{
    Grid grid(20, 20, {}, 11u);
    ThreadPool pool(1);

    auto fut = pool.submit([&grid]() -> SolveResult
    {
        grid.generate();
        grid.resetSolveState();
        return Solver::Solve(grid);
    });

    const SolveResult r = fut.get();
    EXPECT_TRUE(r.solved);
    EXPECT_EQ(r.path.back(), grid.exit());
}

TEST(ThreadPoolTest, JobExceptionReachesFuture)
{
    ThreadPool pool(1);
    auto fut = pool.submit([]() -> int { throw std::logic_error("boom"); });
    EXPECT_THROW(fut.get(), std::logic_error);
}

TEST(ThreadPoolTest, SingleWorkerRunsInOrder)
{
    ThreadPool pool(1);
    std::vector<int> order;
    for (int i = 0; i < 5; ++i)
        pool.submit([&order, i] { order.push_back(i); });

    pool.waitIdle();
    EXPECT_EQ(pool.pending(), 0u);
    EXPECT_EQ(order, (std::vector<int>{ 0, 1, 2, 3, 4 }));
}

TEST(ThreadPoolTest, ShutdownDrainsQueue)
{
    std::atomic<int> ran{0};
    {
        ThreadPool pool(2);
        for (int i = 0; i < 20; ++i)
            pool.submit([&ran] { ran.fetch_add(1); });
        pool.shutdown();
        EXPECT_EQ(pool.size(), 0u);
    }
    EXPECT_EQ(ran.load(), 20);
}

TEST(ThreadPoolTest, SubmitAfterShutdownThrows)
{
    ThreadPool pool(1);
    pool.shutdown();
    EXPECT_THROW(pool.submit([] {}), std::runtime_error);
}
