#include <gtest/gtest.h>

#include <atomic>
#include <future>
#include <stdexcept>
#include <string>
#include <vector>
#include "threading/ThreadPool.hpp"

using namespace RetailForge;

TEST(ThreadPoolTest, ResultsComeBackThroughFutures)
{
    ThreadPool pool(3);
    EXPECT_EQ(pool.worker_count(), 3u);

    std::vector<std::future<int>> results;
    for (int i = 0; i < 20; ++i)
        results.push_back(pool.submit([i]
                                      { return i * i; }));
    for (int i = 0; i < 20; ++i)
        EXPECT_EQ(results[i].get(), i * i);
}

TEST(ThreadPoolTest, JobExceptionIsRethrownByGet)
{
    ThreadPool pool(2);
    auto failing = pool.submit([]() -> std::string
                               { throw std::runtime_error("disk full"); });
    auto fine = pool.submit([]
                            { return std::string("ok"); });

    EXPECT_THROW(failing.get(), std::runtime_error);
    EXPECT_EQ(fine.get(), "ok");
}

TEST(ThreadPoolTest, ZeroWorkersMeansOne)
{
    ThreadPool pool(0);
    EXPECT_EQ(pool.worker_count(), 1u);
    EXPECT_EQ(pool.submit([]
                          { return 7; })
                  .get(),
              7);
}

TEST(ThreadPoolTest, QueuedJobsRunBeforeShutdown)
{
    std::atomic<int> ran{0};
    {
        ThreadPool pool(1);
        for (int i = 0; i < 50; ++i)
            pool.submit([&ran]
                        { ++ran; });
    }
    EXPECT_EQ(ran.load(), 50);
}
