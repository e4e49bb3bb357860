#include <gtest/gtest.h>
#include <web_tiles/util/thread_pool.h>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

namespace web_tiles::tests {

TEST(ThreadPoolTest, ZeroThreadsIsClampedToOne) {
    ThreadPool pool(0);
    EXPECT_EQ(pool.GetThreadCount(), 1u);
}

TEST(ThreadPoolTest, RunsAllTasksBeforeDestruction) {
    std::atomic<int> counter{0};
    {
        ThreadPool pool(4);
        for (int i = 0; i < 100; ++i) {
            pool.Enqueue([&counter] { counter.fetch_add(1); });
        }
    }
    EXPECT_EQ(counter.load(), 100);
}

TEST(ThreadPoolTest, RunsTasksConcurrently) {
    std::atomic<int> running{0};
    std::atomic<int> peak{0};
    {
        ThreadPool pool(4);
        for (int i = 0; i < 4; ++i) {
            pool.Enqueue([&] {
                const int now = running.fetch_add(1) + 1;
                int expected = peak.load();
                while (now > expected && !peak.compare_exchange_weak(expected, now)) {
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
                running.fetch_sub(1);
            });
        }
    }
    EXPECT_GT(peak.load(), 1);
}

TEST(ThreadPoolTest, ThrowingTaskDoesNotKillWorker) {
    std::atomic<int> counter{0};
    {
        ThreadPool pool(1);
        pool.Enqueue([] { throw std::runtime_error("task failure"); });
        pool.Enqueue([&counter] { counter.fetch_add(1); });
    }
    EXPECT_EQ(counter.load(), 1);
}

} // namespace web_tiles::tests
