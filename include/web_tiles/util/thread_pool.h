#pragma once

/**
 * @file thread_pool.h
 * @brief Fixed-size worker pool used for tile fetches
 */

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace web_tiles {

/**
 * @brief FIFO thread pool
 *
 * Tasks run in submission order on the first free worker. The destructor
 * drains the queue and joins every worker, so tasks still queued at
 * destruction time do run.
 */
class ThreadPool {
public:
    /**
     * @brief Start the workers
     *
     * @param num_threads Worker count, clamped to at least 1
     */
    explicit ThreadPool(std::size_t num_threads);

    ~ThreadPool();

    // Non-copyable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Queue a task
     *
     * Tasks submitted after shutdown began are dropped.
     */
    void Enqueue(std::function<void()> task);

    std::size_t GetQueueSize() const;

    std::size_t GetThreadCount() const {
        return workers_.size();
    }

private:
    void WorkerThreadMain();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    mutable std::mutex queue_mutex_;
    std::condition_variable condition_;
    bool stop_;
};

} // namespace web_tiles
