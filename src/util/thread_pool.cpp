/**
 * @file thread_pool.cpp
 * @brief Fixed-size worker pool implementation
 */

#include <web_tiles/util/thread_pool.h>
#include <exception>
#include <spdlog/spdlog.h>

namespace web_tiles {

ThreadPool::ThreadPool(std::size_t num_threads) : stop_(false) {
    if (num_threads < 1) {
        num_threads = 1;
        spdlog::warn("ThreadPool: num_threads < 1, defaulting to 1");
    }

    workers_.reserve(num_threads);
    for (std::size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back(&ThreadPool::WorkerThreadMain, this);
    }

    spdlog::debug("ThreadPool started with {} worker threads", num_threads);
}

ThreadPool::~ThreadPool() {
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }

    condition_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void ThreadPool::Enqueue(std::function<void()> task) {
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        if (stop_) {
            spdlog::warn("ThreadPool: task submitted during shutdown, dropping");
            return;
        }
        tasks_.emplace(std::move(task));
    }

    condition_.notify_one();
}

std::size_t ThreadPool::GetQueueSize() const {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    return tasks_.size();
}

void ThreadPool::WorkerThreadMain() {
    while (true) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            condition_.wait(lock, [this] {
                return stop_ || !tasks_.empty();
            });

            if (stop_ && tasks_.empty()) {
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop();
        }

        try {
            task();
        } catch (const std::exception& e) {
            spdlog::error("ThreadPool: task threw: {}", e.what());
        }
    }
}

} // namespace web_tiles
