#include "llm_dispatch/ThreadPool.hpp"

#include <spdlog/spdlog.h>

namespace llm_dispatch {

ThreadPool::ThreadPool(size_t num_threads) {
    if (num_threads == 0) num_threads = 1;
    threads_.reserve(num_threads);

    for (size_t i = 0; i < num_threads; ++i) {
        threads_.emplace_back([this] {
            while (true) {
                std::function<void()> task;
                {
                    std::unique_lock<std::mutex> lock(queue_mutex_);
                    condition_variable_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
                    if (stop_ && tasks_.empty()) return;

                    task = std::move(tasks_.front());
                    tasks_.pop();
                    ++active_tasks_;
                }

                try {
                    task();
                } catch (const std::exception& e) {
                    spdlog::error("💥 Worker task threw: {}", e.what());
                }

                {
                    std::lock_guard<std::mutex> lock(queue_mutex_);
                    --active_tasks_;
                }
                completion_cv_.notify_all();
            }
        });
    }
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }
    condition_variable_.notify_all();

    for (auto& thread : threads_) {
        if (thread.joinable()) thread.join();
    }
}

void ThreadPool::enqueue(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        tasks_.emplace(std::move(task));
    }
    condition_variable_.notify_one();
}

void ThreadPool::wait_all() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    completion_cv_.wait(lock, [this] { return tasks_.empty() && active_tasks_ == 0; });
}

bool ThreadPool::idle() {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return tasks_.empty() && active_tasks_ == 0;
}

}
