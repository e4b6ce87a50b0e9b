#include "worker_pool.hpp"
#include "session_log.hpp"
#include <fmt/format.h>
#include <exception>

WorkerPool::WorkerPool(int threads, size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {
    if (threads < 1) threads = 1;
    for (int i = 0; i < threads; ++i) {
        threads_.emplace_back(&WorkerPool::worker_loop, this);
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

bool WorkerPool::try_submit(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ || queue_.size() >= capacity_) return false;
        queue_.push_back(std::move(task));
    }
    work_cv_.notify_one();
    return true;
}

void WorkerPool::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return queue_.empty() && active_ == 0; });
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && threads_.empty()) return;
        stopping_ = true;
    }
    work_cv_.notify_all();
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
    threads_.clear();
}

void WorkerPool::worker_loop() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            work_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) return;   // stopping and drained
            task = std::move(queue_.front());
            queue_.pop_front();
            ++active_;
        }

        try {
            task();
        } catch (const std::exception& e) {
            agentmux_log(fmt::format("worker: task failed: {}", e.what()));
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            --active_;
            if (queue_.empty() && active_ == 0) idle_cv_.notify_all();
        }
    }
}
