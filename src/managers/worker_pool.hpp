#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

// Fixed set of threads draining a bounded task queue. One slow task only
// occupies one thread; the rest keep serving other sessions.
class WorkerPool {
public:
    using Task = std::function<void()>;

    WorkerPool(int threads, size_t capacity);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // False when the queue is full or the pool is stopping.
    bool try_submit(Task task);

    // Block until the queue is empty and no task is running.
    void wait_idle();

    // Finish queued work, then join all threads.
    void shutdown();

    size_t thread_count() const { return threads_.size(); }

private:
    void worker_loop();

    size_t capacity_;
    std::vector<std::thread> threads_;

    std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable idle_cv_;
    std::deque<Task> queue_;
    int active_ = 0;
    bool stopping_ = false;
};
