#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace ward {

// Fixed-size worker pool with a bounded task queue. Used for work that must
// never stall the sweep loop (alert delivery). When the queue is full, TryPost()
// refuses the task instead of blocking the caller.
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = 1, size_t max_queue = 1024);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Fire-and-forget. Returns false when the pool is stopped or the queue is full.
    bool TryPost(std::function<void()> task);

    // Runs every queued task, then joins the workers.
    void Shutdown();

    // Blocks until the queue is empty and no task is executing.
    void WaitIdle();

    size_t GetQueueSize() const;
    uint64_t GetRejectedCount() const { return rejected_.load(); }

private:
    void WorkerThread();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    size_t max_queue_;
    size_t busy_{0};

    mutable std::mutex queue_mutex_;
    std::condition_variable condition_;
    std::condition_variable idle_condition_;
    std::atomic<bool> stop_{false};
    std::atomic<uint64_t> rejected_{0};
};

} // namespace ward
