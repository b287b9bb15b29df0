#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace sigscan {
namespace screener {

// Fixed-size thread pool with a FIFO task queue.
class WorkerPool {
public:
    explicit WorkerPool(size_t threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Returns false after shutdown().
    bool submit(std::function<void()> task);

    // Discards queued tasks and joins the workers after their current task.
    void shutdown();

    size_t size() const { return workers_.size(); }
    size_t pending() const;

private:
    void workerLoop();

    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> tasks_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;
};

} // namespace screener
} // namespace sigscan
