#include "screener/WorkerPool.h"

#include <stdexcept>

#include "common/Logger.h"

namespace sigscan {
namespace screener {

WorkerPool::WorkerPool(size_t threads) {
    if (threads == 0) {
        throw std::invalid_argument("worker pool needs at least one thread");
    }
    workers_.reserve(threads);
    for (size_t i = 0; i < threads; ++i) {
        workers_.emplace_back(&WorkerPool::workerLoop, this);
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

bool WorkerPool::submit(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return false;
        }
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && workers_.empty()) {
            return;
        }
        stopping_ = true;
        if (!tasks_.empty()) {
            LOG_WARN("[WorkerPool] discarding {} queued tasks", tasks_.size());
        }
        tasks_.clear();
    }
    cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

size_t WorkerPool::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void WorkerPool::workerLoop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
            if (stopping_) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }

        try {
            task();
        } catch (const std::exception& e) {
            // 태스크 경계에서 예외를 기록하고 워커는 계속 동작
            LOG_ERROR("[WorkerPool] task threw: {}", e.what());
        }
    }
}

} // namespace screener
} // namespace sigscan
