#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

#include <nlohmann/json.hpp>

#include "common/Config.h"
#include "core/contracts/IPersistenceSink.h"

namespace sigscan {
namespace core {

// Batches signals, metrics and events into bounded queues and flushes them
// to the sink on a background thread. Full queues drop their oldest item.
class StateSynchronizer {
public:
    using CountersProvider = std::function<nlohmann::json()>;

    struct Stats {
        size_t enqueued_signals = 0;
        size_t enqueued_metrics = 0;
        size_t enqueued_events = 0;
        size_t evicted_signals = 0;
        size_t evicted_metrics = 0;
        size_t evicted_events = 0;
        size_t flushed_signals = 0;
        size_t flushed_metrics = 0;
        size_t flushed_events = 0;
        size_t failed_batches = 0;
        size_t heartbeats = 0;
        int consecutive_failures = 0;
    };

    StateSynchronizer(SyncConfig config, std::shared_ptr<IPersistenceSink> sink);
    ~StateSynchronizer();

    StateSynchronizer(const StateSynchronizer&) = delete;
    StateSynchronizer& operator=(const StateSynchronizer&) = delete;

    void start();
    // Stops the flush thread and performs a final flush.
    void stop();
    bool isRunning() const { return running_.load(); }
    // false when the flush thread exited without stop()
    bool isHealthy() const;

    void enqueueSignal(Signal signal);
    void enqueueMetric(MetricRecord metric);
    void enqueueEvent(EventRecord event);
    void emitEvent(const std::string& type, Severity severity, nlohmann::json details = nlohmann::json::object());

    // Drains every queue in batches. Returns false if any batch failed (it stays queued).
    bool flushNow();
    bool sendHeartbeat();

    void setCountersProvider(CountersProvider provider);

    size_t pendingSignals() const;
    size_t pendingMetrics() const;
    size_t pendingEvents() const;
    Stats stats() const;
    nlohmann::json statsJson() const;

private:
    template <typename T>
    void pushBounded(std::deque<T>& queue, T item, size_t& evicted, const char* kind);

    template <typename T, typename Writer>
    bool flushQueue(std::deque<T>& queue, size_t& evicted, size_t& flushed,
                    const char* kind, Writer writer);

    void run();
    void onFlushResult(bool ok);
    long long retryDelayMs(int failures) const;

    SyncConfig config_;
    std::shared_ptr<IPersistenceSink> sink_;
    CountersProvider counters_provider_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Signal> signals_;
    std::deque<MetricRecord> metrics_;
    std::deque<EventRecord> events_;
    Stats stats_;
    bool degraded_ = false;

    std::mutex flush_mutex_;    // one flush at a time

    std::thread worker_;
    std::atomic<bool> running_{false};
    std::atomic<bool> thread_alive_{false};
    std::chrono::steady_clock::time_point started_at_;
};

} // namespace core
} // namespace sigscan
