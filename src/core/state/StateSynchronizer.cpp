#include "core/state/StateSynchronizer.h"

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <vector>

#include "common/Logger.h"

namespace sigscan {
namespace core {

StateSynchronizer::StateSynchronizer(SyncConfig config, std::shared_ptr<IPersistenceSink> sink)
    : config_(std::move(config))
    , sink_(std::move(sink))
    , started_at_(std::chrono::steady_clock::now()) {
    if (!sink_) {
        throw std::invalid_argument("StateSynchronizer requires a sink");
    }
    if (config_.max_queue_size == 0 || config_.batch_size == 0) {
        throw std::invalid_argument("queue and batch sizes must be positive");
    }
}

StateSynchronizer::~StateSynchronizer() {
    stop();
}

void StateSynchronizer::start() {
    if (running_.load()) {
        if (thread_alive_.load()) {
            return;
        }
    }
    if (worker_.joinable()) {
        worker_.join();
    }

    running_ = true;
    thread_alive_ = true;
    worker_ = std::thread(&StateSynchronizer::run, this);
    LOG_INFO("[Sync] started (sink={}, flush={}s, cap={})",
             sink_->name(), config_.flush_seconds, config_.max_queue_size);
}

void StateSynchronizer::stop() {
    const bool was_running = running_.exchange(false);
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    if (was_running) {
        if (!flushNow()) {
            LOG_WARN("[Sync] final flush incomplete: {} signals, {} metrics, {} events left",
                     pendingSignals(), pendingMetrics(), pendingEvents());
        }
        LOG_INFO("[Sync] stopped");
    }
}

bool StateSynchronizer::isHealthy() const {
    return !running_.load() || thread_alive_.load();
}

template <typename T>
void StateSynchronizer::pushBounded(std::deque<T>& queue, T item, size_t& evicted, const char* kind) {
    // caller holds mutex_
    if (queue.size() >= config_.max_queue_size) {
        queue.pop_front();
        ++evicted;
        LOG_WARN("[Sync] {} queue full ({}), evicted oldest (total evicted {})",
                 kind, config_.max_queue_size, evicted);
    }
    queue.push_back(std::move(item));
}

void StateSynchronizer::enqueueSignal(Signal signal) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.enqueued_signals;
    pushBounded(signals_, std::move(signal), stats_.evicted_signals, "signal");
}

void StateSynchronizer::enqueueMetric(MetricRecord metric) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.enqueued_metrics;
    pushBounded(metrics_, std::move(metric), stats_.evicted_metrics, "metric");
}

void StateSynchronizer::enqueueEvent(EventRecord event) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.enqueued_events;
    pushBounded(events_, std::move(event), stats_.evicted_events, "event");
}

void StateSynchronizer::emitEvent(const std::string& type, Severity severity, nlohmann::json details) {
    EventRecord event;
    event.source_id = config_.source_id;
    event.type = type;
    event.severity = severity;
    event.timestamp_ms = nowEpochMs();
    event.details = std::move(details);
    enqueueEvent(std::move(event));
}

template <typename T, typename Writer>
bool StateSynchronizer::flushQueue(std::deque<T>& queue, size_t& evicted, size_t& flushed,
                                   const char* kind, Writer writer) {
    while (true) {
        std::vector<T> batch;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (queue.empty()) {
                return true;
            }
            const size_t n = std::min(queue.size(), config_.batch_size);
            batch.assign(std::make_move_iterator(queue.begin()),
                         std::make_move_iterator(queue.begin() + static_cast<std::ptrdiff_t>(n)));
            queue.erase(queue.begin(), queue.begin() + static_cast<std::ptrdiff_t>(n));
        }

        if (writer(batch)) {
            std::lock_guard<std::mutex> lock(mutex_);
            flushed += batch.size();
            continue;
        }

        // 실패한 배치는 앞쪽으로 되돌린다. 그 사이 새로 들어온 항목이 있으면 가장 오래된 것부터 버린다.
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.failed_batches;
        queue.insert(queue.begin(),
                     std::make_move_iterator(batch.begin()),
                     std::make_move_iterator(batch.end()));
        while (queue.size() > config_.max_queue_size) {
            queue.pop_front();
            ++evicted;
        }
        LOG_WARN("[Sync] {} batch of {} failed on sink {}", kind, batch.size(), sink_->name());
        return false;
    }
}

bool StateSynchronizer::flushNow() {
    std::lock_guard<std::mutex> flush_lock(flush_mutex_);

    // 큐별로 독립 플러시. 한 큐의 실패가 나머지를 막지 않는다
    const bool signals_ok = flushQueue(signals_, stats_.evicted_signals, stats_.flushed_signals, "signal",
        [this](const std::vector<Signal>& b) { return sink_->writeSignals(b); });
    const bool metrics_ok = flushQueue(metrics_, stats_.evicted_metrics, stats_.flushed_metrics, "metric",
        [this](const std::vector<MetricRecord>& b) { return sink_->writeMetrics(b); });
    const bool events_ok = flushQueue(events_, stats_.evicted_events, stats_.flushed_events, "event",
        [this](const std::vector<EventRecord>& b) { return sink_->writeEvents(b); });

    const bool ok = signals_ok && metrics_ok && events_ok;
    onFlushResult(ok);
    return ok;
}

void StateSynchronizer::onFlushResult(bool ok) {
    bool became_degraded = false;
    bool recovered = false;
    int failures = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (ok) {
            recovered = degraded_;
            degraded_ = false;
            stats_.consecutive_failures = 0;
        } else {
            failures = ++stats_.consecutive_failures;
            if (!degraded_ && failures >= config_.degraded_after_failures) {
                degraded_ = true;
                became_degraded = true;
            }
        }
    }

    if (became_degraded) {
        LOG_ERROR("[Sync] sink {} failing ({} consecutive flushes)", sink_->name(), failures);
        emitEvent("persistence_degraded", Severity::Error,
                  {{"sink", sink_->name()}, {"consecutive_failures", failures}});
    }
    if (recovered) {
        LOG_INFO("[Sync] sink {} recovered", sink_->name());
        emitEvent("persistence_recovered", Severity::Info, {{"sink", sink_->name()}});
    }
}

bool StateSynchronizer::sendHeartbeat() {
    MetricRecord heartbeat;
    heartbeat.source_id = config_.source_id;
    heartbeat.timestamp_ms = nowEpochMs();

    nlohmann::json counters = statsJson();
    counters["type"] = "heartbeat";
    counters["uptime_seconds"] = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - started_at_).count();

    CountersProvider provider;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        provider = counters_provider_;
    }
    if (provider) {
        counters.update(provider());
    }
    heartbeat.counters = std::move(counters);

    // 하트비트는 큐를 거치지 않고 바로 기록
    const bool ok = sink_->writeMetrics({heartbeat});
    std::lock_guard<std::mutex> lock(mutex_);
    if (ok) {
        ++stats_.heartbeats;
    } else {
        LOG_WARN("[Sync] heartbeat write failed on sink {}", sink_->name());
    }
    return ok;
}

void StateSynchronizer::setCountersProvider(CountersProvider provider) {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_provider_ = std::move(provider);
}

long long StateSynchronizer::retryDelayMs(int failures) const {
    long long delay = config_.retry_initial_ms;
    for (int i = 1; i < failures && delay < config_.retry_max_ms; ++i) {
        delay *= 2;
    }
    return std::min(delay, config_.retry_max_ms);
}

void StateSynchronizer::run() {
    using clock = std::chrono::steady_clock;
    const auto flush_interval = std::chrono::seconds(std::max(1, config_.flush_seconds));
    const auto heartbeat_interval = std::chrono::seconds(std::max(1, config_.heartbeat_seconds));

    auto next_flush = clock::now() + flush_interval;
    auto next_heartbeat = clock::now();

    try {
        while (running_.load()) {
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait_until(lock, std::min(next_flush, next_heartbeat),
                               [this] { return !running_.load(); });
            }
            if (!running_.load()) {
                break;
            }

            const auto now = clock::now();
            if (now >= next_heartbeat) {
                sendHeartbeat();
                next_heartbeat = now + heartbeat_interval;
            }
            if (now >= next_flush) {
                if (flushNow()) {
                    next_flush = clock::now() + flush_interval;
                } else {
                    int failures = 0;
                    {
                        std::lock_guard<std::mutex> lock(mutex_);
                        failures = stats_.consecutive_failures;
                    }
                    const long long delay = retryDelayMs(failures);
                    LOG_WARN("[Sync] flush failed, retry in {}ms", delay);
                    next_flush = clock::now() + std::chrono::milliseconds(delay);
                }
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("[Sync] flush thread terminated: {}", e.what());
        thread_alive_ = false;
        return;
    }
    thread_alive_ = false;
}

size_t StateSynchronizer::pendingSignals() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return signals_.size();
}

size_t StateSynchronizer::pendingMetrics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return metrics_.size();
}

size_t StateSynchronizer::pendingEvents() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

StateSynchronizer::Stats StateSynchronizer::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

nlohmann::json StateSynchronizer::statsJson() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {
        {"queue_signals", signals_.size()},
        {"queue_metrics", metrics_.size()},
        {"queue_events", events_.size()},
        {"evicted_signals", stats_.evicted_signals},
        {"evicted_metrics", stats_.evicted_metrics},
        {"evicted_events", stats_.evicted_events},
        {"flushed_signals", stats_.flushed_signals},
        {"flushed_metrics", stats_.flushed_metrics},
        {"flushed_events", stats_.flushed_events},
        {"failed_batches", stats_.failed_batches},
        {"consecutive_failures", stats_.consecutive_failures},
        {"degraded", degraded_}
    };
}

} // namespace core
} // namespace sigscan
