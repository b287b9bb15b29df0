#include "core/orchestration/Orchestrator.h"

#include <algorithm>
#include <sstream>
#include <stdexcept>

#include "common/Interval.h"
#include "common/Logger.h"

namespace sigscan {
namespace core {

namespace {
constexpr auto kSuperviseInterval = std::chrono::seconds(5);
}

Orchestrator::Orchestrator(AppConfig config, OrchestratorServices services)
    : config_(std::move(config))
    , services_(std::move(services))
    , lifecycle_(config_.signals.dedupe_bars)
    , symbols_(config_.market.symbols.begin(), config_.market.symbols.end())
    , started_at_(std::chrono::steady_clock::now()) {
    if (!services_.store || !services_.sandbox || !services_.screener ||
        !services_.sync || !services_.traders) {
        throw std::invalid_argument("Orchestrator: store, sandbox, screener, sync and trader source are required");
    }
    intervals_.insert(config_.market.fallback_interval);
}

Orchestrator::~Orchestrator() {
    stop();
}

bool Orchestrator::start() {
    if (running_.load()) {
        LOG_WARN("[Orchestrator] already running");
        return false;
    }

    LOG_INFO("========================================");
    LOG_INFO("sigscan starting: {} symbols", symbols_.size());
    LOG_INFO("========================================");

    if (!reloadTraders()) {
        LOG_WARN("[Orchestrator] no trader set loaded yet, will retry every {}s", config_.traders.reload_seconds);
    }

    const auto intervals = requiredIntervals();
    backfill(intervals);

    if (services_.stream && !services_.stream->start(symbols_, intervals)) {
        LOG_ERROR("[Orchestrator] market stream failed to start");
        return false;
    }
    services_.sync->start();
    services_.sync->emitEvent("started", Severity::Info,
                              {{"symbols", symbols_.size()}, {"intervals", intervals}});

    running_ = true;
    started_at_ = std::chrono::steady_clock::now();
    loop_thread_ = std::thread(&Orchestrator::run, this);
    return true;
}

void Orchestrator::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    LOG_INFO("[Orchestrator] stopping");

    // 진행 중인 틱이 빨리 끝나도록 먼저 취소
    services_.screener->cancel();
    wait_cv_.notify_all();
    if (loop_thread_.joinable()) {
        loop_thread_.join();
    }

    services_.screener->stop();
    if (services_.stream) {
        services_.stream->stop();
    }
    services_.sync->emitEvent("stopped", Severity::Info, {{"ticks", ticks_.load()}});
    services_.sync->stop();
    LOG_INFO("[Orchestrator] stopped after {} ticks, {} signals", ticks_.load(), signals_emitted_.load());
}

void Orchestrator::run() {
    using clock = std::chrono::steady_clock;
    const auto tick_interval = std::chrono::seconds(std::max(1, config_.screener.tick_seconds));
    const auto reload_interval = std::chrono::seconds(std::max(1, config_.traders.reload_seconds));

    auto next_tick = clock::now();
    auto next_reload = clock::now() + reload_interval;
    auto next_supervise = clock::now() + kSuperviseInterval;

    LOG_INFO("[Orchestrator] scheduling loop started (tick {}s)", tick_interval.count());

    while (running_.load()) {
        {
            std::unique_lock<std::mutex> lock(wait_mutex_);
            wait_cv_.wait_until(lock, std::min({next_tick, next_reload, next_supervise}),
                                [this] { return !running_.load(); });
        }
        if (!running_.load()) {
            break;
        }

        auto now = clock::now();
        if (now >= next_tick) {
            runTick(nowEpochMs());

            // 틱이 주기를 넘기면 밀린 틱은 건너뛴다
            now = clock::now();
            next_tick += tick_interval;
            if (next_tick <= now) {
                const auto missed = (now - next_tick) / tick_interval + 1;
                LOG_WARN("[Orchestrator] tick overran, skipping {} tick(s)", missed);
                next_tick += tick_interval * missed;
            }
        }
        if (now >= next_reload) {
            reloadTraders();
            next_reload = clock::now() + reload_interval;
        }
        if (now >= next_supervise) {
            superviseOnce();
            next_supervise = clock::now() + kSuperviseInterval;
        }
    }

    LOG_INFO("[Orchestrator] scheduling loop finished");
}

void Orchestrator::runTick(long long now_ms) {
    try {
        // 닫힌 캔들로 바 카운터 진행
        for (const auto& event : services_.store->drainClosedEvents()) {
            lifecycle_.onCandleClosed(event.symbol, event.interval);
        }

        std::vector<Trader> traders = activeTraders();
        if (traders.empty()) {
            ++ticks_;
            return;
        }

        auto snapshots = services_.store->snapshotAll();
        for (auto it = snapshots.begin(); it != snapshots.end();) {
            if (symbols_.count(it->first) == 0) {
                it = snapshots.erase(it);
            } else {
                ++it;
            }
        }

        auto report = services_.screener->screen(traders, snapshots, now_ms);

        std::map<std::string, const Trader*> by_id;
        for (const auto& trader : traders) {
            by_id[trader.id] = &trader;
        }

        size_t new_signals = 0;
        for (const auto& [trader_id, results] : report.matches) {
            auto trader = by_id.find(trader_id);
            if (trader == by_id.end()) {
                continue;
            }
            for (const auto& result : results) {
                auto snap = snapshots.find(result.symbol);
                if (snap == snapshots.end()) {
                    continue;
                }
                auto signal = lifecycle_.process(*trader->second, result, snap->second, now_ms);
                if (signal) {
                    services_.sync->enqueueSignal(std::move(*signal));
                    ++new_signals;
                }
            }
        }
        signals_emitted_ += new_signals;

        MetricRecord metric;
        metric.source_id = config_.sync.source_id;
        metric.timestamp_ms = now_ms;
        metric.counters = {
            {"type", "tick"},
            {"due", report.stats.due},
            {"evaluated", report.stats.evaluated},
            {"matched", report.stats.matched},
            {"new_signals", new_signals},
            {"runtime_errors", report.stats.runtime_errors},
            {"timeouts", report.stats.timeouts},
            {"abandoned", report.stats.abandoned},
            {"duration_ms", report.stats.duration_ms}
        };
        services_.sync->enqueueMetric(std::move(metric));

        ++ticks_;
        if (new_signals > 0 || report.stats.matched > 0) {
            LOG_INFO("[Orchestrator] tick {}: {} matched, {} new signals",
                     ticks_.load(), report.stats.matched, new_signals);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("[Orchestrator] tick failed: {}", e.what());
    }
}

bool Orchestrator::reloadTraders() {
    std::vector<Trader> loaded;
    try {
        loaded = services_.traders->loadTraders();
    } catch (const std::exception& e) {
        LOG_WARN("[Orchestrator] trader reload from {} failed: {}", services_.traders->describe(), e.what());
        return false;
    }

    std::vector<Trader> valid;
    std::vector<std::pair<Trader, std::string>> newly_invalid;
    for (auto& trader : loaded) {
        const std::string error = services_.sandbox->prepare(trader);
        if (error.empty()) {
            valid.push_back(std::move(trader));
        } else {
            newly_invalid.emplace_back(std::move(trader), error);
        }
    }

    std::set<std::string> retired;
    std::set<std::string> active_ids;
    std::set<std::string> intervals;
    std::vector<std::pair<Trader, std::string>> to_report;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);

        for (const auto& trader : valid) {
            active_ids.insert(trader.id);
            invalid_versions_.erase(trader.id);
        }
        for (auto& entry : newly_invalid) {
            auto it = invalid_versions_.find(entry.first.id);
            if (it == invalid_versions_.end() || it->second != entry.first.version) {
                invalid_versions_[entry.first.id] = entry.first.version;
                to_report.push_back(entry);
            }
        }
        for (const auto& old : traders_) {
            if (active_ids.count(old.id) == 0) {
                retired.insert(old.id);
            }
        }

        traders_ = std::move(valid);
        intervals = computeIntervals(traders_);
    }

    for (const auto& [trader, error] : to_report) {
        LOG_WARN("[Orchestrator] trader {} v{} invalid: {}", trader.id, trader.version, error);
        services_.sync->emitEvent("trader_invalid", Severity::Warning,
                                  {{"trader_id", trader.id}, {"version", trader.version}, {"error", error}});
    }

    for (const auto& id : retired) {
        LOG_INFO("[Orchestrator] trader {} retired", id);
        services_.sandbox->forget(id);
        services_.screener->forget(id);
    }
    if (!retired.empty()) {
        lifecycle_.prune(active_ids);
    }

    applyIntervalChange(intervals);
    LOG_INFO("[Orchestrator] {} active traders, {} invalid, intervals {}",
             active_ids.size(), invalidTraders().size(), nlohmann::json(intervals).dump());
    return true;
}

std::set<std::string> Orchestrator::computeIntervals(const std::vector<Trader>& traders) const {
    std::vector<std::string> merged{config_.market.fallback_interval};
    for (const auto& trader : traders) {
        merged = mergeIntervals(merged, trader.intervals());
    }
    return std::set<std::string>(merged.begin(), merged.end());
}

void Orchestrator::applyIntervalChange(const std::set<std::string>& intervals) {
    std::set<std::string> added;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (intervals == intervals_) {
            return;
        }
        for (const auto& interval : intervals) {
            if (intervals_.count(interval) == 0) {
                added.insert(interval);
            }
        }
        intervals_ = intervals;
    }

    LOG_INFO("[Orchestrator] interval set changed: {}", nlohmann::json(intervals).dump());
    services_.store->retain(symbols_, intervals);
    // 기동 시에는 start()가 전체 백필을 수행
    if (running_.load() && !added.empty()) {
        backfill(added);
    }
    if (services_.stream && services_.stream->isRunning()) {
        services_.stream->updateSubscriptions(symbols_, intervals);
    }
}

void Orchestrator::backfill(const std::set<std::string>& intervals) {
    if (!services_.rest || config_.market.backfill_limit <= 0) {
        return;
    }
    for (const auto& symbol : symbols_) {
        for (const auto& interval : intervals) {
            try {
                auto candles = services_.rest->fetchKlines(symbol, interval, config_.market.backfill_limit);
                services_.store->seedCandles(symbol, interval, candles);
                LOG_DEBUG("[Orchestrator] backfilled {} {} ({} candles)", symbol, interval, candles.size());
            } catch (const std::exception& e) {
                LOG_WARN("[Orchestrator] backfill {} {} failed: {}", symbol, interval, e.what());
            }
        }
    }
}

int Orchestrator::superviseOnce() {
    int restarted = 0;

    if (services_.stream && !services_.stream->isHealthy()) {
        LOG_ERROR("[Orchestrator] market stream loop died, restarting");
        services_.stream->stop();
        if (services_.stream->start(symbols_, requiredIntervals())) {
            ++restarted;
            services_.sync->emitEvent("component_restarted", Severity::Warning, {{"component", "market_stream"}});
        }
    }

    if (!services_.sync->isHealthy()) {
        LOG_ERROR("[Orchestrator] state synchronizer thread died, restarting");
        services_.sync->start();
        ++restarted;
        services_.sync->emitEvent("component_restarted", Severity::Warning, {{"component", "state_synchronizer"}});
    }

    restarts_ += static_cast<size_t>(restarted);
    return restarted;
}

std::vector<Trader> Orchestrator::activeTraders() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return traders_;
}

std::set<std::string> Orchestrator::requiredIntervals() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return intervals_;
}

std::set<std::string> Orchestrator::invalidTraders() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    std::set<std::string> ids;
    for (const auto& entry : invalid_versions_) {
        ids.insert(entry.first);
    }
    return ids;
}

nlohmann::json Orchestrator::healthJson() const {
    const auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - started_at_).count();

    nlohmann::json health;
    health["status"] = running_.load() ? "ok" : "stopped";
    health["uptime_seconds"] = uptime;
    health["stream_state"] = services_.stream ? network::toString(services_.stream->state()) : "disabled";
    health["active_traders"] = activeTraders().size();
    health["ticks"] = ticks_.load();
    return health;
}

std::string Orchestrator::prometheusMetrics() const {
    std::ostringstream out;
    const auto totals = services_.screener->totals();
    const auto sync = services_.sync->stats();

    out << "# HELP sigscan_ticks_total Scheduling ticks run\n"
        << "# TYPE sigscan_ticks_total counter\n"
        << "sigscan_ticks_total " << ticks_.load() << "\n";
    out << "# TYPE sigscan_signals_total counter\n"
        << "sigscan_signals_total " << signals_emitted_.load() << "\n";
    out << "# TYPE sigscan_evaluations_total counter\n"
        << "sigscan_evaluations_total " << totals.evaluated << "\n"
        << "# TYPE sigscan_matches_total counter\n"
        << "sigscan_matches_total " << totals.matched << "\n"
        << "# TYPE sigscan_evaluation_errors_total counter\n"
        << "sigscan_evaluation_errors_total{kind=\"runtime\"} " << totals.runtime_errors << "\n"
        << "sigscan_evaluation_errors_total{kind=\"timeout\"} " << totals.timeouts << "\n"
        << "sigscan_evaluation_errors_total{kind=\"abandoned\"} " << totals.abandoned << "\n";
    out << "# TYPE sigscan_active_traders gauge\n"
        << "sigscan_active_traders " << activeTraders().size() << "\n";
    out << "# TYPE sigscan_queue_evictions_total counter\n"
        << "sigscan_queue_evictions_total{queue=\"signals\"} " << sync.evicted_signals << "\n"
        << "sigscan_queue_evictions_total{queue=\"metrics\"} " << sync.evicted_metrics << "\n"
        << "sigscan_queue_evictions_total{queue=\"events\"} " << sync.evicted_events << "\n";
    out << "# TYPE sigscan_component_restarts_total counter\n"
        << "sigscan_component_restarts_total " << restarts_.load() << "\n";

    if (services_.stream) {
        const auto stream = services_.stream->stats();
        out << "# TYPE sigscan_stream_messages_total counter\n"
            << "sigscan_stream_messages_total " << stream.messages_received << "\n"
            << "# TYPE sigscan_stream_malformed_total counter\n"
            << "sigscan_stream_malformed_total " << stream.malformed << "\n"
            << "# TYPE sigscan_stream_reconnects_total counter\n"
            << "sigscan_stream_reconnects_total " << stream.reconnects << "\n";
    }
    return out.str();
}

} // namespace core
} // namespace sigscan
