#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/Config.h"
#include "core/contracts/ITraderSource.h"
#include "core/state/StateSynchronizer.h"
#include "market/MarketDataStore.h"
#include "network/BinanceRestClient.h"
#include "network/BinanceStreamClient.h"
#include "sandbox/StrategySandbox.h"
#include "screener/ParallelScreener.h"
#include "signal/SignalLifecycle.h"

namespace sigscan {
namespace core {

// Services the orchestrator drives. stream and rest may be null (offline / tests).
struct OrchestratorServices {
    std::shared_ptr<market::MarketDataStore> store;
    std::shared_ptr<network::BinanceStreamClient> stream;
    std::shared_ptr<network::BinanceRestClient> rest;
    std::shared_ptr<sandbox::StrategySandbox> sandbox;
    std::shared_ptr<screener::ParallelScreener> screener;
    std::shared_ptr<StateSynchronizer> sync;
    std::shared_ptr<ITraderSource> traders;
};

// Top-level control loop:
// closed candles -> snapshot -> screen -> dedupe -> enqueue, plus trader reload and supervision.
class Orchestrator {
public:
    Orchestrator(AppConfig config, OrchestratorServices services);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // Loads traders, backfills, starts stream/sync and the scheduling thread.
    bool start();
    void stop();
    bool isRunning() const { return running_.load(); }

    // One scheduling tick. Never throws.
    void runTick(long long now_ms);

    // Returns false when the source could not be read (previous set kept).
    bool reloadTraders();

    // Restarts dead components. Returns the number restarted.
    int superviseOnce();

    std::vector<Trader> activeTraders() const;
    std::set<std::string> requiredIntervals() const;
    std::set<std::string> invalidTraders() const;
    long long ticksRun() const { return ticks_.load(); }
    size_t signalsEmitted() const { return signals_emitted_.load(); }

    nlohmann::json healthJson() const;
    std::string prometheusMetrics() const;

private:
    void run();
    std::set<std::string> computeIntervals(const std::vector<Trader>& traders) const;
    void backfill(const std::set<std::string>& intervals);
    void applyIntervalChange(const std::set<std::string>& intervals);

    AppConfig config_;
    OrchestratorServices services_;
    signal::SignalLifecycle lifecycle_;
    std::set<std::string> symbols_;

    mutable std::mutex state_mutex_;
    std::vector<Trader> traders_;
    std::set<std::string> intervals_;
    std::map<std::string, std::string> invalid_versions_;   // trader id -> version reported invalid

    std::atomic<bool> running_{false};
    std::atomic<long long> ticks_{0};
    std::atomic<size_t> signals_emitted_{0};
    std::atomic<size_t> restarts_{0};
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
    std::thread loop_thread_;
    std::chrono::steady_clock::time_point started_at_;
};

} // namespace core
} // namespace sigscan
