#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "common/Config.h"
#include "core/model/Records.h"
#include "market/MarketSnapshot.h"
#include "sandbox/StrategySandbox.h"
#include "screener/WorkerPool.h"

namespace sigscan {
namespace screener {

struct TickStats {
    size_t due = 0;
    size_t evaluated = 0;
    size_t matched = 0;
    size_t compile_errors = 0;
    size_t runtime_errors = 0;
    size_t timeouts = 0;
    size_t abandoned = 0;
    long long duration_ms = 0;
};

struct TickReport {
    std::map<std::string, std::vector<core::EvaluationResult>> matches;   // trader id -> matched results
    std::vector<core::EvaluationResult> failures;                          // compile/runtime/timeout
    TickStats stats;
};

// Evaluates every due (trader, symbol) pair on a worker pool once per tick.
// screen() is not reentrant: one tick at a time, called from the scheduling loop.
class ParallelScreener {
public:
    ParallelScreener(ScreenerConfig config, std::shared_ptr<sandbox::StrategySandbox> sandbox);
    ~ParallelScreener();

    ParallelScreener(const ParallelScreener&) = delete;
    ParallelScreener& operator=(const ParallelScreener&) = delete;

    TickReport screen(const std::vector<core::Trader>& traders,
                      const std::map<std::string, market::MarketSnapshot>& snapshots,
                      long long now_ms);

    // refresh interval x sandbox backoff multiplier elapsed since the last evaluation
    bool isDue(const core::Trader& trader, const std::string& symbol, long long now_ms) const;

    void forget(const std::string& trader_id);
    // Makes queued and running evaluations give up; safe while screen() is waiting.
    void cancel() { cancel_ = true; }
    void stop();

    TickStats lastTickStats() const;
    TickStats totals() const;
    size_t workerCount() const { return pool_.size(); }

private:
    long long tickBudgetMs() const;

    ScreenerConfig config_;
    std::shared_ptr<sandbox::StrategySandbox> sandbox_;
    WorkerPool pool_;
    std::atomic<bool> cancel_{false};

    std::map<std::pair<std::string, std::string>, long long> last_evaluated_;

    mutable std::mutex stats_mutex_;
    TickStats last_tick_;
    TickStats totals_;
};

} // namespace screener
} // namespace sigscan
