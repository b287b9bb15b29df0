#include "screener/ParallelScreener.h"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <stdexcept>

#include "common/Interval.h"
#include "common/Logger.h"

namespace sigscan {
namespace screener {

namespace {

struct Task {
    const core::Trader* trader = nullptr;
    const market::MarketSnapshot* snapshot = nullptr;
    core::EvaluationResult result;
    bool abandoned = false;
};

// 한 틱 동안 워커와 공유되는 상태
struct TickState {
    std::vector<Task> tasks;
    std::chrono::steady_clock::time_point deadline;
    std::mutex mutex;
    std::condition_variable cv;
    size_t completed = 0;
};

void trimDisplayCandles(core::EvaluationResult& result,
                        const market::MarketSnapshot& snapshot,
                        size_t limit) {
    const auto& candles = snapshot.candles(result.interval);
    const size_t n = std::min(limit, candles.size());
    result.display_candles.assign(candles.end() - static_cast<std::ptrdiff_t>(n), candles.end());
}

void accumulate(TickStats& into, const TickStats& from) {
    into.due += from.due;
    into.evaluated += from.evaluated;
    into.matched += from.matched;
    into.compile_errors += from.compile_errors;
    into.runtime_errors += from.runtime_errors;
    into.timeouts += from.timeouts;
    into.abandoned += from.abandoned;
    into.duration_ms += from.duration_ms;
}

}

ParallelScreener::ParallelScreener(ScreenerConfig config, std::shared_ptr<sandbox::StrategySandbox> sandbox)
    : config_(config)
    , sandbox_(std::move(sandbox))
    , pool_(static_cast<size_t>(config.workers > 0 ? config.workers : 1)) {
    if (!sandbox_) {
        throw std::invalid_argument("ParallelScreener requires a sandbox");
    }
    LOG_INFO("[Screener] {} workers, tick budget {}ms", pool_.size(), tickBudgetMs());
}

ParallelScreener::~ParallelScreener() {
    stop();
}

void ParallelScreener::stop() {
    cancel_ = true;
    pool_.shutdown();
}

long long ParallelScreener::tickBudgetMs() const {
    if (config_.tick_budget_ms > 0) {
        return config_.tick_budget_ms;
    }
    return static_cast<long long>(config_.tick_seconds) * 800;
}

bool ParallelScreener::isDue(const core::Trader& trader, const std::string& symbol, long long now_ms) const {
    auto it = last_evaluated_.find({trader.id, symbol});
    if (it == last_evaluated_.end()) {
        return true;
    }
    const long long refresh_ms = intervalToMs(trader.refresh_interval).value_or(60000);
    const long long wait_ms = refresh_ms * sandbox_->backoffMultiplier(trader.id);
    return now_ms - it->second >= wait_ms;
}

void ParallelScreener::forget(const std::string& trader_id) {
    for (auto it = last_evaluated_.begin(); it != last_evaluated_.end();) {
        if (it->first.first == trader_id) {
            it = last_evaluated_.erase(it);
        } else {
            ++it;
        }
    }
}

TickReport ParallelScreener::screen(const std::vector<core::Trader>& traders,
                                    const std::map<std::string, market::MarketSnapshot>& snapshots,
                                    long long now_ms) {
    const auto started = std::chrono::steady_clock::now();
    TickReport report;

    auto tick = std::make_shared<TickState>();
    tick->deadline = started + std::chrono::milliseconds(tickBudgetMs());

    for (const auto& trader : traders) {
        for (const auto& [symbol, snapshot] : snapshots) {
            if (!trader.appliesTo(symbol) || !isDue(trader, symbol, now_ms)) {
                continue;
            }
            Task task;
            task.trader = &trader;
            task.snapshot = &snapshot;
            tick->tasks.push_back(std::move(task));
        }
    }
    report.stats.due = tick->tasks.size();

    const size_t display_candles = config_.display_candles;
    auto sandbox = sandbox_;
    const std::atomic<bool>* cancel = &cancel_;

    size_t submitted = 0;
    for (size_t i = 0; i < tick->tasks.size(); ++i) {
        const bool accepted = pool_.submit([tick, i, sandbox, cancel, display_candles]() {
            Task& task = tick->tasks[i];
            if (std::chrono::steady_clock::now() >= tick->deadline || cancel->load()) {
                task.abandoned = true;
            } else {
                try {
                    task.result = sandbox->evaluate(*task.trader, *task.snapshot, cancel);
                    if (task.result.matched) {
                        trimDisplayCandles(task.result, *task.snapshot, display_candles);
                    }
                } catch (const std::exception& e) {
                    task.result.trader_id = task.trader->id;
                    task.result.symbol = task.snapshot->symbol;
                    task.result.outcome = core::EvaluationOutcome::RuntimeError;
                    task.result.error = e.what();
                }
            }

            std::lock_guard<std::mutex> lock(tick->mutex);
            ++tick->completed;
            tick->cv.notify_all();
        });
        if (!accepted) {
            tick->tasks[i].abandoned = true;
            continue;
        }
        ++submitted;
    }

    {
        // 시작 전 태스크는 데드라인 이후 즉시 포기되므로 실행 중인 것만 기다린다
        std::unique_lock<std::mutex> lock(tick->mutex);
        tick->cv.wait(lock, [&] { return tick->completed >= submitted; });
    }

    for (auto& task : tick->tasks) {
        if (task.abandoned) {
            ++report.stats.abandoned;
            continue;
        }

        ++report.stats.evaluated;
        last_evaluated_[{task.trader->id, task.snapshot->symbol}] = now_ms;

        switch (task.result.outcome) {
            case core::EvaluationOutcome::Matched:
                ++report.stats.matched;
                report.matches[task.trader->id].push_back(std::move(task.result));
                break;
            case core::EvaluationOutcome::NotMatched:
                break;
            case core::EvaluationOutcome::CompileError:
                ++report.stats.compile_errors;
                report.failures.push_back(std::move(task.result));
                break;
            case core::EvaluationOutcome::RuntimeError:
                ++report.stats.runtime_errors;
                report.failures.push_back(std::move(task.result));
                break;
            case core::EvaluationOutcome::TimedOut:
                ++report.stats.timeouts;
                report.failures.push_back(std::move(task.result));
                break;
        }
    }

    report.stats.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();

    if (report.stats.abandoned > 0) {
        LOG_WARN("[Screener] tick budget {}ms exceeded: {} of {} tasks abandoned, retried next tick",
                 tickBudgetMs(), report.stats.abandoned, report.stats.due);
    }
    if (report.stats.runtime_errors + report.stats.timeouts > 0) {
        LOG_WARN("[Screener] {} runtime errors, {} timeouts this tick",
                 report.stats.runtime_errors, report.stats.timeouts);
    }
    LOG_DEBUG("[Screener] tick: due={} evaluated={} matched={} in {}ms",
              report.stats.due, report.stats.evaluated, report.stats.matched, report.stats.duration_ms);

    std::lock_guard<std::mutex> lock(stats_mutex_);
    last_tick_ = report.stats;
    accumulate(totals_, report.stats);
    return report;
}

TickStats ParallelScreener::lastTickStats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return last_tick_;
}

TickStats ParallelScreener::totals() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return totals_;
}

} // namespace screener
} // namespace sigscan
