#include "sandbox/StrategySandbox.h"

#include <chrono>
#include <functional>

#include "common/Logger.h"
#include "sandbox/ScriptBuiltins.h"
#include "sandbox/ScriptInterpreter.h"
#include "sandbox/ScriptParser.h"

namespace sigscan {
namespace sandbox {

namespace {
constexpr int kMaxBackoffMultiplier = 8;

ExecContext makeContext(const SandboxConfig& config,
                        const market::MarketSnapshot& snapshot,
                        const std::string& interval,
                        long long timeout_ms,
                        const std::atomic<bool>* cancel) {
    ExecContext ctx;
    ctx.snapshot = &snapshot;
    ctx.primary_interval = interval;
    ctx.deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    ctx.cancel = cancel;
    ctx.max_steps = config.max_steps;
    ctx.max_call_depth = config.max_call_depth;
    return ctx;
}
}

StrategySandbox::StrategySandbox(SandboxConfig config)
    : config_(config) {}

std::string StrategySandbox::prepare(const core::Trader& trader) {
    return compiled(trader)->error;
}

size_t StrategySandbox::sourceHash(const std::string& filter_code, const std::string& series_code) {
    std::string joined;
    joined.reserve(filter_code.size() + series_code.size() + 1);
    joined += filter_code;
    joined += '\0';
    joined += series_code;
    return std::hash<std::string>{}(joined);
}

std::shared_ptr<const StrategySandbox::CompiledTrader> StrategySandbox::compiled(const core::Trader& trader) {
    const size_t hash = sourceHash(trader.filter_code, trader.series_code);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = cache_.find(trader.id);
        if (it != cache_.end() && it->second->version == trader.version && it->second->source_hash == hash) {
            return it->second;
        }
    }

    // 락 밖에서 컴파일. 동시에 두 번 컴파일되더라도 결과는 같다.
    auto entry = compileSources(trader.version, hash, trader.filter_code, trader.series_code);
    if (!entry->error.empty()) {
        LOG_WARN("[Sandbox] trader {} v{} failed to compile: {}", trader.id, trader.version, entry->error);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    cache_[trader.id] = entry;
    return entry;
}

std::shared_ptr<const StrategySandbox::CompiledTrader> StrategySandbox::compileSources(
    const std::string& version,
    size_t source_hash,
    const std::string& filter_code,
    const std::string& series_code) {
    auto entry = std::make_shared<CompiledTrader>();
    entry->version = version;
    entry->source_hash = source_hash;
    compile_count_.fetch_add(1);

    try {
        entry->filter = ScriptParser::compile(filter_code);
    } catch (const ScriptError& e) {
        entry->error = std::string("filter: ") + e.what();
        return entry;
    }

    if (!series_code.empty()) {
        try {
            entry->series = ScriptParser::compile(series_code);
        } catch (const ScriptError& e) {
            entry->error = std::string("series: ") + e.what();
        }
    }
    return entry;
}

core::EvaluationResult StrategySandbox::evaluate(const core::Trader& trader,
                                                 const market::MarketSnapshot& snapshot,
                                                 const std::atomic<bool>* cancel) {
    core::EvaluationResult result;
    result.trader_id = trader.id;
    result.symbol = snapshot.symbol;
    result.interval = trader.primaryInterval();
    result.evaluated_at_ms = nowEpochMs();

    const auto started = std::chrono::steady_clock::now();
    auto entry = compiled(trader);

    if (!entry->error.empty()) {
        result.outcome = core::EvaluationOutcome::CompileError;
        result.error = entry->error;
        return result;
    }

    runFilter(*entry->filter, snapshot, result.interval, cancel, result);
    if (result.matched && entry->series) {
        runSeries(*entry->series, snapshot, result.interval, cancel, result);
    }

    result.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();
    recordOutcome(trader.id, result.outcome);
    return result;
}

core::EvaluationResult StrategySandbox::evaluateAdhoc(const std::string& filter_code,
                                                      const std::string& series_code,
                                                      const market::MarketSnapshot& snapshot,
                                                      const std::string& interval) {
    core::EvaluationResult result;
    result.trader_id = "adhoc";
    result.symbol = snapshot.symbol;
    result.interval = interval;
    result.evaluated_at_ms = nowEpochMs();

    const auto started = std::chrono::steady_clock::now();
    auto entry = compileSources("adhoc", sourceHash(filter_code, series_code), filter_code, series_code);
    if (!entry->error.empty()) {
        result.outcome = core::EvaluationOutcome::CompileError;
        result.error = entry->error;
        return result;
    }

    runFilter(*entry->filter, snapshot, interval, nullptr, result);
    if (result.matched && entry->series) {
        runSeries(*entry->series, snapshot, interval, nullptr, result);
    }
    result.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();
    return result;
}

void StrategySandbox::runFilter(const CompiledScript& script,
                                const market::MarketSnapshot& snapshot,
                                const std::string& interval,
                                const std::atomic<bool>* cancel,
                                core::EvaluationResult& result) const {
    ExecContext ctx = makeContext(config_, snapshot, interval, config_.filter_timeout_ms, cancel);

    try {
        const ScriptValue value = ScriptInterpreter(script, ctx).run();

        bool matched = false;
        if (value.isObject()) {
            const auto& fields = value.asObject();
            auto it = fields.find("matched");
            matched = it != fields.end() && it->second.truthy();
            auto reason = fields.find("reasoning");
            if (reason != fields.end() && !reason->second.isNull()) {
                ctx.reasoning = reason->second.toDisplayString();
            }
            auto ind = fields.find("indicators");
            if (ind != fields.end() && ind->second.isObject()) {
                ctx.indicators.update(ind->second.toJson());
            }
        } else if (value.type() == ScriptValue::Type::Bool) {
            matched = value.asBool();
        } else if (!value.isNull()) {
            throw ScriptRuntimeError("filter must return a bool or an object, got " + value.typeName());
        }

        result.matched = matched;
        result.outcome = matched ? core::EvaluationOutcome::Matched : core::EvaluationOutcome::NotMatched;
        result.reasoning = ctx.reasoning;
        result.indicators = std::move(ctx.indicators);
    } catch (const ScriptTimeout&) {
        result.outcome = core::EvaluationOutcome::TimedOut;
        result.error = "filter exceeded " + std::to_string(config_.filter_timeout_ms) + "ms";
    } catch (const std::exception& e) {
        // ScriptRuntimeError 및 그 밖의 예외 모두 런타임 오류로 분류
        result.outcome = core::EvaluationOutcome::RuntimeError;
        result.error = e.what();
        LOG_DEBUG("[Sandbox] {} {} filter runtime error: {}", result.trader_id, result.symbol, e.what());
    }
}

void StrategySandbox::runSeries(const CompiledScript& script,
                                const market::MarketSnapshot& snapshot,
                                const std::string& interval,
                                const std::atomic<bool>* cancel,
                                core::EvaluationResult& result) const {
    ExecContext ctx = makeContext(config_, snapshot, interval, config_.series_timeout_ms, cancel);

    // 시리즈 실패는 매칭 결과를 바꾸지 않는다
    try {
        const ScriptValue value = ScriptInterpreter(script, ctx).run();
        nlohmann::json series = value.toJson();
        std::string error;
        if (!validateSeries(series, error)) {
            result.error = "series: " + error;
            LOG_WARN("[Sandbox] {} {} invalid series output: {}", result.trader_id, result.symbol, error);
            return;
        }
        result.series = std::move(series);
        if (!ctx.indicators.empty()) {
            result.indicators.update(ctx.indicators);
        }
        if (result.reasoning.empty()) {
            result.reasoning = ctx.reasoning;
        }
    } catch (const ScriptTimeout&) {
        result.error = "series exceeded " + std::to_string(config_.series_timeout_ms) + "ms";
        LOG_WARN("[Sandbox] {} {} series timed out", result.trader_id, result.symbol);
    } catch (const std::exception& e) {
        result.error = std::string("series: ") + e.what();
        LOG_WARN("[Sandbox] {} {} series runtime error: {}", result.trader_id, result.symbol, e.what());
    }
}

void StrategySandbox::recordOutcome(const std::string& trader_id, core::EvaluationOutcome outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (outcome == core::EvaluationOutcome::TimedOut) {
        int& multiplier = backoff_[trader_id];
        const int next = multiplier < 1 ? 2 : multiplier * 2;
        multiplier = next > kMaxBackoffMultiplier ? kMaxBackoffMultiplier : next;
        LOG_WARN("[Sandbox] trader {} timed out, backoff x{}", trader_id, multiplier);
    } else if (outcome == core::EvaluationOutcome::Matched ||
               outcome == core::EvaluationOutcome::NotMatched) {
        backoff_.erase(trader_id);
    }
}

int StrategySandbox::backoffMultiplier(const std::string& trader_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = backoff_.find(trader_id);
    return it == backoff_.end() ? 1 : it->second;
}

void StrategySandbox::forget(const std::string& trader_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.erase(trader_id);
    backoff_.erase(trader_id);
}

size_t StrategySandbox::cacheSize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

bool StrategySandbox::validateSeries(const nlohmann::json& series, std::string& error) {
    if (!series.is_object()) {
        error = "series must be an object of point arrays";
        return false;
    }
    for (auto it = series.begin(); it != series.end(); ++it) {
        if (!it.value().is_array()) {
            error = "'" + it.key() + "' must be an array";
            return false;
        }
        for (const auto& point : it.value()) {
            if (!point.is_object() ||
                !point.contains("x") || !point["x"].is_number() ||
                !point.contains("y") || !point["y"].is_number()) {
                error = "'" + it.key() + "' points need numeric x and y";
                return false;
            }
            for (const char* extra : {"y2", "y3"}) {
                if (point.contains(extra) && !point[extra].is_number()) {
                    error = "'" + it.key() + "' " + extra + " must be numeric";
                    return false;
                }
            }
        }
    }
    return true;
}

} // namespace sandbox
} // namespace sigscan
