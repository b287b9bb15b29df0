#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "common/Config.h"
#include "core/model/Records.h"
#include "market/MarketSnapshot.h"
#include "sandbox/ScriptAst.h"

namespace sigscan {
namespace sandbox {

// Compiles trader filter/series code once per version and evaluates it
// against market snapshots under a wall-clock budget.
// Thread-safe: the compile cache and backoff table are mutex-guarded,
// each evaluation runs on its own ExecContext.
class StrategySandbox {
public:
    explicit StrategySandbox(SandboxConfig config);

    // Compiles (or reuses) the trader's code. Returns an empty string on success,
    // otherwise the compile error message. Entries are keyed by version and
    // source text, so an edit without a version bump still recompiles.
    std::string prepare(const core::Trader& trader);

    // filter, and series when the filter matched and series code is present
    core::EvaluationResult evaluate(const core::Trader& trader,
                                    const market::MarketSnapshot& snapshot,
                                    const std::atomic<bool>* cancel = nullptr);

    // Uncached evaluation of raw source (validation endpoint).
    core::EvaluationResult evaluateAdhoc(const std::string& filter_code,
                                         const std::string& series_code,
                                         const market::MarketSnapshot& snapshot,
                                         const std::string& interval);

    // Scheduling multiplier: doubled on each consecutive timeout (max 8), reset on success.
    int backoffMultiplier(const std::string& trader_id) const;

    void forget(const std::string& trader_id);
    size_t cacheSize() const;
    long long compileCount() const { return compile_count_.load(); }

    // Object of arrays of {x, y[, y2, y3]} with numeric fields.
    static bool validateSeries(const nlohmann::json& series, std::string& error);

private:
    struct CompiledTrader {
        std::string version;
        size_t source_hash = 0;
        std::shared_ptr<const CompiledScript> filter;
        std::shared_ptr<const CompiledScript> series;
        std::string error;
    };

    std::shared_ptr<const CompiledTrader> compiled(const core::Trader& trader);
    static size_t sourceHash(const std::string& filter_code, const std::string& series_code);
    std::shared_ptr<const CompiledTrader> compileSources(const std::string& version,
                                                         size_t source_hash,
                                                         const std::string& filter_code,
                                                         const std::string& series_code);

    void runFilter(const CompiledScript& script, const market::MarketSnapshot& snapshot,
                   const std::string& interval, const std::atomic<bool>* cancel,
                   core::EvaluationResult& result) const;
    void runSeries(const CompiledScript& script, const market::MarketSnapshot& snapshot,
                   const std::string& interval, const std::atomic<bool>* cancel,
                   core::EvaluationResult& result) const;

    void recordOutcome(const std::string& trader_id, core::EvaluationOutcome outcome);

    SandboxConfig config_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<const CompiledTrader>> cache_;
    std::unordered_map<std::string, int> backoff_;
    std::atomic<long long> compile_count_{0};
};

} // namespace sandbox
} // namespace sigscan
