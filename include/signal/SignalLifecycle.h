#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>

#include "core/model/Records.h"
#include "market/MarketSnapshot.h"

namespace sigscan {
namespace signal {

enum class SignalClass { New, Continuing };

const char* toString(SignalClass cls);

struct SignalHistoryEntry {
    std::string interval;           // trader primary interval
    long long last_signal_ms = 0;
    int bars_since = 0;             // closed candles since last_signal_ms
    int match_count = 0;            // matches inside the current window
};

// Turns per-tick matches into new/continuing signals.
// Not thread-safe: driven serially from the scheduling loop after workers return.
class SignalLifecycle {
public:
    explicit SignalLifecycle(int dedupe_bars);

    // New when no history, or bars_since >= dedupe_bars, or
    // elapsed >= dedupe_bars * bar duration (either condition suffices).
    SignalClass classify(const core::Trader& trader, const std::string& symbol, long long now_ms);

    // classify + build the Signal record for a matched result. nullopt when continuing.
    std::optional<core::Signal> process(const core::Trader& trader,
                                        const core::EvaluationResult& result,
                                        const market::MarketSnapshot& snapshot,
                                        long long now_ms);

    void onCandleClosed(const std::string& symbol, const std::string& interval);

    // Drops history of traders not in the active set.
    void prune(const std::set<std::string>& active_trader_ids);

    std::optional<SignalHistoryEntry> history(const std::string& trader_id, const std::string& symbol) const;
    size_t size() const { return history_.size(); }
    int dedupeBars() const { return dedupe_bars_; }

private:
    using Key = std::pair<std::string, std::string>;   // trader id, symbol

    int dedupe_bars_;
    std::map<Key, SignalHistoryEntry> history_;
};

} // namespace signal
} // namespace sigscan
