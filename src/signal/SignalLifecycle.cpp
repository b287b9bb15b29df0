#include "signal/SignalLifecycle.h"

#include <stdexcept>

#include "common/Interval.h"
#include "common/Logger.h"

namespace sigscan {
namespace signal {

const char* toString(SignalClass cls) {
    return cls == SignalClass::New ? "new" : "continuing";
}

SignalLifecycle::SignalLifecycle(int dedupe_bars)
    : dedupe_bars_(dedupe_bars) {
    if (dedupe_bars_ < 1) {
        throw std::invalid_argument("dedupe_bars must be >= 1");
    }
}

SignalClass SignalLifecycle::classify(const core::Trader& trader, const std::string& symbol, long long now_ms) {
    const Key key(trader.id, symbol);
    auto it = history_.find(key);

    if (it == history_.end()) {
        SignalHistoryEntry entry;
        entry.interval = trader.primaryInterval();
        entry.last_signal_ms = now_ms;
        entry.match_count = 1;
        history_.emplace(key, entry);
        return SignalClass::New;
    }

    SignalHistoryEntry& entry = it->second;
    const long long bar_ms = intervalToMs(trader.primaryInterval()).value_or(60000);
    const long long window_ms = bar_ms * dedupe_bars_;

    const bool bars_elapsed = entry.bars_since >= dedupe_bars_;
    const bool time_elapsed = now_ms - entry.last_signal_ms >= window_ms;

    if (bars_elapsed || time_elapsed) {
        entry.interval = trader.primaryInterval();
        entry.last_signal_ms = now_ms;
        entry.bars_since = 0;
        entry.match_count = 1;
        return SignalClass::New;
    }

    ++entry.match_count;
    return SignalClass::Continuing;
}

std::optional<core::Signal> SignalLifecycle::process(const core::Trader& trader,
                                                     const core::EvaluationResult& result,
                                                     const market::MarketSnapshot& snapshot,
                                                     long long now_ms) {
    if (!result.matched) {
        return std::nullopt;
    }
    if (classify(trader, result.symbol, now_ms) == SignalClass::Continuing) {
        LOG_DEBUG("[Signal] {} {} continuing", trader.id, result.symbol);
        return std::nullopt;
    }

    core::Signal signal;
    signal.trader_id = trader.id;
    signal.symbol = result.symbol;
    signal.interval = trader.primaryInterval();
    signal.timestamp_ms = now_ms;
    signal.price = snapshot.lastPrice(signal.interval);
    if (snapshot.ticker) {
        signal.change_pct = snapshot.ticker->price_change_pct;
        signal.quote_volume = snapshot.ticker->quote_volume;
    }
    signal.indicators = result.indicators;
    signal.reasoning = result.reasoning;
    signal.match_count = 1;

    LOG_INFO("[Signal] NEW {} {} @ {:.8g} ({})", trader.id, signal.symbol, signal.price, signal.interval);
    Logger::getInstance().logSignal(trader.id, signal.symbol, signal.interval, signal.price, signal.timestamp_ms);
    return signal;
}

void SignalLifecycle::onCandleClosed(const std::string& symbol, const std::string& interval) {
    for (auto& [key, entry] : history_) {
        if (key.second == symbol && entry.interval == interval) {
            ++entry.bars_since;
        }
    }
}

void SignalLifecycle::prune(const std::set<std::string>& active_trader_ids) {
    for (auto it = history_.begin(); it != history_.end();) {
        if (active_trader_ids.count(it->first.first) == 0) {
            it = history_.erase(it);
        } else {
            ++it;
        }
    }
}

std::optional<SignalHistoryEntry> SignalLifecycle::history(const std::string& trader_id,
                                                           const std::string& symbol) const {
    auto it = history_.find(Key(trader_id, symbol));
    if (it == history_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace signal
} // namespace sigscan
