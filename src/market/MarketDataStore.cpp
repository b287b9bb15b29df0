#include "market/MarketDataStore.h"

namespace sigscan {
namespace market {

MarketDataStore::MarketDataStore(size_t buffer_capacity, size_t max_closed_events)
    : buffer_capacity_(buffer_capacity)
    , max_closed_events_(max_closed_events) {}

std::shared_ptr<CandleBuffer> MarketDataStore::findOrCreate(const std::string& symbol, const std::string& interval) {
    {
        std::shared_lock<std::shared_mutex> lock(buffers_mutex_);
        auto sit = buffers_.find(symbol);
        if (sit != buffers_.end()) {
            auto iit = sit->second.find(interval);
            if (iit != sit->second.end()) {
                return iit->second;
            }
        }
    }

    std::unique_lock<std::shared_mutex> lock(buffers_mutex_);
    auto& slot = buffers_[symbol][interval];
    if (!slot) {
        slot = std::make_shared<CandleBuffer>(buffer_capacity_);
    }
    return slot;
}

UpdateResult MarketDataStore::applyCandle(const std::string& symbol, const std::string& interval, const Candle& candle) {
    auto buffer = findOrCreate(symbol, interval);
    const auto result = buffer->update(candle);

    const bool applied = result == UpdateResult::Appended || result == UpdateResult::Replaced;
    if (applied && candle.closed) {
        std::lock_guard<std::mutex> lock(events_mutex_);
        closed_events_.push_back({symbol, interval, candle.open_time});
        while (closed_events_.size() > max_closed_events_) {
            closed_events_.pop_front();
        }
    }
    return result;
}

void MarketDataStore::applyTicker(const Ticker& ticker) {
    std::lock_guard<std::mutex> lock(ticker_mutex_);
    tickers_[ticker.symbol] = ticker;
}

void MarketDataStore::seedCandles(const std::string& symbol, const std::string& interval, const std::vector<Candle>& candles) {
    findOrCreate(symbol, interval)->seed(candles);
}

void MarketDataStore::retain(const std::set<std::string>& symbols, const std::set<std::string>& intervals) {
    {
        std::unique_lock<std::shared_mutex> lock(buffers_mutex_);
        for (auto sit = buffers_.begin(); sit != buffers_.end();) {
            if (symbols.count(sit->first) == 0) {
                sit = buffers_.erase(sit);
                continue;
            }
            for (auto iit = sit->second.begin(); iit != sit->second.end();) {
                if (intervals.count(iit->first) == 0) {
                    iit = sit->second.erase(iit);
                } else {
                    ++iit;
                }
            }
            ++sit;
        }
    }

    std::lock_guard<std::mutex> lock(ticker_mutex_);
    for (auto it = tickers_.begin(); it != tickers_.end();) {
        if (symbols.count(it->first) == 0) {
            it = tickers_.erase(it);
        } else {
            ++it;
        }
    }
}

MarketSnapshot MarketDataStore::snapshotLocked(const std::string& symbol, long long now_ms) const {
    MarketSnapshot snap;
    snap.symbol = symbol;
    snap.taken_at_ms = now_ms;

    auto sit = buffers_.find(symbol);
    if (sit != buffers_.end()) {
        for (const auto& [interval, buffer] : sit->second) {
            snap.klines[interval] = buffer->view();
        }
    }

    std::lock_guard<std::mutex> lock(ticker_mutex_);
    auto tit = tickers_.find(symbol);
    if (tit != tickers_.end()) {
        snap.ticker = tit->second;
    }
    return snap;
}

MarketSnapshot MarketDataStore::snapshot(const std::string& symbol) const {
    std::shared_lock<std::shared_mutex> lock(buffers_mutex_);
    return snapshotLocked(symbol, nowEpochMs());
}

std::map<std::string, MarketSnapshot> MarketDataStore::snapshotAll() const {
    std::map<std::string, MarketSnapshot> out;
    const long long now_ms = nowEpochMs();

    std::set<std::string> symbols;
    std::shared_lock<std::shared_mutex> lock(buffers_mutex_);
    for (const auto& entry : buffers_) {
        symbols.insert(entry.first);
    }
    {
        std::lock_guard<std::mutex> ticker_lock(ticker_mutex_);
        for (const auto& entry : tickers_) {
            symbols.insert(entry.first);
        }
    }

    for (const auto& symbol : symbols) {
        out.emplace(symbol, snapshotLocked(symbol, now_ms));
    }
    return out;
}

std::vector<ClosedCandleEvent> MarketDataStore::drainClosedEvents() {
    std::lock_guard<std::mutex> lock(events_mutex_);
    std::vector<ClosedCandleEvent> out(closed_events_.begin(), closed_events_.end());
    closed_events_.clear();
    return out;
}

std::optional<Ticker> MarketDataStore::ticker(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(ticker_mutex_);
    auto it = tickers_.find(symbol);
    if (it == tickers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t MarketDataStore::bufferSize(const std::string& symbol, const std::string& interval) const {
    std::shared_lock<std::shared_mutex> lock(buffers_mutex_);
    auto sit = buffers_.find(symbol);
    if (sit == buffers_.end()) return 0;
    auto iit = sit->second.find(interval);
    if (iit == sit->second.end()) return 0;
    return iit->second->size();
}

size_t MarketDataStore::bufferCount() const {
    std::shared_lock<std::shared_mutex> lock(buffers_mutex_);
    size_t n = 0;
    for (const auto& entry : buffers_) {
        n += entry.second.size();
    }
    return n;
}

} // namespace market
} // namespace sigscan
