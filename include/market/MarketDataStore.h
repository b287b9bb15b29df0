#pragma once

#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

#include "market/CandleBuffer.h"
#include "market/MarketSnapshot.h"

namespace sigscan {
namespace market {

struct ClosedCandleEvent {
    std::string symbol;
    std::string interval;
    long long open_time = 0;
};

// Owns every (symbol, interval) candle buffer and the latest tickers.
// The stream ingestion path is the only writer.
class MarketDataStore {
public:
    explicit MarketDataStore(size_t buffer_capacity, size_t max_closed_events = 10000);

    UpdateResult applyCandle(const std::string& symbol, const std::string& interval, const Candle& candle);
    void applyTicker(const Ticker& ticker);
    void seedCandles(const std::string& symbol, const std::string& interval, const std::vector<Candle>& candles);

    // Drops buffers and tickers outside the given sets.
    void retain(const std::set<std::string>& symbols, const std::set<std::string>& intervals);

    MarketSnapshot snapshot(const std::string& symbol) const;
    std::map<std::string, MarketSnapshot> snapshotAll() const;

    std::vector<ClosedCandleEvent> drainClosedEvents();

    std::optional<Ticker> ticker(const std::string& symbol) const;
    size_t bufferSize(const std::string& symbol, const std::string& interval) const;
    size_t bufferCount() const;

private:
    std::shared_ptr<CandleBuffer> findOrCreate(const std::string& symbol, const std::string& interval);
    MarketSnapshot snapshotLocked(const std::string& symbol, long long now_ms) const;

    const size_t buffer_capacity_;
    const size_t max_closed_events_;

    mutable std::shared_mutex buffers_mutex_;
    std::map<std::string, std::map<std::string, std::shared_ptr<CandleBuffer>>> buffers_;

    mutable std::mutex ticker_mutex_;
    std::map<std::string, Ticker> tickers_;

    std::mutex events_mutex_;
    std::deque<ClosedCandleEvent> closed_events_;
};

} // namespace market
} // namespace sigscan
