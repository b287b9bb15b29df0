#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/Types.h"

namespace sigscan {
namespace market {

using CandleView = std::shared_ptr<const std::vector<Candle>>;

// Point-in-time, read-only market data for one symbol.
// Candle views are shared with the buffers and never mutated after publication.
struct MarketSnapshot {
    std::string symbol;
    std::optional<Ticker> ticker;
    std::map<std::string, CandleView> klines;   // interval -> candles (oldest first)
    long long taken_at_ms = 0;

    const std::vector<Candle>& candles(const std::string& interval) const {
        static const std::vector<Candle> kEmpty;
        auto it = klines.find(interval);
        if (it == klines.end() || !it->second) {
            return kEmpty;
        }
        return *it->second;
    }

    // 티커가 없으면 가장 최근 캔들 종가
    double lastPrice(const std::string& interval) const {
        if (ticker && ticker->last_price > 0.0) {
            return ticker->last_price;
        }
        const auto& c = candles(interval);
        return c.empty() ? 0.0 : c.back().close;
    }
};

} // namespace market
} // namespace sigscan
