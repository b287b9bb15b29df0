#pragma once

#include <mutex>
#include <optional>
#include <vector>

#include "market/MarketSnapshot.h"

namespace sigscan {
namespace market {

enum class UpdateResult {
    Appended,   // new open time, oldest evicted when full
    Replaced,   // in-progress last candle updated
    Ignored,    // last candle already closed
    Rejected    // open time older than the last candle
};

// Fixed-capacity ring of candles for one (symbol, interval).
// Open times are strictly increasing and size() <= capacity() at all times.
class CandleBuffer {
public:
    explicit CandleBuffer(size_t capacity);

    UpdateResult update(const Candle& candle);

    // Merge historical candles. Entries already present keep their live values.
    void seed(const std::vector<Candle>& candles);

    size_t size() const;
    size_t capacity() const { return capacity_; }
    std::optional<Candle> last() const;

    // Ordered oldest -> newest. Rebuilt only after a mutation.
    CandleView view() const;

private:
    size_t indexOf(size_t logical) const { return (head_ + logical) % capacity_; }
    void pushBackLocked(const Candle& candle);

    const size_t capacity_;
    std::vector<Candle> ring_;
    size_t head_ = 0;
    size_t count_ = 0;

    mutable std::mutex mutex_;
    mutable CandleView cached_view_;
};

} // namespace market
} // namespace sigscan
