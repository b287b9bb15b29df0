#include "market/CandleBuffer.h"

#include <algorithm>
#include <map>
#include <stdexcept>

namespace sigscan {
namespace market {

CandleBuffer::CandleBuffer(size_t capacity)
    : capacity_(capacity) {
    if (capacity_ == 0) {
        throw std::invalid_argument("CandleBuffer capacity must be > 0");
    }
    ring_.resize(capacity_);
}

UpdateResult CandleBuffer::update(const Candle& candle) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (count_ > 0) {
        Candle& last = ring_[indexOf(count_ - 1)];
        if (candle.open_time < last.open_time) {
            return UpdateResult::Rejected;
        }
        if (candle.open_time == last.open_time) {
            if (last.closed) {
                return UpdateResult::Ignored;
            }
            last = candle;
            cached_view_.reset();
            return UpdateResult::Replaced;
        }
    }

    pushBackLocked(candle);
    cached_view_.reset();
    return UpdateResult::Appended;
}

void CandleBuffer::seed(const std::vector<Candle>& candles) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::map<long long, Candle> merged;
    for (const auto& c : candles) {
        merged[c.open_time] = c;
    }
    for (size_t i = 0; i < count_; ++i) {
        const Candle& live = ring_[indexOf(i)];
        merged[live.open_time] = live;
    }

    head_ = 0;
    count_ = 0;
    auto it = merged.begin();
    if (merged.size() > capacity_) {
        std::advance(it, merged.size() - capacity_);
    }
    for (; it != merged.end(); ++it) {
        pushBackLocked(it->second);
    }
    cached_view_.reset();
}

size_t CandleBuffer::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_;
}

std::optional<Candle> CandleBuffer::last() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (count_ == 0) {
        return std::nullopt;
    }
    return ring_[indexOf(count_ - 1)];
}

CandleView CandleBuffer::view() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!cached_view_) {
        auto out = std::make_shared<std::vector<Candle>>();
        out->reserve(count_);
        for (size_t i = 0; i < count_; ++i) {
            out->push_back(ring_[indexOf(i)]);
        }
        cached_view_ = std::move(out);
    }
    return cached_view_;
}

void CandleBuffer::pushBackLocked(const Candle& candle) {
    if (count_ < capacity_) {
        ring_[indexOf(count_)] = candle;
        ++count_;
        return;
    }
    // 가득 찬 경우 가장 오래된 캔들 덮어쓰기
    ring_[head_] = candle;
    head_ = (head_ + 1) % capacity_;
}

} // namespace market
} // namespace sigscan
