#pragma once

#include <string>
#include <vector>
#include <chrono>

namespace sigscan {

using Timestamp = std::chrono::system_clock::time_point;
using Price = double;
using Volume = double;

struct Candle {
    double open;
    double high;
    double low;
    double close;
    double volume;
    long long open_time;    // epoch ms
    long long close_time;   // epoch ms
    bool closed;

    Candle() : open(0), high(0), low(0), close(0), volume(0), open_time(0), close_time(0), closed(false) {}

    Candle(double o, double h, double l, double c, double v, long long t, long long ct, bool is_closed = true)
        : open(o), high(h), low(l), close(c), volume(v), open_time(t), close_time(ct), closed(is_closed) {}
};

struct Ticker {
    std::string symbol;
    Price last_price = 0.0;
    double price_change_pct = 0.0;  // 24h
    Volume quote_volume = 0.0;      // 24h
    long long event_time = 0;
};

inline long long nowEpochMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

} // namespace sigscan
