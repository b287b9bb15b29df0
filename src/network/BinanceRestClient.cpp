#include "network/BinanceRestClient.h"

#include "common/Logger.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace sigscan {
namespace network {

namespace {
double toDouble(const nlohmann::json& v) {
    const double out = v.is_string() ? std::stod(v.get<std::string>()) : v.get<double>();
    if (!std::isfinite(out)) {
        throw std::invalid_argument("non-finite number");
    }
    return out;
}
}

BinanceRestClient::BinanceRestClient(std::shared_ptr<IHttpClient> http)
    : http_(std::move(http)) {
    if (!http_) {
        throw std::invalid_argument("BinanceRestClient requires an http client");
    }
}

std::vector<Candle> BinanceRestClient::fetchKlines(const std::string& symbol, const std::string& interval, int limit) {
    const int bounded = std::clamp(limit, 1, 1000);
    auto response = http_->get("/api/v3/klines", {
        {"symbol", symbol},
        {"interval", interval},
        {"limit", std::to_string(bounded)}
    });

    if (!response.isSuccess()) {
        throw std::runtime_error("klines request failed (" + std::to_string(response.status_code) + "): " +
                                 response.body.substr(0, 200));
    }

    nlohmann::json rows;
    try {
        rows = response.json();
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(std::string("klines response is not JSON: ") + e.what());
    }

    auto candles = parseKlines(rows, nowEpochMs());
    LOG_DEBUG("Backfilled {} {} klines for {}", candles.size(), interval, symbol);
    return candles;
}

std::vector<Candle> BinanceRestClient::parseKlines(const nlohmann::json& rows, long long now_ms) {
    if (!rows.is_array()) {
        throw std::runtime_error("klines payload must be an array");
    }

    std::vector<Candle> out;
    out.reserve(rows.size());
    for (const auto& row : rows) {
        // [openTime, open, high, low, close, volume, closeTime, ...]
        if (!row.is_array() || row.size() < 7) {
            continue;
        }
        try {
            Candle c;
            c.open_time = row[0].get<long long>();
            c.open = toDouble(row[1]);
            c.high = toDouble(row[2]);
            c.low = toDouble(row[3]);
            c.close = toDouble(row[4]);
            c.volume = toDouble(row[5]);
            c.close_time = row[6].get<long long>();
            c.closed = c.close_time < now_ms;
            out.push_back(c);
        } catch (const std::exception& e) {
            LOG_WARN("Skipping malformed kline row: {}", e.what());
        }
    }

    std::sort(out.begin(), out.end(), [](const Candle& a, const Candle& b) { return a.open_time < b.open_time; });
    return out;
}

} // namespace network
} // namespace sigscan
