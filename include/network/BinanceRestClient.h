#pragma once

#include <memory>
#include <string>
#include <vector>

#include "common/Types.h"
#include "network/IHttpClient.h"

namespace sigscan {
namespace network {

// Historical kline backfill over the exchange REST API.
class BinanceRestClient {
public:
    explicit BinanceRestClient(std::shared_ptr<IHttpClient> http);

    // Oldest first. The last candle is marked open when its close time is in the future.
    // Throws std::runtime_error on HTTP or format errors.
    std::vector<Candle> fetchKlines(const std::string& symbol, const std::string& interval, int limit);

    // Parses a /api/v3/klines array-of-arrays payload.
    static std::vector<Candle> parseKlines(const nlohmann::json& rows, long long now_ms);

private:
    std::shared_ptr<IHttpClient> http_;
};

} // namespace network
} // namespace sigscan
