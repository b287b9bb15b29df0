#pragma once

#include <optional>
#include <set>
#include <string>
#include <vector>

#include "common/Types.h"

namespace sigscan {
namespace network {

enum class StreamEventType {
    Kline,
    Ticker,
    Control     // subscription ack / error response
};

struct StreamEvent {
    StreamEventType type = StreamEventType::Control;
    std::string symbol;
    std::string interval;   // Kline only
    Candle candle;          // Kline only
    Ticker ticker;          // Ticker only
    std::string control_error;
};

// Stateless decoding of combined-stream payloads.
class BinanceStreamParser {
public:
    // nullopt for malformed or unrecognized payloads
    static std::optional<StreamEvent> parse(const std::string& payload);

    static std::string tickerStream(const std::string& symbol);
    static std::string klineStream(const std::string& symbol, const std::string& interval);

    // ticker stream per symbol plus one kline stream per (symbol, interval)
    static std::set<std::string> buildStreams(const std::set<std::string>& symbols,
                                              const std::set<std::string>& intervals);

    // {"method":"SUBSCRIBE","params":[...],"id":n}
    static std::string buildRequest(const std::string& method,
                                    const std::vector<std::string>& streams,
                                    long long id);
};

} // namespace network
} // namespace sigscan
