#include "network/BinanceStreamParser.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <nlohmann/json.hpp>

namespace sigscan {
namespace network {

namespace {
double toDouble(const nlohmann::json& v) {
    if (v.is_string()) {
        size_t consumed = 0;
        const std::string text = v.get<std::string>();
        const double out = std::stod(text, &consumed);
        if (consumed != text.size()) {
            throw std::invalid_argument("trailing characters in number: " + text);
        }
        if (!std::isfinite(out)) {
            throw std::invalid_argument("non-finite number: " + text);
        }
        return out;
    }
    if (v.is_number()) {
        return v.get<double>();
    }
    throw std::invalid_argument("not a number");
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::optional<StreamEvent> parseKline(const nlohmann::json& data) {
    if (!data.contains("k") || !data["k"].is_object()) {
        return std::nullopt;
    }
    const auto& k = data["k"];

    StreamEvent event;
    event.type = StreamEventType::Kline;
    event.symbol = k.value("s", data.value("s", std::string()));
    event.interval = k.value("i", std::string());
    if (event.symbol.empty() || event.interval.empty()) {
        return std::nullopt;
    }

    Candle& c = event.candle;
    c.open_time = k.at("t").get<long long>();
    c.close_time = k.at("T").get<long long>();
    c.open = toDouble(k.at("o"));
    c.high = toDouble(k.at("h"));
    c.low = toDouble(k.at("l"));
    c.close = toDouble(k.at("c"));
    c.volume = toDouble(k.at("v"));
    c.closed = k.at("x").get<bool>();

    if (c.high < c.low || c.close_time < c.open_time) {
        return std::nullopt;
    }
    return event;
}

std::optional<StreamEvent> parseTicker(const nlohmann::json& data) {
    StreamEvent event;
    event.type = StreamEventType::Ticker;
    event.symbol = data.at("s").get<std::string>();
    if (event.symbol.empty()) {
        return std::nullopt;
    }

    Ticker& t = event.ticker;
    t.symbol = event.symbol;
    t.last_price = toDouble(data.at("c"));
    t.price_change_pct = toDouble(data.at("P"));
    t.quote_volume = toDouble(data.at("q"));
    t.event_time = data.value("E", 0LL);
    return event;
}
}

std::optional<StreamEvent> BinanceStreamParser::parse(const std::string& payload) {
    try {
        const auto message = nlohmann::json::parse(payload);
        if (!message.is_object()) {
            return std::nullopt;
        }

        // 구독 요청 응답: {"result":null,"id":1} / {"error":{...},"id":1}
        if (message.contains("id") && (message.contains("result") || message.contains("error"))) {
            StreamEvent event;
            event.type = StreamEventType::Control;
            if (message.contains("error")) {
                event.control_error = message["error"].dump();
            }
            return event;
        }

        // combined stream: {"stream":"...","data":{...}}, raw stream: {...}
        const nlohmann::json& data = message.contains("data") ? message["data"] : message;
        if (!data.is_object()) {
            return std::nullopt;
        }

        const std::string event_type = data.value("e", std::string());
        if (event_type == "kline") {
            return parseKline(data);
        }
        if (event_type == "24hrTicker") {
            return parseTicker(data);
        }
        return std::nullopt;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string BinanceStreamParser::tickerStream(const std::string& symbol) {
    return toLower(symbol) + "@ticker";
}

std::string BinanceStreamParser::klineStream(const std::string& symbol, const std::string& interval) {
    return toLower(symbol) + "@kline_" + interval;
}

std::set<std::string> BinanceStreamParser::buildStreams(const std::set<std::string>& symbols,
                                                        const std::set<std::string>& intervals) {
    std::set<std::string> streams;
    for (const auto& symbol : symbols) {
        streams.insert(tickerStream(symbol));
        for (const auto& interval : intervals) {
            streams.insert(klineStream(symbol, interval));
        }
    }
    return streams;
}

std::string BinanceStreamParser::buildRequest(const std::string& method,
                                              const std::vector<std::string>& streams,
                                              long long id) {
    nlohmann::json request;
    request["method"] = method;
    request["params"] = streams;
    request["id"] = id;
    return request.dump();
}

} // namespace network
} // namespace sigscan
