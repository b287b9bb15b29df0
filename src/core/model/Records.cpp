#include "core/model/Records.h"

#include <algorithm>
#include <stdexcept>

#include "common/Interval.h"

namespace sigscan {
namespace core {

std::vector<std::string> Trader::intervals() const {
    return mergeIntervals({refresh_interval}, required_timeframes);
}

bool Trader::appliesTo(const std::string& symbol) const {
    if (symbols.empty()) {
        return true;
    }
    return std::find(symbols.begin(), symbols.end(), symbol) != symbols.end();
}

Trader traderFromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("trader entry must be an object");
    }

    Trader t;
    t.id = j.value("id", std::string());
    if (t.id.empty()) {
        throw std::invalid_argument("trader id is required");
    }
    t.name = j.value("name", t.id);
    t.enabled = j.value("enabled", true);

    // version은 숫자나 문자열 모두 허용
    if (j.contains("version")) {
        const auto& v = j.at("version");
        t.version = v.is_string() ? v.get<std::string>() : v.dump();
    }

    const auto filter = j.value("filter", nlohmann::json::object());
    if (!filter.is_object()) {
        throw std::invalid_argument("trader " + t.id + ": filter must be an object");
    }
    t.filter_code = filter.value("code", std::string());
    if (t.filter_code.empty()) {
        throw std::invalid_argument("trader " + t.id + ": filter.code is required");
    }
    t.series_code = filter.value("series_code", std::string());

    for (const auto& tf : filter.value("required_timeframes", nlohmann::json::array())) {
        if (!tf.is_string() || !isValidInterval(tf.get<std::string>())) {
            throw std::invalid_argument("trader " + t.id + ": invalid timeframe " + tf.dump());
        }
        t.required_timeframes.push_back(tf.get<std::string>());
    }

    t.refresh_interval = j.value("refresh_interval", std::string("1m"));
    if (!isValidInterval(t.refresh_interval)) {
        throw std::invalid_argument("trader " + t.id + ": invalid refresh_interval " + t.refresh_interval);
    }

    for (const auto& s : j.value("symbols", nlohmann::json::array())) {
        if (!s.is_string()) {
            throw std::invalid_argument("trader " + t.id + ": symbols must be strings");
        }
        t.symbols.push_back(normalizeSymbol(s.get<std::string>()));
    }
    return t;
}

nlohmann::json toJson(const Trader& trader) {
    return {
        {"id", trader.id},
        {"name", trader.name},
        {"enabled", trader.enabled},
        {"version", trader.version},
        {"filter", {
            {"code", trader.filter_code},
            {"series_code", trader.series_code},
            {"required_timeframes", trader.required_timeframes}
        }},
        {"refresh_interval", trader.refresh_interval},
        {"symbols", trader.symbols}
    };
}

const char* toString(EvaluationOutcome outcome) {
    switch (outcome) {
        case EvaluationOutcome::Matched: return "matched";
        case EvaluationOutcome::NotMatched: return "not_matched";
        case EvaluationOutcome::CompileError: return "compile_error";
        case EvaluationOutcome::RuntimeError: return "runtime_error";
        case EvaluationOutcome::TimedOut: return "timed_out";
    }
    return "not_matched";
}

const char* toString(Severity severity) {
    switch (severity) {
        case Severity::Info: return "info";
        case Severity::Warning: return "warning";
        case Severity::Error: return "error";
    }
    return "info";
}

nlohmann::json Signal::metadata() const {
    nlohmann::json meta;
    meta["interval"] = interval;
    meta["price"] = price;
    meta["change_24h"] = change_pct;
    meta["volume_24h"] = quote_volume;
    meta["match_count"] = match_count;
    if (!indicators.empty()) {
        meta["indicators"] = indicators;
    }
    if (!reasoning.empty()) {
        meta["reasoning"] = reasoning;
    }
    return meta;
}

nlohmann::json Signal::toJson() const {
    return {
        {"trader_id", trader_id},
        {"symbol", symbol},
        {"timestamp", timestamp_ms},
        {"metadata", metadata()}
    };
}

nlohmann::json MetricRecord::toJson() const {
    return {
        {"source_id", source_id},
        {"timestamp", timestamp_ms},
        {"counters", counters}
    };
}

nlohmann::json EventRecord::toJson() const {
    return {
        {"source_id", source_id},
        {"type", type},
        {"severity", toString(severity)},
        {"timestamp", timestamp_ms},
        {"details", details}
    };
}

} // namespace core
} // namespace sigscan
