#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/Types.h"

namespace sigscan {
namespace core {

// 전략 하나. refresh_interval이 기본(primary) 인터벌을 겸한다.
struct Trader {
    std::string id;
    std::string name;
    bool enabled = true;
    std::string version;
    std::string filter_code;
    std::string series_code;
    std::vector<std::string> required_timeframes;
    std::string refresh_interval = "1m";
    std::vector<std::string> symbols;   // empty = every monitored symbol

    const std::string& primaryInterval() const { return refresh_interval; }
    std::vector<std::string> intervals() const;
    bool appliesTo(const std::string& symbol) const;
};

// Throws std::invalid_argument when required fields are missing or malformed.
Trader traderFromJson(const nlohmann::json& j);
nlohmann::json toJson(const Trader& trader);

enum class EvaluationOutcome {
    Matched,
    NotMatched,
    CompileError,
    RuntimeError,
    TimedOut
};

const char* toString(EvaluationOutcome outcome);

struct EvaluationResult {
    std::string trader_id;
    std::string symbol;
    std::string interval;
    EvaluationOutcome outcome = EvaluationOutcome::NotMatched;
    bool matched = false;
    nlohmann::json indicators = nlohmann::json::object();
    std::string reasoning;
    nlohmann::json series;              // null unless series code ran
    std::vector<Candle> display_candles;
    std::string error;
    long long duration_ms = 0;
    long long evaluated_at_ms = 0;
};

struct Signal {
    std::string trader_id;
    std::string symbol;
    std::string interval;
    long long timestamp_ms = 0;
    double price = 0.0;
    double change_pct = 0.0;
    double quote_volume = 0.0;
    int match_count = 1;
    nlohmann::json indicators = nlohmann::json::object();
    std::string reasoning;

    nlohmann::json metadata() const;
    nlohmann::json toJson() const;
};

struct MetricRecord {
    std::string source_id;
    long long timestamp_ms = 0;
    nlohmann::json counters = nlohmann::json::object();

    nlohmann::json toJson() const;
};

enum class Severity { Info, Warning, Error };

const char* toString(Severity severity);

struct EventRecord {
    std::string source_id;
    std::string type;
    Severity severity = Severity::Info;
    long long timestamp_ms = 0;
    nlohmann::json details = nlohmann::json::object();

    nlohmann::json toJson() const;
};

} // namespace core
} // namespace sigscan
