#include "common/Config.h"
#include "common/Interval.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace sigscan {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string readEnvVar(const char* name) {
    const char* value = std::getenv(name);
    return value ? trimCopy(value) : "";
}

const nlohmann::json& requireSection(const nlohmann::json& j, const char* name) {
    if (!j.contains(name) || !j[name].is_object()) {
        throw ConfigError(std::string("missing config section: ") + name);
    }
    return j[name];
}

template <typename T>
T requireKey(const nlohmann::json& section, const char* section_name, const char* key) {
    if (!section.contains(key) || section[key].is_null()) {
        throw ConfigError(std::string("missing config key: ") + section_name + "." + key);
    }
    try {
        return section[key].get<T>();
    } catch (const nlohmann::json::exception&) {
        throw ConfigError(std::string("invalid type for config key: ") + section_name + "." + key);
    }
}
}

AppConfig Config::loadFile(const std::string& path) {
    const std::filesystem::path config_path = utils::PathUtils::resolveRelativePath(path);

    if (!std::filesystem::exists(config_path)) {
        throw ConfigError("config file not found: " + config_path.string());
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        throw ConfigError("cannot open config file: " + config_path.string());
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError(std::string("config parse error: ") + e.what());
    }
    return fromJson(j);
}

AppConfig Config::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigError("config root must be an object");
    }

    AppConfig cfg;

    const auto& m = requireSection(j, "market");
    for (const auto& s : requireKey<std::vector<std::string>>(m, "market", "symbols")) {
        const std::string symbol = normalizeSymbol(s);
        if (!symbol.empty() &&
            std::find(cfg.market.symbols.begin(), cfg.market.symbols.end(), symbol) == cfg.market.symbols.end()) {
            cfg.market.symbols.push_back(symbol);
        }
    }
    cfg.market.fallback_interval = m.value("fallback_interval", cfg.market.fallback_interval);
    cfg.market.stream_url = m.value("stream_url", cfg.market.stream_url);
    cfg.market.rest_url = m.value("rest_url", cfg.market.rest_url);
    cfg.market.buffer_capacity = m.value("buffer_capacity", cfg.market.buffer_capacity);
    cfg.market.backfill_limit = m.value("backfill_limit", cfg.market.backfill_limit);
    cfg.market.reconnect_initial_ms = m.value("reconnect_initial_ms", cfg.market.reconnect_initial_ms);
    cfg.market.reconnect_max_ms = m.value("reconnect_max_ms", cfg.market.reconnect_max_ms);
    cfg.market.idle_timeout_seconds = m.value("idle_timeout_seconds", cfg.market.idle_timeout_seconds);
    cfg.market.connect_timeout_seconds = m.value("connect_timeout_seconds", cfg.market.connect_timeout_seconds);

    if (j.contains("sandbox")) {
        const auto& sb = j["sandbox"];
        cfg.sandbox.filter_timeout_ms = sb.value("filter_timeout_ms", cfg.sandbox.filter_timeout_ms);
        cfg.sandbox.series_timeout_ms = sb.value("series_timeout_ms", cfg.sandbox.series_timeout_ms);
        cfg.sandbox.max_steps = sb.value("max_steps", cfg.sandbox.max_steps);
        cfg.sandbox.max_call_depth = sb.value("max_call_depth", cfg.sandbox.max_call_depth);
    }

    const auto& sc = requireSection(j, "screener");
    cfg.screener.workers = requireKey<int>(sc, "screener", "workers");
    cfg.screener.tick_seconds = requireKey<int>(sc, "screener", "tick_seconds");
    cfg.screener.tick_budget_ms = sc.value("tick_budget_ms", cfg.screener.tick_budget_ms);
    cfg.screener.display_candles = sc.value("display_candles", cfg.screener.display_candles);

    const auto& sg = requireSection(j, "signals");
    cfg.signals.dedupe_bars = requireKey<int>(sg, "signals", "dedupe_bars");

    const auto& sy = requireSection(j, "sync");
    cfg.sync.flush_seconds = requireKey<int>(sy, "sync", "flush_seconds");
    cfg.sync.max_queue_size = requireKey<size_t>(sy, "sync", "max_queue_size");
    cfg.sync.batch_size = sy.value("batch_size", cfg.sync.batch_size);
    cfg.sync.heartbeat_seconds = sy.value("heartbeat_seconds", cfg.sync.heartbeat_seconds);
    cfg.sync.sink = sy.value("sink", cfg.sync.sink);
    cfg.sync.jsonl_dir = sy.value("jsonl_dir", cfg.sync.jsonl_dir);
    cfg.sync.source_id = sy.value("source_id", cfg.sync.source_id);
    cfg.sync.retry_initial_ms = sy.value("retry_initial_ms", cfg.sync.retry_initial_ms);
    cfg.sync.retry_max_ms = sy.value("retry_max_ms", cfg.sync.retry_max_ms);
    cfg.sync.degraded_after_failures = sy.value("degraded_after_failures", cfg.sync.degraded_after_failures);

    if (j.contains("traders")) {
        const auto& t = j["traders"];
        cfg.traders.source = t.value("source", cfg.traders.source);
        cfg.traders.path = t.value("path", cfg.traders.path);
        cfg.traders.reload_seconds = t.value("reload_seconds", cfg.traders.reload_seconds);
    }

    if (j.contains("server")) {
        cfg.server.port = j["server"].value("port", cfg.server.port);
    }

    if (j.contains("logging")) {
        cfg.logging.dir = j["logging"].value("dir", cfg.logging.dir);
        cfg.logging.level = j["logging"].value("level", cfg.logging.level);
    }

    applyEnvironment(cfg);
    validate(cfg);
    return cfg;
}

void Config::applyEnvironment(AppConfig& cfg) {
    // 자격 증명은 환경 변수에서만 읽는다
    cfg.sync.sink_url = readEnvVar("SIGSCAN_SINK_URL");
    cfg.sync.sink_api_key = readEnvVar("SIGSCAN_SINK_API_KEY");

    const std::string level = readEnvVar("SIGSCAN_LOG_LEVEL");
    if (!level.empty()) {
        cfg.logging.level = level;
    }
}

void Config::validate(const AppConfig& cfg) {
    if (cfg.market.symbols.empty()) {
        throw ConfigError("market.symbols must not be empty");
    }
    if (!isValidInterval(cfg.market.fallback_interval)) {
        throw ConfigError("market.fallback_interval is not a valid interval: " + cfg.market.fallback_interval);
    }
    if (cfg.market.buffer_capacity == 0) {
        throw ConfigError("market.buffer_capacity must be >= 1");
    }
    if (cfg.market.reconnect_initial_ms <= 0 || cfg.market.reconnect_max_ms < cfg.market.reconnect_initial_ms) {
        throw ConfigError("market.reconnect_initial_ms/reconnect_max_ms out of range");
    }
    if (cfg.market.connect_timeout_seconds < 1) {
        throw ConfigError("market.connect_timeout_seconds must be >= 1");
    }
    if (cfg.screener.workers < 1) {
        throw ConfigError("screener.workers must be >= 1");
    }
    if (cfg.screener.tick_seconds <= 0) {
        throw ConfigError("screener.tick_seconds must be > 0");
    }
    if (cfg.signals.dedupe_bars < 1) {
        throw ConfigError("signals.dedupe_bars must be >= 1");
    }
    if (cfg.sync.flush_seconds <= 0) {
        throw ConfigError("sync.flush_seconds must be > 0");
    }
    if (cfg.sync.max_queue_size < 1) {
        throw ConfigError("sync.max_queue_size must be >= 1");
    }
    if (cfg.sync.batch_size < 1) {
        throw ConfigError("sync.batch_size must be >= 1");
    }
    if (cfg.sync.sink != "jsonl" && cfg.sync.sink != "rest") {
        throw ConfigError("sync.sink must be 'jsonl' or 'rest'");
    }
    if (cfg.sync.sink == "rest" && cfg.sync.sink_url.empty()) {
        throw ConfigError("sync.sink is 'rest' but SIGSCAN_SINK_URL is not set");
    }
    if (cfg.traders.source != "file" && cfg.traders.source != "rest") {
        throw ConfigError("traders.source must be 'file' or 'rest'");
    }
    if (cfg.traders.source == "rest" && cfg.sync.sink_url.empty()) {
        throw ConfigError("traders.source is 'rest' but SIGSCAN_SINK_URL is not set");
    }
    if (cfg.sandbox.filter_timeout_ms <= 0 || cfg.sandbox.series_timeout_ms <= 0) {
        throw ConfigError("sandbox timeouts must be > 0");
    }
}

} // namespace sigscan
