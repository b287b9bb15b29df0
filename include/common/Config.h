#pragma once

#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace sigscan {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

struct MarketConfig {
    std::vector<std::string> symbols;
    std::string fallback_interval = "1m";
    std::string stream_url = "wss://stream.binance.com:9443";
    std::string rest_url = "https://api.binance.com";
    size_t buffer_capacity = 500;
    int backfill_limit = 500;
    long long reconnect_initial_ms = 5000;
    long long reconnect_max_ms = 60000;
    int idle_timeout_seconds = 90;
    int connect_timeout_seconds = 10;
};

struct SandboxConfig {
    long long filter_timeout_ms = 1000;
    long long series_timeout_ms = 5000;
    long long max_steps = 5000000;
    int max_call_depth = 64;
};

struct ScreenerConfig {
    int workers = 0;
    int tick_seconds = 0;
    long long tick_budget_ms = 0;   // 0 -> 80% of the tick
    size_t display_candles = 100;
};

struct SignalConfig {
    int dedupe_bars = 0;
};

struct SyncConfig {
    int flush_seconds = 0;
    size_t max_queue_size = 0;
    size_t batch_size = 100;
    int heartbeat_seconds = 30;
    std::string sink = "jsonl";        // jsonl | rest
    std::string jsonl_dir = "data";
    std::string sink_url;               // SIGSCAN_SINK_URL
    std::string sink_api_key;           // SIGSCAN_SINK_API_KEY
    std::string source_id = "sigscan";
    long long retry_initial_ms = 1000;
    long long retry_max_ms = 30000;
    int degraded_after_failures = 3;
};

struct TraderSourceConfig {
    std::string source = "file";        // file | rest
    std::string path = "config/traders.json";
    int reload_seconds = 60;
};

struct ServerConfig {
    int port = 0;   // 0 = disabled
};

struct LoggingConfig {
    std::string dir = "logs";
    std::string level = "info";
};

struct AppConfig {
    MarketConfig market;
    SandboxConfig sandbox;
    ScreenerConfig screener;
    SignalConfig signals;
    SyncConfig sync;
    TraderSourceConfig traders;
    ServerConfig server;
    LoggingConfig logging;
};

class Config {
public:
    // Throws ConfigError when the file is missing, unparsable or incomplete.
    static AppConfig loadFile(const std::string& config_path);
    static AppConfig fromJson(const nlohmann::json& j);

private:
    static void applyEnvironment(AppConfig& cfg);
    static void validate(const AppConfig& cfg);
};

} // namespace sigscan
