#include "common/Config.h"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace {

nlohmann::json minimalConfig() {
    return nlohmann::json::parse(R"({
        "market":  { "symbols": ["btcusdt", "ETHUSDT", " BTCUSDT "] },
        "screener": { "workers": 4, "tick_seconds": 5 },
        "signals": { "dedupe_bars": 10 },
        "sync":    { "flush_seconds": 10, "max_queue_size": 500 }
    })");
}

bool throwsConfigError(const nlohmann::json& j) {
    try {
        sigscan::Config::fromJson(j);
    } catch (const sigscan::ConfigError&) {
        return true;
    }
    return false;
}

}

int main() {
    using namespace sigscan;

    std::cout << "[TEST] Starting Config Test..." << std::endl;

    unsetenv("SIGSCAN_SINK_URL");
    unsetenv("SIGSCAN_SINK_API_KEY");
    unsetenv("SIGSCAN_LOG_LEVEL");

    // 1. 필수 키 + 기본값
    AppConfig cfg = Config::fromJson(minimalConfig());
    assert(cfg.market.symbols.size() == 2);
    assert(cfg.market.symbols[0] == "BTCUSDT");
    assert(cfg.market.symbols[1] == "ETHUSDT");
    assert(cfg.market.fallback_interval == "1m");
    assert(cfg.market.reconnect_initial_ms == 5000);
    assert(cfg.market.reconnect_max_ms == 60000);
    assert(cfg.market.connect_timeout_seconds == 10);
    assert(cfg.screener.workers == 4);
    assert(cfg.screener.tick_seconds == 5);
    assert(cfg.screener.display_candles == 100);
    assert(cfg.signals.dedupe_bars == 10);
    assert(cfg.sync.flush_seconds == 10);
    assert(cfg.sync.max_queue_size == 500);
    assert(cfg.sync.batch_size == 100);
    assert(cfg.sync.sink == "jsonl");
    assert(cfg.sandbox.filter_timeout_ms == 1000);
    assert(cfg.server.port == 0);

    // 2. 누락 / 잘못된 값
    {
        auto j = minimalConfig();
        j.erase("signals");
        assert(throwsConfigError(j));
    }
    {
        auto j = minimalConfig();
        j["screener"].erase("workers");
        assert(throwsConfigError(j));
    }
    {
        auto j = minimalConfig();
        j["screener"]["workers"] = "four";
        assert(throwsConfigError(j));
    }
    {
        auto j = minimalConfig();
        j["market"]["symbols"] = nlohmann::json::array();
        assert(throwsConfigError(j));
    }
    {
        auto j = minimalConfig();
        j["market"]["fallback_interval"] = "7x";
        assert(throwsConfigError(j));
    }
    {
        auto j = minimalConfig();
        j["sync"]["max_queue_size"] = 0;
        assert(throwsConfigError(j));
    }
    {
        auto j = minimalConfig();
        j["market"]["connect_timeout_seconds"] = 0;
        assert(throwsConfigError(j));
        j["market"]["connect_timeout_seconds"] = 3;
        assert(Config::fromJson(j).market.connect_timeout_seconds == 3);
    }

    // 3. REST 싱크는 환경 변수가 있어야 한다
    {
        auto j = minimalConfig();
        j["sync"]["sink"] = "rest";
        assert(throwsConfigError(j));

        setenv("SIGSCAN_SINK_URL", "https://db.example.test/rest/v1", 1);
        setenv("SIGSCAN_SINK_API_KEY", " secret ", 1);
        AppConfig rest = Config::fromJson(j);
        assert(rest.sync.sink_url == "https://db.example.test/rest/v1");
        assert(rest.sync.sink_api_key == "secret");
        unsetenv("SIGSCAN_SINK_URL");
        unsetenv("SIGSCAN_SINK_API_KEY");
    }

    // 4. SIGSCAN_LOG_LEVEL override
    {
        setenv("SIGSCAN_LOG_LEVEL", "debug", 1);
        AppConfig debug_cfg = Config::fromJson(minimalConfig());
        assert(debug_cfg.logging.level == "debug");
        unsetenv("SIGSCAN_LOG_LEVEL");
    }

    // 5. 파일 로드
    {
        const auto path = std::filesystem::absolute("test_config.json");
        {
            std::ofstream out(path);
            out << minimalConfig().dump(2);
        }
        AppConfig loaded = Config::loadFile(path.string());
        assert(loaded.market.symbols.size() == 2);

        bool missing_threw = false;
        try {
            Config::loadFile(std::filesystem::absolute("does_not_exist.json").string());
        } catch (const ConfigError&) {
            missing_threw = true;
        }
        assert(missing_threw);

        {
            std::ofstream out(path);
            out << "{ not json";
        }
        bool parse_threw = false;
        try {
            Config::loadFile(path.string());
        } catch (const ConfigError&) {
            parse_threw = true;
        }
        assert(parse_threw);

        std::error_code ec;
        std::filesystem::remove(path, ec);
    }

    std::cout << "[TEST] Config Test PASSED!" << std::endl;
    return 0;
}
