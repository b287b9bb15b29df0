#include "common/Config.h"
#include "common/Logger.h"
#include "common/PathUtils.h"
#include "core/orchestration/Orchestrator.h"
#include "core/state/JsonlPersistenceSink.h"
#include "core/state/RestPersistenceSink.h"
#include "core/state/StateSynchronizer.h"
#include "core/state/TraderSources.h"
#include "network/BinanceRestClient.h"
#include "network/BinanceStreamClient.h"
#include "network/HttpClient.h"
#include "network/RateLimiter.h"
#include "sandbox/StrategySandbox.h"
#include "screener/ParallelScreener.h"
#include "server/EvaluationHttpServer.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace sigscan;

namespace {

std::atomic<bool> g_shutdown_requested{false};

void signalHandler(int) {
    // 핸들러에서는 플래그만 세우고 정리는 메인 스레드에서
    g_shutdown_requested = true;
}

void printUsage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [--config <path>]\n"
              << "  --config   configuration file (default: config/config.json)\n";
}

std::shared_ptr<core::IPersistenceSink> makeSink(const AppConfig& cfg,
                                                 const std::shared_ptr<network::RateLimiter>& limiter) {
    if (cfg.sync.sink == "rest") {
        auto http = std::make_shared<network::HttpClient>(
            cfg.sync.sink_url, core::RestPersistenceSink::authHeaders(cfg.sync.sink_api_key), limiter, "sink");
        return std::make_shared<core::RestPersistenceSink>(http);
    }
    return std::make_shared<core::JsonlPersistenceSink>(
        utils::PathUtils::resolveRelativePath(cfg.sync.jsonl_dir));
}

std::shared_ptr<core::ITraderSource> makeTraderSource(const AppConfig& cfg,
                                                      const std::shared_ptr<network::RateLimiter>& limiter) {
    if (cfg.traders.source == "rest") {
        auto http = std::make_shared<network::HttpClient>(
            cfg.sync.sink_url, core::RestPersistenceSink::authHeaders(cfg.sync.sink_api_key), limiter, "sink");
        return std::make_shared<core::RestTraderSource>(http);
    }
    return std::make_shared<core::JsonFileTraderSource>(
        utils::PathUtils::resolveRelativePath(cfg.traders.path));
}

}

int main(int argc, char* argv[]) {
    std::string config_path = "config/config.json";
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            printUsage(argv[0]);
            return 2;
        }
    }

    AppConfig cfg;
    try {
        cfg = Config::loadFile(utils::PathUtils::resolveRelativePath(config_path).string());
        Logger::getInstance().initialize(
            utils::PathUtils::resolveRelativePath(cfg.logging.dir).string(), cfg.logging.level);
    } catch (const std::exception& e) {
        std::cerr << "Startup failed: " << e.what() << "\n";
        return 1;
    }

    LOG_INFO("config loaded from {}", config_path);

    try {
        auto limiter = std::make_shared<network::RateLimiter>();
        limiter->addGroup("klines", 10);
        limiter->addGroup("sink", 20);

        auto store = std::make_shared<market::MarketDataStore>(cfg.market.buffer_capacity);

        network::StreamClientOptions stream_options;
        stream_options.stream_url = cfg.market.stream_url;
        stream_options.reconnect_initial_ms = cfg.market.reconnect_initial_ms;
        stream_options.reconnect_max_ms = cfg.market.reconnect_max_ms;
        stream_options.idle_timeout_seconds = cfg.market.idle_timeout_seconds;
        stream_options.connect_timeout_seconds = cfg.market.connect_timeout_seconds;

        core::OrchestratorServices services;
        services.store = store;
        services.stream = std::make_shared<network::BinanceStreamClient>(store, stream_options);
        services.rest = std::make_shared<network::BinanceRestClient>(
            std::make_shared<network::HttpClient>(cfg.market.rest_url, std::map<std::string, std::string>{},
                                                  limiter, "klines"));
        services.sandbox = std::make_shared<sandbox::StrategySandbox>(cfg.sandbox);
        services.screener = std::make_shared<screener::ParallelScreener>(cfg.screener, services.sandbox);
        services.sync = std::make_shared<core::StateSynchronizer>(cfg.sync, makeSink(cfg, limiter));
        services.traders = makeTraderSource(cfg, limiter);

        auto orchestrator = std::make_shared<core::Orchestrator>(cfg, services);

        auto stream = services.stream;
        auto screener = services.screener;
        services.sync->setCountersProvider([stream, screener]() {
            const auto s = stream->stats();
            const auto t = screener->totals();
            return nlohmann::json{
                {"stream_state", network::toString(stream->state())},
                {"stream_messages", s.messages_received},
                {"stream_malformed", s.malformed},
                {"stream_reconnects", s.reconnects},
                {"evaluations", t.evaluated},
                {"matches", t.matched},
                {"runtime_errors", t.runtime_errors},
                {"timeouts", t.timeouts}
            };
        });

        server::EvaluationHttpServer http_server(
            cfg.server.port,
            services.sandbox,
            [orchestrator]() { return orchestrator->healthJson(); },
            [orchestrator]() { return orchestrator->prometheusMetrics(); },
            cfg.market.fallback_interval);

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        if (!orchestrator->start()) {
            LOG_ERROR("orchestrator failed to start");
            return 1;
        }
        http_server.start();

        while (!g_shutdown_requested.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        LOG_INFO("shutdown signal received");
        http_server.stop();
        orchestrator->stop();
    } catch (const std::exception& e) {
        LOG_ERROR("fatal: {}", e.what());
        return 1;
    }

    LOG_INFO("bye");
    return 0;
}
