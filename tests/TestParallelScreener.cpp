#include "screener/ParallelScreener.h"
#include "screener/WorkerPool.h"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

namespace {

using namespace sigscan;

market::MarketSnapshot makeSnapshot(const std::string& symbol, double base, size_t count) {
    auto candles = std::make_shared<std::vector<Candle>>();
    long long t = 1700000000000LL;
    for (size_t i = 0; i < count; ++i) {
        const double c = base + static_cast<double>(i);
        candles->emplace_back(c, c + 1.0, c - 1.0, c, 10.0, t, t + 59999, true);
        t += 60000;
    }
    market::MarketSnapshot snap;
    snap.symbol = symbol;
    snap.klines["1m"] = candles;
    return snap;
}

core::Trader makeTrader(const std::string& id, const std::string& code) {
    core::Trader t;
    t.id = id;
    t.version = "1";
    t.filter_code = code;
    t.refresh_interval = "1m";
    return t;
}

}

int main() {
    std::cout << "[TEST] Starting ParallelScreener Test..." << std::endl;

    // 1. WorkerPool
    {
        screener::WorkerPool pool(3);
        assert(pool.size() == 3);
        std::atomic<int> ran{0};
        for (int i = 0; i < 50; ++i) {
            assert(pool.submit([&ran] { ran++; }));
        }
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (ran.load() < 50 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        assert(ran.load() == 50);

        // 예외를 던지는 태스크도 워커를 죽이지 않는다
        assert(pool.submit([] { throw std::runtime_error("boom"); }));
        assert(pool.submit([&ran] { ran++; }));
        while (ran.load() < 51 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        assert(ran.load() == 51);

        pool.shutdown();
        assert(!pool.submit([] {}));

        bool threw = false;
        try {
            screener::WorkerPool empty(0);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }

    std::map<std::string, market::MarketSnapshot> snapshots;
    snapshots["BTCUSDT"] = makeSnapshot("BTCUSDT", 1000.0, 40);
    snapshots["ETHUSDT"] = makeSnapshot("ETHUSDT", 100.0, 40);
    snapshots["SOLUSDT"] = makeSnapshot("SOLUSDT", 10.0, 40);
    snapshots["XRPUSDT"] = makeSnapshot("XRPUSDT", 1.0, 40);

    // 2. 매칭, 실패 분류, display candles
    {
        auto sandbox = std::make_shared<sandbox::StrategySandbox>(SandboxConfig{});
        ScreenerConfig cfg;
        cfg.workers = 4;
        cfg.tick_seconds = 5;
        cfg.display_candles = 5;
        screener::ParallelScreener screener(cfg, sandbox);
        assert(screener.workerCount() == 4);

        std::vector<core::Trader> traders;
        traders.push_back(makeTrader("expensive", "return price() > 100"));
        traders.push_back(makeTrader("broken", "return ("));
        traders.push_back(makeTrader("crashes", "return 1 / 0"));
        auto btc_only = makeTrader("btc-only", "return true");
        btc_only.symbols = {"BTCUSDT"};
        traders.push_back(btc_only);

        const long long now = 1700003000000LL;
        auto report = screener.screen(traders, snapshots, now);

        assert(report.stats.due == 13);
        assert(report.stats.evaluated == 13);
        assert(report.stats.abandoned == 0);
        assert(report.stats.matched == 3);
        assert(report.stats.compile_errors == 4);
        assert(report.stats.runtime_errors == 4);
        assert(report.failures.size() == 8);

        assert(report.matches["expensive"].size() == 2);
        assert(report.matches["btc-only"].size() == 1);
        const auto& match = report.matches["btc-only"][0];
        assert(match.symbol == "BTCUSDT");
        assert(match.display_candles.size() == 5);
        assert(match.display_candles.back().close == 1039.0);

        // 같은 시각에는 아무것도 due가 아니다
        report = screener.screen(traders, snapshots, now + 1000);
        assert(report.stats.due == 0);

        // refresh interval 경과 후 다시 due
        report = screener.screen(traders, snapshots, now + 60000);
        assert(report.stats.due == 13);

        screener.forget("btc-only");
        assert(screener.isDue(btc_only, "BTCUSDT", now + 60001));

        const auto totals = screener.totals();
        assert(totals.due == 26);
        assert(screener.lastTickStats().due == 13);
    }

    // 3. 타임아웃은 backoff로 간격이 늘어난다
    {
        SandboxConfig sandbox_cfg;
        sandbox_cfg.filter_timeout_ms = 20;
        sandbox_cfg.max_steps = 1000000000000LL;
        auto sandbox = std::make_shared<sandbox::StrategySandbox>(sandbox_cfg);
        ScreenerConfig cfg;
        cfg.workers = 2;
        cfg.tick_budget_ms = 5000;
        screener::ParallelScreener screener(cfg, sandbox);

        std::map<std::string, market::MarketSnapshot> one;
        one["BTCUSDT"] = snapshots["BTCUSDT"];
        std::vector<core::Trader> traders{makeTrader("spin", "while true { }\nreturn true")};

        const long long now = 1700003000000LL;
        auto report = screener.screen(traders, one, now);
        assert(report.stats.timeouts == 1);
        assert(report.failures[0].outcome == core::EvaluationOutcome::TimedOut);
        assert(sandbox->backoffMultiplier("spin") == 2);

        assert(!screener.isDue(traders[0], "BTCUSDT", now + 60000));
        assert(screener.isDue(traders[0], "BTCUSDT", now + 120000));
    }

    // 4. 틱 예산 초과 시 남은 태스크는 포기되고 다음 틱에 재시도
    {
        auto sandbox = std::make_shared<sandbox::StrategySandbox>(SandboxConfig{});
        ScreenerConfig cfg;
        cfg.workers = 1;
        cfg.tick_budget_ms = 1;
        screener::ParallelScreener screener(cfg, sandbox);

        std::vector<core::Trader> traders;
        for (int i = 0; i < 5; ++i) {
            traders.push_back(makeTrader("slow" + std::to_string(i),
                "let x = 0\nfor i in 0..200000 { x = x + 1 }\nreturn false"));
        }

        const long long now = 1700003000000LL;
        auto report = screener.screen(traders, snapshots, now);
        assert(report.stats.due == 20);
        assert(report.stats.abandoned > 0);
        assert(report.stats.evaluated + report.stats.abandoned == 20);

        size_t still_due = 0;
        for (const auto& trader : traders) {
            for (const auto& entry : snapshots) {
                if (screener.isDue(trader, entry.first, now)) ++still_due;
            }
        }
        assert(still_due == report.stats.abandoned);
    }

    // 5. cancel 이후의 태스크는 실행되지 않는다
    {
        auto sandbox = std::make_shared<sandbox::StrategySandbox>(SandboxConfig{});
        ScreenerConfig cfg;
        cfg.workers = 2;
        cfg.tick_seconds = 5;
        screener::ParallelScreener screener(cfg, sandbox);
        screener.cancel();
        std::vector<core::Trader> traders{makeTrader("any", "return true")};
        auto report = screener.screen(traders, snapshots, 1700003000000LL);
        assert(report.stats.abandoned == 4);
        assert(report.stats.evaluated == 0);
        screener.stop();
    }

    std::cout << "[TEST] ParallelScreener Test PASSED!" << std::endl;
    return 0;
}
