#include "market/MarketDataStore.h"
#include "sandbox/StrategySandbox.h"
#include "signal/SignalLifecycle.h"

#include <cassert>
#include <iostream>
#include <vector>

namespace {

sigscan::core::Trader makeTrader(const std::string& id, const std::string& interval) {
    sigscan::core::Trader t;
    t.id = id;
    t.version = "1";
    t.filter_code = "return rsi(14) < 30";
    t.refresh_interval = interval;
    return t;
}

}

int main() {
    using namespace sigscan;
    using namespace sigscan::signal;

    std::cout << "[TEST] Starting SignalLifecycle Test..." << std::endl;

    bool threw = false;
    try {
        SignalLifecycle invalid(0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    // 1. RSI 과매도 진입 후 5봉 dedupe
    {
        const long long bar_ms = 15 * 60000LL;
        const long long t0 = 1700000100000LL - (1700000100000LL % bar_ms);
        const auto trader = makeTrader("rsi-oversold", "15m");

        market::MarketDataStore store(500);
        sandbox::StrategySandbox sandbox(SandboxConfig{});
        SignalLifecycle lifecycle(5);

        std::vector<int> new_at;
        std::vector<int> continuing_at;
        std::vector<core::Signal> emitted;

        for (int i = 0; i < 30; ++i) {
            double close = 0.0;
            if (i < 20) close = 100.0 + (i % 2);
            else if (i == 20) close = 81.0;
            else close = 81.0 - 0.5 * (i - 20);

            const long long open_time = t0 + i * bar_ms;
            const Candle candle(close, close + 0.5, close - 0.5, close, 10.0,
                                open_time, open_time + bar_ms - 1, true);
            store.applyCandle("BTCUSDT", "15m", candle);
            for (const auto& ev : store.drainClosedEvents()) {
                lifecycle.onCandleClosed(ev.symbol, ev.interval);
            }

            const auto snap = store.snapshot("BTCUSDT");
            const auto result = sandbox.evaluate(trader, snap);
            if (i < 20) {
                assert(!result.matched);
                continue;
            }
            if (!result.matched) {
                std::cerr << "[TEST] expected match at candle " << i << ": " << result.error << std::endl;
                return 1;
            }

            const long long now = candle.close_time;
            const auto before = lifecycle.history(trader.id, "BTCUSDT");
            const auto signal = lifecycle.process(trader, result, snap, now);
            if (signal) {
                new_at.push_back(i);
                emitted.push_back(*signal);
            } else {
                continuing_at.push_back(i);
                assert(before.has_value());
            }
        }

        assert(!new_at.empty());
        assert(new_at[0] == 20);
        assert(new_at.size() >= 2 && new_at[1] == 25);
        for (int i = 21; i <= 24; ++i) {
            bool found = false;
            for (int c : continuing_at) found = found || c == i;
            assert(found);
        }

        const auto& first = emitted.front();
        assert(first.trader_id == "rsi-oversold");
        assert(first.symbol == "BTCUSDT");
        assert(first.interval == "15m");
        assert(first.price == 81.0);
        assert(first.match_count == 1);

        const auto meta = first.metadata();
        assert(meta["interval"] == "15m");
        assert(meta["match_count"] == 1);
        const auto record = first.toJson();
        assert(record["trader_id"] == "rsi-oversold");
        assert(record.contains("metadata"));
    }

    // 2. 시간 경과만으로도 새 신호 (봉 마감 이벤트 없이)
    {
        SignalLifecycle lifecycle(3);
        const auto trader = makeTrader("time-only", "1m");
        const long long t = 1000000;
        assert(lifecycle.classify(trader, "ETHUSDT", t) == SignalClass::New);
        assert(lifecycle.classify(trader, "ETHUSDT", t + 60000) == SignalClass::Continuing);
        assert(lifecycle.classify(trader, "ETHUSDT", t + 120000) == SignalClass::Continuing);
        assert(lifecycle.history(trader.id, "ETHUSDT")->match_count == 3);
        assert(lifecycle.classify(trader, "ETHUSDT", t + 180000) == SignalClass::New);
        assert(lifecycle.history(trader.id, "ETHUSDT")->match_count == 1);

        // 다른 심볼은 독립
        assert(lifecycle.classify(trader, "BTCUSDT", t + 180000) == SignalClass::New);
        assert(lifecycle.size() == 2);
    }

    // 3. 다른 인터벌의 봉 마감은 카운트하지 않는다
    {
        SignalLifecycle lifecycle(2);
        const auto trader = makeTrader("interval-bound", "1h");
        const long long t = 5000000;
        lifecycle.classify(trader, "BTCUSDT", t);
        lifecycle.onCandleClosed("BTCUSDT", "1m");
        lifecycle.onCandleClosed("BTCUSDT", "1m");
        lifecycle.onCandleClosed("ETHUSDT", "1h");
        assert(lifecycle.history(trader.id, "BTCUSDT")->bars_since == 0);
        assert(lifecycle.classify(trader, "BTCUSDT", t + 1000) == SignalClass::Continuing);

        lifecycle.onCandleClosed("BTCUSDT", "1h");
        lifecycle.onCandleClosed("BTCUSDT", "1h");
        assert(lifecycle.classify(trader, "BTCUSDT", t + 2000) == SignalClass::New);
        assert(lifecycle.history(trader.id, "BTCUSDT")->bars_since == 0);
    }

    // 4. 매칭되지 않은 결과는 무시, prune
    {
        SignalLifecycle lifecycle(5);
        const auto trader = makeTrader("pruned", "5m");
        core::EvaluationResult result;
        result.trader_id = trader.id;
        result.symbol = "BTCUSDT";
        result.matched = false;
        market::MarketSnapshot snap;
        snap.symbol = "BTCUSDT";
        assert(!lifecycle.process(trader, result, snap, 1000).has_value());
        assert(lifecycle.size() == 0);

        result.matched = true;
        result.outcome = core::EvaluationOutcome::Matched;
        assert(lifecycle.process(trader, result, snap, 1000).has_value());
        lifecycle.classify(makeTrader("kept", "5m"), "BTCUSDT", 1000);
        assert(lifecycle.size() == 2);

        lifecycle.prune({"kept"});
        assert(lifecycle.size() == 1);
        assert(!lifecycle.history("pruned", "BTCUSDT").has_value());
        assert(lifecycle.history("kept", "BTCUSDT").has_value());
    }

    std::cout << "[TEST] SignalLifecycle Test PASSED!" << std::endl;
    return 0;
}
