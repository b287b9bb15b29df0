#include "market/CandleBuffer.h"
#include "market/MarketDataStore.h"

#include <cassert>
#include <iostream>

namespace {

sigscan::Candle candleAt(long long open_time, double close, bool closed = true) {
    return sigscan::Candle(close, close + 1.0, close - 1.0, close, 1.0,
                           open_time, open_time + 59999, closed);
}

}

int main() {
    using namespace sigscan;
    using namespace sigscan::market;

    std::cout << "[TEST] Starting CandleBuffer Test..." << std::endl;

    // 1. 용량 초과 시 가장 오래된 캔들 제거
    {
        CandleBuffer buffer(3);
        for (int i = 0; i < 5; ++i) {
            assert(buffer.update(candleAt(i * 60000LL, 100.0 + i)) == UpdateResult::Appended);
        }
        assert(buffer.size() == 3);
        const auto view = buffer.view();
        assert(view->size() == 3);
        assert((*view)[0].open_time == 2 * 60000LL);
        assert((*view)[2].open_time == 4 * 60000LL);
    }

    // 2. 진행 중 캔들 교체, 닫힌 캔들 무시, 과거 캔들 거부
    {
        CandleBuffer buffer(10);
        assert(buffer.update(candleAt(0, 100.0, false)) == UpdateResult::Appended);
        assert(buffer.update(candleAt(0, 101.0, false)) == UpdateResult::Replaced);
        assert(buffer.update(candleAt(0, 102.0, true)) == UpdateResult::Replaced);
        assert(buffer.update(candleAt(0, 103.0, true)) == UpdateResult::Ignored);
        assert(buffer.last()->close == 102.0);

        assert(buffer.update(candleAt(60000, 104.0)) == UpdateResult::Appended);
        assert(buffer.update(candleAt(0, 99.0)) == UpdateResult::Rejected);
        assert(buffer.size() == 2);
    }

    // 3. 발행된 view는 이후 변경에 영향받지 않는다
    {
        CandleBuffer buffer(5);
        buffer.update(candleAt(0, 100.0, false));
        const auto before = buffer.view();
        assert(buffer.view() == before);
        buffer.update(candleAt(0, 200.0, false));
        assert(before->back().close == 100.0);
        assert(buffer.view()->back().close == 200.0);
    }

    // 4. seed: 과거 데이터 병합, 라이브 값 우선
    {
        CandleBuffer buffer(4);
        buffer.update(candleAt(3 * 60000LL, 999.0, false));
        std::vector<Candle> history;
        for (int i = 0; i < 6; ++i) {
            history.push_back(candleAt(i * 60000LL - 2 * 60000LL, 100.0 + i));
        }
        buffer.seed(history);
        const auto view = buffer.view();
        assert(view->size() == 4);
        for (size_t i = 1; i < view->size(); ++i) {
            assert((*view)[i - 1].open_time < (*view)[i].open_time);
        }
        assert(view->back().open_time == 3 * 60000LL);
        assert(view->back().close == 999.0);
    }

    bool threw = false;
    try {
        CandleBuffer zero(0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    // 5. MarketDataStore: snapshot, closed 이벤트, retain
    {
        MarketDataStore store(50);
        store.applyCandle("BTCUSDT", "1m", candleAt(0, 100.0, false));
        store.applyCandle("BTCUSDT", "1m", candleAt(0, 101.0, true));
        store.applyCandle("BTCUSDT", "5m", candleAt(0, 101.0, true));
        store.applyCandle("ETHUSDT", "1m", candleAt(0, 10.0, true));

        Ticker t;
        t.symbol = "BTCUSDT";
        t.last_price = 101.5;
        t.price_change_pct = 1.2;
        t.quote_volume = 5e8;
        store.applyTicker(t);

        const auto snap = store.snapshot("BTCUSDT");
        assert(snap.symbol == "BTCUSDT");
        assert(snap.ticker.has_value());
        assert(snap.candles("1m").size() == 1);
        assert(snap.candles("15m").empty());
        assert(snap.lastPrice("1m") == 101.5);

        const auto events = store.drainClosedEvents();
        assert(events.size() == 3);
        assert(store.drainClosedEvents().empty());

        store.retain({"BTCUSDT"}, {"1m"});
        assert(store.bufferCount() == 1);
        assert(store.bufferSize("BTCUSDT", "1m") == 1);
        assert(store.bufferSize("ETHUSDT", "1m") == 0);
        assert(!store.ticker("ETHUSDT").has_value());
        assert(store.snapshotAll().size() == 1);
    }

    std::cout << "[TEST] CandleBuffer Test PASSED!" << std::endl;
    return 0;
}
