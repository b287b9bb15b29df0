#include "core/state/JsonlPersistenceSink.h"
#include "core/state/RestPersistenceSink.h"
#include "core/state/StateSynchronizer.h"
#include "core/state/TraderSources.h"

#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <thread>

namespace {

using namespace sigscan;
using namespace sigscan::core;

class MemorySink : public IPersistenceSink {
public:
    bool writeSignals(const std::vector<Signal>& batch) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail || fail_signals) return false;
        signals.insert(signals.end(), batch.begin(), batch.end());
        return true;
    }
    bool writeMetrics(const std::vector<MetricRecord>& batch) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail) return false;
        metrics.insert(metrics.end(), batch.begin(), batch.end());
        return true;
    }
    bool writeEvents(const std::vector<EventRecord>& batch) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail) return false;
        events.insert(events.end(), batch.begin(), batch.end());
        return true;
    }
    std::string name() const override { return "memory"; }

    size_t signalCount() {
        std::lock_guard<std::mutex> lock(mutex_);
        return signals.size();
    }

    std::atomic<bool> fail{false};
    std::atomic<bool> fail_signals{false};
    std::vector<Signal> signals;
    std::vector<MetricRecord> metrics;
    std::vector<EventRecord> events;

private:
    std::mutex mutex_;
};

class FakeHttpClient : public network::IHttpClient {
public:
    network::HttpResponse get(const std::string& endpoint,
                              const std::map<std::string, std::string>& query_params) override {
        last_endpoint = endpoint;
        last_query = query_params;
        return next;
    }
    network::HttpResponse post(const std::string& endpoint,
                               const nlohmann::json& body,
                               const std::map<std::string, std::string>& extra_headers) override {
        if (throw_on_post) {
            throw std::runtime_error("connection refused");
        }
        last_endpoint = endpoint;
        last_body = body;
        last_headers = extra_headers;
        return next;
    }

    network::HttpResponse next;
    bool throw_on_post = false;
    std::string last_endpoint;
    nlohmann::json last_body;
    std::map<std::string, std::string> last_query;
    std::map<std::string, std::string> last_headers;
};

SyncConfig syncConfig(size_t cap) {
    SyncConfig cfg;
    cfg.flush_seconds = 1;
    cfg.max_queue_size = cap;
    cfg.batch_size = 30;
    cfg.heartbeat_seconds = 3600;
    cfg.source_id = "test-node";
    cfg.degraded_after_failures = 2;
    return cfg;
}

Signal makeSignal(int n) {
    Signal s;
    s.trader_id = "t" + std::to_string(n % 3);
    s.symbol = "BTCUSDT";
    s.interval = "1m";
    s.timestamp_ms = 1700000000000LL + n;
    s.price = 100.0 + n;
    return s;
}

}

int main() {
    std::cout << "[TEST] Starting StateSynchronizer Test..." << std::endl;

    // 1. 용량 100에 150개: 오래된 50개 제거
    {
        auto sink = std::make_shared<MemorySink>();
        StateSynchronizer sync(syncConfig(100), sink);
        for (int i = 0; i < 150; ++i) {
            sync.enqueueSignal(makeSignal(i));
        }
        assert(sync.pendingSignals() == 100);
        auto stats = sync.stats();
        assert(stats.enqueued_signals == 150);
        assert(stats.evicted_signals == 50);

        assert(sync.flushNow());
        assert(sink->signals.size() == 100);
        assert(sink->signals.front().timestamp_ms == 1700000000000LL + 50);
        assert(sink->signals.back().timestamp_ms == 1700000000000LL + 149);
        assert(sync.pendingSignals() == 0);
        assert(sync.stats().flushed_signals == 100);
    }

    // 2. 실패한 배치는 앞에 되돌리고, 연속 실패 시 degraded 이벤트
    {
        auto sink = std::make_shared<MemorySink>();
        StateSynchronizer sync(syncConfig(50), sink);
        for (int i = 0; i < 40; ++i) {
            sync.enqueueSignal(makeSignal(i));
        }

        sink->fail = true;
        assert(!sync.flushNow());
        assert(sync.pendingSignals() == 40);
        assert(sync.stats().failed_batches == 1);
        assert(sync.stats().consecutive_failures == 1);
        assert(sync.pendingEvents() == 0);

        assert(!sync.flushNow());
        assert(sync.stats().consecutive_failures == 2);
        assert(sync.pendingEvents() == 1);

        // 실패 중에도 용량은 유지
        for (int i = 40; i < 60; ++i) {
            sync.enqueueSignal(makeSignal(i));
        }
        assert(sync.pendingSignals() == 50);

        sink->fail = false;
        assert(sync.flushNow());
        assert(sink->signals.size() == 50);
        assert(sink->signals.front().timestamp_ms == 1700000000000LL + 10);
        assert(sync.stats().consecutive_failures == 0);

        // recovered 이벤트는 다음 flush에서 기록
        assert(sync.pendingEvents() == 1);
        assert(sync.flushNow());
        bool degraded = false;
        bool recovered = false;
        for (const auto& e : sink->events) {
            degraded = degraded || e.type == "persistence_degraded";
            recovered = recovered || e.type == "persistence_recovered";
            assert(e.source_id == "test-node");
        }
        assert(degraded && recovered);
    }

    // 2b. 시그널 쓰기만 계속 실패해도 메트릭과 이벤트는 기록된다
    {
        auto sink = std::make_shared<MemorySink>();
        StateSynchronizer sync(syncConfig(50), sink);
        sink->fail_signals = true;
        for (int i = 0; i < 5; ++i) {
            sync.enqueueSignal(makeSignal(i));
            MetricRecord metric;
            metric.source_id = "test-node";
            metric.timestamp_ms = 1700000000000LL + i;
            metric.counters = {{"n", i}};
            sync.enqueueMetric(metric);
        }

        assert(!sync.flushNow());
        assert(sink->metrics.size() == 5);
        assert(sync.pendingMetrics() == 0);
        assert(sync.pendingSignals() == 5);

        // 두 번째 실패로 degraded, 세 번째 flush에서 이벤트가 나간다
        assert(!sync.flushNow());
        assert(sync.pendingEvents() == 1);
        assert(!sync.flushNow());
        assert(sync.pendingEvents() == 0);
        assert(sink->events.size() == 1);
        assert(sink->events[0].type == "persistence_degraded");
        assert(sink->signals.empty());
        assert(sync.pendingSignals() == 5);
    }

    // 3. 하트비트와 카운터
    {
        auto sink = std::make_shared<MemorySink>();
        StateSynchronizer sync(syncConfig(10), sink);
        sync.setCountersProvider([] { return nlohmann::json{{"active_traders", 3}}; });
        assert(sync.sendHeartbeat());
        assert(sink->metrics.size() == 1);
        const auto& counters = sink->metrics[0].counters;
        assert(counters["type"] == "heartbeat");
        assert(counters["active_traders"] == 3);
        assert(counters.contains("queue_signals"));
        assert(sync.stats().heartbeats == 1);

        sink->fail = true;
        assert(!sync.sendHeartbeat());
        assert(sync.stats().heartbeats == 1);
    }

    // 4. 백그라운드 flush와 stop 시 최종 flush
    {
        auto sink = std::make_shared<MemorySink>();
        StateSynchronizer sync(syncConfig(100), sink);
        sync.start();
        assert(sync.isRunning());
        assert(sync.isHealthy());
        for (int i = 0; i < 5; ++i) {
            sync.enqueueSignal(makeSignal(i));
        }

        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (sink->signalCount() < 5 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        assert(sink->signalCount() == 5);

        sync.enqueueSignal(makeSignal(99));
        sync.stop();
        assert(!sync.isRunning());
        assert(sink->signalCount() == 6);
    }

    // 5. 생성자 검증
    {
        bool threw = false;
        try {
            StateSynchronizer bad(syncConfig(10), nullptr);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);

        threw = false;
        try {
            StateSynchronizer bad(syncConfig(0), std::make_shared<MemorySink>());
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }

    // 6. JSONL 싱크
    {
        const auto dir = std::filesystem::absolute("test_sync_jsonl");
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);

        JsonlPersistenceSink sink(dir);
        assert(sink.writeSignals({makeSignal(1), makeSignal(2)}));
        EventRecord event;
        event.source_id = "test-node";
        event.type = "started";
        event.timestamp_ms = 1;
        assert(sink.writeEvents({event}));

        {
            std::ofstream garbage(dir / "signals.jsonl", std::ios::app);
            garbage << "{broken\n";
        }

        const auto signals = sink.readAll("signals");
        assert(signals.size() == 2);
        assert(signals[0]["trader_id"] == "t1");
        assert(signals[0]["metadata"]["interval"] == "1m");
        const auto events = sink.readAll("events");
        assert(events.size() == 1);
        assert(events[0]["severity"] == "info");
        assert(sink.readAll("metrics").empty());

        std::filesystem::remove_all(dir, ec);
    }

    // 7. REST 싱크
    {
        auto http = std::make_shared<FakeHttpClient>();
        RestPersistenceSink sink(http);

        http->next.status_code = 201;
        assert(sink.writeSignals({makeSignal(1)}));
        assert(http->last_endpoint == "/signals");
        assert(http->last_body.is_array() && http->last_body.size() == 1);
        assert(http->last_headers["Prefer"] == "return=minimal");

        http->next.status_code = 500;
        assert(!sink.writeSignals({makeSignal(2)}));

        http->throw_on_post = true;
        assert(!sink.writeEvents({EventRecord{}}));

        // 빈 배치는 요청 없이 성공
        http->last_endpoint.clear();
        assert(sink.writeMetrics({}));
        assert(http->last_endpoint.empty());

        const auto headers = RestPersistenceSink::authHeaders("key");
        assert(headers.at("apikey") == "key");
        assert(headers.at("Authorization") == "Bearer key");
        assert(RestPersistenceSink::authHeaders("").empty());
    }

    // 8. 트레이더 목록
    {
        const auto doc = nlohmann::json::parse(R"({"traders": [
            {"id": "a", "version": 3, "filter": {"code": "return true", "required_timeframes": ["1h"]},
             "refresh_interval": "5m", "symbols": ["btcusdt"]},
            {"id": "b", "enabled": false, "filter": {"code": "return true"}},
            {"id": "c", "filter": {}},
            {"id": "d", "filter": {"code": "return true"}, "refresh_interval": "7x"},
            "garbage"
        ]})");
        const auto traders = parseTraderList(doc);
        assert(traders.size() == 1);
        assert(traders[0].id == "a");
        assert(traders[0].version == "3");
        assert(traders[0].symbols[0] == "BTCUSDT");
        assert(traders[0].intervals().size() == 2);
        assert(traders[0].appliesTo("BTCUSDT"));
        assert(!traders[0].appliesTo("ETHUSDT"));

        const auto round = traderFromJson(toJson(traders[0]));
        assert(round.id == traders[0].id && round.version == traders[0].version);
        assert(round.filter_code == traders[0].filter_code);

        auto http = std::make_shared<FakeHttpClient>();
        http->next.status_code = 200;
        http->next.body = doc["traders"].dump();
        RestTraderSource source(http);
        assert(source.loadTraders().size() == 1);
        assert(http->last_endpoint == "/traders");
        assert(http->last_query["enabled"] == "eq.true");

        http->next.status_code = 503;
        bool threw = false;
        try {
            source.loadTraders();
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);

        JsonFileTraderSource missing(std::filesystem::absolute("no_such_traders.json"));
        threw = false;
        try {
            missing.loadTraders();
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);
    }

    std::cout << "[TEST] StateSynchronizer Test PASSED!" << std::endl;
    return 0;
}
