#include "core/orchestration/Orchestrator.h"
#include "server/EvaluationHttpServer.h"

#include <boost/asio.hpp>
#include <boost/beast.hpp>

#include <cassert>
#include <chrono>
#include <iostream>
#include <mutex>
#include <thread>

namespace {

using namespace sigscan;
using namespace sigscan::core;

class FakeTraderSource : public ITraderSource {
public:
    std::vector<Trader> loadTraders() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail) {
            throw std::runtime_error("source offline");
        }
        return traders;
    }
    std::string describe() const override { return "fake"; }

    void set(std::vector<Trader> next) {
        std::lock_guard<std::mutex> lock(mutex_);
        traders = std::move(next);
    }

    bool fail = false;
    std::vector<Trader> traders;

private:
    std::mutex mutex_;
};

class MemorySink : public IPersistenceSink {
public:
    bool writeSignals(const std::vector<Signal>& batch) override {
        std::lock_guard<std::mutex> lock(mutex_);
        signals.insert(signals.end(), batch.begin(), batch.end());
        return true;
    }
    bool writeMetrics(const std::vector<MetricRecord>& batch) override {
        std::lock_guard<std::mutex> lock(mutex_);
        metrics.insert(metrics.end(), batch.begin(), batch.end());
        return true;
    }
    bool writeEvents(const std::vector<EventRecord>& batch) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events.insert(events.end(), batch.begin(), batch.end());
        return true;
    }
    std::string name() const override { return "memory"; }

    size_t countEvents(const std::string& type) {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& e : events) {
            if (e.type == type) ++n;
        }
        return n;
    }

    std::vector<Signal> signals;
    std::vector<MetricRecord> metrics;
    std::vector<EventRecord> events;

private:
    std::mutex mutex_;
};

Trader makeTrader(const std::string& id, const std::string& version, const std::string& code) {
    Trader t;
    t.id = id;
    t.name = id;
    t.version = version;
    t.filter_code = code;
    t.refresh_interval = "1m";
    return t;
}

AppConfig testConfig() {
    AppConfig cfg;
    cfg.market.symbols = {"BTCUSDT", "ETHUSDT"};
    cfg.market.backfill_limit = 0;
    cfg.screener.workers = 2;
    cfg.screener.tick_seconds = 5;
    cfg.signals.dedupe_bars = 3;
    cfg.sync.flush_seconds = 60;
    cfg.sync.max_queue_size = 100;
    cfg.sync.heartbeat_seconds = 3600;
    cfg.sync.source_id = "orchestrator-test";
    cfg.traders.reload_seconds = 60;
    return cfg;
}

struct Harness {
    std::shared_ptr<FakeTraderSource> source = std::make_shared<FakeTraderSource>();
    std::shared_ptr<MemorySink> sink = std::make_shared<MemorySink>();
    OrchestratorServices services;

    explicit Harness(const AppConfig& cfg) {
        services.store = std::make_shared<market::MarketDataStore>(cfg.market.buffer_capacity);
        services.sandbox = std::make_shared<sandbox::StrategySandbox>(cfg.sandbox);
        services.screener = std::make_shared<screener::ParallelScreener>(cfg.screener, services.sandbox);
        services.sync = std::make_shared<StateSynchronizer>(cfg.sync, sink);
        services.traders = source;

        for (const auto& symbol : cfg.market.symbols) {
            std::vector<Candle> candles;
            long long t = 1700000000000LL;
            for (int i = 0; i < 30; ++i) {
                const double c = (symbol == "BTCUSDT" ? 30000.0 : 2000.0) + i;
                candles.emplace_back(c, c + 1.0, c - 1.0, c, 5.0, t, t + 59999, true);
                t += 60000;
            }
            services.store->seedCandles(symbol, "1m", candles);
        }
        // 감시 대상이 아닌 심볼은 스크리닝에서 제외
        services.store->seedCandles("DOGEUSDT", "1m", {Candle(1, 1, 1, 1, 1, 0, 59999, true)});
    }
};

}

int main() {
    std::cout << "[TEST] Starting Orchestrator Test..." << std::endl;

    const AppConfig cfg = testConfig();

    // 1. 트레이더 로드, 잘못된 트레이더 보고, 틱, dedupe
    {
        Harness h(cfg);
        auto multi = makeTrader("multi", "1", "return closes(\"1h\").length == 0 && price() > 0");
        multi.required_timeframes = {"1h"};
        h.source->set({
            makeTrader("always", "1", "return true"),
            makeTrader("broken", "1", "return ("),
            multi
        });

        Orchestrator orchestrator(cfg, h.services);
        assert(orchestrator.reloadTraders());
        assert(orchestrator.activeTraders().size() == 2);
        assert(orchestrator.invalidTraders().count("broken") == 1);
        assert(h.services.sync->pendingEvents() == 1);

        const auto intervals = orchestrator.requiredIntervals();
        assert(intervals.size() == 2);
        assert(intervals.count("1m") == 1 && intervals.count("1h") == 1);

        // 같은 버전은 다시 보고하지 않는다
        assert(orchestrator.reloadTraders());
        assert(h.services.sync->pendingEvents() == 1);

        const long long now = 1700002000000LL;
        orchestrator.runTick(now);
        assert(orchestrator.ticksRun() == 1);
        assert(orchestrator.signalsEmitted() == 4);
        assert(h.services.sync->pendingSignals() == 4);
        assert(h.services.sync->pendingMetrics() == 1);

        // refresh interval 이전: 평가 없음
        orchestrator.runTick(now + 1000);
        assert(orchestrator.signalsEmitted() == 4);
        assert(h.services.screener->lastTickStats().due == 0);

        // 다시 매칭되지만 dedupe 창 안이므로 continuing
        orchestrator.runTick(now + 60000);
        assert(h.services.screener->lastTickStats().matched == 4);
        assert(orchestrator.signalsEmitted() == 4);

        // 3봉(3분) 경과 후 새 신호
        orchestrator.runTick(now + 180000);
        assert(orchestrator.signalsEmitted() == 8);

        assert(h.services.sync->flushNow());
        assert(h.sink->signals.size() == 8);
        for (const auto& s : h.sink->signals) {
            assert(s.symbol == "BTCUSDT" || s.symbol == "ETHUSDT");
            assert(s.price > 0.0);
        }
        assert(h.sink->metrics.size() == 4);
        assert(h.sink->metrics[0].counters["type"] == "tick");
        assert(h.sink->countEvents("trader_invalid") == 1);

        // 새 버전이 여전히 잘못되면 다시 보고
        h.source->set({
            makeTrader("always", "1", "return true"),
            makeTrader("broken", "2", "let = 1")
        });
        assert(orchestrator.reloadTraders());
        assert(h.services.sync->pendingEvents() == 1);
        assert(orchestrator.activeTraders().size() == 1);
        assert(orchestrator.requiredIntervals().size() == 1);

        // 고쳐지면 invalid 목록에서 제거
        h.source->set({
            makeTrader("always", "1", "return true"),
            makeTrader("broken", "3", "return false")
        });
        assert(orchestrator.reloadTraders());
        assert(orchestrator.invalidTraders().empty());
        assert(orchestrator.activeTraders().size() == 2);

        // 소스 실패 시 기존 목록 유지
        h.source->fail = true;
        assert(!orchestrator.reloadTraders());
        assert(orchestrator.activeTraders().size() == 2);
        h.source->fail = false;

        const auto health = orchestrator.healthJson();
        assert(health["status"] == "stopped");
        assert(health["stream_state"] == "disabled");
        assert(health["active_traders"] == 2);
        assert(health["ticks"] == 4);

        const std::string metrics = orchestrator.prometheusMetrics();
        assert(metrics.find("sigscan_ticks_total 4") != std::string::npos);
        assert(metrics.find("sigscan_signals_total 8") != std::string::npos);
        assert(metrics.find("sigscan_stream_messages_total") == std::string::npos);

        assert(orchestrator.superviseOnce() == 0);
    }

    // 2. start / stop 수명 주기와 이벤트
    {
        Harness h(cfg);
        h.source->set({makeTrader("always", "1", "return true")});
        {
            Orchestrator orchestrator(cfg, h.services);
            assert(orchestrator.start());
            assert(orchestrator.isRunning());
            assert(!orchestrator.start());
            orchestrator.stop();
            assert(!orchestrator.isRunning());
        }
        assert(h.sink->countEvents("started") == 1);
        assert(h.sink->countEvents("stopped") == 1);
        assert(h.services.sync->pendingEvents() == 0);
    }

    // 3. 필수 서비스 누락
    {
        OrchestratorServices empty;
        bool threw = false;
        try {
            Orchestrator orchestrator(cfg, empty);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }

    // 4. 검증용 HTTP 엔드포인트
    {
        auto sandbox = std::make_shared<sandbox::StrategySandbox>(SandboxConfig{});
        server::EvaluationHttpServer http(0, sandbox,
            [] { return nlohmann::json{{"status", "ok"}, {"active_traders", 2}}; },
            [] { return std::string("sigscan_ticks_total 1\n"); });

        nlohmann::json candles = nlohmann::json::array();
        for (int i = 0; i < 20; ++i) {
            candles.push_back({
                {"open", 100 + i}, {"high", 101 + i}, {"low", 99 + i}, {"close", std::to_string(100 + i)},
                {"volume", 10}, {"openTime", 1700000000000LL + (19 - i) * 60000LL}
            });
        }
        nlohmann::json request = {
            {"filter_code", "let v = sma(closes(), 5)\nreturn { matched: v > 100, reasoning: \"sma \" + v }"},
            {"series_code", "return { sma: points(klines(), sma_series(closes(), 5)) }"},
            {"market_data", {{"symbol", "btcusdt"}, {"klines", {{"5m", candles}}}}}
        };

        auto res = http.handle("POST", "/v1/evaluate", request.dump());
        assert(res.status == 200);
        auto body = nlohmann::json::parse(res.body);
        if (body["outcome"] != "matched") {
            std::cerr << "[TEST] evaluate endpoint: " << res.body << std::endl;
            return 1;
        }
        assert(body["ok"] == true);
        assert(body["matched"] == true);
        assert(body["series"]["sma"].size() == 16);
        assert(body.contains("reasoning"));

        const auto snapshot = server::EvaluationHttpServer::snapshotFromJson(request["market_data"]);
        assert(snapshot.symbol == "BTCUSDT");
        assert(snapshot.candles("5m").front().open_time == 1700000000000LL);

        request["filter_code"] = "return (";
        body = nlohmann::json::parse(http.handle("POST", "/v1/evaluate", request.dump()).body);
        assert(body["ok"] == false);
        assert(body["outcome"] == "compile_error");

        assert(http.handle("POST", "/v1/evaluate", "{oops").status == 400);
        assert(http.handle("POST", "/v1/evaluate", "{\"series_code\":\"\"}").status == 400);
        assert(http.handle("POST", "/v1/evaluate",
            R"({"filter_code":"return true","market_data":{"klines":{"9q":[]}}})").status == 400);

        // 타입이 틀린 필드는 예외 대신 400
        const char* wrong_types[] = {
            R"({"filter_code":"return true","series_code":42})",
            R"({"filter_code":"return true","interval":5})",
            R"({"filter_code":"return true","interval":"7x"})",
            R"({"filter_code":"return true","market_data":[1,2]})",
            R"({"filter_code":"return true","market_data":{"symbol":12}})",
            R"({"filter_code":"return true","market_data":{"ticker":{"last_price":"abc"}}})",
            R"({"filter_code":"return true","market_data":{"ticker":[]}})",
            R"({"filter_code":"return true","market_data":{"klines":{"1m":[{"open":1,"high":1,"low":1,"close":"nan","time":1}]}}})",
            R"({"filter_code":"return true","market_data":{"klines":{"1m":[{"open":1,"high":1,"low":1,"close":1,"time":1,"closed":"yes"}]}}})"
        };
        for (const char* body_text : wrong_types) {
            res = http.handle("POST", "/v1/evaluate", body_text);
            if (res.status != 400) {
                std::cerr << "[TEST] expected 400 for " << body_text << ": " << res.body << std::endl;
                return 1;
            }
            assert(nlohmann::json::parse(res.body)["ok"] == false);
        }

        assert(http.handle("GET", "/v1/evaluate", "").status == 405);
        assert(http.handle("GET", "/nowhere", "").status == 404);

        res = http.handle("GET", "/health?verbose=1", "");
        assert(res.status == 200);
        assert(nlohmann::json::parse(res.body)["active_traders"] == 2);

        res = http.handle("GET", "/metrics", "");
        assert(res.content_type.find("text/plain") == 0);
        assert(res.body == "sigscan_ticks_total 1\n");
    }

    // 5. 소켓 계층: 말 없는 클라이언트가 있어도 다른 요청은 처리되고 stop은 바로 반환
    {
        namespace asio = boost::asio;
        namespace beast = boost::beast;
        namespace http = beast::http;
        using tcp = asio::ip::tcp;

        unsigned short port = 0;
        {
            asio::io_context port_ioc;
            tcp::acceptor free_port(port_ioc, tcp::endpoint(tcp::v4(), 0));
            port = free_port.local_endpoint().port();
        }

        auto sandbox = std::make_shared<sandbox::StrategySandbox>(SandboxConfig{});
        server::EvaluationHttpServer http_server(port, sandbox,
            [] { return nlohmann::json{{"status", "ok"}}; },
            [] { return std::string(); });
        assert(http_server.start());
        assert(http_server.isRunning());
        assert(http_server.port() == port);

        // 같은 포트로 두 번째 서버는 bind 실패
        server::EvaluationHttpServer clash(port, sandbox, nullptr, nullptr);
        assert(!clash.start());

        asio::io_context client_ioc;
        const tcp::endpoint endpoint(asio::ip::make_address("127.0.0.1"), port);

        tcp::socket idle(client_ioc);
        idle.connect(endpoint);

        const auto fetch = [&](const std::string& target) {
            beast::tcp_stream stream(client_ioc);
            stream.connect(endpoint);
            http::request<http::string_body> req{http::verb::get, target, 11};
            req.set(http::field::host, "127.0.0.1");
            http::write(stream, req);
            beast::flat_buffer buffer;
            http::response<http::string_body> res;
            http::read(stream, buffer, res);
            return res;
        };

        const auto started = std::chrono::steady_clock::now();
        for (int i = 0; i < 3; ++i) {
            const auto res = fetch("/health");
            assert(res.result_int() == 200);
            assert(nlohmann::json::parse(res.body())["status"] == "ok");
        }
        assert(fetch("/nowhere").result_int() == 404);
        assert(std::chrono::steady_clock::now() - started < std::chrono::seconds(3));

        const auto stop_started = std::chrono::steady_clock::now();
        http_server.stop();
        assert(!http_server.isRunning());
        assert(std::chrono::steady_clock::now() - stop_started < std::chrono::seconds(2));

        boost::system::error_code ec;
        idle.close(ec);
    }

    std::cout << "[TEST] Orchestrator Test PASSED!" << std::endl;
    return 0;
}
