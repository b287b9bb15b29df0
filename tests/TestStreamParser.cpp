#include "network/BinanceRestClient.h"
#include "network/BinanceStreamClient.h"
#include "network/BinanceStreamParser.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {

std::string klineMessage(const std::string& symbol, const std::string& interval,
                         long long open_time, double close, bool closed) {
    nlohmann::json k = {
        {"t", open_time},
        {"T", open_time + 59999},
        {"s", symbol},
        {"i", interval},
        {"o", std::to_string(close - 0.5)},
        {"h", std::to_string(close + 1.0)},
        {"l", std::to_string(close - 1.0)},
        {"c", std::to_string(close)},
        {"v", "12.5"},
        {"x", closed}
    };
    nlohmann::json msg = {
        {"stream", "x@kline_" + interval},
        {"data", {{"e", "kline"}, {"E", open_time + 1}, {"s", symbol}, {"k", k}}}
    };
    return msg.dump();
}

std::string tickerMessage(const std::string& symbol, double price) {
    nlohmann::json msg = {
        {"stream", "x@ticker"},
        {"data", {
            {"e", "24hrTicker"}, {"E", 1700000000000LL}, {"s", symbol},
            {"c", std::to_string(price)}, {"P", "-1.25"}, {"q", "123456.7"}
        }}
    };
    return msg.dump();
}

}

int main() {
    using namespace sigscan;
    using namespace sigscan::network;

    std::cout << "[TEST] Starting StreamParser Test..." << std::endl;

    // 1. 파서 단위 동작
    {
        auto kline = BinanceStreamParser::parse(klineMessage("BTCUSDT", "1m", 60000, 100.0, true));
        assert(kline.has_value());
        assert(kline->type == StreamEventType::Kline);
        assert(kline->symbol == "BTCUSDT");
        assert(kline->interval == "1m");
        assert(kline->candle.close == 100.0);
        assert(kline->candle.closed);

        auto ticker = BinanceStreamParser::parse(tickerMessage("ETHUSDT", 2000.0));
        assert(ticker.has_value());
        assert(ticker->type == StreamEventType::Ticker);
        assert(ticker->ticker.last_price == 2000.0);
        assert(ticker->ticker.price_change_pct == -1.25);

        auto ack = BinanceStreamParser::parse(R"({"result":null,"id":3})");
        assert(ack.has_value() && ack->type == StreamEventType::Control);
        assert(ack->control_error.empty());

        auto rejected = BinanceStreamParser::parse(R"({"error":{"code":2,"msg":"bad"},"id":4})");
        assert(rejected.has_value() && !rejected->control_error.empty());

        assert(!BinanceStreamParser::parse("not json").has_value());
        assert(!BinanceStreamParser::parse("[]").has_value());
        assert(!BinanceStreamParser::parse(R"({"data":{"e":"depthUpdate"}})").has_value());
        assert(!BinanceStreamParser::parse(R"({"data":{"e":"kline","k":{"s":"X","i":"1m"}}})").has_value());

        const auto streams = BinanceStreamParser::buildStreams({"BTCUSDT"}, {"1m", "5m"});
        assert(streams.size() == 3);
        assert(streams.count("btcusdt@ticker") == 1);
        assert(streams.count("btcusdt@kline_5m") == 1);

        const auto request = nlohmann::json::parse(
            BinanceStreamParser::buildRequest("SUBSCRIBE", {"btcusdt@ticker"}, 7));
        assert(request["method"] == "SUBSCRIBE");
        assert(request["id"] == 7);
        assert(request["params"].size() == 1);
    }

    // 1b. nan/inf 가격은 잘못된 메시지로 취급
    {
        auto nan_close = nlohmann::json::parse(klineMessage("BTCUSDT", "1m", 60000, 100.0, true));
        nan_close["data"]["k"]["c"] = "nan";
        assert(!BinanceStreamParser::parse(nan_close.dump()).has_value());

        auto inf_high = nlohmann::json::parse(klineMessage("BTCUSDT", "1m", 60000, 100.0, true));
        inf_high["data"]["k"]["h"] = "inf";
        assert(!BinanceStreamParser::parse(inf_high.dump()).has_value());

        auto inf_ticker = nlohmann::json::parse(tickerMessage("ETHUSDT", 2000.0));
        inf_ticker["data"]["c"] = "-infinity";
        assert(!BinanceStreamParser::parse(inf_ticker.dump()).has_value());

        auto store = std::make_shared<market::MarketDataStore>(10);
        BinanceStreamClient client(store, StreamClientOptions{});
        assert(!client.processMessage(nan_close.dump()));
        assert(client.stats().malformed == 1);
        assert(store->bufferCount() == 0);

        const auto rows = nlohmann::json::parse(R"([
            [60000, "1", "2", "0.5", "nan", "5", 119999],
            [120000, "3", "4", "2", "3.5", "10", 179999]
        ])");
        const auto candles = BinanceRestClient::parseKlines(rows, 200000);
        assert(candles.size() == 1);
        assert(candles[0].open_time == 120000);
    }

    // 2. 50 심볼 x 2 인터벌 x 10 슬롯, 그중 100번째마다 잘못된 메시지 (총 1000개)
    {
        auto store = std::make_shared<market::MarketDataStore>(500);
        BinanceStreamClient client(store, StreamClientOptions{});

        const std::string intervals[] = {"1m", "5m"};
        int sent = 0;
        for (int s = 0; s < 50; ++s) {
            const std::string symbol = "SYM" + std::to_string(s) + "USDT";
            for (const auto& interval : intervals) {
                for (int m = 0; m < 10; ++m) {
                    ++sent;
                    if (sent % 100 == 0) {
                        client.processMessage("{\"stream\":\"broken\"");
                    } else {
                        client.processMessage(klineMessage(symbol, interval, m * 60000LL, 100.0 + m, true));
                    }
                }
            }
        }

        const auto stats = client.stats();
        assert(sent == 1000);
        assert(stats.messages_received == 1000);
        assert(stats.updates_applied == 990);
        assert(stats.malformed == 10);
        assert(stats.stale == 0);
        assert(store->bufferCount() == 100);
        assert(store->bufferSize("SYM7USDT", "5m") == 10);
        // 100번째 슬롯 = SYM4USDT 5m 의 마지막 캔들
        assert(store->bufferSize("SYM4USDT", "5m") == 9);

        // 이미 닫힌 캔들의 재전송은 stale
        assert(!client.processMessage(klineMessage("SYM7USDT", "5m", 9 * 60000LL, 1.0, true)));
        assert(client.stats().stale == 1);

        assert(client.processMessage(tickerMessage("SYM7USDT", 109.5)));
        assert(store->ticker("SYM7USDT")->last_price == 109.5);
        assert(client.state() == ConnectionState::Disconnected);
        assert(client.isHealthy());
    }

    // 3. 재연결 백오프는 상한에서 멈춘다
    {
        auto store = std::make_shared<market::MarketDataStore>(10);
        BinanceStreamClient client(store, StreamClientOptions{});
        assert(client.nextBackoffMs(0) == 0);
        assert(client.nextBackoffMs(1) == 5000);
        assert(client.nextBackoffMs(2) == 10000);
        assert(client.nextBackoffMs(10) == 60000);
    }

    // 4. REST 과거 캔들 파싱
    {
        const auto rows = nlohmann::json::parse(R"([
            [120000, "3", "4", "2", "3.5", "10", 179999],
            [60000, "1", "2", "0.5", "1.5", "5", 119999],
            ["bad"],
            [180000, "4", "5", "3", "4.5", "7", 239999]
        ])");
        const auto candles = BinanceRestClient::parseKlines(rows, 200000);
        assert(candles.size() == 3);
        assert(candles[0].open_time == 60000);
        assert(candles[0].closed);
        assert(!candles[2].closed);
        assert(candles[1].close == 3.5);

        bool threw = false;
        try {
            BinanceRestClient::parseKlines(nlohmann::json::object(), 0);
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);
    }

    // 5. 연결만 받고 응답하지 않는 서버: 핸드셰이크 타임아웃 후 재연결, stop은 바로 반환
    {
        namespace net = boost::asio;
        using tcp = net::ip::tcp;

        net::io_context server_ioc;
        tcp::acceptor acceptor(server_ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
        const unsigned short port = acceptor.local_endpoint().port();
        std::vector<std::shared_ptr<tcp::socket>> held;
        std::function<void()> accept_next = [&]() {
            auto socket = std::make_shared<tcp::socket>(server_ioc);
            acceptor.async_accept(*socket, [&, socket](boost::system::error_code ec) {
                if (ec) return;
                held.push_back(socket);
                accept_next();
            });
        };
        accept_next();
        std::thread server([&]() { server_ioc.run(); });

        auto store = std::make_shared<market::MarketDataStore>(10);
        StreamClientOptions options;
        options.stream_url = "wss://127.0.0.1:" + std::to_string(port);
        options.connect_timeout_seconds = 1;
        options.reconnect_initial_ms = 100;
        options.reconnect_max_ms = 200;
        BinanceStreamClient client(store, options);
        assert(client.start({"BTCUSDT"}, {"1m"}));

        std::this_thread::sleep_for(std::chrono::milliseconds(2500));
        assert(client.stats().reconnects >= 1);
        assert(client.state() != ConnectionState::Connected);
        assert(client.isHealthy());

        const auto stop_started = std::chrono::steady_clock::now();
        client.stop();
        const auto stop_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - stop_started).count();
        assert(stop_ms < 2000);
        assert(client.state() == ConnectionState::Disconnected);

        // 핸드셰이크 대기 중 stop
        assert(client.start({"BTCUSDT"}, {"1m"}));
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        const auto second_stop = std::chrono::steady_clock::now();
        client.stop();
        assert(std::chrono::steady_clock::now() - second_stop < std::chrono::milliseconds(2000));

        server_ioc.stop();
        server.join();
    }

    std::cout << "[TEST] StreamParser Test PASSED!" << std::endl;
    return 0;
}
