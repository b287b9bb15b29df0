#include "network/BinanceStreamClient.h"

#include "common/Logger.h"
#include "network/BinanceStreamParser.h"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include <algorithm>
#include <chrono>
#include <functional>
#include <stdexcept>
#include <utility>

namespace sigscan {
namespace network {

namespace {
struct WsEndpoint {
    std::string host;
    std::string port;
};

WsEndpoint parseEndpoint(const std::string& url) {
    std::string rest = url;
    std::string default_port = "443";
    if (rest.rfind("wss://", 0) == 0) {
        rest = rest.substr(6);
    } else if (rest.rfind("ws://", 0) == 0) {
        throw std::runtime_error("plain ws:// streams are not supported: " + url);
    }

    const auto slash = rest.find('/');
    if (slash != std::string::npos) {
        rest = rest.substr(0, slash);
    }

    WsEndpoint ep;
    const auto colon = rest.find(':');
    if (colon == std::string::npos) {
        ep.host = rest;
        ep.port = default_port;
    } else {
        ep.host = rest.substr(0, colon);
        ep.port = rest.substr(colon + 1);
    }
    if (ep.host.empty() || ep.port.empty()) {
        throw std::runtime_error("invalid stream url: " + url);
    }
    return ep;
}
}

const char* toString(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connecting: return "connecting";
        case ConnectionState::Connected: return "connected";
        case ConnectionState::Degraded: return "degraded";
    }
    return "disconnected";
}

BinanceStreamClient::BinanceStreamClient(std::shared_ptr<market::MarketDataStore> store, StreamClientOptions options)
    : store_(std::move(store))
    , options_(std::move(options)) {
    if (!store_) {
        throw std::invalid_argument("BinanceStreamClient requires a market data store");
    }
}

BinanceStreamClient::~BinanceStreamClient() {
    stop();
}

bool BinanceStreamClient::start(const std::set<std::string>& symbols, const std::set<std::string>& intervals) {
    if (running_.load()) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(subs_mutex_);
        desired_streams_ = BinanceStreamParser::buildStreams(symbols, intervals);
        pending_frames_.clear();
    }

    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }

    running_ = true;
    loop_alive_ = true;
    worker_thread_ = std::thread(&BinanceStreamClient::runLoop, this);
    return true;
}

void BinanceStreamClient::stop() {
    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        running_ = false;
    }
    stop_cv_.notify_all();

    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }
    state_ = ConnectionState::Disconnected;
}

void BinanceStreamClient::updateSubscriptions(const std::set<std::string>& symbols, const std::set<std::string>& intervals) {
    const auto next = BinanceStreamParser::buildStreams(symbols, intervals);

    std::lock_guard<std::mutex> lock(subs_mutex_);
    std::vector<std::string> added;
    std::vector<std::string> removed;
    std::set_difference(next.begin(), next.end(), desired_streams_.begin(), desired_streams_.end(),
                        std::back_inserter(added));
    std::set_difference(desired_streams_.begin(), desired_streams_.end(), next.begin(), next.end(),
                        std::back_inserter(removed));
    desired_streams_ = next;

    if (added.empty() && removed.empty()) {
        return;
    }

    LOG_INFO("Stream subscription change: +{} -{} (total {})", added.size(), removed.size(), next.size());

    const auto current = state_.load();
    if (current != ConnectionState::Connected && current != ConnectionState::Degraded) {
        // 재연결 시 전체 목록으로 다시 구독
        return;
    }

    for (auto& frame : buildRequests("UNSUBSCRIBE", removed)) {
        pending_frames_.push_back(std::move(frame));
    }
    for (auto& frame : buildRequests("SUBSCRIBE", added)) {
        pending_frames_.push_back(std::move(frame));
    }
}

std::vector<std::string> BinanceStreamClient::buildRequests(const std::string& method,
                                                            const std::vector<std::string>& streams) {
    std::vector<std::string> frames;
    const size_t chunk = std::max<size_t>(1, options_.streams_per_request);
    for (size_t i = 0; i < streams.size(); i += chunk) {
        const auto end = std::min(streams.size(), i + chunk);
        std::vector<std::string> params(streams.begin() + i, streams.begin() + end);
        frames.push_back(BinanceStreamParser::buildRequest(method, params, next_request_id_++));
    }
    return frames;
}

bool BinanceStreamClient::processMessage(const std::string& payload) {
    messages_received_++;

    const auto event = BinanceStreamParser::parse(payload);
    if (!event) {
        malformed_++;
        LOG_DEBUG("Discarded malformed stream message ({} bytes)", payload.size());
        return false;
    }

    switch (event->type) {
        case StreamEventType::Kline: {
            const auto result = store_->applyCandle(event->symbol, event->interval, event->candle);
            if (result == market::UpdateResult::Appended || result == market::UpdateResult::Replaced) {
                updates_applied_++;
                return true;
            }
            stale_++;
            return false;
        }
        case StreamEventType::Ticker:
            store_->applyTicker(event->ticker);
            updates_applied_++;
            return true;
        case StreamEventType::Control:
            if (!event->control_error.empty()) {
                LOG_WARN("Stream request rejected: {}", event->control_error);
            }
            return false;
    }
    return false;
}

StreamStats BinanceStreamClient::stats() const {
    StreamStats s;
    s.messages_received = messages_received_.load();
    s.updates_applied = updates_applied_.load();
    s.malformed = malformed_.load();
    s.stale = stale_.load();
    s.reconnects = reconnects_.load();
    return s;
}

std::set<std::string> BinanceStreamClient::subscribedStreams() const {
    std::lock_guard<std::mutex> lock(subs_mutex_);
    return desired_streams_;
}

long long BinanceStreamClient::nextBackoffMs(int attempt) const {
    if (attempt <= 0) {
        return 0;
    }
    long long delay = options_.reconnect_initial_ms;
    for (int i = 1; i < attempt && delay < options_.reconnect_max_ms; ++i) {
        delay *= 2;
    }
    return std::min(delay, options_.reconnect_max_ms);
}

bool BinanceStreamClient::sleepInterruptible(long long ms) {
    std::unique_lock<std::mutex> lock(stop_mutex_);
    stop_cv_.wait_for(lock, std::chrono::milliseconds(ms), [this]() { return !running_.load(); });
    return running_.load();
}

void BinanceStreamClient::runLoop() {
    int reconnect_attempt = 0;

    while (running_.load()) {
        const auto connected_since = std::chrono::steady_clock::now();
        try {
            connectAndReadLoop();
            reconnect_attempt = 0;
        } catch (const std::exception& e) {
            state_ = ConnectionState::Disconnected;
            if (!running_.load()) {
                break;
            }

            const auto connected_for = std::chrono::duration_cast<std::chrono::seconds>(
                std::chrono::steady_clock::now() - connected_since
            ).count();
            if (connected_for >= 60) {
                reconnect_attempt = 1;
            } else {
                ++reconnect_attempt;
            }
            const long long backoff_ms = nextBackoffMs(reconnect_attempt);
            reconnects_++;
            LOG_WARN("Market stream disconnected: {} (retry in {}ms, attempt {})",
                     e.what(), backoff_ms, reconnect_attempt);
            if (!sleepInterruptible(backoff_ms)) {
                break;
            }
        }
    }

    state_ = ConnectionState::Disconnected;
    loop_alive_ = false;
}

void BinanceStreamClient::connectAndReadLoop() {
    namespace beast = boost::beast;
    namespace websocket = beast::websocket;
    namespace net = boost::asio;
    namespace ssl = boost::asio::ssl;
    using tcp = boost::asio::ip::tcp;

    state_ = ConnectionState::Connecting;
    const WsEndpoint endpoint = parseEndpoint(options_.stream_url);
    const auto connect_timeout = std::chrono::seconds(std::max(1, options_.connect_timeout_seconds));

    net::io_context ioc;
    ssl::context ssl_ctx(ssl::context::tlsv12_client);
    ssl_ctx.set_default_verify_paths();
    ssl_ctx.set_verify_mode(ssl::verify_peer);

    websocket::stream<beast::ssl_stream<beast::tcp_stream>> ws(ioc, ssl_ctx);
    tcp::resolver resolver(ioc);

    std::deque<std::string> outgoing;
    beast::flat_buffer buffer;
    beast::error_code failure;
    bool finished = false;
    bool connected = false;
    bool writing = false;
    bool closing = false;
    net::steady_timer timer(ioc);

    const long long idle_ms = static_cast<long long>(options_.idle_timeout_seconds) * 1000;

    std::function<void()> do_read;
    std::function<void()> on_tick;
    std::function<void()> on_connected;

    auto fail = [&](beast::error_code ec) {
        if (finished) {
            return;
        }
        failure = ec;
        finished = true;
        timer.cancel();
    };

    do_read = [&]() {
        ws.async_read(buffer, [&](beast::error_code ec, std::size_t) {
            if (ec) {
                fail(ec);
                return;
            }
            const std::string payload = beast::buffers_to_string(buffer.cdata());
            buffer.consume(buffer.size());
            last_message_time_ms_ = nowEpochMs();
            if (state_.load() == ConnectionState::Degraded) {
                state_ = ConnectionState::Connected;
            }
            processMessage(payload);
            do_read();
        });
    };

    on_connected = [&]() {
        {
            std::lock_guard<std::mutex> lock(subs_mutex_);
            pending_frames_.clear();
            const std::vector<std::string> all(desired_streams_.begin(), desired_streams_.end());
            for (auto& frame : buildRequests("SUBSCRIBE", all)) {
                outgoing.push_back(std::move(frame));
            }
        }

        connected = true;
        state_ = ConnectionState::Connected;
        last_message_time_ms_ = nowEpochMs();
        LOG_INFO("Market stream connected to {}:{} ({} subscribe requests queued)",
                 endpoint.host, endpoint.port, outgoing.size());

        ws.text(true);
        ws.control_callback([this](websocket::frame_type kind, beast::string_view) {
            if (kind == websocket::frame_type::pong || kind == websocket::frame_type::ping) {
                last_message_time_ms_ = nowEpochMs();
            }
        });
        do_read();
    };

    // resolve -> tcp connect -> TLS -> websocket upgrade, 단계마다 connect_timeout 적용
    resolver.async_resolve(endpoint.host, endpoint.port,
        [&](beast::error_code ec, tcp::resolver::results_type results) {
            if (finished) return;
            if (ec) {
                fail(ec);
                return;
            }
            beast::get_lowest_layer(ws).expires_after(connect_timeout);
            beast::get_lowest_layer(ws).async_connect(results,
                [&](beast::error_code cec, const tcp::endpoint&) {
                    if (finished) return;
                    if (cec) {
                        fail(cec);
                        return;
                    }
                    if (!SSL_set_tlsext_host_name(ws.next_layer().native_handle(), endpoint.host.c_str())) {
                        fail(beast::error_code(static_cast<int>(::ERR_get_error()),
                                               net::error::get_ssl_category()));
                        return;
                    }
                    ws.next_layer().set_verify_callback(ssl::host_name_verification(endpoint.host));

                    beast::get_lowest_layer(ws).expires_after(connect_timeout);
                    ws.next_layer().async_handshake(ssl::stream_base::client, [&](beast::error_code hec) {
                        if (finished) return;
                        if (hec) {
                            fail(hec);
                            return;
                        }

                        // 웹소켓 자체 타임아웃으로 넘긴다
                        beast::get_lowest_layer(ws).expires_never();
                        ws.set_option(websocket::stream_base::timeout{
                            connect_timeout,                                        // handshake timeout
                            std::chrono::seconds(options_.idle_timeout_seconds),    // idle timeout
                            true                                                    // send ping automatically
                        });
                        ws.set_option(websocket::stream_base::decorator(
                            [](websocket::request_type& req) {
                                req.set(boost::beast::http::field::user_agent, "sigscan/1.0");
                            }
                        ));
                        ws.async_handshake(endpoint.host, "/stream", [&](beast::error_code wec) {
                            if (finished) return;
                            if (wec) {
                                fail(wec);
                                return;
                            }
                            on_connected();
                        });
                    });
                });
        });

    on_tick = [&]() {
        // 초당 5개 요청 제한 이내로 한 틱에 한 프레임만 전송
        timer.expires_after(std::chrono::milliseconds(250));
        timer.async_wait([&](beast::error_code ec) {
            if (ec || finished) {
                return;
            }

            if (!running_.load()) {
                if (!connected) {
                    // 연결 도중이면 소켓을 닫아 대기 중인 핸들러를 모두 끝낸다
                    finished = true;
                    resolver.cancel();
                    beast::get_lowest_layer(ws).close();
                    return;
                }
                if (!closing) {
                    closing = true;
                    ws.async_close(websocket::close_code::normal, [&](beast::error_code) {
                        finished = true;
                    });
                }
                return;
            }

            if (connected) {
                {
                    std::lock_guard<std::mutex> lock(subs_mutex_);
                    while (!pending_frames_.empty()) {
                        outgoing.push_back(std::move(pending_frames_.front()));
                        pending_frames_.pop_front();
                    }
                }

                if (!writing && !outgoing.empty()) {
                    writing = true;
                    ws.async_write(net::buffer(outgoing.front()), [&](beast::error_code wec, std::size_t) {
                        writing = false;
                        outgoing.pop_front();
                        if (wec) {
                            failure = wec;
                            beast::get_lowest_layer(ws).close();
                        }
                    });
                }

                const long long silent_ms = nowEpochMs() - last_message_time_ms_.load();
                if (silent_ms > idle_ms / 2 && state_.load() == ConnectionState::Connected) {
                    state_ = ConnectionState::Degraded;
                    LOG_WARN("Market stream degraded: no data for {}ms", silent_ms);
                }
            }

            on_tick();
        });
    };

    on_tick();
    ioc.run();

    state_ = ConnectionState::Disconnected;

    if (!running_.load()) {
        LOG_INFO("Market stream stopped");
        return;
    }
    if (!connected) {
        if (failure == beast::error::timeout) {
            throw std::runtime_error("market stream connect timed out");
        }
        throw std::runtime_error("market stream connect failed: " + failure.message());
    }
    if (failure == beast::error::timeout) {
        throw std::runtime_error("market stream timed out");
    }
    if (failure == websocket::error::closed) {
        throw std::runtime_error("market stream closed by server");
    }
    throw std::runtime_error("market stream read failed: " + failure.message());
}

} // namespace network
} // namespace sigscan
