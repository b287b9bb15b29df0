#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "market/MarketDataStore.h"

namespace sigscan {
namespace network {

enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected,
    Degraded    // connected but silent longer than half the idle window
};

const char* toString(ConnectionState state);

struct StreamClientOptions {
    std::string stream_url = "wss://stream.binance.com:9443";
    long long reconnect_initial_ms = 5000;
    long long reconnect_max_ms = 60000;
    int idle_timeout_seconds = 90;
    int connect_timeout_seconds = 10;   // per stage: tcp connect, TLS, websocket upgrade
    size_t streams_per_request = 200;
};

struct StreamStats {
    long long messages_received = 0;
    long long updates_applied = 0;
    long long malformed = 0;
    long long stale = 0;            // kline older than / equal to a closed last candle
    long long reconnects = 0;
};

// One TLS websocket to the combined stream endpoint. Tickers and klines are
// written into the MarketDataStore from the connection thread.
class BinanceStreamClient {
public:
    BinanceStreamClient(std::shared_ptr<market::MarketDataStore> store, StreamClientOptions options);
    ~BinanceStreamClient();

    BinanceStreamClient(const BinanceStreamClient&) = delete;
    BinanceStreamClient& operator=(const BinanceStreamClient&) = delete;

    bool start(const std::set<std::string>& symbols, const std::set<std::string>& intervals);
    void stop();

    // Live SUBSCRIBE/UNSUBSCRIBE when connected; otherwise applied on next connect.
    void updateSubscriptions(const std::set<std::string>& symbols, const std::set<std::string>& intervals);

    // Decodes one payload and applies it. Returns true when a buffer or ticker changed.
    bool processMessage(const std::string& payload);

    ConnectionState state() const { return state_.load(); }
    bool isRunning() const { return running_.load(); }
    // false once the connection thread has exited while still supposed to run
    bool isHealthy() const { return !running_.load() || loop_alive_.load(); }
    long long getLastMessageTimeMs() const { return last_message_time_ms_.load(); }
    StreamStats stats() const;
    std::set<std::string> subscribedStreams() const;

    long long nextBackoffMs(int attempt) const;

private:
    void runLoop();
    void connectAndReadLoop();
    std::vector<std::string> buildRequests(const std::string& method, const std::vector<std::string>& streams);
    bool sleepInterruptible(long long ms);

    std::shared_ptr<market::MarketDataStore> store_;
    StreamClientOptions options_;

    std::atomic<bool> running_{false};
    std::atomic<bool> loop_alive_{false};
    std::atomic<ConnectionState> state_{ConnectionState::Disconnected};
    std::atomic<long long> last_message_time_ms_{0};
    std::thread worker_thread_;

    std::mutex stop_mutex_;
    std::condition_variable stop_cv_;

    mutable std::mutex subs_mutex_;
    std::set<std::string> desired_streams_;
    std::deque<std::string> pending_frames_;
    long long next_request_id_ = 1;

    std::atomic<long long> messages_received_{0};
    std::atomic<long long> updates_applied_{0};
    std::atomic<long long> malformed_{0};
    std::atomic<long long> stale_{0};
    std::atomic<long long> reconnects_{0};
};

} // namespace network
} // namespace sigscan
