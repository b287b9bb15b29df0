#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <nlohmann/json.hpp>

#include "market/MarketSnapshot.h"
#include "sandbox/StrategySandbox.h"

namespace sigscan {
namespace server {

// Out-of-band strategy validation plus health and Prometheus endpoints.
//   POST /v1/evaluate   GET /health   GET /metrics
// Connections are served asynchronously on a small thread pool; each one has
// a read deadline, so a silent client never holds up the others.
class EvaluationHttpServer {
public:
    using HealthProvider = std::function<nlohmann::json()>;
    using MetricsProvider = std::function<std::string()>;

    struct Response {
        int status = 200;
        std::string content_type = "application/json";
        std::string body;
    };

    EvaluationHttpServer(int port,
                         std::shared_ptr<sandbox::StrategySandbox> sandbox,
                         HealthProvider health,
                         MetricsProvider metrics,
                         std::string default_interval = "1m");
    ~EvaluationHttpServer();

    EvaluationHttpServer(const EvaluationHttpServer&) = delete;
    EvaluationHttpServer& operator=(const EvaluationHttpServer&) = delete;

    // Binds and starts serving. false when disabled (port 0) or the bind fails.
    bool start();
    void stop();
    bool isRunning() const { return running_.load(); }
    unsigned short port() const { return bound_port_; }

    static constexpr int kIoThreads = 4;
    static constexpr int kReadTimeoutSeconds = 10;

    // Routing without the socket layer.
    Response handle(const std::string& method, const std::string& target, const std::string& body);

    // {symbol, ticker:{last_price, price_change_pct, quote_volume}, klines:{interval:[candle...]}}
    // Throws std::invalid_argument on malformed input.
    static market::MarketSnapshot snapshotFromJson(const nlohmann::json& market_data);

private:
    void doAccept();
    Response evaluate(const std::string& body);

    int port_;
    std::shared_ptr<sandbox::StrategySandbox> sandbox_;
    HealthProvider health_;
    MetricsProvider metrics_;
    std::string default_interval_;

    std::atomic<bool> running_{false};
    unsigned short bound_port_ = 0;
    std::unique_ptr<boost::asio::io_context> ioc_;
    std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
    std::vector<std::thread> threads_;
};

} // namespace server
} // namespace sigscan
