#include "server/EvaluationHttpServer.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <optional>
#include <stdexcept>

#include <boost/asio.hpp>
#include <boost/beast.hpp>

#include "common/Interval.h"
#include "common/Logger.h"

namespace sigscan {
namespace server {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

namespace {

constexpr size_t kMaxBodyBytes = 4 * 1024 * 1024;

double numberField(const nlohmann::json& j, const char* key) {
    if (!j.contains(key)) {
        throw std::invalid_argument(std::string("candle field '") + key + "' is required");
    }
    const auto& v = j.at(key);
    if (v.is_number()) {
        return v.get<double>();
    }
    if (v.is_string()) {
        // 거래소 원본처럼 문자열 숫자도 허용
        size_t used = 0;
        const std::string text = v.get<std::string>();
        const double d = std::stod(text, &used);
        if (used != text.size() || !std::isfinite(d)) {
            throw std::invalid_argument(std::string("candle field '") + key + "' is not numeric");
        }
        return d;
    }
    throw std::invalid_argument(std::string("candle field '") + key + "' is not numeric");
}

double tickerField(const nlohmann::json& t, const char* key) {
    if (!t.contains(key)) {
        return 0.0;
    }
    const auto& v = t.at(key);
    if (!v.is_number()) {
        throw std::invalid_argument(std::string("ticker field '") + key + "' must be a number");
    }
    return v.get<double>();
}

Candle candleFromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("candle must be an object");
    }
    Candle c;
    c.open = numberField(j, "open");
    c.high = numberField(j, "high");
    c.low = numberField(j, "low");
    c.close = numberField(j, "close");
    c.volume = j.contains("volume") ? numberField(j, "volume") : 0.0;
    c.open_time = static_cast<long long>(j.contains("openTime") ? numberField(j, "openTime") : numberField(j, "time"));
    c.close_time = j.contains("closeTime") ? static_cast<long long>(numberField(j, "closeTime")) : c.open_time;
    if (j.contains("closed") && !j.at("closed").is_boolean()) {
        throw std::invalid_argument("candle field 'closed' must be a boolean");
    }
    c.closed = j.value("closed", true);
    return c;
}

EvaluationHttpServer::Response jsonResponse(int status, const nlohmann::json& body) {
    EvaluationHttpServer::Response res;
    res.status = status;
    res.body = body.dump();
    return res;
}

}

EvaluationHttpServer::EvaluationHttpServer(int port,
                                           std::shared_ptr<sandbox::StrategySandbox> sandbox,
                                           HealthProvider health,
                                           MetricsProvider metrics,
                                           std::string default_interval)
    : port_(port)
    , sandbox_(std::move(sandbox))
    , health_(std::move(health))
    , metrics_(std::move(metrics))
    , default_interval_(std::move(default_interval)) {}

EvaluationHttpServer::~EvaluationHttpServer() {
    stop();
}

// 연결 하나: 읽기 -> 처리 -> 쓰기 -> 종료
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(tcp::socket&& socket, EvaluationHttpServer& server)
        : stream_(std::move(socket))
        , server_(server) {}

    void run() {
        asio::dispatch(stream_.get_executor(),
                       beast::bind_front_handler(&HttpSession::doRead, shared_from_this()));
    }

private:
    void doRead() {
        parser_.emplace();
        parser_->body_limit(kMaxBodyBytes);
        stream_.expires_after(std::chrono::seconds(EvaluationHttpServer::kReadTimeoutSeconds));
        http::async_read(stream_, buffer_, *parser_,
                         beast::bind_front_handler(&HttpSession::onRead, shared_from_this()));
    }

    void onRead(beast::error_code ec, std::size_t) {
        if (ec == http::error::body_limit) {
            reply(11, EvaluationHttpServer::Response{413, "application/json",
                                                     R"({"ok":false,"error":"body too large"})"});
            return;
        }
        if (ec) {
            if (ec != beast::error::timeout && ec != http::error::end_of_stream) {
                LOG_DEBUG("[HttpServer] read failed: {}", ec.message());
            }
            close();
            return;
        }

        const auto& req = parser_->get();
        const auto method = req.method_string();
        const auto target = req.target();

        EvaluationHttpServer::Response out;
        try {
            out = server_.handle(std::string(method.data(), method.size()),
                                 std::string(target.data(), target.size()),
                                 req.body());
        } catch (const std::exception& e) {
            LOG_ERROR("[HttpServer] handler failed: {}", e.what());
            out = jsonResponse(500, {{"ok", false}, {"error", "internal error"}});
        }
        reply(req.version(), out);
    }

    void reply(unsigned version, const EvaluationHttpServer::Response& out) {
        auto res = std::make_shared<http::response<http::string_body>>();
        res->version(version);
        res->result(static_cast<http::status>(out.status));
        res->set(http::field::server, "sigscan");
        res->set(http::field::content_type, out.content_type);
        res->keep_alive(false);
        res->body() = out.body;
        res->prepare_payload();

        stream_.expires_after(std::chrono::seconds(EvaluationHttpServer::kReadTimeoutSeconds));
        auto self = shared_from_this();
        http::async_write(stream_, *res, [self, res](beast::error_code ec, std::size_t) {
            if (ec) {
                LOG_DEBUG("[HttpServer] write failed: {}", ec.message());
            }
            self->close();
        });
    }

    void close() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

    beast::tcp_stream stream_;
    EvaluationHttpServer& server_;
    beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::string_body>> parser_;
};

bool EvaluationHttpServer::start() {
    if (port_ <= 0) {
        LOG_INFO("[HttpServer] disabled (port 0)");
        return false;
    }
    if (running_.load()) {
        return false;
    }

    ioc_ = std::make_unique<asio::io_context>(kIoThreads);
    try {
        acceptor_ = std::make_unique<tcp::acceptor>(asio::make_strand(*ioc_));
        const tcp::endpoint endpoint(tcp::v4(), static_cast<unsigned short>(port_));
        acceptor_->open(endpoint.protocol());
        acceptor_->set_option(asio::socket_base::reuse_address(true));
        acceptor_->bind(endpoint);
        acceptor_->listen(asio::socket_base::max_listen_connections);
        bound_port_ = acceptor_->local_endpoint().port();
    } catch (const std::exception& e) {
        LOG_ERROR("[HttpServer] cannot listen on port {}: {}", port_, e.what());
        acceptor_.reset();
        ioc_.reset();
        return false;
    }

    running_ = true;
    doAccept();
    for (int i = 0; i < kIoThreads; ++i) {
        threads_.emplace_back([this]() { ioc_->run(); });
    }
    LOG_INFO("[HttpServer] listening on port {} ({} io threads)", bound_port_, kIoThreads);
    return true;
}

void EvaluationHttpServer::stop() {
    running_ = false;
    if (ioc_) {
        ioc_->stop();
    }
    for (auto& t : threads_) {
        if (t.joinable()) {
            t.join();
        }
    }
    threads_.clear();
    // acceptor와 세션 소켓이 io_context보다 먼저 정리돼야 한다
    acceptor_.reset();
    ioc_.reset();
}

void EvaluationHttpServer::doAccept() {
    acceptor_->async_accept(asio::make_strand(*ioc_), [this](beast::error_code ec, tcp::socket socket) {
        if (!running_.load()) {
            return;
        }
        if (ec) {
            LOG_WARN("[HttpServer] accept failed: {}", ec.message());
        } else {
            std::make_shared<HttpSession>(std::move(socket), *this)->run();
        }
        doAccept();
    });
}

EvaluationHttpServer::Response EvaluationHttpServer::handle(const std::string& method,
                                                            const std::string& target,
                                                            const std::string& body) {
    const std::string path = target.substr(0, target.find('?'));

    if (path == "/health" && method == "GET") {
        return jsonResponse(200, health_ ? health_() : nlohmann::json{{"status", "ok"}});
    }
    if (path == "/metrics" && method == "GET") {
        Response res;
        res.content_type = "text/plain; version=0.0.4; charset=utf-8";
        res.body = metrics_ ? metrics_() : std::string();
        return res;
    }
    if (path == "/v1/evaluate") {
        if (method != "POST") {
            return jsonResponse(405, {{"ok", false}, {"error", "use POST"}});
        }
        return evaluate(body);
    }
    return jsonResponse(404, {{"ok", false}, {"error", "not found"}});
}

EvaluationHttpServer::Response EvaluationHttpServer::evaluate(const std::string& body) {
    const auto request = nlohmann::json::parse(body, nullptr, false);
    if (request.is_discarded() || !request.is_object()) {
        return jsonResponse(400, {{"ok", false}, {"error", "invalid JSON body"}});
    }
    if (!request.contains("filter_code") || !request["filter_code"].is_string()) {
        return jsonResponse(400, {{"ok", false}, {"error", "filter_code is required"}});
    }

    if (request.contains("series_code") && !request["series_code"].is_string()) {
        return jsonResponse(400, {{"ok", false}, {"error", "series_code must be a string"}});
    }
    if (request.contains("interval") && !request["interval"].is_string()) {
        return jsonResponse(400, {{"ok", false}, {"error", "interval must be a string"}});
    }
    if (request.contains("market_data") && !request["market_data"].is_object()) {
        return jsonResponse(400, {{"ok", false}, {"error", "market_data must be an object"}});
    }

    const std::string filter_code = request["filter_code"].get<std::string>();
    const std::string series_code = request.value("series_code", std::string());

    market::MarketSnapshot snapshot;
    try {
        snapshot = snapshotFromJson(request.value("market_data", nlohmann::json::object()));
    } catch (const std::exception& e) {
        return jsonResponse(400, {{"ok", false}, {"error", std::string("market_data: ") + e.what()}});
    }

    std::string interval = request.value("interval", std::string());
    if (interval.empty()) {
        interval = snapshot.klines.empty() ? default_interval_ : snapshot.klines.begin()->first;
    } else if (!isValidInterval(interval)) {
        return jsonResponse(400, {{"ok", false}, {"error", "unknown interval " + interval}});
    }

    const auto result = sandbox_->evaluateAdhoc(filter_code, series_code, snapshot, interval);
    const bool ok = result.outcome == core::EvaluationOutcome::Matched ||
                    result.outcome == core::EvaluationOutcome::NotMatched;

    nlohmann::json out;
    out["ok"] = ok;
    out["outcome"] = core::toString(result.outcome);
    out["matched"] = result.matched;
    out["duration_ms"] = result.duration_ms;
    if (!result.error.empty()) out["error"] = result.error;
    if (!result.reasoning.empty()) out["reasoning"] = result.reasoning;
    if (!result.indicators.empty()) out["indicators"] = result.indicators;
    if (!result.series.is_null()) out["series"] = result.series;
    return jsonResponse(200, out);
}

market::MarketSnapshot EvaluationHttpServer::snapshotFromJson(const nlohmann::json& market_data) {
    if (!market_data.is_object()) {
        throw std::invalid_argument("must be an object");
    }

    market::MarketSnapshot snapshot;
    if (market_data.contains("symbol") && !market_data["symbol"].is_string()) {
        throw std::invalid_argument("symbol must be a string");
    }
    snapshot.symbol = normalizeSymbol(market_data.value("symbol", std::string("TEST")));
    snapshot.taken_at_ms = nowEpochMs();

    if (market_data.contains("ticker") && !market_data["ticker"].is_null()) {
        const auto& t = market_data["ticker"];
        if (!t.is_object()) {
            throw std::invalid_argument("ticker must be an object");
        }
        Ticker ticker;
        ticker.symbol = snapshot.symbol;
        ticker.last_price = tickerField(t, "last_price");
        ticker.price_change_pct = tickerField(t, "price_change_pct");
        ticker.quote_volume = tickerField(t, "quote_volume");
        ticker.event_time = snapshot.taken_at_ms;
        snapshot.ticker = ticker;
    }

    const auto klines = market_data.value("klines", nlohmann::json::object());
    if (!klines.is_object()) {
        throw std::invalid_argument("klines must map interval to candle arrays");
    }
    for (auto it = klines.begin(); it != klines.end(); ++it) {
        if (!isValidInterval(it.key())) {
            throw std::invalid_argument("unknown interval " + it.key());
        }
        if (!it.value().is_array()) {
            throw std::invalid_argument("klines." + it.key() + " must be an array");
        }
        std::vector<Candle> candles;
        candles.reserve(it.value().size());
        for (const auto& row : it.value()) {
            candles.push_back(candleFromJson(row));
        }
        std::sort(candles.begin(), candles.end(),
                  [](const Candle& a, const Candle& b) { return a.open_time < b.open_time; });
        snapshot.klines[it.key()] = std::make_shared<const std::vector<Candle>>(std::move(candles));
    }
    return snapshot;
}

} // namespace server
} // namespace sigscan
