#include "core/state/TraderSources.h"

#include <fstream>
#include <stdexcept>

#include "common/Logger.h"

namespace sigscan {
namespace core {

std::vector<Trader> parseTraderList(const nlohmann::json& doc) {
    const nlohmann::json* list = &doc;
    if (doc.is_object() && doc.contains("traders")) {
        list = &doc.at("traders");
    }
    if (!list->is_array()) {
        throw std::runtime_error("trader list must be a JSON array");
    }

    std::vector<Trader> traders;
    for (const auto& entry : *list) {
        try {
            Trader trader = traderFromJson(entry);
            if (!trader.enabled) {
                continue;
            }
            traders.push_back(std::move(trader));
        } catch (const std::exception& e) {
            LOG_WARN("[Traders] skipping entry: {}", e.what());
        }
    }
    return traders;
}

JsonFileTraderSource::JsonFileTraderSource(std::filesystem::path path)
    : path_(std::move(path)) {}

std::vector<Trader> JsonFileTraderSource::loadTraders() {
    std::ifstream in(path_);
    if (!in.is_open()) {
        throw std::runtime_error("cannot open trader file " + path_.string());
    }

    nlohmann::json doc;
    try {
        in >> doc;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("invalid trader file " + path_.string() + ": " + e.what());
    }
    return parseTraderList(doc);
}

RestTraderSource::RestTraderSource(std::shared_ptr<network::IHttpClient> client)
    : client_(std::move(client)) {
    if (!client_) {
        throw std::invalid_argument("RestTraderSource requires an http client");
    }
}

std::vector<Trader> RestTraderSource::loadTraders() {
    auto response = client_->get("/traders", {{"enabled", "eq.true"}});
    if (!response.isSuccess()) {
        throw std::runtime_error("GET /traders failed: HTTP " + std::to_string(response.status_code));
    }

    nlohmann::json doc;
    try {
        doc = response.json();
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("GET /traders returned invalid JSON: ") + e.what());
    }
    return parseTraderList(doc);
}

} // namespace core
} // namespace sigscan
