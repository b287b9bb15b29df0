#include "core/state/RestPersistenceSink.h"

#include <stdexcept>

#include "common/Logger.h"

namespace sigscan {
namespace core {

RestPersistenceSink::RestPersistenceSink(std::shared_ptr<network::IHttpClient> client)
    : client_(std::move(client)) {
    if (!client_) {
        throw std::invalid_argument("RestPersistenceSink requires an http client");
    }
}

std::map<std::string, std::string> RestPersistenceSink::authHeaders(const std::string& api_key) {
    std::map<std::string, std::string> headers;
    if (!api_key.empty()) {
        headers["apikey"] = api_key;
        headers["Authorization"] = "Bearer " + api_key;
    }
    return headers;
}

bool RestPersistenceSink::writeSignals(const std::vector<Signal>& batch) {
    nlohmann::json rows = nlohmann::json::array();
    for (const auto& s : batch) {
        // metadata는 jsonb 컬럼으로 그대로 전달
        rows.push_back(s.toJson());
    }
    return postBatch("signals", rows);
}

bool RestPersistenceSink::writeMetrics(const std::vector<MetricRecord>& batch) {
    nlohmann::json rows = nlohmann::json::array();
    for (const auto& m : batch) {
        rows.push_back(m.toJson());
    }
    return postBatch("metrics", rows);
}

bool RestPersistenceSink::writeEvents(const std::vector<EventRecord>& batch) {
    nlohmann::json rows = nlohmann::json::array();
    for (const auto& e : batch) {
        rows.push_back(e.toJson());
    }
    return postBatch("events", rows);
}

bool RestPersistenceSink::postBatch(const std::string& table, const nlohmann::json& rows) {
    if (rows.empty()) {
        return true;
    }

    try {
        auto response = client_->post("/" + table, rows, {{"Prefer", "return=minimal"}});
        if (!response.isSuccess()) {
            LOG_WARN("[RestSink] POST /{} failed: HTTP {} {}", table, response.status_code, response.body);
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        LOG_WARN("[RestSink] POST /{} error: {}", table, e.what());
        return false;
    }
}

} // namespace core
} // namespace sigscan
