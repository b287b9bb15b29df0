#pragma once

#include <memory>

#include "core/contracts/IPersistenceSink.h"
#include "network/IHttpClient.h"

namespace sigscan {
namespace core {

// PostgREST-style sink: POST /signals, /metrics, /events with a JSON array body.
class RestPersistenceSink : public IPersistenceSink {
public:
    explicit RestPersistenceSink(std::shared_ptr<network::IHttpClient> client);

    bool writeSignals(const std::vector<Signal>& batch) override;
    bool writeMetrics(const std::vector<MetricRecord>& batch) override;
    bool writeEvents(const std::vector<EventRecord>& batch) override;
    std::string name() const override { return "rest"; }

    // apikey / Authorization headers for a PostgREST gateway
    static std::map<std::string, std::string> authHeaders(const std::string& api_key);

private:
    bool postBatch(const std::string& table, const nlohmann::json& rows);

    std::shared_ptr<network::IHttpClient> client_;
};

} // namespace core
} // namespace sigscan
