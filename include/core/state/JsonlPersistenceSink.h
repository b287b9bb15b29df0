#pragma once

#include <filesystem>
#include <mutex>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/contracts/IPersistenceSink.h"

namespace sigscan {
namespace core {

// signals.jsonl / metrics.jsonl / events.jsonl under one directory, one record per line.
class JsonlPersistenceSink : public IPersistenceSink {
public:
    explicit JsonlPersistenceSink(std::filesystem::path dir);

    bool writeSignals(const std::vector<Signal>& batch) override;
    bool writeMetrics(const std::vector<MetricRecord>& batch) override;
    bool writeEvents(const std::vector<EventRecord>& batch) override;
    std::string name() const override { return "jsonl"; }

    // "signals" | "metrics" | "events". Malformed lines are skipped.
    std::vector<nlohmann::json> readAll(const std::string& kind) const;

private:
    bool appendLines(const std::string& kind, const std::vector<nlohmann::json>& rows);
    std::filesystem::path fileFor(const std::string& kind) const;

    std::filesystem::path dir_;
    mutable std::mutex mutex_;
};

} // namespace core
} // namespace sigscan
