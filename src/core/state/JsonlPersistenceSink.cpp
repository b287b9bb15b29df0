#include "core/state/JsonlPersistenceSink.h"

#include <fstream>

#include "common/Logger.h"

namespace sigscan {
namespace core {

JsonlPersistenceSink::JsonlPersistenceSink(std::filesystem::path dir)
    : dir_(std::move(dir)) {}

bool JsonlPersistenceSink::writeSignals(const std::vector<Signal>& batch) {
    std::vector<nlohmann::json> rows;
    rows.reserve(batch.size());
    for (const auto& s : batch) {
        rows.push_back(s.toJson());
    }
    return appendLines("signals", rows);
}

bool JsonlPersistenceSink::writeMetrics(const std::vector<MetricRecord>& batch) {
    std::vector<nlohmann::json> rows;
    rows.reserve(batch.size());
    for (const auto& m : batch) {
        rows.push_back(m.toJson());
    }
    return appendLines("metrics", rows);
}

bool JsonlPersistenceSink::writeEvents(const std::vector<EventRecord>& batch) {
    std::vector<nlohmann::json> rows;
    rows.reserve(batch.size());
    for (const auto& e : batch) {
        rows.push_back(e.toJson());
    }
    return appendLines("events", rows);
}

std::filesystem::path JsonlPersistenceSink::fileFor(const std::string& kind) const {
    return dir_ / (kind + ".jsonl");
}

bool JsonlPersistenceSink::appendLines(const std::string& kind, const std::vector<nlohmann::json>& rows) {
    if (rows.empty()) {
        return true;
    }
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    std::filesystem::create_directories(dir_, ec);
    if (ec) {
        LOG_ERROR("[JsonlSink] cannot create {}: {}", dir_.string(), ec.message());
        return false;
    }

    std::ofstream out(fileFor(kind), std::ios::binary | std::ios::app);
    if (!out.is_open()) {
        LOG_ERROR("[JsonlSink] cannot open {}", fileFor(kind).string());
        return false;
    }

    // 배치를 한 번에 버퍼링한 뒤 기록
    std::string buffer;
    for (const auto& row : rows) {
        buffer += row.dump();
        buffer += '\n';
    }
    out << buffer;
    out.flush();
    return out.good();
}

std::vector<nlohmann::json> JsonlPersistenceSink::readAll(const std::string& kind) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<nlohmann::json> out;
    std::ifstream in(fileFor(kind), std::ios::binary);
    if (!in.is_open()) {
        return out;
    }

    std::string row;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }
        auto line = nlohmann::json::parse(row, nullptr, false);
        if (line.is_discarded()) {
            continue;
        }
        out.push_back(std::move(line));
    }
    return out;
}

} // namespace core
} // namespace sigscan
