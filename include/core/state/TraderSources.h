#pragma once

#include <filesystem>
#include <memory>

#include <nlohmann/json.hpp>

#include "core/contracts/ITraderSource.h"
#include "network/IHttpClient.h"

namespace sigscan {
namespace core {

// Accepts a JSON array of traders or an object with a "traders" array.
// Disabled and malformed entries are dropped (malformed ones are logged).
std::vector<Trader> parseTraderList(const nlohmann::json& doc);

class JsonFileTraderSource : public ITraderSource {
public:
    explicit JsonFileTraderSource(std::filesystem::path path);

    std::vector<Trader> loadTraders() override;
    std::string describe() const override { return "file:" + path_.string(); }

private:
    std::filesystem::path path_;
};

// GET /traders?enabled=eq.true
class RestTraderSource : public ITraderSource {
public:
    explicit RestTraderSource(std::shared_ptr<network::IHttpClient> client);

    std::vector<Trader> loadTraders() override;
    std::string describe() const override { return "rest:/traders"; }

private:
    std::shared_ptr<network::IHttpClient> client_;
};

} // namespace core
} // namespace sigscan
