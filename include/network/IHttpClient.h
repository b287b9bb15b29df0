#pragma once

#include <string>
#include <map>
#include <nlohmann/json.hpp>

namespace sigscan {
namespace network {

struct HttpResponse {
    int status_code = 0;
    std::string body;
    std::map<std::string, std::string> headers;

    bool isSuccess() const { return status_code >= 200 && status_code < 300; }
    bool isRateLimited() const { return status_code == 429; }
    bool isBlocked() const { return status_code == 418; }

    nlohmann::json json() const {
        return nlohmann::json::parse(body);
    }
};

class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    // throws std::runtime_error on transport failure
    virtual HttpResponse get(
        const std::string& endpoint,
        const std::map<std::string, std::string>& query_params = {}
    ) = 0;

    virtual HttpResponse post(
        const std::string& endpoint,
        const nlohmann::json& body,
        const std::map<std::string, std::string>& extra_headers = {}
    ) = 0;
};

} // namespace network
} // namespace sigscan
