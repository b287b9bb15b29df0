#pragma once

#include "network/IHttpClient.h"
#include "network/RateLimiter.h"
#include <curl/curl.h>
#include <memory>
#include <mutex>

namespace sigscan {
namespace network {

// libcurl client bound to one base URL. One easy handle, serialized by a mutex.
class HttpClient : public IHttpClient {
public:
    HttpClient(std::string base_url,
               std::map<std::string, std::string> default_headers = {},
               std::shared_ptr<RateLimiter> rate_limiter = nullptr,
               std::string rate_group = "default",
               long timeout_seconds = 15);
    ~HttpClient() override;

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    HttpResponse get(
        const std::string& endpoint,
        const std::map<std::string, std::string>& query_params = {}
    ) override;

    HttpResponse post(
        const std::string& endpoint,
        const nlohmann::json& body,
        const std::map<std::string, std::string>& extra_headers = {}
    ) override;

    const std::string& baseUrl() const { return base_url_; }

private:
    HttpResponse performRequest(
        const std::string& method,
        const std::string& url,
        const std::string& body_data,
        const std::map<std::string, std::string>& headers
    );
    void applyRateLimitHeaders(const HttpResponse& response);

    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);
    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata);

    std::string buildQueryString(const std::map<std::string, std::string>& params);

    std::string base_url_;
    std::map<std::string, std::string> default_headers_;
    std::shared_ptr<RateLimiter> rate_limiter_;
    std::string rate_group_;
    long timeout_seconds_;
    CURL* curl_;
    std::mutex mutex_;
};

} // namespace network
} // namespace sigscan
