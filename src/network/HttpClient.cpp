#include "network/HttpClient.h"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace sigscan {
namespace network {

namespace {
std::once_flag g_curl_init_flag;
}

HttpClient::HttpClient(std::string base_url,
                       std::map<std::string, std::string> default_headers,
                       std::shared_ptr<RateLimiter> rate_limiter,
                       std::string rate_group,
                       long timeout_seconds)
    : base_url_(std::move(base_url))
    , default_headers_(std::move(default_headers))
    , rate_limiter_(std::move(rate_limiter))
    , rate_group_(std::move(rate_group))
    , timeout_seconds_(timeout_seconds)
{
    // curl_global_init은 프로세스당 한 번
    std::call_once(g_curl_init_flag, []() { curl_global_init(CURL_GLOBAL_ALL); });
    curl_ = curl_easy_init();

    if (!curl_) {
        throw std::runtime_error("Failed to initialize CURL");
    }

    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

HttpClient::~HttpClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
}

HttpResponse HttpClient::get(
    const std::string& endpoint,
    const std::map<std::string, std::string>& query_params
) {
    if (rate_limiter_) {
        rate_limiter_->acquire(rate_group_);
    }

    std::string url = base_url_ + endpoint;
    if (!query_params.empty()) {
        url += (endpoint.find('?') == std::string::npos ? "?" : "&") + buildQueryString(query_params);
    }

    auto headers = default_headers_;
    headers["Accept"] = "application/json";

    auto response = performRequest("GET", url, "", headers);
    applyRateLimitHeaders(response);
    return response;
}

HttpResponse HttpClient::post(
    const std::string& endpoint,
    const nlohmann::json& body,
    const std::map<std::string, std::string>& extra_headers
) {
    if (rate_limiter_) {
        rate_limiter_->acquire(rate_group_);
    }

    auto headers = default_headers_;
    headers["Content-Type"] = "application/json";
    for (const auto& [key, value] : extra_headers) {
        headers[key] = value;
    }

    auto response = performRequest("POST", base_url_ + endpoint, body.dump(), headers);
    applyRateLimitHeaders(response);
    return response;
}

void HttpClient::applyRateLimitHeaders(const HttpResponse& response) {
    if (!rate_limiter_) {
        return;
    }

    auto weight = response.headers.find("x-mbx-used-weight-1m");
    if (weight != response.headers.end()) {
        rate_limiter_->updateFromUsedWeight(weight->second);
    }

    if (response.isRateLimited() || response.isBlocked()) {
        int retry_after = 0;
        auto it = response.headers.find("retry-after");
        if (it != response.headers.end()) {
            try {
                retry_after = std::stoi(it->second);
            } catch (const std::exception&) {
                retry_after = 0;
            }
        }
        rate_limiter_->handleRateLimitError(response.status_code, retry_after);
    }
}

HttpResponse HttpClient::performRequest(
    const std::string& method,
    const std::string& url,
    const std::string& body_data,
    const std::map<std::string, std::string>& headers
) {
    std::lock_guard<std::mutex> lock(mutex_);

    HttpResponse response;
    std::string response_body;
    std::map<std::string, std::string> response_headers;

    curl_easy_reset(curl_);
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl_, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl_, CURLOPT_HEADERDATA, &response_headers);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT, timeout_seconds_);
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl_, CURLOPT_USERAGENT, "sigscan/1.0");

    if (method == "POST") {
        curl_easy_setopt(curl_, CURLOPT_POST, 1L);
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body_data.c_str());
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(body_data.size()));
    }

    struct curl_slist* header_list = nullptr;
    for (const auto& [key, value] : headers) {
        std::string header_line = key + ": " + value;
        header_list = curl_slist_append(header_list, header_line.c_str());
    }
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, header_list);

    CURLcode res = curl_easy_perform(curl_);

    if (res != CURLE_OK) {
        curl_slist_free_all(header_list);
        throw std::runtime_error("CURL error: " + std::string(curl_easy_strerror(res)));
    }

    long http_code = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &http_code);

    curl_slist_free_all(header_list);

    response.status_code = static_cast<int>(http_code);
    response.body = std::move(response_body);
    response.headers = std::move(response_headers);
    return response;
}

size_t HttpClient::writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total_size = size * nmemb;
    std::string* response_body = static_cast<std::string*>(userp);
    response_body->append(static_cast<char*>(contents), total_size);
    return total_size;
}

size_t HttpClient::headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    size_t total_size = size * nitems;
    std::string header_line(buffer, total_size);

    size_t colon_pos = header_line.find(':');
    if (colon_pos != std::string::npos) {
        std::string key = header_line.substr(0, colon_pos);
        std::string value = header_line.substr(colon_pos + 1);

        value.erase(0, value.find_first_not_of(" \t\r\n"));
        value.erase(value.find_last_not_of(" \t\r\n") + 1);

        // HTTP/2는 소문자 헤더를 보내므로 키를 통일
        std::transform(key.begin(), key.end(), key.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
        (*headers)[key] = value;
    }

    return total_size;
}

std::string HttpClient::buildQueryString(const std::map<std::string, std::string>& params) {
    std::ostringstream oss;
    bool first = true;
    for (const auto& [key, value] : params) {
        if (!first) oss << "&";
        char* escaped = curl_easy_escape(curl_, value.c_str(), static_cast<int>(value.size()));
        oss << key << "=" << (escaped ? escaped : value.c_str());
        if (escaped) {
            curl_free(escaped);
        }
        first = false;
    }
    return oss.str();
}

} // namespace network
} // namespace sigscan
