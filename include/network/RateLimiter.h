#pragma once

#include <string>
#include <map>
#include <chrono>
#include <mutex>
#include <condition_variable>

namespace sigscan {
namespace network {

// 그룹별 초당 요청 제한
struct RateLimitConfig {
    std::string group_name;
    int max_per_second;
    int current_count;
    std::chrono::steady_clock::time_point window_start;

    RateLimitConfig(const std::string& name, int max_req)
        : group_name(name)
        , max_per_second(max_req)
        , current_count(0)
        , window_start(std::chrono::steady_clock::now())
    {}
};

// Thread-safe request limiter for outbound REST calls.
// Also honours exchange weight headers and 429/418 responses.
class RateLimiter {
public:
    RateLimiter();

    void addGroup(const std::string& group, int max_per_second);

    // Blocking until a slot is free. Unknown groups share the "default" window.
    void acquire(const std::string& group);

    // X-MBX-USED-WEIGHT-1M 값으로 사용량 보정
    void updateFromUsedWeight(const std::string& used_weight_header);

    // 429: 잠시 정지, 418: IP 차단 (retry_after_seconds 우선)
    void handleRateLimitError(int status_code, int retry_after_seconds = 0);

private:
    void blockFor(std::chrono::milliseconds duration);
    void resetWindowIfNeeded(RateLimitConfig& config);
    RateLimitConfig& configFor(const std::string& group);

    std::map<std::string, RateLimitConfig> configs_;
    std::mutex mutex_;
    std::condition_variable cv_;

    bool is_blocked_;
    std::chrono::steady_clock::time_point block_end_time_;

    static constexpr int kWeightLimitPerMinute = 6000;
    static constexpr int kWeightSoftLimit = 5400;
};

} // namespace network
} // namespace sigscan
