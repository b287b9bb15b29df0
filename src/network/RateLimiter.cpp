#include "network/RateLimiter.h"
#include "common/Logger.h"
#include <algorithm>

namespace sigscan {
namespace network {

RateLimiter::RateLimiter()
    : is_blocked_(false)
{
    configs_.emplace("klines", RateLimitConfig("klines", 10));
    configs_.emplace("sink", RateLimitConfig("sink", 20));
    configs_.emplace("default", RateLimitConfig("default", 10));
}

void RateLimiter::addGroup(const std::string& group, int max_per_second) {
    std::lock_guard<std::mutex> lock(mutex_);
    // 대기 중인 acquire가 참조를 쥐고 있을 수 있으므로 제자리에서 갱신
    auto it = configs_.find(group);
    if (it != configs_.end()) {
        it->second.max_per_second = std::max(1, max_per_second);
        return;
    }
    configs_.emplace(group, RateLimitConfig(group, std::max(1, max_per_second)));
}

RateLimitConfig& RateLimiter::configFor(const std::string& group) {
    auto it = configs_.find(group);
    if (it == configs_.end()) it = configs_.find("default");
    return it->second;
}

void RateLimiter::acquire(const std::string& group) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto& config = configFor(group);

    while (true) {
        if (is_blocked_) {
            auto status = cv_.wait_until(lock, block_end_time_);
            if (status == std::cv_status::timeout) {
                is_blocked_ = false;
            } else {
                continue;
            }
        }

        resetWindowIfNeeded(config);

        if (config.current_count < config.max_per_second) {
            config.current_count++;
            return;
        }

        // 다음 윈도우 시작까지 대기
        auto wake_time = config.window_start + std::chrono::seconds(1) + std::chrono::milliseconds(1);
        cv_.wait_until(lock, wake_time);
    }
}

void RateLimiter::updateFromUsedWeight(const std::string& used_weight_header) {
    int used = 0;
    try {
        used = std::stoi(used_weight_header);
    } catch (const std::exception&) {
        return;
    }

    if (used >= kWeightSoftLimit) {
        LOG_WARN("REST weight {}/{} used, pausing requests until the minute rolls over",
                 used, kWeightLimitPerMinute);
        const auto now = std::chrono::system_clock::now().time_since_epoch();
        const auto into_minute = std::chrono::duration_cast<std::chrono::milliseconds>(now) % std::chrono::minutes(1);
        blockFor(std::chrono::minutes(1) - into_minute);
    }
}

void RateLimiter::handleRateLimitError(int status_code, int retry_after_seconds) {
    if (status_code == 429) {
        const int seconds = retry_after_seconds > 0 ? retry_after_seconds : 1;
        LOG_WARN("429 Too Many Requests (pausing {}s)", seconds);
        blockFor(std::chrono::seconds(seconds));
    } else if (status_code == 418) {
        const int seconds = retry_after_seconds > 0 ? retry_after_seconds : 60;
        LOG_ERROR("418 IP banned (pausing {}s)", seconds);
        blockFor(std::chrono::seconds(seconds));
    }
}

void RateLimiter::blockFor(std::chrono::milliseconds duration) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto until = std::chrono::steady_clock::now() + duration;
    if (!is_blocked_ || until > block_end_time_) {
        block_end_time_ = until;
    }
    is_blocked_ = true;
}

void RateLimiter::resetWindowIfNeeded(RateLimitConfig& config) {
    auto now = std::chrono::steady_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - config.window_start);

    if (elapsed.count() >= 1000) {
        config.current_count = 0;
        config.window_start = now;
        cv_.notify_all();
    }
}

} // namespace network
} // namespace sigscan
