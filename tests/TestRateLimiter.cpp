#include "network/RateLimiter.h"

#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

namespace {

long long elapsedMs(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - since).count();
}

}

int main() {
    using namespace sigscan::network;

    std::cout << "[TEST] Starting RateLimiter Test..." << std::endl;

    // 1. 초당 5개: 5개는 즉시, 6번째는 다음 윈도우까지 대기
    {
        RateLimiter limiter;
        const auto started = std::chrono::steady_clock::now();
        limiter.addGroup("g", 5);
        for (int i = 0; i < 5; ++i) {
            limiter.acquire("g");
        }
        assert(elapsedMs(started) < 300);

        limiter.acquire("g");
        const long long waited = elapsedMs(started);
        assert(waited >= 950);
        assert(waited < 2500);
    }

    // 2. 그룹 한도 변경은 기존 윈도우를 유지한다
    {
        RateLimiter limiter;
        limiter.addGroup("g", 1);
        limiter.acquire("g");
        limiter.addGroup("g", 3);
        const auto started = std::chrono::steady_clock::now();
        limiter.acquire("g");
        limiter.acquire("g");
        assert(elapsedMs(started) < 300);
    }

    // 3. 429 Retry-After 동안 모든 그룹이 멈춘다
    {
        RateLimiter limiter;
        limiter.addGroup("g", 100);
        limiter.handleRateLimitError(429, 1);
        const auto started = std::chrono::steady_clock::now();
        limiter.acquire("g");
        const long long waited = elapsedMs(started);
        assert(waited >= 900);
        assert(waited < 2500);

        // 정지가 풀린 뒤에는 바로 통과
        const auto after = std::chrono::steady_clock::now();
        limiter.acquire("unknown-group");
        assert(elapsedMs(after) < 300);
    }

    // 4. 418도 Retry-After를 따른다, 다른 상태 코드는 무시
    {
        RateLimiter limiter;
        limiter.handleRateLimitError(500, 30);
        auto started = std::chrono::steady_clock::now();
        limiter.acquire("default");
        assert(elapsedMs(started) < 300);

        limiter.handleRateLimitError(418, 1);
        started = std::chrono::steady_clock::now();
        limiter.acquire("default");
        assert(elapsedMs(started) >= 900);
    }

    // 5. 소프트 한도 아래의 weight 헤더나 잘못된 값은 막지 않는다
    {
        RateLimiter limiter;
        limiter.updateFromUsedWeight("100");
        limiter.updateFromUsedWeight("not-a-number");
        limiter.updateFromUsedWeight("");
        const auto started = std::chrono::steady_clock::now();
        limiter.acquire("klines");
        limiter.acquire("sink");
        assert(elapsedMs(started) < 300);
    }

    // 6. 여러 스레드가 같은 그룹을 나눠 쓴다: 3개 한도에 6개 요청이면 한 윈도우 이상 대기
    {
        RateLimiter limiter;
        limiter.addGroup("shared", 3);
        const auto started = std::chrono::steady_clock::now();
        std::thread a([&]() { for (int i = 0; i < 3; ++i) limiter.acquire("shared"); });
        std::thread b([&]() { for (int i = 0; i < 3; ++i) limiter.acquire("shared"); });
        a.join();
        b.join();
        assert(elapsedMs(started) >= 950);
    }

    std::cout << "[TEST] RateLimiter Test PASSED!" << std::endl;
    return 0;
}
