#include "common/Interval.h"

#include <cassert>
#include <iostream>

int main() {
    using namespace sigscan;

    std::cout << "[TEST] Starting Interval Test..." << std::endl;

    assert(intervalToMs("1m").value() == 60000);
    assert(intervalToMs("15m").value() == 900000);
    assert(intervalToMs("1h").value() == 3600000);
    assert(intervalToMs("4h").value() == 4LL * 3600000);
    assert(intervalToMs("1d").value() == 86400000);
    assert(intervalToMs("1w").value() == 7LL * 86400000);
    assert(intervalToMs("45m").value() == 45LL * 60000);
    assert(intervalToMs("10s").value() == 10000);

    assert(!intervalToMs("").has_value());
    assert(!intervalToMs("m").has_value());
    assert(!intervalToMs("0m").has_value());
    assert(!intervalToMs("15x").has_value());
    assert(!intervalToMs("-5m").has_value());
    assert(!isValidInterval("abc"));
    assert(isValidInterval("5m"));

    assert(normalizeSymbol(" btcusdt ") == "BTCUSDT");
    assert(normalizeSymbol("EthUsdt") == "ETHUSDT");

    // 중복 제거 + 짧은 주기부터
    const auto merged = mergeIntervals({"1h", "1m", "bogus"}, {"15m", "1m", "4h"});
    assert(merged.size() == 4);
    assert(merged[0] == "1m");
    assert(merged[1] == "15m");
    assert(merged[2] == "1h");
    assert(merged[3] == "4h");

    std::cout << "[TEST] Interval Test PASSED!" << std::endl;
    return 0;
}
