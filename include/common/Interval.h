#pragma once

#include <optional>
#include <string>
#include <vector>

namespace sigscan {

// "15m" -> 900000. Unknown formats yield nullopt.
std::optional<long long> intervalToMs(const std::string& interval);

bool isValidInterval(const std::string& interval);

// Upper case, surrounding whitespace removed ("btcusdt " -> "BTCUSDT")
std::string normalizeSymbol(const std::string& symbol);

// Sorted, de-duplicated union of interval lists. Invalid entries are dropped.
std::vector<std::string> mergeIntervals(const std::vector<std::string>& a,
                                        const std::vector<std::string>& b);

} // namespace sigscan
