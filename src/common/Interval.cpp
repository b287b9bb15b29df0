#include "common/Interval.h"

#include <algorithm>
#include <cctype>
#include <map>
#include <set>

namespace sigscan {

namespace {
const std::map<std::string, long long>& knownIntervals() {
    static const std::map<std::string, long long> kIntervals = {
        {"1m", 60LL * 1000},
        {"3m", 3LL * 60 * 1000},
        {"5m", 5LL * 60 * 1000},
        {"15m", 15LL * 60 * 1000},
        {"30m", 30LL * 60 * 1000},
        {"1h", 60LL * 60 * 1000},
        {"2h", 2LL * 60 * 60 * 1000},
        {"4h", 4LL * 60 * 60 * 1000},
        {"6h", 6LL * 60 * 60 * 1000},
        {"8h", 8LL * 60 * 60 * 1000},
        {"12h", 12LL * 60 * 60 * 1000},
        {"1d", 24LL * 60 * 60 * 1000},
        {"3d", 3LL * 24 * 60 * 60 * 1000},
        {"1w", 7LL * 24 * 60 * 60 * 1000},
    };
    return kIntervals;
}

std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}
}

std::optional<long long> intervalToMs(const std::string& interval) {
    const auto& known = knownIntervals();
    auto it = known.find(interval);
    if (it != known.end()) {
        return it->second;
    }

    // generic <N><unit>
    if (interval.size() < 2) {
        return std::nullopt;
    }
    const char unit = interval.back();
    const std::string digits = interval.substr(0, interval.size() - 1);
    if (!std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }

    long long count = 0;
    try {
        count = std::stoll(digits);
    } catch (const std::exception&) {
        return std::nullopt;
    }
    if (count <= 0) {
        return std::nullopt;
    }

    switch (unit) {
        case 's': return count * 1000;
        case 'm': return count * 60 * 1000;
        case 'h': return count * 60 * 60 * 1000;
        case 'd': return count * 24 * 60 * 60 * 1000;
        case 'w': return count * 7 * 24 * 60 * 60 * 1000;
        default: return std::nullopt;
    }
}

bool isValidInterval(const std::string& interval) {
    return intervalToMs(interval).has_value();
}

std::string normalizeSymbol(const std::string& symbol) {
    std::string out = trimCopy(symbol);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

std::vector<std::string> mergeIntervals(const std::vector<std::string>& a,
                                        const std::vector<std::string>& b) {
    std::set<std::string> merged;
    for (const auto& iv : a) {
        if (isValidInterval(iv)) merged.insert(iv);
    }
    for (const auto& iv : b) {
        if (isValidInterval(iv)) merged.insert(iv);
    }

    std::vector<std::string> out(merged.begin(), merged.end());
    // 짧은 주기부터
    std::stable_sort(out.begin(), out.end(), [](const std::string& l, const std::string& r) {
        return intervalToMs(l).value_or(0) < intervalToMs(r).value_or(0);
    });
    return out;
}

} // namespace sigscan
