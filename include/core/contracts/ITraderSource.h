#pragma once

#include <string>
#include <vector>

#include "core/model/Records.h"

namespace sigscan {
namespace core {

class ITraderSource {
public:
    virtual ~ITraderSource() = default;

    // Throws std::runtime_error when the source cannot be read at all.
    // Individually malformed entries are skipped and logged.
    virtual std::vector<Trader> loadTraders() = 0;
    virtual std::string describe() const = 0;
};

} // namespace core
} // namespace sigscan
