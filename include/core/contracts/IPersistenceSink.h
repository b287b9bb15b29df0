#pragma once

#include <string>
#include <vector>

#include "core/model/Records.h"

namespace sigscan {
namespace core {

// Storage collaborator for batched records. Each write is all-or-nothing:
// false means the whole batch must be retried.
class IPersistenceSink {
public:
    virtual ~IPersistenceSink() = default;

    virtual bool writeSignals(const std::vector<Signal>& batch) = 0;
    virtual bool writeMetrics(const std::vector<MetricRecord>& batch) = 0;
    virtual bool writeEvents(const std::vector<EventRecord>& batch) = 0;
    virtual std::string name() const = 0;
};

} // namespace core
} // namespace sigscan
