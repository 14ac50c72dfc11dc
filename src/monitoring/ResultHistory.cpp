#include "monitoring/ResultHistory.hpp"

namespace netprobe::monitoring {

const core::CycleReport& ResultHistory::append(core::CycleReport report) {
    records_.push_back(std::move(report));
    return records_.back();
}

} // namespace netprobe::monitoring
