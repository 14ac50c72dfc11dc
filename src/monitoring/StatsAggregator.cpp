#include "monitoring/StatsAggregator.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace netprobe::monitoring {

void StatsAggregator::update(core::CumulativeStats& stats, const core::CycleReport& report) const {
    // Work on a copy so the caller's object changes in a single assignment.
    core::CumulativeStats next = stats;
    next.totalCycles += 1;

    double cycleLatencySum = 0.0;
    int cycleSuccesses = 0;

    for (const auto& entry : report.reachability) {
        if (!entry.outcome.success) {
            next.failedPings += 1;
            continue;
        }

        double latencyMs = entry.outcome.elapsedMs();
        next.successfulPings += 1;
        next.minLatencyMs = next.minLatencyMs ? std::min(*next.minLatencyMs, latencyMs) : latencyMs;
        next.maxLatencyMs = next.maxLatencyMs ? std::max(*next.maxLatencyMs, latencyMs) : latencyMs;

        cycleLatencySum += latencyMs;
        ++cycleSuccesses;
    }

    if (cycleSuccesses > 0) {
        next.avgLatencyMs = cycleLatencySum / cycleSuccesses;
    }

    next.packetLossPercent = packetLossPercent(next.successfulPings, next.failedPings);

    stats = next;

    spdlog::debug("Cycle {} folded: {}/{} pings ok, loss {:.1f}%", stats.totalCycles,
                  cycleSuccesses, report.reachability.size(), stats.packetLossPercent);
}

double StatsAggregator::packetLossPercent(int64_t successful, int64_t failed) {
    int64_t total = successful + failed;
    if (total <= 0) {
        return 0.0;
    }
    return (static_cast<double>(failed) / static_cast<double>(total)) * 100.0;
}

} // namespace netprobe::monitoring
