/**
 * @file StatsAggregator.hpp
 * @brief Folds cycle reports into cumulative statistics.
 */

#pragma once

#include "core/types/CumulativeStats.hpp"
#include "core/types/CycleReport.hpp"

namespace netprobe::monitoring {

/**
 * @brief Updates CumulativeStats from completed cycle reports.
 *
 * The aggregator holds no state of its own. The statistics object is owned by
 * the caller and passed in explicitly; all of its fields are updated together
 * for a given report.
 */
class StatsAggregator {
public:
    /**
     * @brief Folds one cycle report into the statistics.
     *
     * Increments the cycle count, adds every reachability outcome to the
     * success/failure counters, widens the min/max latency bounds, recomputes
     * packet loss over the cumulative counters, and replaces the average
     * latency with the mean of this cycle's successes. A cycle with no
     * successful reachability probe leaves the average untouched.
     *
     * @param stats Statistics to update.
     * @param report Completed cycle report.
     */
    void update(core::CumulativeStats& stats, const core::CycleReport& report) const;

    /**
     * @brief Packet loss percentage for the given counters.
     * @return failed / (failed + successful) * 100, or 0 when nothing was attempted.
     */
    static double packetLossPercent(int64_t successful, int64_t failed);
};

} // namespace netprobe::monitoring
