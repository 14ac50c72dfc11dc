/**
 * @file CumulativeStats.hpp
 * @brief Running statistics across all completed measurement cycles.
 */

#pragma once

#include <cstdint>
#include <optional>

namespace netprobe::core {

/**
 * @brief Process-lifetime statistics folded from cycle reports.
 *
 * Mutated only by monitoring::StatsAggregator, once per completed cycle.
 * minLatencyMs and maxLatencyMs stay empty until the first successful
 * reachability probe has been recorded.
 *
 * @note avgLatencyMs is the mean of the most recent cycle that had at least
 *       one successful reachability probe, not a mean over all cycles.
 */
struct CumulativeStats {
    int64_t totalCycles{0};              ///< Number of cycles folded in
    int64_t successfulPings{0};          ///< Successful reachability probes (cumulative)
    int64_t failedPings{0};              ///< Failed reachability probes (cumulative)
    double avgLatencyMs{0.0};            ///< Mean latency of the latest cycle with successes
    std::optional<double> minLatencyMs;  ///< Lowest observed latency, empty before any success
    std::optional<double> maxLatencyMs;  ///< Highest observed latency, empty before any success
    double packetLossPercent{0.0};       ///< failed / (failed + successful) * 100

    /**
     * @brief Total reachability probes attempted so far.
     */
    [[nodiscard]] int64_t totalPings() const { return successfulPings + failedPings; }

    /**
     * @brief Whether at least one successful reachability probe has been recorded.
     */
    [[nodiscard]] bool hasLatencyData() const { return minLatencyMs.has_value(); }

    bool operator==(const CumulativeStats& other) const = default;
};

} // namespace netprobe::core
