/**
 * @file ReadinessAssessment.hpp
 * @brief Banded quality verdict derived from cumulative statistics.
 */

#pragma once

#include <string>
#include <vector>

namespace netprobe::core {

/**
 * @brief Coarse quality classification of a single metric.
 */
enum class ReadinessBand : int {
    Unknown = 0,
    Excellent = 1,
    Good = 2,
    Fair = 3,
    Poor = 4
};

/**
 * @brief Overall suitability of the network for interactive sessions.
 */
enum class ReadinessVerdict : int {
    Unknown = 0,
    Ready = 1,
    Marginal = 2,
    NotReady = 3
};

/**
 * @brief Result of a readiness analysis.
 *
 * Recomputed on demand from CumulativeStats and never stored separately.
 */
struct ReadinessAssessment {
    ReadinessBand latency{ReadinessBand::Unknown};
    ReadinessBand stability{ReadinessBand::Unknown};
    ReadinessVerdict overall{ReadinessVerdict::Unknown};
    std::vector<std::string> recommendations;

    [[nodiscard]] std::string latencyToString() const { return bandToString(latency); }
    [[nodiscard]] std::string stabilityToString() const { return bandToString(stability); }
    [[nodiscard]] std::string overallToString() const { return verdictToString(overall); }

    /**
     * @brief Converts a band to its lower-case name (e.g. "excellent").
     */
    static std::string bandToString(ReadinessBand band);

    /**
     * @brief Converts a verdict to its lower-case name (e.g. "not_ready").
     */
    static std::string verdictToString(ReadinessVerdict verdict);

    bool operator==(const ReadinessAssessment& other) const = default;
};

} // namespace netprobe::core
