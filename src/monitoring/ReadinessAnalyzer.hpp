/**
 * @file ReadinessAnalyzer.hpp
 * @brief Classifies cumulative statistics into readiness bands.
 */

#pragma once

#include "core/types/CumulativeStats.hpp"
#include "core/types/ReadinessAssessment.hpp"

namespace netprobe::monitoring {

/**
 * @brief Band thresholds used by ReadinessAnalyzer.
 *
 * A value strictly below a threshold falls into that band.
 */
struct ReadinessThresholds {
    double latencyExcellentMs{50.0};
    double latencyGoodMs{100.0};
    double latencyFairMs{200.0};
    double lossExcellentPercent{1.0};
    double lossGoodPercent{3.0};
    double lossFairPercent{5.0};
};

/**
 * @brief Produces a readiness verdict for remote interactive sessions.
 *
 * assess() is a pure function of its input: the same statistics always yield
 * the same assessment.
 */
class ReadinessAnalyzer {
public:
    static constexpr const char* WIRED_CONNECTION_HINT =
        "High latency detected. Consider using wired connection.";
    static constexpr const char* NETWORK_STABILITY_HINT =
        "High packet loss detected. Check network stability.";

    ReadinessAnalyzer() = default;
    explicit ReadinessAnalyzer(ReadinessThresholds thresholds) : thresholds_(thresholds) {}

    /**
     * @brief Computes the readiness assessment for a statistics snapshot.
     *
     * Latency is banded only when the average latency is positive; otherwise
     * it stays unknown. Stability is always banded from packet loss. The
     * verdict is ready when both bands are excellent or good, marginal when
     * either band is fair, and not ready otherwise.
     */
    [[nodiscard]] core::ReadinessAssessment assess(const core::CumulativeStats& stats) const;

    [[nodiscard]] core::ReadinessBand latencyBand(double avgLatencyMs) const;
    [[nodiscard]] core::ReadinessBand stabilityBand(double packetLossPercent) const;

    const ReadinessThresholds& thresholds() const { return thresholds_; }

private:
    ReadinessThresholds thresholds_;
};

} // namespace netprobe::monitoring
