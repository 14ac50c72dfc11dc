#pragma once

#include "core/types/CumulativeStats.hpp"
#include "core/types/CycleReport.hpp"
#include "core/types/ReadinessAssessment.hpp"

#include <ostream>
#include <string>

namespace netprobe::app {

/**
 * @brief Quality marker shown next to a measurement.
 */
enum class StatusMarker { Good, Warning, Bad };

/**
 * @brief Renders reports, statistics and readiness verdicts as console text.
 */
class ReportPrinter {
public:
    explicit ReportPrinter(std::ostream& out);

    void printCycle(const core::CycleReport& report);
    void printSummary(const core::CumulativeStats& stats);
    void printReadiness(const core::ReadinessAssessment& assessment);

    // Marker thresholds per section
    static StatusMarker pingMarker(double latencyMs);
    static StatusMarker tcpMarker(double latencyMs);
    static StatusMarker bandwidthMarker(double mbps);
    static StatusMarker dnsMarker(double latencyMs);

    static std::string markerToString(StatusMarker marker);

private:
    std::ostream& out_;
};

} // namespace netprobe::app
