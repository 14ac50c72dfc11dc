#include "monitoring/ReadinessAnalyzer.hpp"

namespace netprobe::monitoring {

namespace {

bool isAcceptable(core::ReadinessBand band) {
    return band == core::ReadinessBand::Excellent || band == core::ReadinessBand::Good;
}

} // namespace

core::ReadinessBand ReadinessAnalyzer::latencyBand(double avgLatencyMs) const {
    if (avgLatencyMs <= 0.0) {
        return core::ReadinessBand::Unknown;
    }
    if (avgLatencyMs < thresholds_.latencyExcellentMs) {
        return core::ReadinessBand::Excellent;
    }
    if (avgLatencyMs < thresholds_.latencyGoodMs) {
        return core::ReadinessBand::Good;
    }
    if (avgLatencyMs < thresholds_.latencyFairMs) {
        return core::ReadinessBand::Fair;
    }
    return core::ReadinessBand::Poor;
}

core::ReadinessBand ReadinessAnalyzer::stabilityBand(double packetLossPercent) const {
    if (packetLossPercent < thresholds_.lossExcellentPercent) {
        return core::ReadinessBand::Excellent;
    }
    if (packetLossPercent < thresholds_.lossGoodPercent) {
        return core::ReadinessBand::Good;
    }
    if (packetLossPercent < thresholds_.lossFairPercent) {
        return core::ReadinessBand::Fair;
    }
    return core::ReadinessBand::Poor;
}

core::ReadinessAssessment ReadinessAnalyzer::assess(const core::CumulativeStats& stats) const {
    core::ReadinessAssessment assessment;

    assessment.latency = latencyBand(stats.avgLatencyMs);
    if (assessment.latency == core::ReadinessBand::Poor) {
        assessment.recommendations.emplace_back(WIRED_CONNECTION_HINT);
    }

    assessment.stability = stabilityBand(stats.packetLossPercent);
    if (assessment.stability == core::ReadinessBand::Poor) {
        assessment.recommendations.emplace_back(NETWORK_STABILITY_HINT);
    }

    // Unknown latency never counts as fair, so it cannot produce a marginal verdict.
    if (isAcceptable(assessment.latency) && isAcceptable(assessment.stability)) {
        assessment.overall = core::ReadinessVerdict::Ready;
    } else if (assessment.latency == core::ReadinessBand::Fair ||
               assessment.stability == core::ReadinessBand::Fair) {
        assessment.overall = core::ReadinessVerdict::Marginal;
    } else {
        assessment.overall = core::ReadinessVerdict::NotReady;
    }

    return assessment;
}

} // namespace netprobe::monitoring
