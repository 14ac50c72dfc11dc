/**
 * @file CycleOrchestrator.hpp
 * @brief Runs one measurement cycle across all probe kinds.
 */

#pragma once

#include "core/services/INameResolver.hpp"
#include "core/services/IReachabilityProbe.hpp"
#include "core/services/ITcpConnectProbe.hpp"
#include "core/services/ITransferProvider.hpp"
#include "core/types/CycleReport.hpp"
#include "core/types/ProbeSettings.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace netprobe::monitoring {

/**
 * @brief Probe collaborators used by the orchestrator.
 */
struct ProbeSet {
    std::shared_ptr<core::IReachabilityProbe> reachability;
    std::shared_ptr<core::ITcpConnectProbe> tcpConnect;
    std::shared_ptr<core::ITransferProvider> transfer;
    std::shared_ptr<core::INameResolver> nameResolver;
};

/**
 * @brief Drives a single measurement cycle and assembles its report.
 *
 * A cycle consists of four sub-phases that always run to completion, in this
 * order:
 *  - reachability: every target probed concurrently, joined before moving on;
 *  - transport connect: each (host, port) pair probed one after another, so
 *    the report lists them in configuration order and connect timings never
 *    overlap;
 *  - bandwidth: one bulk transfer, absent from the report on any failure;
 *  - name resolution: the leading targets resolved one after another.
 *
 * Probe failures become failure outcomes in the report. runCycle() does not
 * throw.
 */
class CycleOrchestrator {
public:
    /**
     * @brief Constructs the orchestrator.
     * @param settings Targets and per-probe timeouts.
     * @param bandwidth Bulk transfer endpoint and deadline.
     * @param probes Probe collaborators; all must be non-null.
     * @throws std::invalid_argument if a collaborator is missing.
     */
    CycleOrchestrator(core::ProbeSettings settings, core::BandwidthSettings bandwidth,
                      ProbeSet probes);

    /**
     * @brief Runs all four sub-phases and returns the finished report.
     */
    core::CycleReport runCycle();

    /**
     * @brief Builds a report in which every probe failed.
     *
     * Used when a cycle could not be run at all, so the cycle still counts
     * against the statistics.
     * @param reason Message stored in each failure outcome.
     */
    [[nodiscard]] core::CycleReport failureReport(const std::string& reason) const;

    const core::ProbeSettings& settings() const { return settings_; }
    const core::BandwidthSettings& bandwidthSettings() const { return bandwidth_; }

private:
    std::vector<core::LabeledOutcome> runReachabilityPhase();
    std::vector<core::LabeledOutcome> runTcpConnectPhase();
    std::optional<double> runBandwidthPhase();
    std::vector<core::LabeledOutcome> runNameResolutionPhase();

    core::ProbeSettings settings_;
    core::BandwidthSettings bandwidth_;
    ProbeSet probes_;
};

} // namespace netprobe::monitoring
