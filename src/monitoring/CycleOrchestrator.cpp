#include "monitoring/CycleOrchestrator.hpp"

#include "monitoring/ProbeGroup.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace netprobe::monitoring {

CycleOrchestrator::CycleOrchestrator(core::ProbeSettings settings,
                                     core::BandwidthSettings bandwidth, ProbeSet probes)
    : settings_(std::move(settings)), bandwidth_(std::move(bandwidth)), probes_(std::move(probes)) {
    if (!probes_.reachability || !probes_.tcpConnect || !probes_.transfer ||
        !probes_.nameResolver) {
        throw std::invalid_argument("CycleOrchestrator requires all probe collaborators");
    }
    spdlog::debug("CycleOrchestrator configured: {} targets, {} tcp targets, transfer via {}",
                  settings_.targets.size(), settings_.tcpTargets.size(),
                  probes_.transfer->name());
}

core::CycleReport CycleOrchestrator::runCycle() {
    core::CycleReport report;
    report.timestamp = std::chrono::system_clock::now();

    report.reachability = runReachabilityPhase();
    report.tcpConnect = runTcpConnectPhase();
    report.bandwidthKbps = runBandwidthPhase();
    report.nameResolution = runNameResolutionPhase();

    spdlog::debug("Cycle complete: {}/{} targets reachable", report.successfulReachabilityCount(),
                  report.reachability.size());
    return report;
}

std::vector<core::LabeledOutcome> CycleOrchestrator::runReachabilityPhase() {
    ProbeGroup group;
    for (const auto& target : settings_.targets) {
        group.spawn(target, settings_.pingTimeout, [this, &target]() {
            return probes_.reachability->probeAsync(target, settings_.pingTimeout);
        });
    }
    return group.joinAll();
}

std::vector<core::LabeledOutcome> CycleOrchestrator::runTcpConnectPhase() {
    std::vector<core::LabeledOutcome> outcomes;
    outcomes.reserve(settings_.tcpTargets.size());

    for (const auto& target : settings_.tcpTargets) {
        auto label = target.label();
        auto outcome = ProbeGroup::runOne(label, settings_.tcpTimeout, [this, &target]() {
            return probes_.tcpConnect->connectAsync(target.host, target.port,
                                                    settings_.tcpTimeout);
        });
        if (!outcome.success) {
            spdlog::debug("TCP connect to {} failed: {}", label, outcome.detail);
        }
        outcomes.push_back({std::move(label), std::move(outcome)});
    }

    return outcomes;
}

std::optional<double> CycleOrchestrator::runBandwidthPhase() {
    if (!probes_.transfer->available()) {
        spdlog::warn("Bandwidth test skipped: {} transfer capability not available",
                     probes_.transfer->name());
        return std::nullopt;
    }

    try {
        auto future = probes_.transfer->downloadAsync(bandwidth_);
        if (future.wait_for(bandwidth_.timeout + ProbeGroup::JOIN_GRACE) !=
            std::future_status::ready) {
            spdlog::warn("Bandwidth test did not settle within its deadline");
            return std::nullopt;
        }

        auto result = future.get();
        auto throughput = result.throughputKbps();
        if (!throughput) {
            spdlog::warn("Bandwidth test failed: {}", result.errorMessage);
        }
        return throughput;
    } catch (const std::exception& e) {
        spdlog::warn("Bandwidth test failed: {}", e.what());
        return std::nullopt;
    }
}

std::vector<core::LabeledOutcome> CycleOrchestrator::runNameResolutionPhase() {
    std::vector<core::LabeledOutcome> outcomes;

    for (const auto& target : settings_.nameResolutionTargets()) {
        auto outcome = ProbeGroup::runOne(target, settings_.dnsTimeout, [this, &target]() {
            return probes_.nameResolver->resolveAsync(target, settings_.dnsTimeout);
        });
        outcomes.push_back({target, std::move(outcome)});
    }

    return outcomes;
}

core::CycleReport CycleOrchestrator::failureReport(const std::string& reason) const {
    core::CycleReport report;
    report.timestamp = std::chrono::system_clock::now();

    auto failure = core::ProbeOutcome::failed(core::ProbeFailure::TransportError, reason);
    for (const auto& target : settings_.targets) {
        report.reachability.push_back({target, failure});
    }
    for (const auto& target : settings_.tcpTargets) {
        report.tcpConnect.push_back({target.label(), failure});
    }
    for (const auto& target : settings_.nameResolutionTargets()) {
        report.nameResolution.push_back({target, failure});
    }
    return report;
}

} // namespace netprobe::monitoring
