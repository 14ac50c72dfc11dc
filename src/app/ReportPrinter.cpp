#include "app/ReportPrinter.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cctype>

namespace netprobe::app {

namespace {

constexpr int LABEL_WIDTH = 20;

template <typename MarkerFn>
void printOutcomes(std::ostream& out, const std::vector<core::LabeledOutcome>& outcomes,
                   MarkerFn marker, const char* failureText) {
    for (const auto& entry : outcomes) {
        if (entry.outcome.success) {
            double ms = entry.outcome.elapsedMs();
            out << fmt::format("  {} {:<{}} {:.1f}ms\n", ReportPrinter::markerToString(marker(ms)),
                               entry.label, LABEL_WIDTH, ms);
        } else {
            out << fmt::format("  {} {:<{}} {}\n",
                               ReportPrinter::markerToString(StatusMarker::Bad), entry.label,
                               LABEL_WIDTH, failureText);
        }
    }
}

std::string toUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

} // namespace

ReportPrinter::ReportPrinter(std::ostream& out) : out_(out) {}

StatusMarker ReportPrinter::pingMarker(double latencyMs) {
    if (latencyMs < 50.0)
        return StatusMarker::Good;
    if (latencyMs < 100.0)
        return StatusMarker::Warning;
    return StatusMarker::Bad;
}

StatusMarker ReportPrinter::tcpMarker(double latencyMs) {
    if (latencyMs < 100.0)
        return StatusMarker::Good;
    if (latencyMs < 200.0)
        return StatusMarker::Warning;
    return StatusMarker::Bad;
}

StatusMarker ReportPrinter::bandwidthMarker(double mbps) {
    if (mbps > 10.0)
        return StatusMarker::Good;
    if (mbps > 1.0)
        return StatusMarker::Warning;
    return StatusMarker::Bad;
}

StatusMarker ReportPrinter::dnsMarker(double latencyMs) {
    if (latencyMs < 50.0)
        return StatusMarker::Good;
    if (latencyMs < 100.0)
        return StatusMarker::Warning;
    return StatusMarker::Bad;
}

std::string ReportPrinter::markerToString(StatusMarker marker) {
    switch (marker) {
    case StatusMarker::Good:
        return "[ OK ]";
    case StatusMarker::Warning:
        return "[WARN]";
    case StatusMarker::Bad:
        return "[FAIL]";
    }
    return "[ ?? ]";
}

void ReportPrinter::printCycle(const core::CycleReport& report) {
    out_ << "\nNetwork Test Results - " << core::formatIsoTimestamp(report.timestamp) << "\n";
    out_ << std::string(60, '=') << "\n";

    out_ << "Ping Results:\n";
    printOutcomes(out_, report.reachability, &ReportPrinter::pingMarker, "TIMEOUT");

    out_ << "\nTCP Connection Results:\n";
    printOutcomes(out_, report.tcpConnect, &ReportPrinter::tcpMarker, "FAILED");

    if (report.bandwidthKbps) {
        double mbps = *report.bandwidthKbps / 1000.0;
        out_ << fmt::format("\nBandwidth: {} {:.2f} Mbps\n", markerToString(bandwidthMarker(mbps)),
                            mbps);
    } else {
        out_ << fmt::format("\nBandwidth: {} unavailable\n", markerToString(StatusMarker::Bad));
    }

    out_ << "\nDNS Resolution:\n";
    printOutcomes(out_, report.nameResolution, &ReportPrinter::dnsMarker, "FAILED");
    out_.flush();
}

void ReportPrinter::printSummary(const core::CumulativeStats& stats) {
    out_ << "\nSummary Statistics:\n";
    out_ << std::string(40, '=') << "\n";
    out_ << fmt::format("Total Tests: {}\n", stats.totalCycles);
    out_ << fmt::format("Successful Pings: {}\n", stats.successfulPings);
    out_ << fmt::format("Failed Pings: {}\n", stats.failedPings);
    out_ << fmt::format("Packet Loss: {:.1f}%\n", stats.packetLossPercent);

    if (stats.hasLatencyData()) {
        out_ << fmt::format("Min Latency: {:.1f}ms\n", *stats.minLatencyMs);
        out_ << fmt::format("Avg Latency: {:.1f}ms\n", stats.avgLatencyMs);
        out_ << fmt::format("Max Latency: {:.1f}ms\n", *stats.maxLatencyMs);
    }
    out_.flush();
}

void ReportPrinter::printReadiness(const core::ReadinessAssessment& assessment) {
    out_ << fmt::format("\nRemote Desktop Readiness: {}\n", toUpper(assessment.overallToString()));
    out_ << fmt::format("  Latency:   {}\n", assessment.latencyToString());
    out_ << fmt::format("  Stability: {}\n", assessment.stabilityToString());

    if (!assessment.recommendations.empty()) {
        out_ << "Recommendations:\n";
        for (const auto& recommendation : assessment.recommendations) {
            out_ << "  - " << recommendation << "\n";
        }
    }
    out_.flush();
}

} // namespace netprobe::app
