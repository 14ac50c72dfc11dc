#include "infrastructure/export/ResultExporter.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

namespace netprobe::infra {

namespace {

nlohmann::ordered_json outcomesToJson(const std::vector<core::LabeledOutcome>& outcomes) {
    auto j = nlohmann::ordered_json::object();
    for (const auto& entry : outcomes) {
        if (entry.outcome.success) {
            j[entry.label] = entry.outcome.elapsedMs();
        } else {
            j[entry.label] = nullptr;
        }
    }
    return j;
}

nlohmann::ordered_json optionalToJson(const std::optional<double>& value) {
    return value ? nlohmann::ordered_json(*value) : nlohmann::ordered_json(nullptr);
}

} // namespace

nlohmann::ordered_json ResultExporter::reportToJson(const core::CycleReport& report) {
    nlohmann::ordered_json j;
    j["timestamp"] = core::formatIsoTimestamp(report.timestamp);
    j["ping_results"] = outcomesToJson(report.reachability);
    j["tcp_results"] = outcomesToJson(report.tcpConnect);
    j["bandwidth"] = optionalToJson(report.bandwidthKbps);
    j["dns_resolution"] = outcomesToJson(report.nameResolution);
    return j;
}

nlohmann::ordered_json ResultExporter::statsToJson(const core::CumulativeStats& stats) {
    nlohmann::ordered_json j;
    j["total_tests"] = stats.totalCycles;
    j["successful_pings"] = stats.successfulPings;
    j["failed_pings"] = stats.failedPings;
    j["avg_latency"] = stats.avgLatencyMs;
    j["min_latency"] = optionalToJson(stats.minLatencyMs);
    j["max_latency"] = optionalToJson(stats.maxLatencyMs);
    j["packet_loss"] = stats.packetLossPercent;
    return j;
}

nlohmann::ordered_json ResultExporter::buildDocument(
    const std::vector<core::CycleReport>& history, const core::CumulativeStats& stats,
    std::chrono::system_clock::time_point generatedAt) {
    nlohmann::ordered_json j;
    j["results"] = nlohmann::ordered_json::array();
    for (const auto& report : history) {
        j["results"].push_back(reportToJson(report));
    }
    j["stats"] = statsToJson(stats);
    j["generated_at"] = core::formatIsoTimestamp(generatedAt);
    return j;
}

bool ResultExporter::writeToFile(const std::filesystem::path& path,
                                 const std::vector<core::CycleReport>& history,
                                 const core::CumulativeStats& stats) {
    try {
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }

        std::ofstream file(path);
        if (!file) {
            spdlog::error("Failed to open export file for writing: {}", path.string());
            return false;
        }

        file << buildDocument(history, stats).dump(2);
        spdlog::info("Results saved to {}", path.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to export results: {}", e.what());
        return false;
    }
}

} // namespace netprobe::infra
