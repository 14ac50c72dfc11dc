#pragma once

#include "core/types/CumulativeStats.hpp"
#include "core/types/CycleReport.hpp"

#include <chrono>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <vector>

namespace netprobe::infra {

/**
 * @brief Serializes cycle history and cumulative statistics to JSON.
 *
 * Document shape:
 * @code
 * {
 *   "results": [ { "timestamp", "ping_results", "tcp_results", "bandwidth", "dns_resolution" } ],
 *   "stats": { "total_tests", "successful_pings", "failed_pings", "avg_latency",
 *              "min_latency", "max_latency", "packet_loss" },
 *   "generated_at": "..."
 * }
 * @endcode
 * Failed probes and absent measurements are written as null, so they stay
 * distinguishable from a measured zero.
 */
class ResultExporter {
public:
    static nlohmann::ordered_json reportToJson(const core::CycleReport& report);
    static nlohmann::ordered_json statsToJson(const core::CumulativeStats& stats);

    /**
     * @brief Builds the complete export document.
     * @param history Cycle reports in the order they were recorded.
     * @param stats Final cumulative statistics.
     * @param generatedAt Time stamped into "generated_at".
     */
    static nlohmann::ordered_json buildDocument(
        const std::vector<core::CycleReport>& history, const core::CumulativeStats& stats,
        std::chrono::system_clock::time_point generatedAt = std::chrono::system_clock::now());

    /**
     * @brief Writes the export document to a file.
     * @return True if the file was written, false otherwise.
     */
    static bool writeToFile(const std::filesystem::path& path,
                            const std::vector<core::CycleReport>& history,
                            const core::CumulativeStats& stats);
};

} // namespace netprobe::infra
