/**
 * @file CycleReport.hpp
 * @brief Results of one complete measurement cycle.
 *
 * A CycleReport is produced exactly once per cycle by the orchestrator and is
 * not modified after it has been handed to the statistics aggregator.
 */

#pragma once

#include "core/types/ProbeOutcome.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace netprobe::core {

/**
 * @brief Probe outcome tagged with the target it was taken against.
 *
 * The label is the target for reachability and name resolution, and
 * "host:port" for transport connect probes.
 */
struct LabeledOutcome {
    std::string label;    ///< Target or "host:port" label
    ProbeOutcome outcome; ///< Result of the probe

    bool operator==(const LabeledOutcome& other) const = default;
};

/**
 * @brief A (host, port) pair used by the transport connect sub-phase.
 */
struct TcpTarget {
    std::string host;  ///< Hostname or IP address
    uint16_t port{0};  ///< TCP port

    /**
     * @brief Builds the "host:port" label used in reports.
     */
    [[nodiscard]] std::string label() const;

    bool operator==(const TcpTarget& other) const = default;
};

/**
 * @brief Aggregate output of one measurement cycle.
 *
 * Outcome lists keep the order in which targets were configured, so a report
 * can be compared target-by-target with the input lists.
 */
struct CycleReport {
    std::chrono::system_clock::time_point timestamp; ///< When the cycle started
    std::vector<LabeledOutcome> reachability;  ///< One entry per configured target
    std::vector<LabeledOutcome> tcpConnect;    ///< One entry per transport target, in input order
    std::optional<double> bandwidthKbps;       ///< Throughput, absent when the transfer failed
    std::vector<LabeledOutcome> nameResolution; ///< One entry per resolved target

    /**
     * @brief Looks up a reachability outcome by target.
     * @param target Target to find.
     * @return Pointer to the first matching outcome, or nullptr.
     */
    [[nodiscard]] const ProbeOutcome* findReachability(const std::string& target) const;

    /**
     * @brief Looks up a transport connect outcome by "host:port" label.
     */
    [[nodiscard]] const ProbeOutcome* findTcpConnect(const std::string& label) const;

    /**
     * @brief Looks up a name resolution outcome by target.
     */
    [[nodiscard]] const ProbeOutcome* findNameResolution(const std::string& target) const;

    /**
     * @brief Counts successful reachability outcomes in this cycle.
     */
    [[nodiscard]] int successfulReachabilityCount() const;

    bool operator==(const CycleReport& other) const = default;
};

/**
 * @brief Formats a time point as local ISO-8601 with microsecond precision.
 * @param timePoint Time to format.
 * @return String such as "2024-05-01T13:45:10.123456".
 */
std::string formatIsoTimestamp(std::chrono::system_clock::time_point timePoint);

} // namespace netprobe::core
