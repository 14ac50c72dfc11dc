/**
 * @file ProbeOutcome.hpp
 * @brief Result of a single bounded network probe.
 *
 * Every probe kind (reachability, transport connect, name resolution) reports
 * through this type. An outcome is either a measured elapsed time or an
 * explicit failure; there is no partial state.
 */

#pragma once

#include <chrono>
#include <string>

namespace netprobe::core {

/**
 * @brief Reason a probe did not produce a measurement.
 */
enum class ProbeFailure : int {
    None = 0,             ///< Probe succeeded
    Timeout = 1,          ///< Probe exceeded its deadline
    TransportError = 2,   ///< Socket or connection level error
    ResolutionFailed = 3, ///< Target name could not be resolved
    ProcessFailed = 4     ///< Reachability utility exited with non-zero status
};

/**
 * @brief Outcome of one probe invocation.
 */
struct ProbeOutcome {
    bool success{false};                  ///< Whether a measurement was taken
    std::chrono::microseconds elapsed{0}; ///< Measured duration (valid only on success)
    ProbeFailure failure{ProbeFailure::None}; ///< Failure reason when success is false
    std::string detail;                   ///< Resolved address or error message

    /**
     * @brief Creates a successful outcome.
     * @param elapsed Measured duration.
     * @param detail Optional probe-specific detail (e.g. resolved address).
     */
    static ProbeOutcome succeeded(std::chrono::microseconds elapsed, std::string detail = {});

    /**
     * @brief Creates a failed outcome.
     * @param failure Reason for the failure (must not be ProbeFailure::None).
     * @param message Human-readable description of the failure.
     */
    static ProbeOutcome failed(ProbeFailure failure, std::string message);

    /**
     * @brief Converts the elapsed time to milliseconds.
     * @return Elapsed time as a floating-point number of milliseconds.
     */
    [[nodiscard]] double elapsedMs() const {
        return static_cast<double>(elapsed.count()) / 1000.0;
    }

    [[nodiscard]] std::string failureToString() const;

    static std::string probeFailureToString(ProbeFailure failure);

    bool operator==(const ProbeOutcome& other) const = default;
};

} // namespace netprobe::core
