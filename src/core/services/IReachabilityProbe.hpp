/**
 * @file IReachabilityProbe.hpp
 * @brief Interface for the reachability (ping) probe.
 */

#pragma once

#include "core/types/ProbeOutcome.hpp"

#include <chrono>
#include <future>
#include <string>

namespace netprobe::core {

/**
 * @brief Checks whether a target answers a reachability request.
 *
 * Implementations must not block the caller: the returned future becomes
 * ready once the probe has succeeded, failed, or timed out. Failures are
 * reported through the outcome, never as an exception stored in the future.
 */
class IReachabilityProbe {
public:
    virtual ~IReachabilityProbe() = default;

    /**
     * @brief Starts a reachability probe against a target.
     * @param target Hostname or IP address.
     * @param timeout Maximum time to wait for the probe to complete.
     * @return Future that will contain the probe outcome.
     */
    virtual std::future<ProbeOutcome> probeAsync(const std::string& target,
                                                 std::chrono::milliseconds timeout) = 0;
};

} // namespace netprobe::core
