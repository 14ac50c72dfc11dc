/**
 * @file ITcpConnectProbe.hpp
 * @brief Interface for the transport connect probe.
 */

#pragma once

#include "core/types/ProbeOutcome.hpp"

#include <chrono>
#include <cstdint>
#include <future>
#include <string>

namespace netprobe::core {

/**
 * @brief Measures the time to open (and immediately close) a TCP connection.
 */
class ITcpConnectProbe {
public:
    virtual ~ITcpConnectProbe() = default;

    /**
     * @brief Starts a connect probe.
     * @param host Hostname or IP address.
     * @param port TCP port.
     * @param timeout Deadline covering resolution and connect.
     * @return Future that will contain the probe outcome.
     */
    virtual std::future<ProbeOutcome> connectAsync(const std::string& host, uint16_t port,
                                                   std::chrono::milliseconds timeout) = 0;
};

} // namespace netprobe::core
