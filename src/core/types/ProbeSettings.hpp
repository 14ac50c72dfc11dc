/**
 * @file ProbeSettings.hpp
 * @brief Target lists and timeouts for a measurement cycle.
 */

#pragma once

#include "core/types/CycleReport.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace netprobe::core {

/// Port of the companion session service probed by the transport connect sub-phase.
constexpr uint16_t COMPANION_SERVICE_PORT = 9000;

/**
 * @brief Default reachability targets: two public resolvers, a rendezvous host and localhost.
 */
std::vector<std::string> defaultTargets();

/**
 * @brief Default transport connect targets, ending with the companion service.
 */
std::vector<TcpTarget> defaultTcpTargets();

/**
 * @brief Settings consumed by the cycle orchestrator.
 */
struct ProbeSettings {
    std::vector<std::string> targets{defaultTargets()};    ///< Reachability targets
    std::vector<TcpTarget> tcpTargets{defaultTcpTargets()}; ///< Transport connect targets
    std::chrono::milliseconds pingTimeout{3000};  ///< Per-target reachability timeout
    std::chrono::milliseconds tcpTimeout{3000};   ///< Per-target connect timeout
    std::chrono::milliseconds dnsTimeout{3000};   ///< Per-target resolution timeout
    std::size_t dnsTargetCount{2};                ///< Leading targets that get name resolution

    /**
     * @brief Returns the prefix of targets that the name resolution sub-phase covers.
     */
    [[nodiscard]] std::vector<std::string> nameResolutionTargets() const;

    bool operator==(const ProbeSettings& other) const = default;
};

/**
 * @brief Settings for the bulk transfer probe.
 */
struct BandwidthSettings {
    bool enabled{true};                         ///< Whether a transfer provider is constructed
    std::string scheme{"https"};                ///< "http" or "https"
    std::string host{"httpbin.org"};            ///< Remote endpoint serving /bytes/<n>
    uint16_t port{0};                           ///< 0 selects the scheme's default port
    int sizeKb{100};                            ///< Payload size in KiB
    std::chrono::milliseconds timeout{10000};   ///< Overall transfer deadline

    /**
     * @brief Port to connect to, resolving 0 to 80 or 443 by scheme.
     */
    [[nodiscard]] uint16_t effectivePort() const {
        if (port != 0) {
            return port;
        }
        return scheme == "https" ? 443 : 80;
    }

    /**
     * @brief Payload size in bytes.
     */
    [[nodiscard]] std::size_t payloadBytes() const {
        return static_cast<std::size_t>(sizeKb > 0 ? sizeKb : 0) * 1024;
    }

    bool operator==(const BandwidthSettings& other) const = default;
};

} // namespace netprobe::core
