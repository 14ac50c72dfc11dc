/**
 * @file ITransferProvider.hpp
 * @brief Interface for the bulk transfer (bandwidth) probe.
 *
 * The transfer capability is optional. Whether it is present is decided when
 * the provider is constructed; a provider without the capability still
 * answers every request, with a failure.
 */

#pragma once

#include "core/types/ProbeSettings.hpp"

#include <chrono>
#include <cstddef>
#include <future>
#include <optional>
#include <string>

namespace netprobe::core {

/**
 * @brief Outcome of a bulk transfer.
 */
struct TransferResult {
    bool success{false};             ///< Whether the payload was fully received
    std::size_t bytesReceived{0};    ///< Body bytes received
    std::chrono::microseconds duration{0}; ///< Wall time of the transfer
    std::string errorMessage;        ///< Error description if the transfer failed

    /**
     * @brief Effective throughput in kilobits per second.
     * @return Throughput, or std::nullopt when the transfer failed.
     */
    [[nodiscard]] std::optional<double> throughputKbps() const {
        if (!success || duration.count() <= 0) {
            return std::nullopt;
        }
        double seconds = static_cast<double>(duration.count()) / 1'000'000.0;
        return (static_cast<double>(bytesReceived) * 8.0) / (seconds * 1000.0);
    }
};

/**
 * @brief Provider of streamed downloads used to estimate bandwidth.
 */
class ITransferProvider {
public:
    virtual ~ITransferProvider() = default;

    /**
     * @brief Whether this provider can perform transfers at all.
     */
    [[nodiscard]] virtual bool available() const = 0;

    /**
     * @brief Human-readable provider name for logs.
     */
    [[nodiscard]] virtual std::string name() const = 0;

    /**
     * @brief Downloads a fixed-size payload under the configured deadline.
     * @param settings Endpoint, payload size and timeout.
     * @return Future that will contain the transfer result.
     */
    virtual std::future<TransferResult> downloadAsync(const BandwidthSettings& settings) = 0;
};

} // namespace netprobe::core
