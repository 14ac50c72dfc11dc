#pragma once

#include "core/services/ITcpConnectProbe.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <asio.hpp>
#include <memory>

namespace netprobe::infra {

/**
 * @brief Measures TCP connection establishment time.
 *
 * Resolves the host, connects to the first reachable endpoint and closes the
 * socket straight away. A timer races the whole operation; whichever finishes
 * first decides the outcome. Implements the core::ITcpConnectProbe interface.
 */
class TcpConnectProbe : public core::ITcpConnectProbe {
public:
    /**
     * @brief Constructs a TcpConnectProbe with the given Asio context.
     * @param context Reference to the AsioContext for async operations.
     */
    explicit TcpConnectProbe(AsioContext& context);

    /**
     * @brief Starts an asynchronous connect probe.
     * @param host Hostname or IP address.
     * @param port TCP port to connect to.
     * @param timeout Deadline covering resolution and connect.
     * @return Future containing the elapsed time or the failure reason.
     */
    std::future<core::ProbeOutcome> connectAsync(const std::string& host, uint16_t port,
                                                 std::chrono::milliseconds timeout) override;

private:
    struct ConnectState;

    static void complete(const std::shared_ptr<ConnectState>& state, core::ProbeOutcome outcome);

    AsioContext& context_;
};

} // namespace netprobe::infra
