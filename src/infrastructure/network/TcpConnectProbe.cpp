#include "infrastructure/network/TcpConnectProbe.hpp"

#include <spdlog/spdlog.h>

namespace netprobe::infra {

struct TcpConnectProbe::ConnectState {
    explicit ConnectState(asio::io_context& io)
        : strand(asio::make_strand(io)), resolver(strand), socket(strand), timer(strand) {}

    asio::strand<asio::io_context::executor_type> strand;
    asio::ip::tcp::resolver resolver;
    asio::ip::tcp::socket socket;
    asio::steady_timer timer;
    std::string label;
    std::chrono::steady_clock::time_point startTime;
    std::promise<core::ProbeOutcome> promise;
    bool completed{false};
};

TcpConnectProbe::TcpConnectProbe(AsioContext& context) : context_(context) {}

std::future<core::ProbeOutcome> TcpConnectProbe::connectAsync(const std::string& host,
                                                              uint16_t port,
                                                              std::chrono::milliseconds timeout) {
    auto state = std::make_shared<ConnectState>(context_.getContext());
    state->label = host + ":" + std::to_string(port);
    state->startTime = std::chrono::steady_clock::now();
    auto future = state->promise.get_future();

    asio::dispatch(state->strand, [state, host, port, timeout]() {
        state->timer.expires_after(timeout);
        state->timer.async_wait([state](const asio::error_code& ec) {
            if (ec) {
                return; // Timer cancelled
            }
            complete(state, core::ProbeOutcome::failed(core::ProbeFailure::Timeout, "Timeout"));
        });

        state->resolver.async_resolve(
            host, std::to_string(port),
            [state](const asio::error_code& ec, asio::ip::tcp::resolver::results_type results) {
                if (state->completed) {
                    return;
                }
                if (ec) {
                    complete(state, core::ProbeOutcome::failed(core::ProbeFailure::ResolutionFailed,
                                                               ec.message()));
                    return;
                }

                asio::async_connect(
                    state->socket, results,
                    [state](const asio::error_code& connectEc, const asio::ip::tcp::endpoint&) {
                        if (state->completed) {
                            return;
                        }
                        if (connectEc) {
                            complete(state, core::ProbeOutcome::failed(
                                                core::ProbeFailure::TransportError,
                                                connectEc.message()));
                            return;
                        }

                        auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
                            std::chrono::steady_clock::now() - state->startTime);
                        complete(state, core::ProbeOutcome::succeeded(elapsed));
                    });
            });
    });

    return future;
}

void TcpConnectProbe::complete(const std::shared_ptr<ConnectState>& state,
                               core::ProbeOutcome outcome) {
    if (state->completed) {
        return;
    }
    state->completed = true;

    asio::error_code ignored;
    state->timer.cancel();
    state->resolver.cancel();
    state->socket.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
    state->socket.close(ignored);

    if (outcome.success) {
        spdlog::debug("TCP connect to {} took {:.2f}ms", state->label, outcome.elapsedMs());
    } else {
        spdlog::debug("TCP connect to {} failed: {}", state->label, outcome.detail);
    }

    state->promise.set_value(std::move(outcome));
}

} // namespace netprobe::infra
