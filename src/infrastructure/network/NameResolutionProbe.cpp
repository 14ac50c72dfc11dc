#include "infrastructure/network/NameResolutionProbe.hpp"

#include <spdlog/spdlog.h>

namespace netprobe::infra {

struct NameResolutionProbe::ResolveState {
    explicit ResolveState(asio::io_context& io)
        : strand(asio::make_strand(io)), resolver(strand), timer(strand) {}

    void complete(core::ProbeOutcome outcome) {
        if (completed) {
            return;
        }
        completed = true;
        timer.cancel();
        resolver.cancel();
        promise.set_value(std::move(outcome));
    }

    asio::strand<asio::io_context::executor_type> strand;
    asio::ip::tcp::resolver resolver;
    asio::steady_timer timer;
    std::chrono::steady_clock::time_point startTime;
    std::promise<core::ProbeOutcome> promise;
    bool completed{false};
};

NameResolutionProbe::NameResolutionProbe(AsioContext& context) : context_(context) {}

std::future<core::ProbeOutcome> NameResolutionProbe::resolveAsync(
    const std::string& target, std::chrono::milliseconds timeout) {
    if (target.empty()) {
        std::promise<core::ProbeOutcome> failed;
        failed.set_value(
            core::ProbeOutcome::failed(core::ProbeFailure::ResolutionFailed, "Empty target"));
        return failed.get_future();
    }

    auto state = std::make_shared<ResolveState>(context_.getContext());
    state->startTime = std::chrono::steady_clock::now();
    auto future = state->promise.get_future();

    asio::dispatch(state->strand, [state, target, timeout]() {
        state->timer.expires_after(timeout);
        state->timer.async_wait([state, target](const asio::error_code& ec) {
            if (ec) {
                return;
            }
            spdlog::debug("Resolution of {} timed out", target);
            state->complete(core::ProbeOutcome::failed(core::ProbeFailure::Timeout, "Timeout"));
        });

        state->resolver.async_resolve(
            target, "0",
            [state, target](const asio::error_code& ec,
                            asio::ip::tcp::resolver::results_type results) {
                if (state->completed) {
                    return;
                }
                if (ec || results.empty()) {
                    auto reason = ec ? ec.message() : std::string("No addresses");
                    spdlog::debug("Resolution of {} failed: {}", target, reason);
                    state->complete(
                        core::ProbeOutcome::failed(core::ProbeFailure::ResolutionFailed, reason));
                    return;
                }

                auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
                    std::chrono::steady_clock::now() - state->startTime);
                auto address = results.begin()->endpoint().address().to_string();
                spdlog::debug("Resolved {} to {} in {:.2f}ms", target, address,
                              static_cast<double>(elapsed.count()) / 1000.0);
                state->complete(core::ProbeOutcome::succeeded(elapsed, address));
            });
    });

    return future;
}

} // namespace netprobe::infra
