#include "core/types/ProbeOutcome.hpp"

namespace netprobe::core {

ProbeOutcome ProbeOutcome::succeeded(std::chrono::microseconds elapsed, std::string detail) {
    ProbeOutcome outcome;
    outcome.success = true;
    outcome.elapsed = elapsed < std::chrono::microseconds::zero() ? std::chrono::microseconds::zero()
                                                                 : elapsed;
    outcome.failure = ProbeFailure::None;
    outcome.detail = std::move(detail);
    return outcome;
}

ProbeOutcome ProbeOutcome::failed(ProbeFailure failure, std::string message) {
    ProbeOutcome outcome;
    outcome.success = false;
    outcome.elapsed = std::chrono::microseconds::zero();
    outcome.failure = failure == ProbeFailure::None ? ProbeFailure::TransportError : failure;
    outcome.detail = std::move(message);
    return outcome;
}

std::string ProbeOutcome::failureToString() const {
    return probeFailureToString(failure);
}

std::string ProbeOutcome::probeFailureToString(ProbeFailure failure) {
    switch (failure) {
    case ProbeFailure::None:
        return "None";
    case ProbeFailure::Timeout:
        return "Timeout";
    case ProbeFailure::TransportError:
        return "TransportError";
    case ProbeFailure::ResolutionFailed:
        return "ResolutionFailed";
    case ProbeFailure::ProcessFailed:
        return "ProcessFailed";
    }
    return "Unknown";
}

} // namespace netprobe::core
