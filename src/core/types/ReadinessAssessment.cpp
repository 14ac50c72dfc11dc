#include "core/types/ReadinessAssessment.hpp"

namespace netprobe::core {

std::string ReadinessAssessment::bandToString(ReadinessBand band) {
    switch (band) {
    case ReadinessBand::Unknown:
        return "unknown";
    case ReadinessBand::Excellent:
        return "excellent";
    case ReadinessBand::Good:
        return "good";
    case ReadinessBand::Fair:
        return "fair";
    case ReadinessBand::Poor:
        return "poor";
    }
    return "unknown";
}

std::string ReadinessAssessment::verdictToString(ReadinessVerdict verdict) {
    switch (verdict) {
    case ReadinessVerdict::Unknown:
        return "unknown";
    case ReadinessVerdict::Ready:
        return "ready";
    case ReadinessVerdict::Marginal:
        return "marginal";
    case ReadinessVerdict::NotReady:
        return "not_ready";
    }
    return "unknown";
}

} // namespace netprobe::core
