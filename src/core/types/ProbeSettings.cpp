#include "core/types/ProbeSettings.hpp"

#include <algorithm>

namespace netprobe::core {

std::vector<std::string> defaultTargets() {
    return {"8.8.8.8", "1.1.1.1", "stun.l.google.com", "localhost"};
}

std::vector<TcpTarget> defaultTcpTargets() {
    return {
        {"google.com", 80},
        {"github.com", 443},
        {"localhost", COMPANION_SERVICE_PORT},
    };
}

std::vector<std::string> ProbeSettings::nameResolutionTargets() const {
    auto count = std::min(dnsTargetCount, targets.size());
    return {targets.begin(), targets.begin() + static_cast<std::ptrdiff_t>(count)};
}

} // namespace netprobe::core
