#include "core/types/CycleReport.hpp"

#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace netprobe::core {

namespace {

const ProbeOutcome* findByLabel(const std::vector<LabeledOutcome>& outcomes,
                                const std::string& label) {
    auto it = std::find_if(outcomes.begin(), outcomes.end(),
                           [&label](const LabeledOutcome& entry) { return entry.label == label; });
    return it != outcomes.end() ? &it->outcome : nullptr;
}

} // namespace

std::string TcpTarget::label() const {
    return host + ":" + std::to_string(port);
}

const ProbeOutcome* CycleReport::findReachability(const std::string& target) const {
    return findByLabel(reachability, target);
}

const ProbeOutcome* CycleReport::findTcpConnect(const std::string& label) const {
    return findByLabel(tcpConnect, label);
}

const ProbeOutcome* CycleReport::findNameResolution(const std::string& target) const {
    return findByLabel(nameResolution, target);
}

int CycleReport::successfulReachabilityCount() const {
    return static_cast<int>(std::count_if(reachability.begin(), reachability.end(),
                                          [](const LabeledOutcome& entry) {
                                              return entry.outcome.success;
                                          }));
}

std::string formatIsoTimestamp(std::chrono::system_clock::time_point timePoint) {
    auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(timePoint);
    auto micros =
        std::chrono::duration_cast<std::chrono::microseconds>(timePoint - seconds).count();
    if (micros < 0) {
        micros += 1000000;
        seconds -= std::chrono::seconds(1);
    }

    std::time_t time = std::chrono::system_clock::to_time_t(seconds);
    std::tm localTm{};
    localtime_r(&time, &localTm);

    std::ostringstream oss;
    oss << std::put_time(&localTm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(6)
        << std::setfill('0') << micros;
    return oss.str();
}

} // namespace netprobe::core
