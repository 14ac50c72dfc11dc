#include "monitoring/ProbeGroup.hpp"

#include <spdlog/spdlog.h>

namespace netprobe::monitoring {

void ProbeGroup::spawn(std::string label, std::chrono::milliseconds timeout, const Starter& start) {
    Task task{std::move(label), timeout, std::chrono::steady_clock::now(), {}};
    try {
        task.future = start();
    } catch (const std::exception& e) {
        spdlog::warn("Probe for {} failed to start: {}", task.label, e.what());
        std::promise<core::ProbeOutcome> failed;
        failed.set_value(core::ProbeOutcome::failed(core::ProbeFailure::TransportError, e.what()));
        task.future = failed.get_future();
    }
    tasks_.push_back(std::move(task));
}

std::vector<core::LabeledOutcome> ProbeGroup::joinAll() {
    std::vector<core::LabeledOutcome> outcomes;
    outcomes.reserve(tasks_.size());

    for (auto& task : tasks_) {
        outcomes.push_back({task.label, await(task)});
    }

    tasks_.clear();
    return outcomes;
}

core::ProbeOutcome ProbeGroup::runOne(const std::string& label, std::chrono::milliseconds timeout,
                                      const Starter& start) {
    ProbeGroup group;
    group.spawn(label, timeout, start);
    return group.joinAll().front().outcome;
}

core::ProbeOutcome ProbeGroup::await(Task& task) {
    if (!task.future.valid()) {
        return core::ProbeOutcome::failed(core::ProbeFailure::TransportError,
                                          "Probe returned no result");
    }

    auto deadline = task.spawnedAt + task.timeout + JOIN_GRACE;
    if (task.future.wait_until(deadline) != std::future_status::ready) {
        spdlog::warn("Probe for {} did not settle within {}ms, abandoning", task.label,
                     (task.timeout + JOIN_GRACE).count());
        return core::ProbeOutcome::failed(core::ProbeFailure::Timeout, "Probe did not settle");
    }

    try {
        return task.future.get();
    } catch (const std::exception& e) {
        spdlog::warn("Probe for {} raised: {}", task.label, e.what());
        return core::ProbeOutcome::failed(core::ProbeFailure::TransportError, e.what());
    }
}

} // namespace netprobe::monitoring
