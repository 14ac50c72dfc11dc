/**
 * @file ProbeGroup.hpp
 * @brief Fan-out/fan-in helper for concurrently running probes.
 */

#pragma once

#include "core/types/CycleReport.hpp"

#include <chrono>
#include <functional>
#include <future>
#include <string>
#include <vector>

namespace netprobe::monitoring {

/**
 * @brief Starts a set of probes and waits for all of them.
 *
 * Each spawned probe is tagged with a label. joinAll() blocks until every
 * probe has settled and returns the outcomes in spawn order. A probe that
 * throws while starting or stores an exception is recorded as a failure, as
 * is one still pending once its timeout plus a grace period has passed since
 * it was spawned. joinAll() itself does not throw.
 */
class ProbeGroup {
public:
    using Starter = std::function<std::future<core::ProbeOutcome>()>;

    /// Extra time granted beyond a probe's own timeout before it is abandoned.
    static constexpr std::chrono::milliseconds JOIN_GRACE{1000};

    /**
     * @brief Starts a probe immediately.
     * @param label Target label recorded with the outcome.
     * @param timeout The probe's own timeout.
     * @param start Callable that starts the probe and returns its future.
     */
    void spawn(std::string label, std::chrono::milliseconds timeout, const Starter& start);

    /**
     * @brief Waits for every spawned probe and collects the outcomes.
     *
     * The group is empty afterwards and can be reused.
     */
    std::vector<core::LabeledOutcome> joinAll();

    /**
     * @brief Runs a single probe to completion.
     */
    static core::ProbeOutcome runOne(const std::string& label, std::chrono::milliseconds timeout,
                                     const Starter& start);

    std::size_t pending() const { return tasks_.size(); }

private:
    struct Task {
        std::string label;
        std::chrono::milliseconds timeout;
        std::chrono::steady_clock::time_point spawnedAt;
        std::future<core::ProbeOutcome> future;
    };

    static core::ProbeOutcome await(Task& task);

    std::vector<Task> tasks_;
};

} // namespace netprobe::monitoring
