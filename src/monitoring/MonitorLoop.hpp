/**
 * @file MonitorLoop.hpp
 * @brief Repeats measurement cycles at a fixed interval.
 */

#pragma once

#include "core/types/CumulativeStats.hpp"
#include "core/types/CycleReport.hpp"
#include "monitoring/CycleOrchestrator.hpp"
#include "monitoring/ResultHistory.hpp"
#include "monitoring/StatsAggregator.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>

namespace netprobe::monitoring {

/**
 * @brief Runs the orchestrator repeatedly until stopped or out of time.
 *
 * Each iteration runs one full cycle, folds it into the statistics, appends
 * it to the history and then sleeps for the interval. Cycles never overlap.
 * The statistics and history are owned by the caller and must not be touched
 * by anyone else while run() is active.
 */
class MonitorLoop {
public:
    /**
     * @brief Called after each cycle has been folded into the statistics.
     */
    using CycleCallback =
        std::function<void(const core::CycleReport&, const core::CumulativeStats&)>;

    /**
     * @brief Called once when run() terminates, with the final statistics.
     */
    using FinishCallback = std::function<void(const core::CumulativeStats&)>;

    MonitorLoop(CycleOrchestrator& orchestrator, core::CumulativeStats& stats,
                ResultHistory& history);

    MonitorLoop(const MonitorLoop&) = delete;
    MonitorLoop& operator=(const MonitorLoop&) = delete;

    void setCycleCallback(CycleCallback callback) { onCycle_ = std::move(callback); }
    void setFinishCallback(FinishCallback callback) { onFinish_ = std::move(callback); }

    /**
     * @brief Runs cycles until stop() is called or maxDuration has elapsed.
     *
     * The duration is checked at the top of each iteration, so a cycle that
     * has started always completes and is recorded. The sleep between cycles
     * is interrupted by stop(). On return the finish callback receives the
     * final statistics.
     *
     * @param interval Pause between the end of one cycle and the next.
     * @param maxDuration Optional bound on the total run time.
     */
    void run(std::chrono::milliseconds interval,
             std::optional<std::chrono::milliseconds> maxDuration = std::nullopt);

    /**
     * @brief Runs and records exactly one cycle.
     * @return The recorded report.
     */
    const core::CycleReport& runOnce();

    /**
     * @brief Requests termination. Safe to call from any thread.
     *
     * Has no effect while the loop is not running.
     */
    void stop();

    bool isRunning() const { return running_.load(); }
    bool stopRequested() const { return stopRequested_.load(); }

private:
    const core::CycleReport& executeCycle();
    bool sleepFor(std::chrono::milliseconds interval);

    CycleOrchestrator& orchestrator_;
    core::CumulativeStats& stats_;
    ResultHistory& history_;
    StatsAggregator aggregator_;

    CycleCallback onCycle_;
    FinishCallback onFinish_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stopRequested_{false};
    std::mutex mutex_;
    std::condition_variable wakeup_;
};

} // namespace netprobe::monitoring
