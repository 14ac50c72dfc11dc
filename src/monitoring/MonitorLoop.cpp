#include "monitoring/MonitorLoop.hpp"

#include <spdlog/spdlog.h>

namespace netprobe::monitoring {

MonitorLoop::MonitorLoop(CycleOrchestrator& orchestrator, core::CumulativeStats& stats,
                         ResultHistory& history)
    : orchestrator_(orchestrator), stats_(stats), history_(history) {}

void MonitorLoop::run(std::chrono::milliseconds interval,
                      std::optional<std::chrono::milliseconds> maxDuration) {
    if (running_.exchange(true)) {
        spdlog::warn("Monitor loop already running");
        return;
    }

    auto startTime = std::chrono::steady_clock::now();
    spdlog::info("Monitor loop started, interval {}ms", interval.count());

    while (!stopRequested_) {
        if (maxDuration && std::chrono::steady_clock::now() - startTime > *maxDuration) {
            spdlog::info("Monitor loop reached its duration limit");
            break;
        }

        executeCycle();

        if (!sleepFor(interval)) {
            break;
        }
    }

    if (stopRequested_) {
        spdlog::info("Monitor loop stopped on request");
    }

    {
        std::lock_guard lock(mutex_);
        running_ = false;
        stopRequested_ = false;
    }

    spdlog::info("Monitor loop finished after {} cycles", stats_.totalCycles);
    if (onFinish_) {
        onFinish_(stats_);
    }
}

const core::CycleReport& MonitorLoop::runOnce() {
    return executeCycle();
}

void MonitorLoop::stop() {
    {
        std::lock_guard lock(mutex_);
        if (!running_) {
            return;
        }
        stopRequested_ = true;
    }
    wakeup_.notify_all();
}

const core::CycleReport& MonitorLoop::executeCycle() {
    core::CycleReport report;
    try {
        report = orchestrator_.runCycle();
    } catch (const std::exception& e) {
        spdlog::error("Cycle failed: {}", e.what());
        report = orchestrator_.failureReport(e.what());
    }

    aggregator_.update(stats_, report);
    const auto& recorded = history_.append(std::move(report));

    if (onCycle_) {
        try {
            onCycle_(recorded, stats_);
        } catch (const std::exception& e) {
            spdlog::error("Cycle callback failed: {}", e.what());
        }
    }

    return recorded;
}

bool MonitorLoop::sleepFor(std::chrono::milliseconds interval) {
    std::unique_lock lock(mutex_);
    return !wakeup_.wait_for(lock, interval, [this]() { return stopRequested_.load(); });
}

} // namespace netprobe::monitoring
