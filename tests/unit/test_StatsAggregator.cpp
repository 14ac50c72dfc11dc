#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "monitoring/StatsAggregator.hpp"
#include "support/FakeProbes.hpp"

using namespace netprobe::monitoring;
using namespace netprobe::core;
using netprobe::testing::successMs;
using netprobe::testing::timeoutOutcome;
using Catch::Matchers::WithinAbs;

namespace {

CycleReport reportWith(std::vector<ProbeOutcome> outcomes) {
    CycleReport report;
    report.timestamp = std::chrono::system_clock::now();
    int index = 0;
    for (auto& outcome : outcomes) {
        report.reachability.push_back({"target" + std::to_string(index++), std::move(outcome)});
    }
    return report;
}

} // namespace

TEST_CASE("StatsAggregator initial state", "[StatsAggregator]") {
    CumulativeStats stats;

    REQUIRE(stats.totalCycles == 0);
    REQUIRE(stats.totalPings() == 0);
    REQUIRE(stats.avgLatencyMs == 0.0);
    REQUIRE(stats.packetLossPercent == 0.0);
    REQUIRE_FALSE(stats.hasLatencyData());
    REQUIRE_FALSE(stats.minLatencyMs.has_value());
    REQUIRE_FALSE(stats.maxLatencyMs.has_value());
}

TEST_CASE("StatsAggregator folds a mixed cycle", "[StatsAggregator]") {
    StatsAggregator aggregator;
    CumulativeStats stats;

    aggregator.update(stats, reportWith({successMs(10.0), successMs(30.0), successMs(20.0),
                                         timeoutOutcome()}));

    REQUIRE(stats.totalCycles == 1);
    REQUIRE(stats.successfulPings == 3);
    REQUIRE(stats.failedPings == 1);
    REQUIRE_THAT(stats.avgLatencyMs, WithinAbs(20.0, 1e-9));
    REQUIRE_THAT(*stats.minLatencyMs, WithinAbs(10.0, 1e-9));
    REQUIRE_THAT(*stats.maxLatencyMs, WithinAbs(30.0, 1e-9));
    REQUIRE_THAT(stats.packetLossPercent, WithinAbs(25.0, 1e-9));
}

TEST_CASE("StatsAggregator counts cycles and pings across updates", "[StatsAggregator]") {
    StatsAggregator aggregator;
    CumulativeStats stats;

    constexpr int cycles = 5;
    for (int i = 0; i < cycles; ++i) {
        aggregator.update(stats, reportWith({successMs(15.0), timeoutOutcome(), successMs(25.0),
                                             successMs(35.0)}));
    }

    REQUIRE(stats.totalCycles == cycles);
    REQUIRE(stats.totalPings() == cycles * 4);
    REQUIRE(stats.successfulPings == cycles * 3);
    REQUIRE(stats.failedPings == cycles);
    REQUIRE_THAT(stats.packetLossPercent, WithinAbs(25.0, 1e-9));
}

TEST_CASE("StatsAggregator average reflects the latest cycle only", "[StatsAggregator]") {
    StatsAggregator aggregator;
    CumulativeStats stats;

    aggregator.update(stats, reportWith({successMs(100.0), successMs(200.0)}));
    REQUIRE_THAT(stats.avgLatencyMs, WithinAbs(150.0, 1e-9));

    aggregator.update(stats, reportWith({successMs(10.0), successMs(20.0)}));
    REQUIRE_THAT(stats.avgLatencyMs, WithinAbs(15.0, 1e-9));

    SECTION("A cycle without successes leaves the average untouched") {
        aggregator.update(stats, reportWith({timeoutOutcome(), timeoutOutcome()}));
        REQUIRE_THAT(stats.avgLatencyMs, WithinAbs(15.0, 1e-9));
        REQUIRE(stats.totalCycles == 3);
    }

    SECTION("Min and max span every cycle") {
        REQUIRE_THAT(*stats.minLatencyMs, WithinAbs(10.0, 1e-9));
        REQUIRE_THAT(*stats.maxLatencyMs, WithinAbs(200.0, 1e-9));
    }
}

TEST_CASE("StatsAggregator handles all-failure cycles", "[StatsAggregator]") {
    StatsAggregator aggregator;
    CumulativeStats stats;

    aggregator.update(stats, reportWith({timeoutOutcome(), timeoutOutcome(), timeoutOutcome(),
                                         timeoutOutcome()}));

    REQUIRE(stats.totalCycles == 1);
    REQUIRE(stats.failedPings == 4);
    REQUIRE(stats.successfulPings == 0);
    REQUIRE(stats.packetLossPercent == 100.0);
    REQUIRE(stats.avgLatencyMs == 0.0);
    REQUIRE_FALSE(stats.hasLatencyData());
}

TEST_CASE("StatsAggregator with an empty reachability list", "[StatsAggregator]") {
    StatsAggregator aggregator;
    CumulativeStats stats;

    aggregator.update(stats, reportWith({}));

    REQUIRE(stats.totalCycles == 1);
    REQUIRE(stats.totalPings() == 0);
    REQUIRE(stats.packetLossPercent == 0.0);
}

TEST_CASE("StatsAggregator keeps invariants", "[StatsAggregator]") {
    StatsAggregator aggregator;
    CumulativeStats stats;

    std::vector<std::vector<ProbeOutcome>> cycles = {
        {successMs(5.0), timeoutOutcome()},
        {timeoutOutcome(), timeoutOutcome()},
        {successMs(120.0), successMs(0.2), successMs(48.0)},
        {},
        {successMs(60.0)},
    };

    for (auto& outcomes : cycles) {
        aggregator.update(stats, reportWith(outcomes));

        REQUIRE(stats.packetLossPercent >= 0.0);
        REQUIRE(stats.packetLossPercent <= 100.0);
        if (stats.hasLatencyData()) {
            REQUIRE(stats.maxLatencyMs.has_value());
            REQUIRE(*stats.minLatencyMs <= *stats.maxLatencyMs);
        }
    }

    REQUIRE(stats.totalCycles == static_cast<int64_t>(cycles.size()));
    REQUIRE_THAT(*stats.minLatencyMs, WithinAbs(0.2, 1e-9));
    REQUIRE_THAT(*stats.maxLatencyMs, WithinAbs(120.0, 1e-9));
}

TEST_CASE("StatsAggregator packet loss helper", "[StatsAggregator]") {
    REQUIRE(StatsAggregator::packetLossPercent(0, 0) == 0.0);
    REQUIRE(StatsAggregator::packetLossPercent(10, 0) == 0.0);
    REQUIRE(StatsAggregator::packetLossPercent(0, 10) == 100.0);
    REQUIRE_THAT(StatsAggregator::packetLossPercent(199, 1), WithinAbs(0.5, 1e-9));
}
