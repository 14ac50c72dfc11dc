#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "infrastructure/export/ResultExporter.hpp"
#include "monitoring/MonitorLoop.hpp"
#include "monitoring/ReadinessAnalyzer.hpp"
#include "support/FakeProbes.hpp"

#include <filesystem>
#include <fstream>

using namespace netprobe::monitoring;
using namespace netprobe::core;
using namespace netprobe::testing;
using netprobe::infra::ResultExporter;
using Catch::Matchers::WithinAbs;

namespace {

class SessionFixture {
public:
    SessionFixture()
        : orchestrator_(std::make_unique<CycleOrchestrator>(testSettings(), BandwidthSettings{},
                                                            fakes.probeSet())) {}

    /// Runs the loop until the cumulative cycle count reaches `totalCycles`.
    void runUntil(int64_t totalCycles) {
        MonitorLoop loop(*orchestrator_, stats, history);
        loop.setCycleCallback([&loop, totalCycles](const CycleReport&,
                                                   const CumulativeStats& current) {
            if (current.totalCycles >= totalCycles) {
                loop.stop();
            }
        });
        loop.run(std::chrono::milliseconds(1));
    }

    FakeProbeSet fakes;
    CumulativeStats stats;
    ResultHistory history;

private:
    std::unique_ptr<CycleOrchestrator> orchestrator_;
};

} // namespace

TEST_CASE("Healthy network session", "[Integration][Session]") {
    SessionFixture session;
    session.fakes.reachability->script.set("8.8.8.8", successMs(30.0));
    session.fakes.reachability->script.set("1.1.1.1", successMs(20.0));
    session.fakes.reachability->script.set("stun.l.google.com", successMs(40.0));
    session.fakes.reachability->script.set("localhost", successMs(30.0));

    session.runUntil(5);

    REQUIRE(session.stats.totalCycles == 5);
    REQUIRE(session.stats.totalPings() == 20);
    REQUIRE(session.stats.packetLossPercent == 0.0);
    REQUIRE_THAT(session.stats.avgLatencyMs, WithinAbs(30.0, 1e-9));
    REQUIRE_THAT(*session.stats.minLatencyMs, WithinAbs(20.0, 1e-9));
    REQUIRE_THAT(*session.stats.maxLatencyMs, WithinAbs(40.0, 1e-9));

    auto assessment = ReadinessAnalyzer().assess(session.stats);
    REQUIRE(assessment.overall == ReadinessVerdict::Ready);
    REQUIRE(assessment.recommendations.empty());
}

TEST_CASE("Session against an unreachable target", "[Integration][Session]") {
    SessionFixture session;
    session.fakes.reachability->script.set("stun.l.google.com", timeoutOutcome());
    session.fakes.reachability->script.setDefault(successMs(250.0));

    session.runUntil(4);

    REQUIRE(session.stats.successfulPings == 12);
    REQUIRE(session.stats.failedPings == 4);
    REQUIRE_THAT(session.stats.packetLossPercent, WithinAbs(25.0, 1e-9));

    auto assessment = ReadinessAnalyzer().assess(session.stats);
    REQUIRE(assessment.latency == ReadinessBand::Poor);
    REQUIRE(assessment.stability == ReadinessBand::Poor);
    REQUIRE(assessment.overall == ReadinessVerdict::NotReady);
    REQUIRE(assessment.recommendations.size() == 2);
}

TEST_CASE("Offline session keeps running and exports nulls", "[Integration][Session]") {
    SessionFixture session;
    session.fakes.reachability->script.setDefault(timeoutOutcome());
    session.fakes.tcpConnect->script.setDefault(
        ProbeOutcome::failed(ProbeFailure::TransportError, "Network is unreachable"));
    session.fakes.nameResolver->script.setDefault(
        ProbeOutcome::failed(ProbeFailure::ResolutionFailed, "Host not found"));
    session.fakes.transfer->isAvailable = false;

    session.runUntil(3);

    REQUIRE(session.stats.totalCycles == 3);
    REQUIRE(session.stats.packetLossPercent == 100.0);
    REQUIRE_FALSE(session.stats.hasLatencyData());

    auto assessment = ReadinessAnalyzer().assess(session.stats);
    REQUIRE(assessment.latency == ReadinessBand::Unknown);
    REQUIRE(assessment.overall == ReadinessVerdict::NotReady);

    auto doc = ResultExporter::buildDocument(session.history.records(), session.stats);
    REQUIRE(doc["results"].size() == 3);
    for (const auto& result : doc["results"]) {
        REQUIRE(result["bandwidth"].is_null());
        for (const auto& [label, value] : result["ping_results"].items()) {
            REQUIRE(value.is_null());
        }
    }
    REQUIRE(doc["stats"]["min_latency"].is_null());
    REQUIRE(doc["stats"]["packet_loss"] == 100.0);
}

TEST_CASE("Recovering network session", "[Integration][Session]") {
    SessionFixture session;
    session.fakes.reachability->script.setDefault(timeoutOutcome());
    session.runUntil(2);
    REQUIRE_FALSE(session.stats.hasLatencyData());

    session.fakes.reachability->script.setDefault(successMs(45.0));
    session.runUntil(5);

    REQUIRE(session.stats.totalCycles == 5);
    REQUIRE(session.history.size() == 5);
    REQUIRE_THAT(session.stats.avgLatencyMs, WithinAbs(45.0, 1e-9));
    REQUIRE_THAT(session.stats.packetLossPercent, WithinAbs(40.0, 1e-9));
}

TEST_CASE("Session export round trip through a file", "[Integration][Session]") {
    SessionFixture session;
    session.fakes.tcpConnect->script.set(
        "localhost:9000", ProbeOutcome::failed(ProbeFailure::TransportError, "refused"));
    session.runUntil(2);

    auto dir = std::filesystem::temp_directory_path() / "netprobe_session_test";
    std::filesystem::remove_all(dir);
    auto path = dir / "results.json";

    REQUIRE(ResultExporter::writeToFile(path, session.history.records(), session.stats));

    std::ifstream file(path);
    auto doc = nlohmann::json::parse(file);

    REQUIRE(doc["results"].size() == 2);
    REQUIRE(doc["results"][0]["tcp_results"]["google.com:80"] == 20.0);
    REQUIRE(doc["results"][0]["tcp_results"]["localhost:9000"].is_null());
    REQUIRE(doc["results"][1]["dns_resolution"].size() == 2);
    REQUIRE_THAT(doc["results"][1]["bandwidth"].get<double>(), WithinAbs(8192.0, 1e-6));
    REQUIRE(doc["stats"]["total_tests"] == 2);
    REQUIRE(doc["stats"]["successful_pings"] == 8);

    std::filesystem::remove_all(dir);
}
