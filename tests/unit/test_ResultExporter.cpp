#include <catch2/catch_test_macros.hpp>

#include "infrastructure/export/ResultExporter.hpp"

#include <filesystem>
#include <fstream>

using namespace netprobe::infra;
using namespace netprobe::core;

namespace {

CycleReport sampleReport() {
    CycleReport report;
    report.timestamp = std::chrono::system_clock::now();
    report.reachability = {
        {"8.8.8.8", ProbeOutcome::succeeded(std::chrono::microseconds(12500))},
        {"localhost", ProbeOutcome::failed(ProbeFailure::Timeout, "Timeout")},
    };
    report.tcpConnect = {
        {"google.com:80", ProbeOutcome::succeeded(std::chrono::microseconds(30000))},
        {"localhost:9000", ProbeOutcome::failed(ProbeFailure::TransportError, "refused")},
    };
    report.bandwidthKbps = 8192.0;
    report.nameResolution = {
        {"8.8.8.8", ProbeOutcome::succeeded(std::chrono::microseconds(0), "8.8.8.8")},
    };
    return report;
}

} // namespace

TEST_CASE("ResultExporter report serialization", "[ResultExporter]") {
    auto j = ResultExporter::reportToJson(sampleReport());

    SECTION("Keys appear in a stable order") {
        std::vector<std::string> keys;
        for (const auto& item : j.items()) {
            keys.push_back(item.key());
        }
        REQUIRE(keys == std::vector<std::string>{"timestamp", "ping_results", "tcp_results",
                                                 "bandwidth", "dns_resolution"});
    }

    SECTION("Successful probes carry milliseconds") {
        REQUIRE(j["ping_results"]["8.8.8.8"] == 12.5);
        REQUIRE(j["tcp_results"]["google.com:80"] == 30.0);
        REQUIRE(j["bandwidth"] == 8192.0);
    }

    SECTION("Failures are null, distinct from a measured zero") {
        REQUIRE(j["ping_results"]["localhost"].is_null());
        REQUIRE(j["tcp_results"]["localhost:9000"].is_null());
        REQUIRE(j["dns_resolution"]["8.8.8.8"].is_number());
        REQUIRE(j["dns_resolution"]["8.8.8.8"] == 0.0);
    }

    SECTION("Missing bandwidth is null") {
        auto report = sampleReport();
        report.bandwidthKbps.reset();
        REQUIRE(ResultExporter::reportToJson(report)["bandwidth"].is_null());
    }
}

TEST_CASE("ResultExporter statistics serialization", "[ResultExporter]") {
    SECTION("Fresh statistics have null latency bounds") {
        auto j = ResultExporter::statsToJson(CumulativeStats{});
        REQUIRE(j["total_tests"] == 0);
        REQUIRE(j["min_latency"].is_null());
        REQUIRE(j["max_latency"].is_null());
        REQUIRE(j["packet_loss"] == 0.0);
    }

    SECTION("Populated statistics") {
        CumulativeStats stats;
        stats.totalCycles = 3;
        stats.successfulPings = 10;
        stats.failedPings = 2;
        stats.avgLatencyMs = 21.5;
        stats.minLatencyMs = 4.0;
        stats.maxLatencyMs = 80.0;
        stats.packetLossPercent = 100.0 * 2 / 12;

        auto j = ResultExporter::statsToJson(stats);
        REQUIRE(j["total_tests"] == 3);
        REQUIRE(j["successful_pings"] == 10);
        REQUIRE(j["failed_pings"] == 2);
        REQUIRE(j["avg_latency"] == 21.5);
        REQUIRE(j["min_latency"] == 4.0);
        REQUIRE(j["max_latency"] == 80.0);
    }
}

TEST_CASE("ResultExporter document", "[ResultExporter]") {
    std::vector<CycleReport> history{sampleReport(), sampleReport()};
    auto doc = ResultExporter::buildDocument(history, CumulativeStats{});

    REQUIRE(doc["results"].size() == 2);
    REQUIRE(doc.contains("stats"));
    REQUIRE(doc["generated_at"].is_string());

    SECTION("Empty history yields an empty results array") {
        auto empty = ResultExporter::buildDocument({}, CumulativeStats{});
        REQUIRE(empty["results"].is_array());
        REQUIRE(empty["results"].empty());
    }
}

TEST_CASE("ResultExporter writes files", "[ResultExporter]") {
    auto dir = std::filesystem::temp_directory_path() / "netprobe_export_test";
    std::filesystem::remove_all(dir);
    auto path = dir / "nested" / "results.json";

    REQUIRE(ResultExporter::writeToFile(path, {sampleReport()}, CumulativeStats{}));
    REQUIRE(std::filesystem::exists(path));

    std::ifstream file(path);
    auto parsed = nlohmann::json::parse(file);
    REQUIRE(parsed["results"].size() == 1);
    REQUIRE(parsed["results"][0]["ping_results"]["localhost"].is_null());

    std::filesystem::remove_all(dir);
}
