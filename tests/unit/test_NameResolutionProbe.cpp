#include <catch2/catch_test_macros.hpp>

#include "infrastructure/network/NameResolutionProbe.hpp"

using namespace netprobe::infra;
using namespace netprobe::core;

TEST_CASE("NameResolutionProbe resolves local names", "[NameResolutionProbe]") {
    AsioContext context(2);
    context.start();
    NameResolutionProbe probe(context);

    SECTION("localhost") {
        auto outcome = probe.resolveAsync("localhost", std::chrono::milliseconds(3000)).get();
        REQUIRE(outcome.success);
        REQUIRE((outcome.detail == "127.0.0.1" || outcome.detail == "::1"));
    }

    SECTION("Numeric addresses resolve to themselves") {
        auto outcome = probe.resolveAsync("8.8.8.8", std::chrono::milliseconds(3000)).get();
        REQUIRE(outcome.success);
        REQUIRE(outcome.detail == "8.8.8.8");
    }

    context.stop();
}

TEST_CASE("NameResolutionProbe failures", "[NameResolutionProbe]") {
    AsioContext context(2);
    context.start();
    NameResolutionProbe probe(context);

    SECTION("Empty target fails immediately") {
        auto future = probe.resolveAsync("", std::chrono::milliseconds(3000));
        REQUIRE(future.wait_for(std::chrono::seconds(0)) == std::future_status::ready);
        auto outcome = future.get();
        REQUIRE_FALSE(outcome.success);
        REQUIRE(outcome.failure == ProbeFailure::ResolutionFailed);
    }

    SECTION("Reserved invalid domain does not resolve") {
        auto outcome =
            probe.resolveAsync("netprobe.invalid", std::chrono::milliseconds(2000)).get();
        REQUIRE_FALSE(outcome.success);
        REQUIRE((outcome.failure == ProbeFailure::ResolutionFailed ||
                 outcome.failure == ProbeFailure::Timeout));
    }

    context.stop();
}
