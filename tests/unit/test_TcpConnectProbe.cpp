#include <catch2/catch_test_macros.hpp>

#include "infrastructure/network/TcpConnectProbe.hpp"

using namespace netprobe::infra;
using namespace netprobe::core;

namespace {

uint16_t closedLoopbackPort(asio::io_context& io) {
    asio::ip::tcp::acceptor acceptor(io, {asio::ip::address_v4::loopback(), 0});
    auto port = acceptor.local_endpoint().port();
    acceptor.close();
    return port;
}

} // namespace

TEST_CASE("TcpConnectProbe connects to a listening port", "[TcpConnectProbe]") {
    AsioContext context(2);
    context.start();

    asio::ip::tcp::acceptor acceptor(context.getContext(),
                                     {asio::ip::address_v4::loopback(), 0});
    auto port = acceptor.local_endpoint().port();

    TcpConnectProbe probe(context);
    auto outcome = probe.connectAsync("127.0.0.1", port, std::chrono::milliseconds(2000)).get();

    REQUIRE(outcome.success);
    REQUIRE(outcome.failure == ProbeFailure::None);
    REQUIRE(outcome.elapsedMs() < 2000.0);

    acceptor.close();
    context.stop();
}

TEST_CASE("TcpConnectProbe reports refused connections", "[TcpConnectProbe]") {
    AsioContext context(2);
    context.start();
    auto port = closedLoopbackPort(context.getContext());

    TcpConnectProbe probe(context);
    auto outcome = probe.connectAsync("127.0.0.1", port, std::chrono::milliseconds(2000)).get();

    REQUIRE_FALSE(outcome.success);
    REQUIRE(outcome.failure == ProbeFailure::TransportError);
    REQUIRE_FALSE(outcome.detail.empty());

    context.stop();
}

TEST_CASE("TcpConnectProbe reports unresolvable hosts", "[TcpConnectProbe]") {
    AsioContext context(2);
    context.start();

    TcpConnectProbe probe(context);
    auto outcome =
        probe.connectAsync("netprobe.invalid", 80, std::chrono::milliseconds(2000)).get();

    REQUIRE_FALSE(outcome.success);
    REQUIRE((outcome.failure == ProbeFailure::ResolutionFailed ||
             outcome.failure == ProbeFailure::Timeout));

    context.stop();
}

TEST_CASE("TcpConnectProbe settles every probe exactly once", "[TcpConnectProbe]") {
    AsioContext context(4);
    context.start();

    asio::ip::tcp::acceptor acceptor(context.getContext(),
                                     {asio::ip::address_v4::loopback(), 0});
    auto openPort = acceptor.local_endpoint().port();
    auto closedPort = closedLoopbackPort(context.getContext());

    TcpConnectProbe probe(context);
    std::vector<std::future<ProbeOutcome>> futures;
    for (int i = 0; i < 8; ++i) {
        auto port = (i % 2 == 0) ? openPort : closedPort;
        futures.push_back(probe.connectAsync("127.0.0.1", port, std::chrono::milliseconds(2000)));
    }

    for (std::size_t i = 0; i < futures.size(); ++i) {
        auto outcome = futures[i].get();
        REQUIRE(outcome.success == (i % 2 == 0));
    }

    acceptor.close();
    context.stop();
}
