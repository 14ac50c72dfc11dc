#include <catch2/catch_test_macros.hpp>

#include "infrastructure/network/HttpTransferProvider.hpp"
#include "support/LoopbackHttpServer.hpp"

using namespace netprobe::infra;
using namespace netprobe::core;
using netprobe::testing::LoopbackHttpServer;

namespace {

BandwidthSettings loopbackSettings(uint16_t port) {
    BandwidthSettings settings;
    settings.scheme = "http";
    settings.host = "127.0.0.1";
    settings.port = port;
    settings.sizeKb = 1;
    settings.timeout = std::chrono::milliseconds(3000);
    return settings;
}

} // namespace

TEST_CASE("parseResponseHead", "[HttpTransferProvider]") {
    SECTION("Parses status and content length") {
        std::string data = "HTTP/1.1 200 OK\r\ncontent-length: 1024\r\nServer: x\r\n\r\nbody";
        auto head = parseResponseHead(data);
        REQUIRE(head.has_value());
        REQUIRE(head->statusCode == 200);
        REQUIRE(head->contentLength == std::optional<std::size_t>(1024));
        REQUIRE(data.substr(head->headerLength) == "body");
    }

    SECTION("Content length is optional") {
        auto head = parseResponseHead("HTTP/1.0 204 No Content\r\n\r\n");
        REQUIRE(head.has_value());
        REQUIRE(head->statusCode == 204);
        REQUIRE_FALSE(head->contentLength.has_value());
    }

    SECTION("Incomplete head is rejected") {
        REQUIRE_FALSE(parseResponseHead("HTTP/1.1 200 OK\r\nContent-Length: 5\r\n").has_value());
    }

    SECTION("Non-HTTP status line is rejected") {
        REQUIRE_FALSE(parseResponseHead("SSH-2.0-OpenSSH\r\n\r\n").has_value());
        REQUIRE_FALSE(parseResponseHead("HTTP/1.1 abc OK\r\n\r\n").has_value());
    }
}

TEST_CASE("Transfer URL construction", "[HttpTransferProvider]") {
    BandwidthSettings settings;
    REQUIRE(buildTransferPath(settings) == "/bytes/102400");
    REQUIRE(buildTransferUrl(settings) == "https://httpbin.org/bytes/102400");

    settings.scheme = "http";
    settings.host = "127.0.0.1";
    settings.port = 8080;
    settings.sizeKb = 2;
    REQUIRE(buildTransferUrl(settings) == "http://127.0.0.1:8080/bytes/2048");
}

TEST_CASE("HttpTransferProvider downloads from a loopback server", "[HttpTransferProvider]") {
    AsioContext context(2);
    context.start();
    HttpTransferProvider provider(context);

    REQUIRE(provider.available());
    REQUIRE(provider.name() == "http");

    SECTION("Complete body yields throughput") {
        LoopbackHttpServer server(LoopbackHttpServer::okResponse(1024));
        auto result = provider.downloadAsync(loopbackSettings(server.port())).get();

        REQUIRE(result.success);
        REQUIRE(result.bytesReceived == 1024);
        REQUIRE(result.throughputKbps().has_value());
        REQUIRE(*result.throughputKbps() > 0.0);

        auto request = server.request();
        REQUIRE(request.rfind("GET /bytes/1024 HTTP/1.0\r\n", 0) == 0);
        REQUIRE(request.find("Host: 127.0.0.1:" + std::to_string(server.port())) !=
                std::string::npos);
    }

    SECTION("Error status fails the transfer") {
        LoopbackHttpServer server("HTTP/1.1 503 Service Unavailable\r\nContent-Length: 0\r\n\r\n");
        auto result = provider.downloadAsync(loopbackSettings(server.port())).get();

        REQUIRE_FALSE(result.success);
        REQUIRE(result.errorMessage == "HTTP error: 503");
        REQUIRE_FALSE(result.throughputKbps().has_value());
    }

    SECTION("Short body fails the transfer") {
        LoopbackHttpServer server("HTTP/1.1 200 OK\r\nContent-Length: 2048\r\n\r\n" +
                                 std::string(100, 'x'));
        auto result = provider.downloadAsync(loopbackSettings(server.port())).get();

        REQUIRE_FALSE(result.success);
        REQUIRE(result.errorMessage.find("truncated") != std::string::npos);
    }

    SECTION("Refused connection fails the transfer") {
        uint16_t port = 0;
        {
            asio::ip::tcp::acceptor probe(context.getContext(),
                                          {asio::ip::address_v4::loopback(), 0});
            port = probe.local_endpoint().port();
        }
        auto result = provider.downloadAsync(loopbackSettings(port)).get();

        REQUIRE_FALSE(result.success);
        REQUIRE(result.errorMessage.rfind("Connect failed", 0) == 0);
    }

    SECTION("Unsupported scheme fails immediately") {
        auto settings = loopbackSettings(1);
        settings.scheme = "ftp";
        auto result = provider.downloadAsync(settings).get();

        REQUIRE_FALSE(result.success);
        REQUIRE(result.errorMessage == "Unsupported scheme: ftp");
    }

    context.stop();
}

TEST_CASE("Transfer provider selection", "[HttpTransferProvider]") {
    AsioContext context(1);

    SECTION("Disabled bandwidth yields an unavailable provider") {
        BandwidthSettings settings;
        settings.enabled = false;
        auto provider = makeTransferProvider(context, settings);

        REQUIRE_FALSE(provider->available());
        auto result = provider->downloadAsync(settings).get();
        REQUIRE_FALSE(result.success);
        REQUIRE(result.errorMessage ==
                "Transfer capability not available: disabled by configuration");
    }

    SECTION("Unknown scheme yields an unavailable provider") {
        BandwidthSettings settings;
        settings.scheme = "gopher";
        REQUIRE_FALSE(makeTransferProvider(context, settings)->available());
    }

    SECTION("Default settings yield the HTTP provider") {
        auto provider = makeTransferProvider(context, BandwidthSettings{});
        REQUIRE(provider->available());
        REQUIRE(provider->name() == "http");
    }
}
