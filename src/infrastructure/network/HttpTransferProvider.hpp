#pragma once

#include "core/services/ITransferProvider.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <asio.hpp>
#include <asio/ssl.hpp>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace netprobe::infra {

/**
 * @brief Status line and framing information of an HTTP response.
 */
struct HttpResponseHead {
    int statusCode{0};                       ///< HTTP status code (e.g. 200)
    std::size_t headerLength{0};             ///< Bytes up to and including the blank line
    std::optional<std::size_t> contentLength; ///< Declared body length, if any
};

/**
 * @brief Parses the head of a raw HTTP/1.x response.
 * @param data Response bytes received so far.
 * @return Parsed head, or std::nullopt if the head is incomplete or malformed.
 */
std::optional<HttpResponseHead> parseResponseHead(std::string_view data);

/**
 * @brief Builds the download URL for the configured endpoint.
 * @return URL such as "https://httpbin.org/bytes/102400".
 */
std::string buildTransferUrl(const core::BandwidthSettings& settings);

/**
 * @brief Builds the request path for the configured payload size.
 */
std::string buildTransferPath(const core::BandwidthSettings& settings);

/**
 * @brief Bulk transfer over HTTP or HTTPS using Asio and OpenSSL.
 *
 * Issues an HTTP/1.0 GET with "Connection: close" and reads the response to
 * end-of-stream under a single deadline that covers resolution, connect, TLS
 * handshake and the download. Only a 2xx response whose body is complete
 * counts as success.
 */
class HttpTransferProvider : public core::ITransferProvider {
public:
    /**
     * @brief Constructs the provider and its TLS context.
     * @param context I/O pool for the asynchronous transfer.
     * @throws std::system_error if the TLS context cannot be initialised.
     */
    explicit HttpTransferProvider(AsioContext& context);

    bool available() const override { return true; }
    std::string name() const override { return "http"; }

    std::future<core::TransferResult> downloadAsync(
        const core::BandwidthSettings& settings) override;

private:
    AsioContext& context_;
    asio::ssl::context sslContext_;
};

/**
 * @brief Provider used when bulk transfers are not possible.
 *
 * Every request fails immediately with an "unavailable" message.
 */
class UnavailableTransferProvider : public core::ITransferProvider {
public:
    explicit UnavailableTransferProvider(std::string reason);

    bool available() const override { return false; }
    std::string name() const override { return "unavailable"; }

    std::future<core::TransferResult> downloadAsync(
        const core::BandwidthSettings& settings) override;

    const std::string& reason() const { return reason_; }

private:
    std::string reason_;
};

/**
 * @brief Chooses the transfer provider for the given settings.
 *
 * Returns an UnavailableTransferProvider when bandwidth tests are disabled,
 * the scheme is unsupported, or the TLS context cannot be created.
 */
std::shared_ptr<core::ITransferProvider> makeTransferProvider(
    AsioContext& context, const core::BandwidthSettings& settings);

} // namespace netprobe::infra
