#include "infrastructure/network/HttpTransferProvider.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>

namespace netprobe::infra {

namespace {

using Strand = asio::strand<asio::io_context::executor_type>;
using TlsStream = asio::ssl::stream<asio::ip::tcp::socket>;

bool equalsIgnoreCase(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

std::string_view trim(std::string_view value) {
    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == ' ' || value.back() == '\t' || value.back() == '\r')) {
        value.remove_suffix(1);
    }
    return value;
}

asio::ip::tcp::socket& lowestLayer(asio::ip::tcp::socket& socket) {
    return socket;
}

asio::ip::tcp::socket& lowestLayer(TlsStream& stream) {
    return stream.next_layer();
}

template <typename Handler>
void handshake(asio::ip::tcp::socket&, Handler&& handler) {
    handler(asio::error_code{});
}

template <typename Handler>
void handshake(TlsStream& stream, Handler&& handler) {
    stream.async_handshake(asio::ssl::stream_base::client, std::forward<Handler>(handler));
}

bool isEndOfStream(const asio::error_code& ec) {
    return ec == asio::error::eof || ec == asio::ssl::error::stream_truncated;
}

/**
 * One download. Resolve, connect, optional TLS handshake, write the request,
 * then read until the peer closes. A deadline timer races the whole chain.
 */
template <typename Stream>
class TransferSession : public std::enable_shared_from_this<TransferSession<Stream>> {
public:
    TransferSession(Strand strand, Stream stream, core::BandwidthSettings settings)
        : strand_(strand), resolver_(strand), stream_(std::move(stream)), timer_(strand),
          settings_(std::move(settings)) {}

    std::future<core::TransferResult> start() {
        auto future = promise_.get_future();
        startTime_ = std::chrono::steady_clock::now();

        asio::dispatch(strand_, [self = this->shared_from_this()]() {
            self->timer_.expires_after(self->settings_.timeout);
            self->timer_.async_wait([self](const asio::error_code& ec) {
                if (ec) {
                    return;
                }
                self->fail("Transfer timed out");
            });
            self->resolve();
        });

        return future;
    }

private:
    void resolve() {
        resolver_.async_resolve(
            settings_.host, std::to_string(settings_.effectivePort()),
            [self = this->shared_from_this()](const asio::error_code& ec,
                                              asio::ip::tcp::resolver::results_type results) {
                if (self->completed_) {
                    return;
                }
                if (ec) {
                    self->fail("Resolve failed: " + ec.message());
                    return;
                }
                self->connect(results);
            });
    }

    void connect(const asio::ip::tcp::resolver::results_type& results) {
        asio::async_connect(
            lowestLayer(stream_), results,
            [self = this->shared_from_this()](const asio::error_code& ec,
                                              const asio::ip::tcp::endpoint&) {
                if (self->completed_) {
                    return;
                }
                if (ec) {
                    self->fail("Connect failed: " + ec.message());
                    return;
                }
                handshake(self->stream_, [self](const asio::error_code& handshakeEc) {
                    if (self->completed_) {
                        return;
                    }
                    if (handshakeEc) {
                        self->fail("TLS handshake failed: " + handshakeEc.message());
                        return;
                    }
                    self->sendRequest();
                });
            });
    }

    void sendRequest() {
        request_ = "GET " + buildTransferPath(settings_) + " HTTP/1.0\r\n";
        request_ += "Host: " + settings_.host;
        if (settings_.port != 0) {
            request_ += ":" + std::to_string(settings_.port);
        }
        request_ += "\r\nUser-Agent: netprobe/1.0\r\nAccept: */*\r\nConnection: close\r\n\r\n";

        asio::async_write(stream_, asio::buffer(request_),
                          [self = this->shared_from_this()](const asio::error_code& ec,
                                                            std::size_t) {
                              if (self->completed_) {
                                  return;
                              }
                              if (ec) {
                                  self->fail("Request failed: " + ec.message());
                                  return;
                              }
                              self->readResponse();
                          });
    }

    void readResponse() {
        stream_.async_read_some(
            asio::buffer(buffer_),
            [self = this->shared_from_this()](const asio::error_code& ec, std::size_t bytes) {
                if (self->completed_) {
                    return;
                }
                self->response_.append(self->buffer_.data(), bytes);
                if (!ec) {
                    self->readResponse();
                    return;
                }
                if (isEndOfStream(ec)) {
                    self->evaluate();
                    return;
                }
                self->fail("Read failed: " + ec.message());
            });
    }

    void evaluate() {
        auto head = parseResponseHead(response_);
        if (!head) {
            fail("Malformed HTTP response");
            return;
        }
        if (head->statusCode < 200 || head->statusCode >= 300) {
            fail("HTTP error: " + std::to_string(head->statusCode));
            return;
        }

        std::size_t bodyBytes = response_.size() - head->headerLength;
        if (head->contentLength && bodyBytes < *head->contentLength) {
            fail("Response truncated after " + std::to_string(bodyBytes) + " bytes");
            return;
        }

        core::TransferResult result;
        result.success = true;
        result.bytesReceived = bodyBytes;
        result.duration = elapsed();
        finish(std::move(result));
    }

    void fail(const std::string& message) {
        core::TransferResult result;
        result.success = false;
        result.duration = elapsed();
        result.errorMessage = message;
        finish(std::move(result));
    }

    void finish(core::TransferResult result) {
        if (completed_) {
            return;
        }
        completed_ = true;

        asio::error_code ignored;
        timer_.cancel();
        resolver_.cancel();
        lowestLayer(stream_).close(ignored);

        if (result.success) {
            spdlog::debug("Transfer of {} bytes from {} took {}us", result.bytesReceived,
                          settings_.host, result.duration.count());
        } else {
            spdlog::debug("Transfer from {} failed: {}", settings_.host, result.errorMessage);
        }
        promise_.set_value(std::move(result));
    }

    std::chrono::microseconds elapsed() const {
        return std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - startTime_);
    }

    Strand strand_;
    asio::ip::tcp::resolver resolver_;
    Stream stream_;
    asio::steady_timer timer_;
    core::BandwidthSettings settings_;
    std::string request_;
    std::string response_;
    std::array<char, 16384> buffer_{};
    std::chrono::steady_clock::time_point startTime_;
    std::promise<core::TransferResult> promise_;
    bool completed_{false};
};

std::future<core::TransferResult> failedTransfer(const std::string& message) {
    std::promise<core::TransferResult> promise;
    core::TransferResult result;
    result.success = false;
    result.errorMessage = message;
    promise.set_value(std::move(result));
    return promise.get_future();
}

} // namespace

std::optional<HttpResponseHead> parseResponseHead(std::string_view data) {
    auto headerEnd = data.find("\r\n\r\n");
    if (headerEnd == std::string_view::npos) {
        return std::nullopt;
    }

    HttpResponseHead head;
    head.headerLength = headerEnd + 4;

    auto lineEnd = data.find("\r\n");
    std::string_view statusLine = data.substr(0, lineEnd);
    if (statusLine.substr(0, 5) != "HTTP/") {
        return std::nullopt;
    }

    auto firstSpace = statusLine.find(' ');
    if (firstSpace == std::string_view::npos) {
        return std::nullopt;
    }
    std::string_view code = statusLine.substr(firstSpace + 1, 3);
    auto [codeEnd, codeEc] = std::from_chars(code.data(), code.data() + code.size(), head.statusCode);
    if (codeEc != std::errc{} || codeEnd != code.data() + code.size()) {
        return std::nullopt;
    }

    std::size_t position = lineEnd + 2;
    while (position < headerEnd) {
        auto next = data.find("\r\n", position);
        std::string_view line = data.substr(position, next - position);
        position = next + 2;

        auto colon = line.find(':');
        if (colon == std::string_view::npos) {
            continue;
        }
        if (equalsIgnoreCase(trim(line.substr(0, colon)), "Content-Length")) {
            auto value = trim(line.substr(colon + 1));
            std::size_t length = 0;
            auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), length);
            if (ec == std::errc{} && end == value.data() + value.size()) {
                head.contentLength = length;
            }
        }
    }

    return head;
}

std::string buildTransferPath(const core::BandwidthSettings& settings) {
    return "/bytes/" + std::to_string(settings.payloadBytes());
}

std::string buildTransferUrl(const core::BandwidthSettings& settings) {
    std::string url = settings.scheme + "://" + settings.host;
    if (settings.port != 0) {
        url += ":" + std::to_string(settings.port);
    }
    return url + buildTransferPath(settings);
}

HttpTransferProvider::HttpTransferProvider(AsioContext& context)
    : context_(context), sslContext_(asio::ssl::context::tls_client) {
    sslContext_.set_default_verify_paths();
    sslContext_.set_verify_mode(asio::ssl::verify_peer);
}

std::future<core::TransferResult> HttpTransferProvider::downloadAsync(
    const core::BandwidthSettings& settings) {
    spdlog::debug("Starting bandwidth test: {}", buildTransferUrl(settings));
    auto strand = asio::make_strand(context_.getContext());

    if (settings.scheme == "https") {
        TlsStream stream(strand, sslContext_);
        if (!SSL_set_tlsext_host_name(stream.native_handle(), settings.host.c_str())) {
            return failedTransfer("Failed to set TLS server name");
        }
        stream.set_verify_callback(asio::ssl::host_name_verification(settings.host));

        auto session = std::make_shared<TransferSession<TlsStream>>(strand, std::move(stream),
                                                                   settings);
        return session->start();
    }

    if (settings.scheme == "http") {
        auto session = std::make_shared<TransferSession<asio::ip::tcp::socket>>(
            strand, asio::ip::tcp::socket(strand), settings);
        return session->start();
    }

    return failedTransfer("Unsupported scheme: " + settings.scheme);
}

UnavailableTransferProvider::UnavailableTransferProvider(std::string reason)
    : reason_(std::move(reason)) {}

std::future<core::TransferResult> UnavailableTransferProvider::downloadAsync(
    const core::BandwidthSettings& /*settings*/) {
    return failedTransfer("Transfer capability not available: " + reason_);
}

std::shared_ptr<core::ITransferProvider> makeTransferProvider(
    AsioContext& context, const core::BandwidthSettings& settings) {
    if (!settings.enabled) {
        spdlog::info("Bandwidth test disabled");
        return std::make_shared<UnavailableTransferProvider>("disabled by configuration");
    }

    if (settings.scheme != "http" && settings.scheme != "https") {
        spdlog::warn("Bandwidth test unavailable: unsupported scheme '{}'", settings.scheme);
        return std::make_shared<UnavailableTransferProvider>("unsupported scheme " +
                                                             settings.scheme);
    }

    try {
        return std::make_shared<HttpTransferProvider>(context);
    } catch (const std::exception& e) {
        spdlog::warn("Bandwidth test unavailable: {}", e.what());
        return std::make_shared<UnavailableTransferProvider>(e.what());
    }
}

} // namespace netprobe::infra
