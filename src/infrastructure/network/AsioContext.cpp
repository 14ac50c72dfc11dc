#include "infrastructure/network/AsioContext.hpp"

#include <spdlog/spdlog.h>

namespace netprobe::infra {

AsioContext::AsioContext(std::size_t threadCount)
    : threadCount_(threadCount > 0 ? threadCount : 1) {
    spdlog::debug("AsioContext created with {} threads", threadCount_);
}

AsioContext::~AsioContext() {
    stop();
}

void AsioContext::start() {
    if (running_.exchange(true)) {
        return;
    }

    workGuard_.emplace(asio::make_work_guard(ioContext_));

    threads_.reserve(threadCount_);
    for (std::size_t i = 0; i < threadCount_; ++i) {
        threads_.emplace_back([this, i]() {
            spdlog::debug("I/O worker {} started", i);
            ioContext_.run();
            spdlog::debug("I/O worker {} stopped", i);
        });
    }

    spdlog::debug("AsioContext started with {} worker threads", threadCount_);
}

void AsioContext::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    if (signals_) {
        asio::error_code ignored;
        signals_->cancel(ignored);
    }

    workGuard_.reset();
    ioContext_.stop();

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
    signals_.reset();

    ioContext_.restart();
    spdlog::debug("AsioContext stopped");
}

void AsioContext::watchSignals(std::initializer_list<int> signals, SignalCallback callback) {
    signalCallback_ = std::move(callback);
    signals_.emplace(ioContext_);
    for (int signalNumber : signals) {
        signals_->add(signalNumber);
    }
    awaitSignal();
}

void AsioContext::awaitSignal() {
    signals_->async_wait([this](const asio::error_code& ec, int signalNumber) {
        if (ec) {
            return;
        }

        spdlog::debug("Received signal {}", signalNumber);
        if (signalCallback_) {
            signalCallback_(signalNumber);
        }

        if (running_ && signals_) {
            awaitSignal();
        }
    });
}

} // namespace netprobe::infra
