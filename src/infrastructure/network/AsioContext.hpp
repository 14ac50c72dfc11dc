#pragma once

#include <asio.hpp>
#include <atomic>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <optional>
#include <thread>
#include <vector>

namespace netprobe::infra {

/**
 * @brief Owns an Asio I/O context and the worker threads that run it.
 *
 * Probes post their asynchronous operations here. The context is kept alive
 * by a work guard between start() and stop(), so handlers can be posted
 * before any I/O is pending.
 *
 * @note Non-copyable. Instances are created by the application and passed by
 *       reference; there is no shared global instance.
 */
class AsioContext {
public:
    /**
     * @brief Callback invoked when a watched signal is delivered.
     */
    using SignalCallback = std::function<void(int)>;

    /**
     * @brief Constructs an AsioContext with the specified number of threads.
     * @param threadCount Number of worker threads (at least one is used).
     */
    explicit AsioContext(std::size_t threadCount = 4);

    /**
     * @brief Destructor. Stops the context and joins all threads.
     */
    ~AsioContext();

    AsioContext(const AsioContext&) = delete;
    AsioContext& operator=(const AsioContext&) = delete;

    /**
     * @brief Starts the worker threads. Has no effect if already running.
     */
    void start();

    /**
     * @brief Stops the context and joins all worker threads.
     *
     * Pending handlers are discarded. The context can be started again.
     */
    void stop();

    /**
     * @brief Installs a handler for process signals (e.g. SIGINT, SIGTERM).
     *
     * The callback runs on a worker thread each time one of the signals is
     * delivered, until stop() is called.
     */
    void watchSignals(std::initializer_list<int> signals, SignalCallback callback);

    asio::io_context& getContext() { return ioContext_; }

    /**
     * @brief Posts a handler to be executed on the worker pool.
     */
    template <typename Handler>
    void post(Handler&& handler) {
        asio::post(ioContext_, std::forward<Handler>(handler));
    }

    bool isRunning() const { return running_.load(); }
    std::size_t threadCount() const { return threadCount_; }

private:
    using WorkGuard = asio::executor_work_guard<asio::io_context::executor_type>;

    void awaitSignal();

    asio::io_context ioContext_;
    std::optional<WorkGuard> workGuard_;
    std::optional<asio::signal_set> signals_;
    SignalCallback signalCallback_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
    std::size_t threadCount_;
};

} // namespace netprobe::infra
