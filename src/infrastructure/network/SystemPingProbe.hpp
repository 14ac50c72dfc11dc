#pragma once

#include "core/services/IReachabilityProbe.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <sys/types.h>
#include <vector>

namespace netprobe::infra {

/**
 * @brief Host OS family, which decides the ping utility's argument syntax.
 */
enum class HostPlatform { Posix, Windows };

/**
 * @brief Program and arguments used to run the reachability utility.
 */
struct PingCommand {
    std::string program;
    std::vector<std::string> arguments;

    bool operator==(const PingCommand& other) const = default;
};

/**
 * @brief Builds the single-echo ping command for a platform.
 *
 * POSIX: `ping -c 1 -W <seconds> <target>` (seconds rounded down, at least 1).
 * Windows: `ping -n 1 -w <milliseconds> <target>`.
 */
PingCommand buildPingCommand(HostPlatform platform, const std::string& target,
                             std::chrono::milliseconds timeout);

/**
 * @brief Platform this binary was built for.
 */
HostPlatform currentPlatform();

/**
 * @brief Reachability probe backed by the operating system's ping utility.
 *
 * Each probe spawns one child process and measures the wall time until it
 * exits. The child's output is drained asynchronously on the I/O pool, so any
 * number of probes can be in flight without tying up worker threads. A child
 * that outlives the timeout is killed and reported as a timeout; a non-zero
 * exit status is reported as a process failure.
 */
class SystemPingProbe : public core::IReachabilityProbe {
public:
    /**
     * @brief Produces the command for a target. Replaceable for testing.
     */
    using CommandBuilder =
        std::function<PingCommand(const std::string& target, std::chrono::milliseconds timeout)>;

    /**
     * @brief Constructs a probe using the platform's ping syntax.
     * @param context I/O pool used to wait for child processes.
     */
    explicit SystemPingProbe(AsioContext& context);

    /**
     * @brief Constructs a probe with a custom command builder.
     */
    SystemPingProbe(AsioContext& context, CommandBuilder builder);

    /**
     * @brief Kills any child process still running.
     */
    ~SystemPingProbe() override;

    std::future<core::ProbeOutcome> probeAsync(const std::string& target,
                                               std::chrono::milliseconds timeout) override;

    /**
     * @brief Number of child processes currently running.
     */
    std::size_t runningProbes() const;

private:
    struct ChildRegistry {
        std::mutex mutex;
        std::set<pid_t> children;

        void add(pid_t pid);
        void remove(pid_t pid);
    };

    struct PendingProbe;

    static void readOutput(std::shared_ptr<PendingProbe> pending);
    static void finish(const std::shared_ptr<PendingProbe>& pending, bool timedOut);

    AsioContext& context_;
    CommandBuilder builder_;
    std::shared_ptr<ChildRegistry> registry_;
};

} // namespace netprobe::infra
