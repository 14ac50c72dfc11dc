#include "infrastructure/network/SystemPingProbe.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <stdexcept>
#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace netprobe::infra {

namespace {

struct SpawnedChild {
    pid_t pid{-1};
    int outputFd{-1};
};

// Spawns the command with stdout and stderr redirected into a pipe whose read
// end is returned. The read end hits EOF when the child exits.
SpawnedChild spawnChild(const PingCommand& command) {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0) {
        throw std::runtime_error(std::string("pipe2 failed: ") + std::strerror(errno));
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, fds[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, fds[1], STDERR_FILENO);

    std::vector<char*> argv;
    argv.reserve(command.arguments.size() + 2);
    argv.push_back(const_cast<char*>(command.program.c_str()));
    for (const auto& argument : command.arguments) {
        argv.push_back(const_cast<char*>(argument.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = -1;
    int rc = posix_spawnp(&pid, command.program.c_str(), &actions, nullptr, argv.data(), environ);
    posix_spawn_file_actions_destroy(&actions);
    close(fds[1]);

    if (rc != 0) {
        close(fds[0]);
        throw std::runtime_error("Failed to spawn " + command.program + ": " +
                                 std::strerror(rc));
    }

    return {pid, fds[0]};
}

} // namespace

struct SystemPingProbe::PendingProbe {
    PendingProbe(asio::io_context& io, int fd)
        : strand(asio::make_strand(io)), output(strand, fd), timer(strand) {}

    asio::strand<asio::io_context::executor_type> strand;
    asio::posix::stream_descriptor output;
    asio::steady_timer timer;
    std::array<char, 512> buffer{};
    std::string target;
    pid_t pid{-1};
    std::chrono::steady_clock::time_point startTime;
    std::promise<core::ProbeOutcome> promise;
    std::shared_ptr<ChildRegistry> registry;
    bool completed{false};
};

PingCommand buildPingCommand(HostPlatform platform, const std::string& target,
                             std::chrono::milliseconds timeout) {
    if (platform == HostPlatform::Windows) {
        return {"ping", {"-n", "1", "-w", std::to_string(timeout.count()), target}};
    }

    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(timeout).count();
    if (seconds < 1) {
        seconds = 1;
    }
    return {"ping", {"-c", "1", "-W", std::to_string(seconds), target}};
}

HostPlatform currentPlatform() {
#ifdef _WIN32
    return HostPlatform::Windows;
#else
    return HostPlatform::Posix;
#endif
}

void SystemPingProbe::ChildRegistry::add(pid_t pid) {
    std::lock_guard lock(mutex);
    children.insert(pid);
}

void SystemPingProbe::ChildRegistry::remove(pid_t pid) {
    std::lock_guard lock(mutex);
    children.erase(pid);
}

SystemPingProbe::SystemPingProbe(AsioContext& context)
    : SystemPingProbe(context, [](const std::string& target, std::chrono::milliseconds timeout) {
          return buildPingCommand(currentPlatform(), target, timeout);
      }) {}

SystemPingProbe::SystemPingProbe(AsioContext& context, CommandBuilder builder)
    : context_(context), builder_(std::move(builder)),
      registry_(std::make_shared<ChildRegistry>()) {}

SystemPingProbe::~SystemPingProbe() {
    std::lock_guard lock(registry_->mutex);
    for (pid_t pid : registry_->children) {
        kill(pid, SIGKILL);
        waitpid(pid, nullptr, 0);
    }
    registry_->children.clear();
}

std::size_t SystemPingProbe::runningProbes() const {
    std::lock_guard lock(registry_->mutex);
    return registry_->children.size();
}

std::future<core::ProbeOutcome> SystemPingProbe::probeAsync(const std::string& target,
                                                            std::chrono::milliseconds timeout) {
    auto startTime = std::chrono::steady_clock::now();

    SpawnedChild child;
    try {
        child = spawnChild(builder_(target, timeout));
    } catch (const std::exception& e) {
        spdlog::warn("Ping to {} failed: {}", target, e.what());
        std::promise<core::ProbeOutcome> failed;
        failed.set_value(core::ProbeOutcome::failed(core::ProbeFailure::ProcessFailed, e.what()));
        return failed.get_future();
    }

    auto pending = std::make_shared<PendingProbe>(context_.getContext(), child.outputFd);
    pending->target = target;
    pending->pid = child.pid;
    pending->startTime = startTime;
    pending->registry = registry_;
    registry_->add(child.pid);

    auto future = pending->promise.get_future();

    asio::dispatch(pending->strand, [pending, timeout]() {
        pending->timer.expires_at(pending->startTime + timeout);
        pending->timer.async_wait([pending](const asio::error_code& ec) {
            if (ec) {
                return; // Child exited first
            }
            finish(pending, true);
        });
        readOutput(pending);
    });

    return future;
}

void SystemPingProbe::readOutput(std::shared_ptr<PendingProbe> pending) {
    pending->output.async_read_some(
        asio::buffer(pending->buffer), [pending](const asio::error_code& ec, std::size_t) {
            if (pending->completed) {
                return;
            }
            if (!ec) {
                readOutput(pending);
                return;
            }
            // EOF: every copy of the write end is closed, i.e. the child exited.
            finish(pending, false);
        });
}

void SystemPingProbe::finish(const std::shared_ptr<PendingProbe>& pending, bool timedOut) {
    if (pending->completed) {
        return;
    }
    pending->completed = true;

    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - pending->startTime);

    asio::error_code ignored;
    pending->timer.cancel();
    pending->output.close(ignored);

    if (timedOut) {
        kill(pending->pid, SIGKILL);
    }

    pending->registry->remove(pending->pid);
    int status = 0;
    pid_t waited = waitpid(pending->pid, &status, 0);

    if (timedOut) {
        spdlog::debug("Ping to {} timed out", pending->target);
        pending->promise.set_value(
            core::ProbeOutcome::failed(core::ProbeFailure::Timeout, "Timeout"));
        return;
    }

    if (waited < 0) {
        pending->promise.set_value(core::ProbeOutcome::failed(
            core::ProbeFailure::ProcessFailed,
            std::string("waitpid failed: ") + std::strerror(errno)));
        return;
    }

    if (WIFEXITED(status) && WEXITSTATUS(status) == 0) {
        spdlog::debug("Ping to {} successful: {:.2f}ms", pending->target,
                      static_cast<double>(elapsed.count()) / 1000.0);
        pending->promise.set_value(core::ProbeOutcome::succeeded(elapsed));
        return;
    }

    std::string reason = WIFEXITED(status)
                             ? "ping exited with status " + std::to_string(WEXITSTATUS(status))
                             : "ping terminated abnormally";
    spdlog::debug("Ping to {} failed: {}", pending->target, reason);
    pending->promise.set_value(core::ProbeOutcome::failed(core::ProbeFailure::ProcessFailed, reason));
}

} // namespace netprobe::infra
