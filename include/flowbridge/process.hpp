// filename: process.hpp
// part of FlowBridge 2D Obstacle Solver Bridge
// MIT License

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

#include "flowbridge/timer.hpp"

namespace flowbridge {

/**
 * @brief A spawned child process. Killed and reaped on destruction if still running.
 */
class ChildProcess {
public:
    ChildProcess() = default;
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;
    ChildProcess(ChildProcess&& other) noexcept;
    ChildProcess& operator=(ChildProcess&& other) noexcept;

    // Throws LifecycleError when the program cannot be started. With searchPath
    // the program is looked up on PATH, otherwise it must be a path.
    static ChildProcess spawn(const std::string& program, const std::vector<std::string>& args,
                              bool searchPath = false);

    pid_t pid() const { return pid_; }
    bool started() const { return pid_ > 0; }

    // Reaps without blocking. False once the child has exited.
    bool running();

    // Polls running() every pollInterval until it exits or timeout elapses.
    bool waitForExit(Millis timeout, Millis pollInterval);

    // SIGKILL then a blocking reap. No-op when already exited.
    void kill();

    // Forgets the child without signalling it.
    void detach() noexcept { pid_ = -1; }

    // Raw wait status once reaped.
    std::optional<int> exitStatus() const { return status_; }

    std::string describeExit() const;

private:
    explicit ChildProcess(pid_t pid) : pid_(pid) {}

    pid_t pid_{-1};
    std::optional<int> status_;
};

bool isExecutableFile(const std::string& path);

}  // namespace flowbridge
