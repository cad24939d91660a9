// filename: controller.hpp
// part of FlowBridge 2D Obstacle Solver Bridge
// MIT License

#pragma once

#include <cstddef>
#include <list>
#include <optional>
#include <string>
#include <vector>

#include "flowbridge/config.hpp"
#include "flowbridge/http.hpp"
#include "flowbridge/process.hpp"
#include "flowbridge/request.hpp"
#include "flowbridge/timer.hpp"

namespace flowbridge {

enum class SessionState {
    Stopped,
    Starting,
    Running,
    Stopping,
    Crashed,
};

const char* toString(SessionState state);

/**
 * @brief Owns the solver process and talks to it over loopback HTTP.
 *
 * Single-threaded and cooperative: the owner calls poll() from its own loop.
 * Nothing here blocks longer than one short probe except waitUntilRunning()
 * and stopServer().
 */
class SimulationController {
public:
    explicit SimulationController(ControllerConfig config);
    ~SimulationController();

    SimulationController(const SimulationController&) = delete;
    SimulationController& operator=(const SimulationController&) = delete;

    // Throws LifecycleError when the executable or script is missing or spawn fails.
    void startServer();

    // Safe in every state; ends in Stopped with no child process.
    void stopServer();

    // False without touching the network unless Running. Returns once the request
    // is queued; bytes the solver has not read yet are written by poll().
    bool applyParameters(const SimulationRequest& request);

    SessionState poll();

    bool waitUntilRunning(Millis timeout);

    SessionState state() const { return state_; }
    bool isRunning() const { return state_ == SessionState::Running; }
    const std::optional<std::string>& lastError() const { return lastError_; }
    std::size_t pendingAcknowledgements() const { return pending_.size(); }
    std::size_t requestsIssued() const { return requestsIssued_; }
    std::optional<pid_t> pid() const;
    const ControllerConfig& config() const { return config_; }

private:
    struct PendingAck {
        PendingResponse response;
        Deadline deadline;
        std::size_t id;
    };

    void reapChild();
    void probeReadiness();
    void drainAcknowledgements();
    void deleteLiveFrames();

    ControllerConfig config_;
    SessionState state_{SessionState::Stopped};
    ChildProcess child_;
    std::optional<Deadline> startDeadline_;
    IntervalTimer readinessTimer_;
    std::list<PendingAck> pending_;
    std::vector<std::string> liveFrames_;
    std::optional<std::string> lastError_;
    std::size_t requestsIssued_{0};
};

}  // namespace flowbridge
