// filename: controller.cpp
// part of FlowBridge 2D Obstacle Solver Bridge
// MIT License

#include "flowbridge/controller.hpp"

#include "flowbridge/errors.hpp"
#include "flowbridge/handoff.hpp"
#include "flowbridge/log.hpp"

#include <algorithm>
#include <filesystem>
#include <thread>
#include <utility>

namespace flowbridge {
namespace {

constexpr const char* kLog = "controller";

// A single /status probe never holds the caller longer than this.
constexpr Millis kProbeTimeout{500};
constexpr Millis kShutdownRequestTimeout{5000};

}  // namespace

const char* toString(SessionState state) {
    switch (state) {
        case SessionState::Stopped:
            return "stopped";
        case SessionState::Starting:
            return "starting";
        case SessionState::Running:
            return "running";
        case SessionState::Stopping:
            return "stopping";
        case SessionState::Crashed:
            return "crashed";
    }
    return "unknown";
}

SimulationController::SimulationController(ControllerConfig config)
    : config_(std::move(config)), readinessTimer_(config_.intervals.readinessPoll) {}

SimulationController::~SimulationController() {
    stopServer();
}

std::optional<pid_t> SimulationController::pid() const {
    if (child_.started()) {
        return child_.pid();
    }
    return std::nullopt;
}

void SimulationController::startServer() {
    if (state_ == SessionState::Starting || state_ == SessionState::Running) {
        logWarn(kLog, "Server already " + std::string(toString(state_)));
        return;
    }
    if (state_ == SessionState::Crashed) {
        stopServer();
    }

    if (!isExecutableFile(config_.executable)) {
        throw LifecycleError("Solver executable not found or not executable: " + config_.executable);
    }
    if (!config_.script.empty() && !std::filesystem::is_regular_file(config_.script)) {
        throw LifecycleError("Solver script not found: " + config_.script);
    }

    std::vector<std::string> args;
    if (!config_.script.empty()) {
        args.push_back(config_.script);
    }
    args.insert(args.end(), config_.extraArgs.begin(), config_.extraArgs.end());

    child_ = ChildProcess::spawn(config_.executable, args);
    lastError_.reset();
    startDeadline_.emplace(config_.intervals.startupTimeout);
    readinessTimer_ = IntervalTimer(config_.intervals.readinessPoll);
    state_ = SessionState::Starting;
    logInfo(kLog, "Started solver process " + std::to_string(child_.pid()) + ": " + config_.executable);
}

void SimulationController::stopServer() {
    if (state_ == SessionState::Stopped && !child_.started()) {
        return;
    }

    if (child_.running()) {
        state_ = SessionState::Stopping;
        try {
            const HttpResponse response =
                httpExchange(config_.host, config_.port, "GET", "/shutdown", "", kShutdownRequestTimeout);
            logInfo(kLog, "Shutdown acknowledged with status " + std::to_string(response.status));
        } catch (const HttpError& ex) {
            logWarn(kLog, std::string("Shutdown request failed: ") + ex.what());
        }

        if (!child_.waitForExit(config_.intervals.stopGrace, config_.intervals.shutdownPoll)) {
            logWarn(kLog, "Solver did not exit within the grace period; killing it");
            child_.kill();
        }
        logInfo(kLog, "Solver process ended (" + child_.describeExit() + ")");
    }

    child_ = ChildProcess();
    pending_.clear();
    startDeadline_.reset();
    deleteLiveFrames();
    state_ = SessionState::Stopped;
}

bool SimulationController::applyParameters(const SimulationRequest& request) {
    if (state_ != SessionState::Running) {
        logWarn(kLog, std::string("Cannot apply parameters while ") + toString(state_));
        return false;
    }

    const std::string body = serializeSimulationRequest(request);
    ++requestsIssued_;
    std::size_t unsent = 0;
    try {
        Socket socket = connectTcp(config_.host, config_.port, kProbeTimeout);
        // The service reads one connection at a time; a busy one leaves the tail queued for poll().
        PendingResponse exchange(std::move(socket),
                                 formatHttpRequest("POST", config_.host, config_.port, "/process", body));
        if (exchange.poll() == PendingResponse::State::Closed) {
            logError(kLog, "Failed to send simulation request");
            return false;
        }
        unsent = exchange.unsentBytes();
        pending_.push_back(PendingAck{std::move(exchange), Deadline(config_.intervals.ackTimeout), requestsIssued_});
    } catch (const HttpError& ex) {
        logError(kLog, std::string("Simulation request failed: ") + ex.what());
        return false;
    }

    if (request.parameters.liveFramePath &&
        std::find(liveFrames_.begin(), liveFrames_.end(), *request.parameters.liveFramePath) == liveFrames_.end()) {
        liveFrames_.push_back(*request.parameters.liveFramePath);
    }
    logInfo(kLog, "Sent simulation request #" + std::to_string(requestsIssued_) + " (" +
                      std::to_string(body.size()) + " bytes" +
                      (unsent > 0 ? ", " + std::to_string(unsent) + " queued until the solver reads it" : "") + ")");
    return true;
}

SessionState SimulationController::poll() {
    reapChild();
    if (state_ == SessionState::Starting) {
        probeReadiness();
    }
    drainAcknowledgements();
    return state_;
}

bool SimulationController::waitUntilRunning(Millis timeout) {
    const Deadline deadline(timeout);
    while (poll() == SessionState::Starting && !deadline.expired()) {
        std::this_thread::sleep_for(std::min(config_.intervals.readinessPoll, deadline.remaining()));
    }
    return state_ == SessionState::Running;
}

void SimulationController::reapChild() {
    if ((state_ != SessionState::Starting && state_ != SessionState::Running) || child_.running()) {
        return;
    }
    const std::string detail = "Solver process exited unexpectedly (" + child_.describeExit() + ")";
    logError(kLog, detail);
    lastError_ = detail;
    pending_.clear();
    startDeadline_.reset();
    state_ = SessionState::Crashed;
}

void SimulationController::probeReadiness() {
    if (startDeadline_ && startDeadline_->expired()) {
        const std::string detail = "Solver did not become ready within " +
                                   std::to_string(config_.intervals.startupTimeout.count()) + " ms";
        logError(kLog, detail);
        child_.kill();
        child_ = ChildProcess();
        startDeadline_.reset();
        lastError_ = detail;
        state_ = SessionState::Stopped;
        return;
    }
    if (!readinessTimer_.due()) {
        return;
    }
    try {
        const HttpResponse response =
            httpExchange(config_.host, config_.port, "GET", "/status", "", kProbeTimeout);
        if (response.status == 200) {
            startDeadline_.reset();
            state_ = SessionState::Running;
            logInfo(kLog, "Solver is ready on " + config_.host + ":" + std::to_string(config_.port));
        }
    } catch (const HttpError&) {
        // Not listening yet.
    }
}

void SimulationController::drainAcknowledgements() {
    for (auto it = pending_.begin(); it != pending_.end();) {
        const PendingResponse::State ackState = it->response.poll();
        const std::string label = "Request #" + std::to_string(it->id);
        if (ackState == PendingResponse::State::Complete) {
            const HttpResponse& response = it->response.response();
            if (response.status == 200) {
                logInfo(kLog, label + " completed: " + response.body);
            } else {
                logWarn(kLog, label + " rejected with status " + std::to_string(response.status) + ": " +
                                  response.body);
            }
            it = pending_.erase(it);
        } else if (ackState == PendingResponse::State::Closed) {
            logInfo(kLog, label + ": connection closed without acknowledgement; watch the result file");
            it = pending_.erase(it);
        } else if (it->deadline.expired()) {
            logInfo(kLog, label + ": no acknowledgement within the timeout; watch the result file");
            it = pending_.erase(it);
        } else {
            ++it;
        }
    }
}

void SimulationController::deleteLiveFrames() {
    for (const auto& path : liveFrames_) {
        LiveFrameWriter(path).remove();
    }
    liveFrames_.clear();
}

}  // namespace flowbridge
