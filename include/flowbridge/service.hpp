// filename: service.hpp
// part of FlowBridge 2D Obstacle Solver Bridge
// MIT License

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "flowbridge/config.hpp"
#include "flowbridge/geometry.hpp"
#include "flowbridge/http.hpp"
#include "flowbridge/process.hpp"
#include "flowbridge/request.hpp"
#include "flowbridge/solve.hpp"

namespace flowbridge {

/**
 * @brief Cooperative run state shared between the dispatch loop and its handlers.
 *
 * GET /shutdown clears `running`; the loop notices within one shutdownPoll.
 */
struct ServiceContext {
    std::atomic<bool> running{true};
    std::atomic<std::size_t> requestsServed{0};
    std::atomic<std::size_t> solvesCompleted{0};
};

struct SolveOutcome {
    std::string resultPath;
    std::string liveFramePath;
    bool defaultLocation{false};
    FallbackReason fallback{FallbackReason::None};
    SolveSummary summary;
};

/**
 * @brief HTTP front end of the solver process.
 *
 * One listener, sequential dispatch. Each POST runs one solve to completion:
 * live frames while iterating, then the final artifact published by
 * stage-then-rename, and only then the acknowledgement.
 */
class SimulationService {
public:
    explicit SimulationService(ServiceConfig config, std::unique_ptr<SolveBackend> backend = nullptr);
    ~SimulationService();

    SimulationService(const SimulationService&) = delete;
    SimulationService& operator=(const SimulationService&) = delete;

    // Opens the listener. Throws HttpError when the address is unavailable.
    void bind();
    std::uint16_t port() const;

    // Serves until context.running is cleared. Binds first if needed.
    void run(ServiceContext& context);

    HttpResponse handle(const HttpRequest& request, ServiceContext& context);

    // Throws HandoffError when the result cannot be renamed into place.
    SolveOutcome runSimulation(const SimulationRequest& request);

    const ServiceConfig& config() const { return config_; }

private:
    std::string defaultResultPath() const;
    std::string defaultLiveFramePath() const;
    void launchViewer(const std::string& resultPath);
    void reapViewers();

    ServiceConfig config_;
    std::unique_ptr<SolveBackend> backend_;
    std::unique_ptr<HttpListener> listener_;
    std::vector<ChildProcess> viewers_;
    bool defaultLiveFrameUsed_{false};
};

}  // namespace flowbridge
