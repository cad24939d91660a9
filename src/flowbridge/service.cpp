// filename: service.cpp
// part of FlowBridge 2D Obstacle Solver Bridge
// MIT License

#include "flowbridge/service.hpp"

#include "flowbridge/errors.hpp"
#include "flowbridge/handoff.hpp"
#include "flowbridge/io_image.hpp"
#include "flowbridge/io_vtk.hpp"
#include "flowbridge/log.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <utility>

namespace flowbridge {
namespace {

namespace fs = std::filesystem;

constexpr const char* kLog = "service";
constexpr Millis kLingerTimeout{1000};

class LiveFrameSink final : public FrameSink {
public:
    LiveFrameSink(LiveFrameWriter& writer, const SimulationParameters& params)
        : writer_(writer), params_(params) {}

    bool onFrame(const SolveProgress& progress, const FlowGrid& grid) override {
        try {
            const RgbImage image =
                renderSpeedField(grid, params_.colorScaleMin, params_.colorScaleMax, params_.showBody);
            (void)writer_.write(encodePpm(image));
        } catch (const std::exception& ex) {
            logWarn(kLog, std::string("Live frame render failed: ") + ex.what());
        }
        if (!progress.final) {
            std::ostringstream msg;
            msg << "iter " << progress.iter << " rel residual " << std::scientific << std::setprecision(3)
                << progress.relResidual;
            logInfo(kLog, msg.str());
        }
        return true;
    }

private:
    LiveFrameWriter& writer_;
    const SimulationParameters& params_;
};

std::string timestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    const auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm local{};
    ::localtime_r(&seconds, &local);
    std::ostringstream out;
    out << std::put_time(&local, "%Y%m%d_%H%M%S") << '_' << std::setw(3) << std::setfill('0') << millis;
    return out.str();
}

std::vector<std::string> splitCommand(const std::string& command) {
    std::istringstream in(command);
    std::vector<std::string> parts;
    std::string part;
    while (in >> part) {
        parts.push_back(part);
    }
    return parts;
}

HttpResponse textResponse(int status, std::string body) {
    HttpResponse response{};
    response.status = status;
    response.body = std::move(body);
    return response;
}

}  // namespace

SimulationService::SimulationService(ServiceConfig config, std::unique_ptr<SolveBackend> backend)
    : config_(std::move(config)), backend_(std::move(backend)) {
    if (!backend_) {
        backend_ = std::make_unique<PotentialFlowBackend>();
    }
}

SimulationService::~SimulationService() {
    for (auto& viewer : viewers_) {
        viewer.detach();
    }
}

void SimulationService::bind() {
    listener_ = std::make_unique<HttpListener>(config_.host, config_.port);
}

std::uint16_t SimulationService::port() const {
    return listener_ ? listener_->port() : config_.port;
}

void SimulationService::run(ServiceContext& context) {
    if (!listener_) {
        bind();
    }
    logInfo(kLog, "Listening on " + config_.host + ":" + std::to_string(port()) + " (backend " +
                      backend_->name() + ")");

    while (context.running.load()) {
        reapViewers();
        std::optional<Socket> client = listener_->accept(config_.shutdownPoll);
        if (!client) {
            continue;
        }

        HttpResponse response{};
        try {
            const HttpRequest request = readHttpRequest(*client, config_.maxRequestBytes, config_.requestReadTimeout);
            response = handle(request, context);
        } catch (const HttpError& ex) {
            logWarn(kLog, std::string("Rejected request: ") + ex.what());
            response = textResponse(ex.status() != 0 ? ex.status() : 400, ex.what());
        }

        if (!writeHttpResponse(*client, response)) {
            logWarn(kLog, "Acknowledgement could not be delivered; the result file is authoritative");
        }
        lingeringClose(*client, kLingerTimeout);
        context.requestsServed.fetch_add(1);
    }

    if (defaultLiveFrameUsed_) {
        LiveFrameWriter(defaultLiveFramePath()).remove();
        defaultLiveFrameUsed_ = false;
    }
    logInfo(kLog, "Stopped after " + std::to_string(context.requestsServed.load()) + " request(s)");
}

HttpResponse SimulationService::handle(const HttpRequest& request, ServiceContext& context) {
    const std::string path = request.path();
    logInfo(kLog, request.method + " " + request.target);

    if (path == "/status") {
        return textResponse(200, "Simulation server is running");
    }
    if (path == "/shutdown") {
        logInfo(kLog, "Shutdown requested");
        context.running.store(false);
        return textResponse(200, "Server shutting down");
    }
    if (path != "/" && path != "/process") {
        return textResponse(404, "Not found: " + path);
    }
    if (request.method != "POST") {
        return textResponse(405, "Use POST to submit a simulation request");
    }

    SimulationRequest parsed;
    try {
        parsed = parseSimulationRequest(request.body);
    } catch (const RequestSchemaError& ex) {
        logWarn(kLog, std::string("Invalid request: ") + ex.what());
        return textResponse(400, std::string("Invalid request: ") + ex.what());
    }

    try {
        const SolveOutcome outcome = runSimulation(parsed);
        context.solvesCompleted.fetch_add(1);
        return textResponse(200, "Simulation completed. Result saved at: " + outcome.resultPath);
    } catch (const HandoffError& ex) {
        logError(kLog, std::string(ex.what()) + " (staging file kept at " + ex.stagingPath() + ")");
        return textResponse(500, std::string("Result could not be published: ") + ex.what());
    } catch (const std::exception& ex) {
        logError(kLog, std::string("Simulation failed: ") + ex.what());
        return textResponse(500, std::string("Simulation failed: ") + ex.what());
    }
}

SolveOutcome SimulationService::runSimulation(const SimulationRequest& request) {
    const SimulationParameters& params = request.parameters;
    SolveOutcome outcome{};
    outcome.defaultLocation = !params.resultPath.has_value();
    outcome.resultPath = params.resultPath.value_or(defaultResultPath());
    outcome.liveFramePath = params.liveFramePath.value_or(defaultLiveFramePath());
    if (!params.liveFramePath) {
        defaultLiveFrameUsed_ = true;
    }

    const BodyGeometry body = loadBodyGeometry(request.polylines, params);
    outcome.fallback = body.fallback;

    FlowGrid grid = makeFlowGrid(params);
    rasterizeBody(body, grid);
    logInfo(kLog, "Grid " + std::to_string(grid.nx) + "x" + std::to_string(grid.ny) + ", " +
                      std::to_string(grid.solidCount()) + " solid node(s)");

    LiveFrameWriter liveWriter(outcome.liveFramePath);
    LiveFrameSink sink(liveWriter, params);
    outcome.summary = backend_->run(grid, params, &sink);

    const ArtifactHandle handle = makeFinalResultHandle(outcome.resultPath);
    publishArtifact(handle, [&grid](const std::string& staging) { writeFlowFieldVti(staging, grid); });
    logInfo(kLog, "Result published: " + outcome.resultPath);

    if (outcome.defaultLocation) {
        if (config_.keepArtifacts > 0) {
            (void)pruneArtifacts(config_.outputDirectory, ".vti", config_.keepArtifacts);
        }
        launchViewer(outcome.resultPath);
    }
    return outcome;
}

std::string SimulationService::defaultResultPath() const {
    fs::path base = fs::path(config_.outputDirectory) / ("simulation_" + timestamp());
    fs::path candidate = base;
    candidate += ".vti";
    for (int n = 1; fs::exists(candidate); ++n) {
        candidate = base;
        candidate += "_" + std::to_string(n) + ".vti";
    }
    return candidate.string();
}

std::string SimulationService::defaultLiveFramePath() const {
    return (fs::path(config_.outputDirectory) / "live_frame.ppm").string();
}

void SimulationService::launchViewer(const std::string& resultPath) {
    std::vector<std::string> parts = splitCommand(config_.viewerCommand);
    if (parts.empty()) {
        return;
    }
    const std::string program = parts.front();
    parts.erase(parts.begin());
    parts.push_back(resultPath);
    try {
        viewers_.push_back(ChildProcess::spawn(program, parts, true));
        logInfo(kLog, "Opened viewer: " + program);
    } catch (const LifecycleError& ex) {
        logWarn(kLog, std::string("Viewer not launched: ") + ex.what());
    }
}

void SimulationService::reapViewers() {
    viewers_.erase(std::remove_if(viewers_.begin(), viewers_.end(),
                                  [](ChildProcess& viewer) { return !viewer.running(); }),
                   viewers_.end());
}

}  // namespace flowbridge
