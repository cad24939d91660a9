// filename: flowbridge_client.cpp
// part of FlowBridge 2D Obstacle Solver Bridge
// MIT License

// Drives a solver process the way an editor front end would: start it, send
// one request, follow the live frame and wait for the final artifact.

#include "flowbridge/config.hpp"
#include "flowbridge/controller.hpp"
#include "flowbridge/handoff.hpp"
#include "flowbridge/io_image.hpp"
#include "flowbridge/log.hpp"
#include "flowbridge/request.hpp"

#include <chrono>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

namespace {

struct ClientOptions {
    std::string geometryPath;
    std::optional<std::string> configPath;
    std::optional<std::string> paramsPath;
    std::optional<std::string> livePath;
    std::optional<std::string> resultPath;
    std::optional<std::string> executable;
    bool wait{false};
    bool quiet{false};
};

void printUsage() {
    std::cout << "flowbridge_client options:\n"
              << "  --geometry <path>      JSON file with {\"polylines\": [...]} (required)\n"
              << "  --config <path>        JSON config; its \"controller\" section is used\n"
              << "  --params <path>        JSON object of simulation_parameters\n"
              << "  --live <path>          Live frame location passed to the solver\n"
              << "  --result <path>        Final result location passed to the solver\n"
              << "  --executable <path>    Solver executable (overrides config)\n"
              << "  --wait                 Report live frame updates while the solve runs\n"
              << "  --quiet                Only print warnings and errors\n"
              << "  --help                 Show this message\n";
}

bool parseArgs(int argc, char** argv, ClientOptions& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help") {
            printUsage();
            return false;
        } else if (arg == "--geometry" && i + 1 < argc) {
            opts.geometryPath = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            opts.configPath = argv[++i];
        } else if (arg == "--params" && i + 1 < argc) {
            opts.paramsPath = argv[++i];
        } else if (arg == "--live" && i + 1 < argc) {
            opts.livePath = argv[++i];
        } else if (arg == "--result" && i + 1 < argc) {
            opts.resultPath = argv[++i];
        } else if (arg == "--executable" && i + 1 < argc) {
            opts.executable = argv[++i];
        } else if (arg == "--wait") {
            opts.wait = true;
        } else if (arg == "--quiet") {
            opts.quiet = true;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return false;
        }
    }
    if (opts.geometryPath.empty()) {
        std::cerr << "--geometry is required\n";
        return false;
    }
    return true;
}

// Runs the cooperative loop until a new artifact is in place or the acknowledgement
// arrives. Without a result path the acknowledgement is all there is to wait for.
bool followRun(flowbridge::SimulationController& controller,
               const ClientOptions& opts,
               std::optional<flowbridge::ArtifactWatcher>& watcher) {
    const flowbridge::PollIntervals& intervals = controller.config().intervals;
    std::optional<flowbridge::LiveFramePoller> frames;
    if (opts.wait && opts.livePath) {
        frames.emplace(*opts.livePath, intervals.freshnessWindow, flowbridge::isCompletePpm);
    }
    flowbridge::IntervalTimer frameTimer(intervals.framePoll);
    flowbridge::IntervalTimer artifactTimer(intervals.artifactPoll);

    for (;;) {
        const flowbridge::SessionState state = controller.poll();
        if (state != flowbridge::SessionState::Running) {
            std::cerr << "Solver session ended while waiting: " << flowbridge::toString(state) << "\n";
            return false;
        }
        if (frames && frameTimer.due()) {
            const flowbridge::LiveFrame frame = frames->poll();
            if (frame.status == flowbridge::FrameStatus::Fresh && frames->changed()) {
                flowbridge::logInfo("client", "Live frame updated (" + std::to_string(frame.bytes.size()) +
                                                  " bytes)");
            }
        }
        if (watcher && artifactTimer.due() && watcher->poll()) {
            flowbridge::logInfo("client", "Result ready: " + watcher->path());
            return true;
        }
        if (controller.pendingAcknowledgements() == 0) {
            return !watcher || watcher->poll();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
}

}  // namespace

int main(int argc, char** argv) {
    ClientOptions opts;
    if (!parseArgs(argc, argv, opts)) {
        return 1;
    }
    flowbridge::setQuiet(opts.quiet);

    try {
        flowbridge::ControllerConfig config{};
        if (opts.configPath) {
            config = flowbridge::loadBridgeConfigFromJson(*opts.configPath).controller;
        }
        if (opts.executable) {
            config.executable = *opts.executable;
        }
        if (config.executable.empty()) {
            // Sibling service binary, told where to listen.
            config.executable = (std::filesystem::path(argv[0]).parent_path() / "flowbridge_service").string();
            config.extraArgs.insert(config.extraArgs.end(),
                                    {"--host", config.host, "--port", std::to_string(config.port)});
        }

        flowbridge::SimulationRequest request{};
        request.polylines = flowbridge::loadPolylinesFromJson(opts.geometryPath);
        if (opts.paramsPath) {
            request.parameters = flowbridge::loadSimulationParametersFromJson(*opts.paramsPath);
        }
        if (opts.livePath) {
            request.parameters.liveFramePath = std::filesystem::absolute(*opts.livePath).string();
        }
        if (opts.resultPath) {
            request.parameters.resultPath = std::filesystem::absolute(*opts.resultPath).string();
        }

        flowbridge::SimulationController controller(config);
        controller.startServer();
        if (!controller.waitUntilRunning(config.intervals.startupTimeout)) {
            std::cerr << "Solver did not start: " << controller.lastError().value_or("unknown reason") << "\n";
            controller.stopServer();
            return 1;
        }
        // Before the request goes out: a result left by an earlier run must not count.
        std::optional<flowbridge::ArtifactWatcher> watcher;
        if (request.parameters.resultPath) {
            watcher.emplace(*request.parameters.resultPath);
        }
        if (!controller.applyParameters(request)) {
            controller.stopServer();
            return 1;
        }

        ClientOptions resolved = opts;
        resolved.livePath = request.parameters.liveFramePath;
        resolved.resultPath = request.parameters.resultPath;
        const bool ok = followRun(controller, resolved, watcher);
        controller.stopServer();
        return ok ? 0 : 1;
    } catch (const std::exception& ex) {
        std::cerr << "flowbridge_client: " << ex.what() << "\n";
        return 1;
    }
}
