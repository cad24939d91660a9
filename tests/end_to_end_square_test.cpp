// filename: end_to_end_square_test.cpp
// part of FlowBridge 2D Obstacle Solver Bridge
// MIT License

#include "flowbridge/controller.hpp"
#include "flowbridge/handoff.hpp"
#include "flowbridge/http.hpp"
#include "flowbridge/io_image.hpp"
#include "flowbridge/log.hpp"
#include "test_support.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <thread>

#ifndef FLOWBRIDGE_SERVICE_BINARY
#error "FLOWBRIDGE_SERVICE_BINARY must name the flowbridge_service executable"
#endif

int main() {
    using namespace flowbridge;
    namespace fs = std::filesystem;

    setQuiet(true);
    testing::TempDir dir("flowbridge_e2e");

    std::uint16_t port = 0;
    {
        HttpListener probe("127.0.0.1", 0);
        port = probe.port();
    }

    ControllerConfig config{};
    config.executable = FLOWBRIDGE_SERVICE_BINARY;
    config.port = port;
    config.extraArgs = {"--port", std::to_string(port), "--output-dir", dir.file("outputs"), "--quiet"};
    config.intervals.readinessPoll = Millis{50};
    config.intervals.framePoll = Millis{20};
    config.intervals.artifactPoll = Millis{20};
    config.intervals.shutdownPoll = Millis{20};
    config.intervals.stopGrace = Millis{3000};

    SimulationRequest request{};
    request.parameters.gridResolutionX = 48;
    request.parameters.gridResolutionY = 32;
    request.parameters.maxIterations = 400;
    request.parameters.frameEveryIterations = 25;
    request.parameters.liveFramePath = dir.file("live.ppm");
    request.parameters.resultPath = dir.file("square.vti");
    Polyline square;
    square.points = {{0.0, 0.0}, {1.0, 0.0}, {1.0, 1.0}, {0.0, 1.0}, {0.0, 0.0}};
    request.polylines.push_back(square);

    SimulationController controller(config);
    try {
        controller.startServer();
    } catch (const std::exception& ex) {
        std::cerr << "Could not start " << FLOWBRIDGE_SERVICE_BINARY << ": " << ex.what() << "\n";
        return 1;
    }
    if (!controller.waitUntilRunning(Millis{15000})) {
        std::cerr << "Service never became ready: " << controller.lastError().value_or("no error") << "\n";
        return 1;
    }
    ArtifactWatcher watcher(*request.parameters.resultPath);
    if (!controller.applyParameters(request)) {
        std::cerr << "applyParameters failed while Running\n";
        return 1;
    }

    LiveFramePoller frames(*request.parameters.liveFramePath, Millis{60000}, isCompletePpm);
    IntervalTimer frameTimer(config.intervals.framePoll);
    bool sawFrame = false;
    const Deadline deadline(Millis{60000});
    while (!watcher.poll()) {
        if (controller.poll() != SessionState::Running || deadline.expired()) {
            std::cerr << "Result never appeared (state " << toString(controller.state()) << ")\n";
            return 1;
        }
        if (frameTimer.due() && frames.poll().status == FrameStatus::Fresh) {
            sawFrame = true;
        }
        std::this_thread::sleep_for(Millis{10});
    }
    // The last frame stays in place until the session ends.
    sawFrame = sawFrame || frames.poll().status == FrameStatus::Fresh;
    if (!sawFrame) {
        std::cerr << "No complete live frame was observed\n";
        return 1;
    }

    const std::string vti = testing::readWhole(*request.parameters.resultPath);
    if (vti.rfind("<?xml", 0) != 0 || vti.find("Name=\"speed\"") == std::string::npos ||
        vti.find("Name=\"sdf\"") == std::string::npos || vti.find("</VTKFile>") == std::string::npos) {
        std::cerr << "Result is not a complete VTK ImageData file\n";
        return 1;
    }

    while (controller.pendingAcknowledgements() > 0 && !deadline.expired()) {
        controller.poll();
        std::this_thread::sleep_for(Millis{10});
    }

    controller.stopServer();
    if (controller.state() != SessionState::Stopped) {
        std::cerr << "Session did not stop cleanly\n";
        return 1;
    }
    if (fs::exists(*request.parameters.liveFramePath)) {
        std::cerr << "Live frame should be deleted when the session ends\n";
        return 1;
    }
    if (!fs::exists(*request.parameters.resultPath)) {
        std::cerr << "Final result must survive the session\n";
        return 1;
    }

    std::cout << "End-to-end square scenario validated\n";
    return 0;
}
