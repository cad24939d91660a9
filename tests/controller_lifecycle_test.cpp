// filename: controller_lifecycle_test.cpp
// part of FlowBridge 2D Obstacle Solver Bridge
// MIT License

#include "flowbridge/controller.hpp"
#include "flowbridge/errors.hpp"
#include "flowbridge/http.hpp"
#include "flowbridge/log.hpp"
#include "test_support.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cmath>
#include <iostream>
#include <optional>
#include <thread>
#include <utility>

#include <signal.h>

namespace {

// A port that was free a moment ago; nothing will answer on it.
std::uint16_t unusedPort() {
    flowbridge::HttpListener probe("127.0.0.1", 0);
    return probe.port();
}

flowbridge::ControllerConfig shellConfig(const std::string& script, std::uint16_t port) {
    flowbridge::ControllerConfig config{};
    config.executable = "/bin/sh";
    config.script = script;
    config.port = port;
    config.intervals.readinessPoll = flowbridge::Millis{50};
    config.intervals.shutdownPoll = flowbridge::Millis{20};
    config.intervals.stopGrace = flowbridge::Millis{200};
    config.intervals.startupTimeout = flowbridge::Millis{5000};
    return config;
}

bool processGone(pid_t pid) {
    return ::kill(pid, 0) != 0 && errno == ESRCH;
}

// Several megabytes once serialized, well past what a loopback socket buffers.
flowbridge::SimulationRequest largeRequest() {
    flowbridge::SimulationRequest request{};
    flowbridge::Polyline ring;
    const std::size_t count = 300000;
    ring.points.reserve(count);
    for (std::size_t k = 0; k < count; ++k) {
        const double t = 6.283185307179586 * static_cast<double>(k) / static_cast<double>(count);
        ring.points.push_back({1000.0 + 250.123456 * std::cos(t), -1000.0 + 250.654321 * std::sin(t)});
    }
    request.polylines.push_back(std::move(ring));
    return request;
}

// Answers /status until told to stop, then holds the next connection in the
// backlog until the upload is released (or 8 s pass), then reads it whole and
// acknowledges it.
struct BusySolver {
    flowbridge::HttpListener listener{"127.0.0.1", 0};
    std::atomic<bool> ready{false};
    std::atomic<bool> releaseUpload{false};
    std::atomic<std::size_t> receivedBytes{0};
    std::atomic<bool> failed{false};

    void serve() {
        using namespace flowbridge;
        try {
            while (!ready.load()) {
                if (auto client = listener.accept(Millis{50})) {
                    try {
                        (void)readHttpRequest(*client, 1024, Millis{2000});
                        (void)writeHttpResponse(*client, HttpResponse{200, "text/plain", "ok"});
                    } catch (const HttpError&) {
                        // A status check that gave up early; the next one is answered.
                    }
                }
            }
            const Deadline busy(Millis{8000});
            while (!releaseUpload.load() && !busy.expired()) {
                std::this_thread::sleep_for(Millis{10});
            }
            auto client = listener.accept(Millis{10000});
            if (!client) {
                failed.store(true);
                return;
            }
            const HttpRequest upload = readHttpRequest(*client, 256U * 1024U * 1024U, Millis{20000});
            receivedBytes.store(upload.body.size());
            (void)writeHttpResponse(*client, HttpResponse{200, "text/plain", "Simulation completed"});
            lingeringClose(*client, Millis{1000});
        } catch (const HttpError& ex) {
            std::cerr << "Busy solver stub failed: " << ex.what() << "\n";
            failed.store(true);
        }
    }
};

}  // namespace

int main() {
    using namespace flowbridge;

    setQuiet(true);
    testing::TempDir dir("flowbridge_lifecycle");
    const std::string sleeper = dir.file("sleeper.sh");
    testing::writeWhole(sleeper, "exec sleep 30\n");
    const std::string crasher = dir.file("crasher.sh");
    testing::writeWhole(crasher, "exit 3\n");
    const std::uint16_t port = unusedPort();

    {
        ControllerConfig config = shellConfig(sleeper, port);
        config.executable = dir.file("no-such-solver");
        SimulationController controller(config);
        bool threw = false;
        try {
            controller.startServer();
        } catch (const LifecycleError&) {
            threw = true;
        }
        if (!threw || controller.state() != SessionState::Stopped || controller.pid()) {
            std::cerr << "Missing executable must throw and stay Stopped\n";
            return 1;
        }
    }

    {
        SimulationController controller(shellConfig(dir.file("missing.sh"), port));
        bool threw = false;
        try {
            controller.startServer();
        } catch (const LifecycleError&) {
            threw = true;
        }
        if (!threw || controller.state() != SessionState::Stopped) {
            std::cerr << "Missing script must throw and stay Stopped\n";
            return 1;
        }
    }

    {
        SimulationController controller(shellConfig(sleeper, port));
        SimulationRequest request{};
        if (controller.applyParameters(request) || controller.requestsIssued() != 0) {
            std::cerr << "Apply while Stopped must return false without network traffic\n";
            return 1;
        }

        // Start then immediate stop.
        controller.startServer();
        if (controller.state() != SessionState::Starting || !controller.pid()) {
            std::cerr << "startServer should return in Starting with a child\n";
            return 1;
        }
        const pid_t pid = *controller.pid();
        if (controller.applyParameters(request) || controller.requestsIssued() != 0) {
            std::cerr << "Apply while Starting must return false without network traffic\n";
            return 1;
        }
        controller.stopServer();
        if (controller.state() != SessionState::Stopped || controller.pid() || !processGone(pid)) {
            std::cerr << "stopServer must end Stopped with the child reaped\n";
            return 1;
        }
        controller.stopServer();
        if (controller.state() != SessionState::Stopped) {
            std::cerr << "A second stopServer must be a no-op\n";
            return 1;
        }
    }

    {
        SimulationController controller(shellConfig(crasher, port));
        controller.startServer();
        const Deadline deadline(Millis{5000});
        while (controller.poll() == SessionState::Starting && !deadline.expired()) {
            std::this_thread::sleep_for(Millis{20});
        }
        if (controller.state() != SessionState::Crashed || !controller.lastError()) {
            std::cerr << "An exiting child should be reported as Crashed, got " << toString(controller.state())
                      << "\n";
            return 1;
        }
        controller.stopServer();
        if (controller.state() != SessionState::Stopped) {
            std::cerr << "stopServer after a crash should reach Stopped\n";
            return 1;
        }
    }

    {
        ControllerConfig config = shellConfig(sleeper, port);
        config.intervals.startupTimeout = Millis{300};
        SimulationController controller(config);
        controller.startServer();
        const pid_t pid = *controller.pid();
        if (controller.waitUntilRunning(Millis{3000})) {
            std::cerr << "A child that never listens must not become Running\n";
            return 1;
        }
        if (controller.state() != SessionState::Stopped || !controller.lastError() || !processGone(pid)) {
            std::cerr << "Start timeout must kill the child and record the error\n";
            return 1;
        }
    }

    {
        // A solver that is not reading must not hold up applyParameters.
        std::optional<BusySolver> solver;
        solver.emplace();
        SimulationController controller(shellConfig(sleeper, solver->listener.port()));
        std::thread server([&solver] { solver->serve(); });
        controller.startServer();
        const bool running = controller.waitUntilRunning(Millis{5000});
        solver->ready.store(true);
        std::this_thread::sleep_for(Millis{200});

        const SimulationRequest request = largeRequest();
        const std::size_t expectedBytes = serializeSimulationRequest(request).size();
        const auto start = std::chrono::steady_clock::now();
        const bool applied = running && controller.applyParameters(request);
        const auto elapsed =
            std::chrono::duration_cast<Millis>(std::chrono::steady_clock::now() - start);
        solver->releaseUpload.store(true);

        bool acknowledged = false;
        const Deadline deadline(Millis{30000});
        while (applied && !deadline.expired()) {
            controller.poll();
            if (controller.pendingAcknowledgements() == 0) {
                acknowledged = true;
                break;
            }
            std::this_thread::sleep_for(Millis{5});
        }
        server.join();
        const std::size_t received = solver->receivedBytes.load();
        const bool serverFailed = solver->failed.load();
        solver.reset();
        controller.stopServer();

        if (!running || !applied) {
            std::cerr << "Controller should reach Running and accept the request\n";
            return 1;
        }
        if (elapsed > Millis{5000}) {
            std::cerr << "applyParameters blocked for " << elapsed.count() << " ms on a busy solver\n";
            return 1;
        }
        if (serverFailed || !acknowledged || received != expectedBytes) {
            std::cerr << "Queued request bytes were not delivered by poll(): got " << received << " of "
                      << expectedBytes << "\n";
            return 1;
        }
    }

    std::cout << "Controller lifecycle validated\n";
    return 0;
}
