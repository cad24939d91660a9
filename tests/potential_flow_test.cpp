// filename: potential_flow_test.cpp
// part of FlowBridge 2D Obstacle Solver Bridge
// MIT License

#include "flowbridge/geometry.hpp"
#include "flowbridge/io_vtk.hpp"
#include "flowbridge/log.hpp"
#include "flowbridge/solve.hpp"
#include "test_support.hpp"

#include <cmath>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <stdexcept>

namespace {

struct CountingSink final : flowbridge::FrameSink {
    std::size_t frames{0};
    std::size_t finals{0};
    std::size_t stopAfter{0};

    bool onFrame(const flowbridge::SolveProgress& progress, const flowbridge::FlowGrid&) override {
        ++frames;
        finals += progress.final ? 1U : 0U;
        return stopAfter == 0 || frames < stopAfter;
    }
};

}  // namespace

int main() {
    using namespace flowbridge;

    setQuiet(true);

    // Node counts that would wrap size_t never reach allocation.
    SimulationParameters huge{};
    huge.gridResolutionX = std::size_t{1} << 33;
    huge.gridResolutionY = std::size_t{1} << 31;
    bool refused = false;
    try {
        (void)makeFlowGrid(huge);
    } catch (const std::invalid_argument&) {
        refused = true;
    }
    if (!refused) {
        std::cerr << "makeFlowGrid accepted a grid whose node count overflows\n";
        return 1;
    }

    // Without a body the free stream is already the solution.
    SimulationParameters params{};
    params.gridResolutionX = 21;
    params.gridResolutionY = 11;
    params.inletVelocity = 1.5;
    FlowGrid empty = makeFlowGrid(params);
    PotentialFlowBackend backend;
    const SolveSummary trivial = backend.run(empty, params, nullptr);
    if (!trivial.converged || trivial.iters != 1) {
        std::cerr << "Uniform flow should converge immediately\n";
        return 1;
    }
    for (std::size_t p = 0; p < empty.u.size(); ++p) {
        if (std::abs(empty.u[p] - 1.5) > 1e-9 || std::abs(empty.v[p]) > 1e-9) {
            std::cerr << "Uniform flow velocity wrong at node " << p << "\n";
            return 1;
        }
    }

    // A centred circle: zero velocity inside, acceleration over the top.
    params.gridResolutionX = 64;
    params.gridResolutionY = 48;
    params.inletVelocity = 1.0;
    params.maxIterations = 3000;
    params.convergenceTolerance = 1e-7;
    params.frameEveryIterations = 10;
    // Circle of radius 6 cells on the grid's own centre, so the node layout is symmetric.
    BodyGeometry body{};
    body.sdf = [](double x, double y) { return std::hypot(x - 31.5, y - 23.5) - 6.0; };
    FlowGrid grid = makeFlowGrid(params);
    rasterizeBody(body, grid);
    if (grid.solidCount() == 0 || grid.solid[grid.idx(32, 24)] == 0) {
        std::cerr << "Circle was not rasterised onto the grid\n";
        return 1;
    }

    CountingSink sink;
    const SolveSummary summary = backend.run(grid, params, &sink);
    if (!summary.converged) {
        std::cerr << "Circle case did not converge in " << summary.iters << " iterations\n";
        return 1;
    }
    if (sink.finals != 1 || sink.frames != summary.framesEmitted || sink.frames < 2) {
        std::cerr << "Expected periodic frames plus one final frame, got " << sink.frames << "\n";
        return 1;
    }
    const std::size_t centre = grid.idx(32, 24);
    if (grid.u[centre] != 0.0 || grid.v[centre] != 0.0) {
        std::cerr << "Solid nodes must carry zero velocity\n";
        return 1;
    }
    // Just above the body versus far upstream.
    const double shoulder = grid.u[grid.idx(31, 30)];
    const double farField = grid.u[grid.idx(2, 23)];
    if (!(shoulder > farField) || !(shoulder > 1.0)) {
        std::cerr << "Flow should speed up over the body: shoulder " << shoulder << ", far " << farField << "\n";
        return 1;
    }
    // Symmetry about the horizontal centre line.
    const double above = grid.u[grid.idx(20, 34)];
    const double below = grid.u[grid.idx(20, 13)];
    if (std::abs(above - below) > 1e-3) {
        std::cerr << "Flow is not symmetric about the body: " << above << " vs " << below << "\n";
        return 1;
    }

    // A sink can stop the solve early.
    CountingSink stopper;
    stopper.stopAfter = 2;
    params.convergenceTolerance = 1e-14;
    FlowGrid again = makeFlowGrid(params);
    rasterizeBody(body, again);
    const SolveSummary stopped = backend.run(again, params, &stopper);
    if (stopper.frames != 2 || stopper.finals != 0 || stopped.iters != 2 * params.frameEveryIterations) {
        std::cerr << "Sink returning false should stop the solve\n";
        return 1;
    }

    testing::TempDir dir("flowbridge_vti");
    const std::string path = dir.file("circle.vti");
    writeFlowFieldVti(path, grid);
    const std::string vti = testing::readWhole(path);
    if (vti.find("header_type=\"UInt64\">") == std::string::npos ||
        vti.find("<PointData Scalars=\"speed\">") == std::string::npos) {
        std::cerr << "VTI header is malformed\n";
        return 1;
    }
    // First appended block: UInt64 byte count then nx * ny doubles of sdf.
    const auto marker = vti.find("encoding=\"raw\">\n  _");
    if (marker == std::string::npos) {
        std::cerr << "Appended data marker missing\n";
        return 1;
    }
    std::uint64_t bytes = 0;
    std::memcpy(&bytes, vti.data() + vti.find('_', marker) + 1, sizeof(bytes));
    if (bytes != grid.nx * grid.ny * sizeof(double)) {
        std::cerr << "First data block has " << bytes << " bytes\n";
        return 1;
    }

    std::cout << "Potential flow solve validated in " << summary.iters << " iterations\n";
    return 0;
}
