// filename: solve.cpp
// part of FlowBridge 2D Obstacle Solver Bridge
// MIT License

#include "flowbridge/solve.hpp"

#include "flowbridge/log.hpp"

#include <chrono>
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>

namespace flowbridge {
namespace {

using Clock = std::chrono::steady_clock;

constexpr const char* kLog = "solve";

void applyFreeStream(FlowGrid& grid, double inletVelocity) {
    const double yCentre = 0.5 * static_cast<double>(grid.ny - 1) * grid.dy;
    for (std::size_t j = 0; j < grid.ny; ++j) {
        const double y = static_cast<double>(j) * grid.dy;
        for (std::size_t i = 0; i < grid.nx; ++i) {
            const std::size_t p = grid.idx(i, j);
            grid.psi[p] = grid.solid[p] != 0 ? inletVelocity * yCentre : inletVelocity * y;
        }
    }
}

bool emitFrame(FrameSink* sink, const SolveProgress& progress, FlowGrid& grid, std::size_t& emitted) {
    if (sink == nullptr) {
        return true;
    }
    computeVelocity(grid);
    ++emitted;
    return sink->onFrame(progress, grid);
}

}  // namespace

FlowGrid makeFlowGrid(const SimulationParameters& params) {
    const std::size_t nx = params.gridResolutionX;
    const std::size_t ny = params.gridResolutionY;
    if (nx < 3 || ny < 3 || nx > kMaxGridNodes / ny) {
        throw std::invalid_argument("Grid " + std::to_string(nx) + "x" + std::to_string(ny) +
                                    " is outside 3x3 .. " + std::to_string(kMaxGridNodes) + " nodes");
    }
    const double dx = params.domainWidth / static_cast<double>(nx - 1);
    const double dy = params.domainHeight / static_cast<double>(ny - 1);
    return FlowGrid(nx, ny, dx, dy);
}

void rasterizeBody(const BodyGeometry& body, FlowGrid& grid) {
    for (std::size_t j = 0; j < grid.ny; ++j) {
        for (std::size_t i = 0; i < grid.nx; ++i) {
            const std::size_t p = grid.idx(i, j);
            const double d = body.sdf ? body.sdf(static_cast<double>(i), static_cast<double>(j))
                                      : std::numeric_limits<double>::infinity();
            grid.sdf[p] = d;
            grid.solid[p] = d < 0.0 ? 1 : 0;
        }
    }
}

void computeVelocity(FlowGrid& grid) {
    const double inv2dx = 0.5 / grid.dx;
    const double inv2dy = 0.5 / grid.dy;
    for (std::size_t j = 0; j < grid.ny; ++j) {
        for (std::size_t i = 0; i < grid.nx; ++i) {
            const std::size_t p = grid.idx(i, j);
            if (grid.solid[p] != 0) {
                grid.u[p] = 0.0;
                grid.v[p] = 0.0;
                continue;
            }
            // One-sided differences on the outer frame.
            const std::size_t iw = i > 0 ? i - 1 : i;
            const std::size_t ie = i + 1 < grid.nx ? i + 1 : i;
            const std::size_t js = j > 0 ? j - 1 : j;
            const std::size_t jn = j + 1 < grid.ny ? j + 1 : j;
            const double sx = (ie - iw) == 2 ? inv2dx : 1.0 / grid.dx;
            const double sy = (jn - js) == 2 ? inv2dy : 1.0 / grid.dy;
            grid.u[p] = (grid.psi[grid.idx(i, jn)] - grid.psi[grid.idx(i, js)]) * sy;
            grid.v[p] = -(grid.psi[grid.idx(ie, j)] - grid.psi[grid.idx(iw, j)]) * sx;
        }
    }
}

SolveSummary PotentialFlowBackend::run(FlowGrid& grid, const SimulationParameters& params, FrameSink* sink) {
    SolveSummary summary{};
    if (grid.nx < 3 || grid.ny < 3) {
        return summary;
    }

    applyFreeStream(grid, params.inletVelocity);

    const double invDx2 = 1.0 / (grid.dx * grid.dx);
    const double invDy2 = 1.0 / (grid.dy * grid.dy);
    const double diag = 2.0 * (invDx2 + invDy2);
    const double omega = params.relaxation;
    const std::size_t frameEvery = params.frameEveryIterations > 0 ? params.frameEveryIterations : 1;

    // Residuals are measured against the stencil magnitude of the initial field.
    double reference2 = 0.0;
    for (std::size_t j = 1; j + 1 < grid.ny; ++j) {
        for (std::size_t i = 1; i + 1 < grid.nx; ++i) {
            const std::size_t p = grid.idx(i, j);
            if (grid.solid[p] == 0) {
                reference2 += (diag * grid.psi[p]) * (diag * grid.psi[p]);
            }
        }
    }
    const double denom = std::sqrt(reference2) + 1e-30;

    const auto start = Clock::now();
    bool stopped = false;

    for (std::size_t iter = 0; iter < params.maxIterations; ++iter) {
        double residualNorm2 = 0.0;

        for (std::size_t j = 1; j + 1 < grid.ny; ++j) {
            for (std::size_t i = 1; i + 1 < grid.nx; ++i) {
                const std::size_t p = grid.idx(i, j);
                if (grid.solid[p] != 0) {
                    continue;
                }
                const double neighbours = (grid.psi[grid.idx(i + 1, j)] + grid.psi[grid.idx(i - 1, j)]) * invDx2 +
                                          (grid.psi[grid.idx(i, j + 1)] + grid.psi[grid.idx(i, j - 1)]) * invDy2;
                const double residual = neighbours - diag * grid.psi[p];
                grid.psi[p] += omega * residual / diag;
                residualNorm2 += residual * residual;
            }
        }

        summary.iters = iter + 1;
        summary.relResidual = std::sqrt(residualNorm2) / denom;
        if (summary.relResidual < params.convergenceTolerance) {
            summary.converged = true;
            break;
        }

        if (sink != nullptr && summary.iters % frameEvery == 0) {
            SolveProgress progress{};
            progress.iter = summary.iters;
            progress.relResidual = summary.relResidual;
            progress.elapsedSeconds = std::chrono::duration<double>(Clock::now() - start).count();
            if (!emitFrame(sink, progress, grid, summary.framesEmitted)) {
                stopped = true;
                break;
            }
        }
    }

    computeVelocity(grid);
    if (!stopped) {
        SolveProgress progress{};
        progress.iter = summary.iters;
        progress.relResidual = summary.relResidual;
        progress.elapsedSeconds = std::chrono::duration<double>(Clock::now() - start).count();
        progress.final = true;
        (void)emitFrame(sink, progress, grid, summary.framesEmitted);
    }

    std::ostringstream msg;
    msg << name() << ": " << summary.iters << " iterations, rel residual " << summary.relResidual
        << (summary.converged ? " (converged)" : " (iteration cap)");
    logInfo(kLog, msg.str());
    return summary;
}

}  // namespace flowbridge
