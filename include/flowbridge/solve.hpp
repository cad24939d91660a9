// filename: solve.hpp
// part of FlowBridge 2D Obstacle Solver Bridge
// MIT License

#pragma once

#include <cstddef>

#include "flowbridge/geometry.hpp"
#include "flowbridge/grid.hpp"
#include "flowbridge/request.hpp"

namespace flowbridge {

struct SolveProgress {
    std::size_t iter{0};
    double relResidual{0.0};
    double elapsedSeconds{0.0};
    bool final{false};
};

/**
 * @brief Receives intermediate fields while a solve runs.
 *
 * Returning false from onFrame stops the solve after the current iteration.
 */
struct FrameSink {
    virtual ~FrameSink() = default;
    virtual bool onFrame(const SolveProgress& progress, const FlowGrid& grid) = 0;
};

struct SolveSummary {
    std::size_t iters{0};
    double relResidual{0.0};
    bool converged{false};
    std::size_t framesEmitted{0};
};

/**
 * @brief The numerical method behind a service. Treated as opaque by the bridge.
 */
class SolveBackend {
public:
    virtual ~SolveBackend() = default;
    virtual const char* name() const = 0;
    virtual SolveSummary run(FlowGrid& grid, const SimulationParameters& params, FrameSink* sink) = 0;
};

/**
 * @brief Inviscid flow around the body via the stream function.
 *
 * Solves Laplace(psi) = 0 with Gauss-Seidel SOR. The outer boundary carries the
 * free stream psi = U * y; solid nodes hold psi at the value of the centre line.
 */
class PotentialFlowBackend final : public SolveBackend {
public:
    const char* name() const override { return "potential-flow-sor"; }
    SolveSummary run(FlowGrid& grid, const SimulationParameters& params, FrameSink* sink) override;
};

FlowGrid makeFlowGrid(const SimulationParameters& params);

// Samples the body SDF at every node and marks nodes with sdf < 0 as solid.
void rasterizeBody(const BodyGeometry& body, FlowGrid& grid);

// Central-difference velocity from psi; solid nodes get zero velocity.
void computeVelocity(FlowGrid& grid);

}  // namespace flowbridge
