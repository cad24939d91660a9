// filename: request.hpp
// part of FlowBridge 2D Obstacle Solver Bridge
// MIT License

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "flowbridge/types.hpp"

namespace flowbridge {

constexpr int kRequestSchemaVersion = 1;

// Upper bound on grid_resolution_x * grid_resolution_y (a 4096 x 4096 grid).
constexpr std::size_t kMaxGridNodes = std::size_t{1} << 24;

struct SimulationParameters {
    double inletVelocity{1.0};
    double domainWidth{2.0};
    double domainHeight{1.0};
    std::size_t gridResolutionX{192};
    std::size_t gridResolutionY{128};

    double simplifyTolerance{0.0};
    std::size_t maxPointsPerPoly{1000};
    double objectScaleFactor{0.3};

    double colorScaleMin{0.0};
    double colorScaleMax{2.0};
    bool showBody{true};

    std::size_t maxIterations{4000};
    double convergenceTolerance{1e-6};
    double relaxation{1.8};
    std::size_t frameEveryIterations{100};

    // When unset the service writes to its own output directory.
    std::optional<std::string> liveFramePath;
    std::optional<std::string> resultPath;
};

struct SimulationRequest {
    SimulationParameters parameters;
    std::vector<Polyline> polylines;
};

/**
 * @brief Decodes a request body in the canonical (version 1, snake_case) schema.
 * @throws RequestSchemaError on malformed JSON, wrong types, unknown keys, or
 *         out-of-range values.
 */
SimulationRequest parseSimulationRequest(const std::string& body);

SimulationRequest loadSimulationRequestFromJson(const std::string& path);

std::string serializeSimulationRequest(const SimulationRequest& request);

// Reads a geometry-only document: {"polylines": [...]}.
std::vector<Polyline> loadPolylinesFromJson(const std::string& path);

// Reads a bare parameter object in the same schema as "simulation_parameters".
SimulationParameters loadSimulationParametersFromJson(const std::string& path);

}  // namespace flowbridge
