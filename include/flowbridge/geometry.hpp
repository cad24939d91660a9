// filename: geometry.hpp
// part of FlowBridge 2D Obstacle Solver Bridge
// MIT License

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "flowbridge/domain_scaler.hpp"
#include "flowbridge/request.hpp"
#include "flowbridge/sdf.hpp"
#include "flowbridge/types.hpp"

namespace flowbridge {

enum class FallbackReason {
    None,
    NoPolylines,
    NoPoints,
    NoUsablePolygon,
    DegenerateExtent,
};

const char* toString(FallbackReason reason);

/**
 * @brief Solver-ready body description in grid coordinates.
 *
 * `sdf` is evaluated at grid coordinates (cell units, origin at the lower-left
 * node) and returns distances in cell units. When `fallback` is not None the
 * body is the substitute circle and `mapping` is the identity.
 */
struct BodyGeometry {
    SdfQuery sdf;
    FallbackReason fallback{FallbackReason::None};
    DomainMapping mapping;
    std::vector<Polyline> simplified;
    std::size_t originalPoints{0};
    std::size_t simplifiedPoints{0};

    [[nodiscard]] bool usedFallback() const { return fallback != FallbackReason::None; }
};

/**
 * @brief Simplifies, unions and scales request polylines onto the solver grid.
 *
 * Never throws for geometric reasons: empty or degenerate input yields the
 * fallback circle centred in the grid with radius min(nx, ny) / 8 and the
 * corresponding FallbackReason.
 */
BodyGeometry loadBodyGeometry(const std::vector<Polyline>& polylines, const SimulationParameters& params);

SdfQuery makeFallbackCircle(std::size_t nx, std::size_t ny);

}  // namespace flowbridge
