// filename: simplify.hpp
// part of FlowBridge 2D Obstacle Solver Bridge
// MIT License

#pragma once

#include <cstddef>
#include <vector>

#include "flowbridge/types.hpp"

namespace flowbridge {

struct SimplifiedPolyline {
    Polyline polyline;
    double tolerance{0.0};
    std::size_t maxPoints{0};
    std::size_t originalCount{0};
};

/**
 * @brief Indices kept by Douglas-Peucker, in ascending order.
 *
 * Always contains the first and last index. Runs on an explicit work stack so
 * long, nearly collinear inputs cannot exhaust the call stack.
 */
std::vector<std::size_t> douglasPeuckerIndices(const std::vector<Point2>& points, double tolerance);

/**
 * @brief Reduces a point sequence within a perpendicular-distance tolerance.
 *
 * A tolerance of zero keeps every point. If the reduced sequence still has more
 * than maxPoints entries it is resampled with a fixed stride; the final point is
 * always retained. Never throws.
 */
std::vector<Point2> simplifyPoints(const std::vector<Point2>& points,
                                   double tolerance,
                                   std::size_t maxPoints);

SimplifiedPolyline simplifyPolyline(const Polyline& polyline, double tolerance, std::size_t maxPoints);

}  // namespace flowbridge
