// filename: domain_scaler.cpp
// part of FlowBridge 2D Obstacle Solver Bridge
// MIT License

#include "flowbridge/domain_scaler.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace flowbridge {
namespace {
constexpr double kMinExtent = 1e-12;
}  // namespace

DomainMapping buildDomainMapping(const Point2& extentMin,
                                 const Point2& extentMax,
                                 const Point2& targetCenter,
                                 const Point2& targetSpan,
                                 double objectScaleFraction) {
    if (!(objectScaleFraction > 0.0) || objectScaleFraction > 1.0) {
        throw std::invalid_argument("object scale fraction must lie in (0, 1]");
    }
    if (!(targetSpan.x > 0.0) || !(targetSpan.y > 0.0)) {
        throw std::invalid_argument("target span must be positive on both axes");
    }

    const double width = extentMax.x - extentMin.x;
    const double height = extentMax.y - extentMin.y;

    double scale = std::numeric_limits<double>::infinity();
    if (width > kMinExtent) {
        scale = std::min(scale, targetSpan.x * objectScaleFraction / width);
    }
    if (height > kMinExtent) {
        scale = std::min(scale, targetSpan.y * objectScaleFraction / height);
    }
    if (!std::isfinite(scale)) {
        throw std::invalid_argument("extent is degenerate on both axes");
    }

    const Point2 extentCenter{0.5 * (extentMin.x + extentMax.x), 0.5 * (extentMin.y + extentMax.y)};
    return DomainMapping(scale, extentCenter, targetCenter);
}

}  // namespace flowbridge
