// filename: geometry.cpp
// part of FlowBridge 2D Obstacle Solver Bridge
// MIT License

#include "flowbridge/geometry.hpp"

#include "flowbridge/log.hpp"
#include "flowbridge/simplify.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace flowbridge {
namespace {

constexpr const char* kLog = "geometry";

BodyGeometry fallbackBody(FallbackReason reason, const SimulationParameters& params) {
    BodyGeometry body{};
    body.fallback = reason;
    body.sdf = makeFallbackCircle(params.gridResolutionX, params.gridResolutionY);
    logWarn(kLog, std::string("Using fallback circle: ") + toString(reason));
    return body;
}

}  // namespace

const char* toString(FallbackReason reason) {
    switch (reason) {
        case FallbackReason::None:
            return "none";
        case FallbackReason::NoPolylines:
            return "no polylines";
        case FallbackReason::NoPoints:
            return "no points found in any polyline";
        case FallbackReason::NoUsablePolygon:
            return "no polyline has three or more distinct points";
        case FallbackReason::DegenerateExtent:
            return "geometry extent is degenerate";
    }
    return "unknown";
}

SdfQuery makeFallbackCircle(std::size_t nx, std::size_t ny) {
    const double cx = 0.5 * static_cast<double>(nx);
    const double cy = 0.5 * static_cast<double>(ny);
    const double radius = static_cast<double>(std::min(nx, ny)) / 8.0;
    return [cx, cy, radius](double x, double y) { return std::hypot(x - cx, y - cy) - radius; };
}

BodyGeometry loadBodyGeometry(const std::vector<Polyline>& polylines, const SimulationParameters& params) {
    if (polylines.empty()) {
        return fallbackBody(FallbackReason::NoPolylines, params);
    }

    BodyGeometry body{};
    Point2 lo{std::numeric_limits<double>::infinity(), std::numeric_limits<double>::infinity()};
    Point2 hi{-std::numeric_limits<double>::infinity(), -std::numeric_limits<double>::infinity()};

    for (const auto& source : polylines) {
        if (source.points.empty()) {
            continue;
        }
        const Polyline polyline = dropClosingDuplicate(source);
        body.originalPoints += polyline.points.size();

        Polyline reduced = polyline;
        if (params.simplifyTolerance > 0.0 && params.maxPointsPerPoly < polyline.points.size()) {
            reduced = simplifyPolyline(polyline, params.simplifyTolerance, params.maxPointsPerPoly).polyline;
            std::ostringstream msg;
            msg << "Simplified: " << polyline.points.size() << " -> " << reduced.points.size() << " points";
            logInfo(kLog, msg.str());
        }

        for (const auto& p : reduced.points) {
            lo.x = std::min(lo.x, p.x);
            lo.y = std::min(lo.y, p.y);
            hi.x = std::max(hi.x, p.x);
            hi.y = std::max(hi.y, p.y);
        }
        body.simplifiedPoints += reduced.points.size();
        body.simplified.push_back(std::move(reduced));
    }

    if (body.simplified.empty()) {
        return fallbackBody(FallbackReason::NoPoints, params);
    }

    auto worldSdf = std::make_shared<const MultiPolygonSdf>(body.simplified);
    if (worldSdf->empty()) {
        return fallbackBody(FallbackReason::NoUsablePolygon, params);
    }

    const double nx = static_cast<double>(params.gridResolutionX);
    const double ny = static_cast<double>(params.gridResolutionY);
    try {
        body.mapping = buildDomainMapping(lo, hi, Point2{0.5 * nx, 0.5 * ny}, Point2{nx, ny},
                                          params.objectScaleFactor);
    } catch (const std::invalid_argument& ex) {
        logWarn(kLog, std::string("Domain mapping rejected: ") + ex.what());
        return fallbackBody(FallbackReason::DegenerateExtent, params);
    }

    const DomainMapping mapping = body.mapping;
    body.sdf = [worldSdf, mapping](double x, double y) {
        const Point2 world = mapping.inverse(Point2{x, y});
        return (*worldSdf)(world) * mapping.scale();
    };

    std::ostringstream summary;
    summary << "Total points: " << body.originalPoints << " -> " << body.simplifiedPoints << " across "
            << worldSdf->polygonCount() << " polygon(s)";
    if (worldSdf->skippedPolygons() > 0) {
        summary << " (" << worldSdf->skippedPolygons() << " skipped)";
    }
    logInfo(kLog, summary.str());

    std::ostringstream scaling;
    scaling << "Scaling: " << std::fixed << std::setprecision(3) << mapping.scale() << "x, centred at ("
            << mapping.targetCenter().x << ", " << mapping.targetCenter().y << ")";
    logInfo(kLog, scaling.str());
    return body;
}

}  // namespace flowbridge
