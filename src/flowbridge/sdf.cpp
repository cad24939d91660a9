// filename: sdf.cpp
// part of FlowBridge 2D Obstacle Solver Bridge
// MIT License

#include "flowbridge/sdf.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace flowbridge {
namespace {

constexpr double kTiny = 1e-12;

double distanceToBoundary(const MultiPolygonSdf::Polygon& polygon, double x, double y) {
    const std::size_t count = polygon.xs.size();
    double minDist = std::numeric_limits<double>::infinity();
    for (std::size_t i = 0; i < count; ++i) {
        const std::size_t j = (i + 1 == count) ? 0 : i + 1;
        const double ax = polygon.xs[i];
        const double ay = polygon.ys[i];
        const double vx = polygon.xs[j] - ax;
        const double vy = polygon.ys[j] - ay;
        const double wx = x - ax;
        const double wy = y - ay;

        const double t = std::clamp((wx * vx + wy * vy) / (vx * vx + vy * vy + kGeomEps), 0.0, 1.0);
        const double dx = x - (ax + t * vx);
        const double dy = y - (ay + t * vy);
        minDist = std::min(minDist, std::sqrt(dx * dx + dy * dy));
    }
    return minDist;
}

}  // namespace

bool pointInPolygon(double x, double y, const std::vector<double>& xs, const std::vector<double>& ys) {
    const std::size_t count = xs.size();
    if (count == 0U || count != ys.size()) {
        return false;
    }

    bool inside = false;
    for (std::size_t i = 0, j = count - 1; i < count; j = i++) {
        const double xi = xs[i];
        const double yi = ys[i];
        const double xj = xs[j];
        const double yj = ys[j];

        const double denom = yj - yi;
        if (std::abs(denom) < kTiny) {
            continue;
        }
        const bool intersects = ((yi > y) != (yj > y)) &&
                                (x < (xj - xi) * (y - yi) / denom + xi);
        if (intersects) {
            inside = !inside;
        }
    }

    return inside;
}

MultiPolygonSdf::MultiPolygonSdf(const std::vector<Polyline>& polylines) {
    polygons_.reserve(polylines.size());
    for (const auto& source : polylines) {
        const Polyline polyline = dropClosingDuplicate(source);
        if (polyline.points.size() < 3) {
            ++skipped_;
            continue;
        }
        Polygon polygon;
        polygon.xs.reserve(polyline.points.size());
        polygon.ys.reserve(polyline.points.size());
        for (const auto& p : polyline.points) {
            polygon.xs.push_back(p.x);
            polygon.ys.push_back(p.y);
        }
        polygons_.push_back(std::move(polygon));
    }
}

double MultiPolygonSdf::polygonSignedDistance(const Polygon& polygon, double x, double y) {
    const double minDist = distanceToBoundary(polygon, x, y);
    return pointInPolygon(x, y, polygon.xs, polygon.ys) ? -minDist : minDist;
}

double MultiPolygonSdf::operator()(double x, double y) const {
    double best = std::numeric_limits<double>::infinity();
    for (const auto& polygon : polygons_) {
        best = std::min(best, polygonSignedDistance(polygon, x, y));
    }
    return best;
}

std::size_t MultiPolygonSdf::pointCount() const {
    std::size_t total = 0;
    for (const auto& polygon : polygons_) {
        total += polygon.xs.size();
    }
    return total;
}

MultiPolygonSdf buildMultiPolygonSdf(const std::vector<Polyline>& polylines) {
    return MultiPolygonSdf(polylines);
}

}  // namespace flowbridge
