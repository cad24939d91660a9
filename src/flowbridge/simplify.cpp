// filename: simplify.cpp
// part of FlowBridge 2D Obstacle Solver Bridge
// MIT License

#include "flowbridge/simplify.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace flowbridge {
namespace {

constexpr std::size_t kMinPoints = 2;

// Distance from p to the infinite line through a and b, in implicit form.
double perpendicularDistance(const Point2& p, const Point2& a, const Point2& b) {
    const double lineA = b.y - a.y;
    const double lineB = -(b.x - a.x);
    const double lineC = b.x * a.y - b.y * a.x;
    return std::abs(lineA * p.x + lineB * p.y + lineC) /
           std::sqrt(lineA * lineA + lineB * lineB + kGeomEps);
}

std::vector<Point2> resampleByStride(const std::vector<Point2>& points, std::size_t maxPoints) {
    const std::size_t n = points.size();
    const std::size_t stride = std::max<std::size_t>(1, (n - 1 + maxPoints - 2) / (maxPoints - 1));

    std::vector<Point2> reduced;
    reduced.reserve(maxPoints);
    for (std::size_t i = 0; i < n; i += stride) {
        reduced.push_back(points[i]);
    }
    if ((n - 1) % stride != 0) {
        reduced.push_back(points.back());
    }
    return reduced;
}

}  // namespace

std::vector<std::size_t> douglasPeuckerIndices(const std::vector<Point2>& points, double tolerance) {
    const std::size_t n = points.size();
    std::vector<std::size_t> indices;
    if (n <= 2) {
        for (std::size_t i = 0; i < n; ++i) {
            indices.push_back(i);
        }
        return indices;
    }

    std::vector<bool> keep(n, false);
    keep.front() = true;
    keep.back() = true;

    std::vector<std::pair<std::size_t, std::size_t>> work;
    work.emplace_back(0, n - 1);
    while (!work.empty()) {
        const auto [first, last] = work.back();
        work.pop_back();
        if (last <= first + 1) {
            continue;
        }

        double maxDist = 0.0;
        std::size_t maxIdx = first;
        for (std::size_t i = first + 1; i < last; ++i) {
            const double dist = perpendicularDistance(points[i], points[first], points[last]);
            if (dist > maxDist) {
                maxDist = dist;
                maxIdx = i;
            }
        }

        if (maxDist > tolerance) {
            keep[maxIdx] = true;
            work.emplace_back(maxIdx, last);
            work.emplace_back(first, maxIdx);
        }
    }

    for (std::size_t i = 0; i < n; ++i) {
        if (keep[i]) {
            indices.push_back(i);
        }
    }
    return indices;
}

std::vector<Point2> simplifyPoints(const std::vector<Point2>& points,
                                   double tolerance,
                                   std::size_t maxPoints) {
    if (points.size() <= 2) {
        return points;
    }
    if (!(tolerance >= 0.0)) {
        tolerance = 0.0;
    }
    maxPoints = std::max(maxPoints, kMinPoints);

    std::vector<Point2> reduced;
    if (tolerance == 0.0) {
        reduced = points;
    } else {
        const std::vector<std::size_t> kept = douglasPeuckerIndices(points, tolerance);
        reduced.reserve(kept.size());
        for (const std::size_t idx : kept) {
            reduced.push_back(points[idx]);
        }
    }

    if (reduced.size() > maxPoints) {
        reduced = resampleByStride(reduced, maxPoints);
    }
    return reduced;
}

SimplifiedPolyline simplifyPolyline(const Polyline& polyline, double tolerance, std::size_t maxPoints) {
    SimplifiedPolyline result{};
    result.tolerance = tolerance;
    result.maxPoints = maxPoints;
    result.originalCount = polyline.points.size();
    result.polyline.closed = polyline.closed;
    result.polyline.points = simplifyPoints(polyline.points, tolerance, maxPoints);
    return result;
}

}  // namespace flowbridge
