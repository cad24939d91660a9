// filename: sdf.hpp
// part of FlowBridge 2D Obstacle Solver Bridge
// MIT License

#pragma once

#include <cstddef>
#include <functional>
#include <vector>

#include "flowbridge/types.hpp"

namespace flowbridge {

using SdfQuery = std::function<double(double, double)>;

bool pointInPolygon(double x, double y, const std::vector<double>& xs, const std::vector<double>& ys);

/**
 * @brief Signed distance to the union of a set of closed polygons.
 *
 * Negative inside, positive outside. Vertex arrays are copied once at build time;
 * queries allocate nothing and are safe to call concurrently.
 */
class MultiPolygonSdf {
public:
    struct Polygon {
        std::vector<double> xs;
        std::vector<double> ys;
    };

    MultiPolygonSdf() = default;
    explicit MultiPolygonSdf(const std::vector<Polyline>& polylines);

    double operator()(double x, double y) const;
    double operator()(const Point2& p) const { return (*this)(p.x, p.y); }

    [[nodiscard]] bool empty() const { return polygons_.empty(); }
    [[nodiscard]] std::size_t polygonCount() const { return polygons_.size(); }
    [[nodiscard]] std::size_t skippedPolygons() const { return skipped_; }
    [[nodiscard]] std::size_t pointCount() const;
    [[nodiscard]] const std::vector<Polygon>& polygons() const { return polygons_; }

    static double polygonSignedDistance(const Polygon& polygon, double x, double y);

private:
    std::vector<Polygon> polygons_;
    std::size_t skipped_{0};
};

// Polygons with fewer than three vertices are skipped, not rejected.
MultiPolygonSdf buildMultiPolygonSdf(const std::vector<Polyline>& polylines);

}  // namespace flowbridge
