// filename: sdf_test.cpp
// part of FlowBridge 2D Obstacle Solver Bridge
// MIT License

#include "flowbridge/sdf.hpp"
#include "flowbridge/types.hpp"

#include <cmath>
#include <iostream>
#include <limits>
#include <vector>

namespace {

flowbridge::Polyline square(double x0, double y0, double size, bool repeatFirst) {
    flowbridge::Polyline polyline;
    polyline.points = {{x0, y0}, {x0 + size, y0}, {x0 + size, y0 + size}, {x0, y0 + size}};
    if (repeatFirst) {
        polyline.points.push_back({x0, y0});
    }
    return polyline;
}

bool near(double a, double b, double tol) {
    return std::abs(a - b) <= tol;
}

}  // namespace

int main() {
    using namespace flowbridge;

    const MultiPolygonSdf unit = buildMultiPolygonSdf({square(0.0, 0.0, 1.0, true)});
    if (unit.polygonCount() != 1 || unit.pointCount() != 4) {
        std::cerr << "Closing duplicate should be dropped: " << unit.pointCount() << " points\n";
        return 1;
    }

    const double centre = unit(0.5, 0.5);
    if (!near(centre, -0.5, 1e-6)) {
        std::cerr << "Centroid distance expected -0.5, got " << centre << "\n";
        return 1;
    }
    const double far = unit(10.0, 10.0);
    if (!near(far, std::hypot(9.0, 9.0), 1e-6)) {
        std::cerr << "Far point distance expected " << std::hypot(9.0, 9.0) << ", got " << far << "\n";
        return 1;
    }
    if (!near(unit(1.5, 0.5), 0.5, 1e-6) || !near(unit(0.5, 0.9), -0.1, 1e-6)) {
        std::cerr << "Edge distances are wrong\n";
        return 1;
    }

    const MultiPolygonSdf pair = buildMultiPolygonSdf({square(0.0, 0.0, 1.0, false), square(3.0, 0.0, 1.0, false)});
    if (pair.polygonCount() != 2) {
        std::cerr << "Expected two polygons in the union\n";
        return 1;
    }
    if (!(pair(3.5, 0.5) < 0.0) || !(pair(0.5, 0.5) < 0.0)) {
        std::cerr << "Both squares should be inside the union\n";
        return 1;
    }
    if (!near(pair(2.0, 0.5), 1.0, 1e-6)) {
        std::cerr << "Gap midpoint should be 1.0 from both squares, got " << pair(2.0, 0.5) << "\n";
        return 1;
    }

    Polyline sliver;
    sliver.points = {{0.0, 0.0}, {1.0, 1.0}};
    const MultiPolygonSdf mixed = buildMultiPolygonSdf({sliver, square(0.0, 0.0, 1.0, true)});
    if (mixed.polygonCount() != 1 || mixed.skippedPolygons() != 1) {
        std::cerr << "Two-point polyline should be skipped and counted\n";
        return 1;
    }

    const MultiPolygonSdf none = buildMultiPolygonSdf({sliver});
    if (!none.empty() || none(0.0, 0.0) != std::numeric_limits<double>::infinity()) {
        std::cerr << "An SDF with no usable polygons must return +infinity\n";
        return 1;
    }

    const std::vector<double> xs{0.0, 1.0, 1.0, 0.0};
    const std::vector<double> ys{0.0, 0.0, 1.0, 1.0};
    if (!pointInPolygon(0.25, 0.75, xs, ys) || pointInPolygon(1.25, 0.75, xs, ys)) {
        std::cerr << "Ray casting misclassified a point\n";
        return 1;
    }

    std::cout << "Multi-polygon SDF validated\n";
    return 0;
}
