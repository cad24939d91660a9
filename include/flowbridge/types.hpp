// filename: types.hpp
// part of FlowBridge 2D Obstacle Solver Bridge
// MIT License

#pragma once

#include <cstddef>
#include <vector>

namespace flowbridge {

constexpr double kGeomEps = 1e-10;

struct Point2 {
    double x{0.0};
    double y{0.0};
};

inline bool operator==(const Point2& a, const Point2& b) {
    return a.x == b.x && a.y == b.y;
}

inline bool operator!=(const Point2& a, const Point2& b) {
    return !(a == b);
}

struct Polyline {
    std::vector<Point2> points;
    bool closed{true};
};

/**
 * @brief Removes the redundant closing vertex of a closed polyline.
 *
 * A closed polyline wraps last -> first implicitly, so a trailing point equal to
 * the first one carries no information.
 */
inline Polyline dropClosingDuplicate(Polyline polyline) {
    if (polyline.closed && polyline.points.size() > 1 &&
        polyline.points.front() == polyline.points.back()) {
        polyline.points.pop_back();
    }
    return polyline;
}

}  // namespace flowbridge
