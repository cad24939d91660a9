// filename: simplify_test.cpp
// part of FlowBridge 2D Obstacle Solver Bridge
// MIT License

#include "flowbridge/simplify.hpp"
#include "flowbridge/types.hpp"

#include <cmath>
#include <iostream>
#include <vector>

int main() {
    using namespace flowbridge;

    // Two points or fewer come back untouched whatever the settings.
    const std::vector<Point2> pair{{0.0, 0.0}, {1.0, 1.0}};
    if (simplifyPoints(pair, 5.0, 2) != pair) {
        std::cerr << "Two-point input was modified\n";
        return 1;
    }
    if (!simplifyPoints({}, 1.0, 2).empty()) {
        std::cerr << "Empty input produced points\n";
        return 1;
    }

    // Noisy line sampled from a sine wave.
    std::vector<Point2> wave;
    for (int k = 0; k <= 200; ++k) {
        const double x = static_cast<double>(k) * 0.05;
        wave.push_back({x, std::sin(x)});
    }

    const std::vector<Point2> identity = simplifyPoints(wave, 0.0, 1000);
    if (identity != wave) {
        std::cerr << "Tolerance 0 under the cap should be the identity\n";
        return 1;
    }

    const std::vector<Point2> reduced = simplifyPoints(wave, 0.01, 1000);
    if (reduced.size() >= wave.size() || reduced.size() < 3) {
        std::cerr << "Expected a reduction, got " << reduced.size() << " of " << wave.size() << " points\n";
        return 1;
    }
    if (reduced.front() != wave.front() || reduced.back() != wave.back()) {
        std::cerr << "Endpoints were not preserved\n";
        return 1;
    }
    for (std::size_t k = 1; k < reduced.size(); ++k) {
        if (!(reduced[k].x > reduced[k - 1].x)) {
            std::cerr << "Kept points are not in original order\n";
            return 1;
        }
    }

    // A huge tolerance collapses to the chord.
    const std::vector<Point2> chord = simplifyPoints(wave, 100.0, 1000);
    if (chord.size() != 2) {
        std::cerr << "Huge tolerance should leave 2 points, got " << chord.size() << "\n";
        return 1;
    }

    // Negative tolerance behaves as 0.
    if (simplifyPoints(wave, -1.0, 1000) != wave) {
        std::cerr << "Negative tolerance was not clamped to 0\n";
        return 1;
    }

    // The cap is honoured and the last point survives resampling.
    const std::vector<Point2> capped = simplifyPoints(wave, 0.0, 17);
    if (capped.size() > 17 || capped.size() < 2) {
        std::cerr << "Cap of 17 not honoured: " << capped.size() << " points\n";
        return 1;
    }
    if (capped.front() != wave.front() || capped.back() != wave.back()) {
        std::cerr << "Resampling dropped an endpoint\n";
        return 1;
    }

    // maxPoints below 2 is treated as 2.
    const std::vector<Point2> tiny = simplifyPoints(wave, 0.0, 0);
    if (tiny.size() != 2) {
        std::cerr << "maxPoints 0 should yield 2 points, got " << tiny.size() << "\n";
        return 1;
    }

    const std::vector<std::size_t> indices = douglasPeuckerIndices(wave, 0.01);
    if (indices.empty() || indices.front() != 0 || indices.back() != wave.size() - 1) {
        std::cerr << "Douglas-Peucker indices must start at 0 and end at n-1\n";
        return 1;
    }

    Polyline polyline;
    polyline.points = wave;
    const SimplifiedPolyline simplified = simplifyPolyline(polyline, 0.01, 1000);
    if (simplified.originalCount != wave.size() || simplified.polyline.points != reduced) {
        std::cerr << "simplifyPolyline disagrees with simplifyPoints\n";
        return 1;
    }

    std::cout << "Polyline simplification validated (" << wave.size() << " -> " << reduced.size()
              << " points)\n";
    return 0;
}
