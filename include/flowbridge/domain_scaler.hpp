// filename: domain_scaler.hpp
// part of FlowBridge 2D Obstacle Solver Bridge
// MIT License

#pragma once

#include "flowbridge/types.hpp"

namespace flowbridge {

/**
 * @brief Uniform, reversible map from world extents into solver coordinates.
 */
class DomainMapping {
public:
    DomainMapping() = default;
    DomainMapping(double scale, Point2 extentCenter, Point2 targetCenter)
        : scale_(scale), extentCenter_(extentCenter), targetCenter_(targetCenter) {}

    [[nodiscard]] Point2 forward(const Point2& p) const {
        return {(p.x - extentCenter_.x) * scale_ + targetCenter_.x,
                (p.y - extentCenter_.y) * scale_ + targetCenter_.y};
    }

    [[nodiscard]] Point2 inverse(const Point2& q) const {
        return {(q.x - targetCenter_.x) / scale_ + extentCenter_.x,
                (q.y - targetCenter_.y) / scale_ + extentCenter_.y};
    }

    [[nodiscard]] double scale() const { return scale_; }
    [[nodiscard]] const Point2& extentCenter() const { return extentCenter_; }
    [[nodiscard]] const Point2& targetCenter() const { return targetCenter_; }

private:
    double scale_{1.0};
    Point2 extentCenter_{};
    Point2 targetCenter_{};
};

/**
 * @brief Builds the mapping that fits [extentMin, extentMax] into a target span.
 *
 * The scale is the smaller of the per-axis ratios, so the object covers at most
 * objectScaleFraction of the target along either axis. An axis whose extent is
 * zero does not constrain the scale.
 *
 * @throws std::invalid_argument if both axes are degenerate, the target span is
 *         not positive, or objectScaleFraction is outside (0, 1].
 */
DomainMapping buildDomainMapping(const Point2& extentMin,
                                 const Point2& extentMax,
                                 const Point2& targetCenter,
                                 const Point2& targetSpan,
                                 double objectScaleFraction);

}  // namespace flowbridge
