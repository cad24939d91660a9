// filename: timer.hpp
// part of FlowBridge 2D Obstacle Solver Bridge
// MIT License

#pragma once

#include <chrono>

namespace flowbridge {

using Millis = std::chrono::milliseconds;

/**
 * @brief Fixed-rate tick source polled from a caller's loop.
 *
 * due() returns true at most once per interval and re-arms itself. Nothing runs
 * on a background thread.
 */
class IntervalTimer {
public:
    using Clock = std::chrono::steady_clock;

    explicit IntervalTimer(Millis interval, bool fireImmediately = true)
        : interval_(interval), next_(fireImmediately ? Clock::now() : Clock::now() + interval) {}

    bool due(Clock::time_point now = Clock::now()) {
        if (now < next_) {
            return false;
        }
        next_ = now + interval_;
        return true;
    }

    void reset(Clock::time_point now = Clock::now()) { next_ = now + interval_; }

    Millis interval() const { return interval_; }

private:
    Millis interval_;
    Clock::time_point next_;
};

class Deadline {
public:
    using Clock = std::chrono::steady_clock;

    explicit Deadline(Millis budget) : end_(Clock::now() + budget) {}

    bool expired() const { return Clock::now() >= end_; }

    Millis remaining() const {
        const auto left = end_ - Clock::now();
        return left.count() > 0 ? std::chrono::duration_cast<Millis>(left) : Millis{0};
    }

private:
    Clock::time_point end_;
};

}  // namespace flowbridge
