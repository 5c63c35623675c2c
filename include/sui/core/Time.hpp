/**
 * Time.hpp - Clock aliases shared by the pipeline
 *
 * Components that make time-based decisions take a NowFunction so tests
 * can drive them with a manual clock.
 */

#pragma once

#include <chrono>
#include <functional>

namespace sui {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using NowFunction = std::function<TimePoint()>;

inline double secondsBetween(TimePoint from, TimePoint to) {
    return std::chrono::duration<double>(to - from).count();
}

inline TimePoint addSeconds(TimePoint t, double seconds) {
    return t + std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(seconds));
}

} // namespace sui
