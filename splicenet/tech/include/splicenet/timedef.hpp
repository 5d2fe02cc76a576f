#pragma once

#include <chrono>

namespace splicenet {

/// Deadlines and timeouts are measured on the steady clock: readiness waits must not jump with wall clock changes.
using SteadyClock = std::chrono::steady_clock;
using SteadyTimePoint = SteadyClock::time_point;
using SteadyDuration = SteadyClock::duration;

/// Sentinel meaning "no deadline".
inline constexpr SteadyTimePoint kNoDeadline = SteadyTimePoint::max();

}  // namespace splicenet
