#pragma once

#include <chrono>

namespace filterlet {

/// The host clock is exposed as a system_clock time point, as it is the only one guaranteed to provide conversions to
/// Unix epoch time (proxies report the current time as nanoseconds since epoch).
using SysClock = std::chrono::system_clock;
using SysTimePoint = SysClock::time_point;
using SysDuration = SysClock::duration;

using Millis = std::chrono::milliseconds;

}  // namespace filterlet
