#pragma once

#include <chrono>
#include <functional>

using Timestamp = std::chrono::system_clock::time_point;
using Clock = std::function<Timestamp()>;

Clock SystemClock();

// Always returns `t`. Use Timestamp{} for a zero clock.
Clock FixedClock(Timestamp t);
