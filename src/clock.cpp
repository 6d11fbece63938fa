#include "clock.h"

Clock SystemClock() {
    return [] { return std::chrono::system_clock::now(); };
}

Clock FixedClock(Timestamp t) {
    return [t] { return t; };
}
