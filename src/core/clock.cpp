/// @file src/core/clock.cpp
/// @brief SystemClock.

#include "flash/clock.hpp"

#include <chrono>

namespace flash {

TimestampMs SystemClock::now() const noexcept {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

} // namespace flash
