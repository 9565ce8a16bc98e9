#pragma once

/// @file include/flash/clock.hpp
/// @brief Millisecond time source used for every deadline in the core.
///
/// `SystemClock` backs the daemon; `ManualClock` lets tests drive proof,
/// consensus and dispute windows deterministically.

#include "flash/types.hpp"

#include <atomic>

namespace flash {

class Clock {
public:
    virtual ~Clock() = default;

    /// Current time in milliseconds. Must be non-decreasing.
    [[nodiscard]] virtual TimestampMs now() const noexcept = 0;
};

/// Wall clock (milliseconds since the Unix epoch).
class SystemClock final : public Clock {
public:
    [[nodiscard]] TimestampMs now() const noexcept override;
};

/// Externally driven clock. Thread-safe.
class ManualClock final : public Clock {
public:
    explicit ManualClock(TimestampMs start = 0) noexcept : now_(start) {}

    [[nodiscard]] TimestampMs now() const noexcept override {
        return now_.load(std::memory_order_acquire);
    }

    /// Move forward by `delta_ms`; negative deltas are ignored.
    void advance(TimestampMs delta_ms) noexcept {
        if (delta_ms > 0) now_.fetch_add(delta_ms, std::memory_order_acq_rel);
    }

private:
    std::atomic<TimestampMs> now_;
};

} // namespace flash
