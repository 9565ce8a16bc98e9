/// @file src/tau/concentration.cpp
/// @brief ConcentrationCalculator: time-left to τ mapping.

#include "flash/tau.hpp"

#include <algorithm>
#include <cmath>

namespace flash::tau {

// ─── compute ──────────────────────────────────────────────────────────────────

Tau ConcentrationCalculator::compute(double time_left_s) noexcept {
    return compute(time_left_s, TauConfig{});
}

Tau ConcentrationCalculator::compute(double time_left_s, const TauConfig& cfg) noexcept {
    if (!std::isfinite(cfg.scale) || cfg.scale <= 0.0) return Tau{0.0};
    if (!std::isfinite(cfg.reference_window) || cfg.reference_window <= 0.0) return Tau{0.0};

    // NaN and negative time both collapse to the fully concentrated boundary.
    if (std::isnan(time_left_s) || time_left_s <= 0.0) return Tau{0.0};

    const double clamped = std::min(time_left_s, constants::FLASH_HORIZON_S);
    return Tau{cfg.scale * (clamped / cfg.reference_window)};
}

// ─── bonus ────────────────────────────────────────────────────────────────────

double ConcentrationCalculator::bonus(Tau tau, double bonus_constant) noexcept {
    if (!std::isfinite(tau.value) || tau.value <= 0.0) return 1.0;
    if (!std::isfinite(bonus_constant) || bonus_constant <= 0.0) return 1.0;
    return 1.0 + tau.value * bonus_constant;
}

} // namespace flash::tau
