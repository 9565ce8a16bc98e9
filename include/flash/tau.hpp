#pragma once

/// @file include/flash/tau.hpp
/// @brief Concentration Parameter Calculator.
///
/// # Module: Concentration Parameter
///
/// ## Formula
///   τ = K · (max(time_left, 0) / T_ref)
///
/// with K = 1e-4 and T_ref = 60 s. At τ = 0 liquidity is fully concentrated
/// and the trade solver prices without slippage.
///
/// ## Guarantees
/// - Pure, `noexcept`, no side effects.
/// - Result is finite and ≥ 0 for every input; NaN and −∞ map to 0,
///   +∞ saturates at the flash horizon.
/// - Monotonically non-decreasing in `time_left`.

#include "flash/constants.hpp"
#include "flash/types.hpp"

namespace flash::tau {

struct TauConfig {
    double scale             = constants::TAU_SCALE;
    double reference_window  = constants::TAU_REFERENCE_WINDOW_S;
};

class ConcentrationCalculator {
public:
    ConcentrationCalculator() = delete; // pure static, not instantiable

    /// τ for the reference configuration.
    [[nodiscard]] static Tau compute(double time_left_s) noexcept;

    /// τ for a custom configuration. A non-positive or non-finite reference
    /// window or scale yields τ = 0.
    [[nodiscard]] static Tau compute(double time_left_s, const TauConfig& cfg) noexcept;

    /// Tau-derived efficiency bonus 1 + τ · bonus.
    [[nodiscard]] static double bonus(Tau tau,
                                      double bonus_constant = constants::TAU_BONUS) noexcept;
};

} // namespace flash::tau
