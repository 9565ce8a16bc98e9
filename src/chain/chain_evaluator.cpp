/// @file src/chain/chain_evaluator.cpp
/// @brief ChainStep construction and the pure chain evaluation.

#include "flash/chain.hpp"
#include "flash/tau.hpp"

#include <algorithm>
#include <cmath>
#include <fmt/format.h>

namespace flash::chain {

// ─── range_for ────────────────────────────────────────────────────────────────

MultiplierRange range_for(ChainAction action) noexcept {
    switch (action) {
        case ChainAction::AmplifyA: return {1.0, constants::AMPLIFY_A_MULTIPLIER};
        case ChainAction::AmplifyB: return {1.0, constants::AMPLIFY_B_MULTIPLIER};
        case ChainAction::AmplifyC: return {1.0, constants::AMPLIFY_C_MULTIPLIER};
    }
    return {1.0, 1.0};
}

// ─── ChainStep::make ──────────────────────────────────────────────────────────

Result<ChainStep> ChainStep::make(ChainAction action,
                                  std::optional<double> multiplier) {
    const MultiplierRange range = range_for(action);
    const double m = multiplier.value_or(range.max);
    if (!std::isfinite(m) || m < range.min || m > range.max) {
        return make_error(ErrorCode::InvalidAmount,
                          fmt::format("{} multiplier {} outside [{}, {}]",
                                      to_string(action), m, range.min, range.max));
    }
    return ChainStep(action, m);
}

// ─── evaluate_chain ───────────────────────────────────────────────────────────

Result<double> evaluate_chain(double base_leverage, std::span<const ChainStep> steps,
                              Tau tau, const ChainConfig& cfg) {
    if (steps.size() > cfg.max_steps) {
        return make_error(ErrorCode::ChainTooLong,
                          fmt::format("{} steps, at most {}", steps.size(), cfg.max_steps));
    }
    if (!std::isfinite(base_leverage) || base_leverage < 1.0) {
        return make_error(ErrorCode::InvalidAmount,
                          fmt::format("base leverage {}", base_leverage));
    }
    if (base_leverage > cfg.max_base_leverage) {
        return make_error(ErrorCode::LeverageExceedsCeiling,
                          fmt::format("base leverage {}x > {}x",
                                      base_leverage, cfg.max_base_leverage));
    }

    const double bonus = tau::ConcentrationCalculator::bonus(tau, cfg.tau_bonus);

    double leverage = base_leverage;
    for (const auto& step : steps) {
        leverage *= step.multiplier();
        if (cfg.bonus_mode == BonusMode::PerStep) {
            leverage *= bonus;
        }
    }
    if (cfg.bonus_mode == BonusMode::OnceAfterChain) {
        leverage *= bonus;
    }
    return std::min(leverage, cfg.global_cap);
}

} // namespace flash::chain
