/**
 * @file  prop_tau_monotone.cpp
 * @brief Property: ∀ t ≥ 0: τ(t) ≥ 0, and t₁ ≤ t₂ ⇒ τ(t₁) ≤ τ(t₂)
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_tau_monotone
 *
 * Mathematical basis:
 *   τ(t) = K · min(t, H) / T_ref,   K = 1e-4, T_ref = 60 s, H = 14400 s
 *
 * τ is the variance of the pricing curve. It must never go negative and must
 * shrink as the market approaches its deadline, otherwise slippage would grow
 * toward expiry instead of vanishing.
 */

#include <rapidcheck.h>
#include <cmath>

#include "flash/constants.hpp"
#include "flash/tau.hpp"

using namespace flash;
using flash::tau::ConcentrationCalculator;

int main() {
    // ── Property 1: τ ≥ 0 and finite for every double ───────────────────────
    rc::check(
        "tau: non-negative and finite for any time_left",
        [](double t) {
            const Tau tau = ConcentrationCalculator::compute(t);
            RC_ASSERT(std::isfinite(tau.value));
            RC_ASSERT(tau.value >= 0.0);
        }
    );

    // ── Property 2: monotone non-decreasing in time_left ────────────────────
    rc::check(
        "tau: t1 <= t2 implies tau(t1) <= tau(t2)",
        [](double raw_a, double raw_b) {
            // Map arbitrary doubles into [0, 2H] so the horizon clamp is covered.
            const double span = 2.0 * constants::FLASH_HORIZON_S;
            const double a = std::isfinite(raw_a) ? std::fabs(std::fmod(raw_a, span)) : 0.0;
            const double b = std::isfinite(raw_b) ? std::fabs(std::fmod(raw_b, span)) : 0.0;
            const double lo = std::min(a, b);
            const double hi = std::max(a, b);

            RC_ASSERT(ConcentrationCalculator::compute(lo).value <=
                      ConcentrationCalculator::compute(hi).value);
        }
    );

    // ── Property 3: bonus ≥ 1 ───────────────────────────────────────────────
    rc::check(
        "tau: efficiency bonus never drops below 1",
        [](double t) {
            RC_ASSERT(ConcentrationCalculator::bonus(ConcentrationCalculator::compute(t)) >= 1.0);
        }
    );

    return 0;
}
