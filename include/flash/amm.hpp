#pragma once

/// @file include/flash/amm.hpp
/// @brief AMM Trade Solver: micro-tau bonding curve.
///
/// # Module: AMM Trade Solver
///
/// ## Responsibility
/// Given an order size x, a liquidity parameter L and the concentration
/// parameter τ, find the root y* of
///
///     f(y) = (y − x)·Φ(z) + L√τ·φ(z) − y,     z = (y − x) / (L√τ)
///
/// by Newton–Raphson, and report the realised execution amount
///
///     execution = clamp(x − y*, 0, x).
///
/// y* is the part of the order absorbed by the curve (slippage). Since
/// f'(y) = Φ(z) − 1 and f is convex and decreasing, iteration from y₀ = 0
/// approaches the root monotonically from below.
///
/// ## Edge Cases
/// - τ = 0: √τ is undefined; short-circuit to execution = x exactly.
/// - L = 0: `InsufficientLiquidity`, never a division by zero.
/// - Iteration cap reached before |Δy| < ε: the best estimate is returned
///   with `converged == false` (low confidence). This is not an error.
///
/// ## Guarantees
/// - Side-effect free, safe to call concurrently for quotes. Only building an
///   error message can throw (`std::bad_alloc`).
/// - φ/Φ come from a precomputed table, so identical inputs give
///   bit-identical outputs.

#include "flash/constants.hpp"
#include "flash/error.hpp"
#include "flash/types.hpp"

namespace flash::amm {

// ─── SolverConfig ─────────────────────────────────────────────────────────────

struct SolverConfig {
    double epsilon        = constants::SOLVER_EPSILON;
    int    max_iterations = constants::SOLVER_MAX_ITERATIONS;
};

// ─── SolveResult ──────────────────────────────────────────────────────────────

struct SolveResult {
    double execution_amount{0.0}; ///< Realised amount, in [0, order]
    double slippage{0.0};         ///< order − execution_amount
    double residual{0.0};         ///< |f(y*)| at the returned estimate
    int    iterations{0};         ///< Newton steps taken
    bool   converged{true};       ///< false ⇒ low-confidence estimate

    [[nodiscard]] bool low_confidence() const noexcept { return !converged; }

    /// Execution / order. 1.0 means no slippage.
    [[nodiscard]] double fill_ratio(double order_size) const noexcept;
};

// ─── TradeSolver ──────────────────────────────────────────────────────────────

class TradeSolver {
public:
    explicit TradeSolver(SolverConfig config = SolverConfig{}) noexcept;

    /// Solve one order against the curve.
    ///
    /// # Errors
    /// - `InvalidAmount` if `order_size` is not finite and positive, or τ is
    ///   negative or not finite.
    /// - `InsufficientLiquidity` if `liquidity` is zero, negative or not finite.
    [[nodiscard]] Result<SolveResult>
    solve(double order_size, double liquidity, Tau tau) const;

    /// Evaluate the invariant f(y). Exposed for tests and diagnostics.
    /// Precondition: liquidity > 0 and τ > 0.
    [[nodiscard]] static double
    invariant(double y, double order_size, double liquidity, Tau tau) noexcept;

    [[nodiscard]] const SolverConfig& config() const noexcept { return config_; }

private:
    SolverConfig config_;
};

} // namespace flash::amm
