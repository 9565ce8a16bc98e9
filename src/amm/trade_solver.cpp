/// @file src/amm/trade_solver.cpp
/// @brief Newton–Raphson solver for the micro-tau bonding curve.

#include "flash/amm.hpp"

#include "normal_table.hpp"

#include <algorithm>
#include <cmath>
#include <fmt/format.h>

namespace flash::amm {

namespace {

/// Derivative magnitudes below this are treated as a flat curve.
constexpr double FLAT_DERIVATIVE = 1e-15;

} // namespace

// ─── SolveResult ──────────────────────────────────────────────────────────────

double SolveResult::fill_ratio(double order_size) const noexcept {
    if (!std::isfinite(order_size) || order_size <= 0.0) return 0.0;
    return execution_amount / order_size;
}

// ─── TradeSolver ──────────────────────────────────────────────────────────────

TradeSolver::TradeSolver(SolverConfig config) noexcept
    : config_(config)
{
    if (!std::isfinite(config_.epsilon) || config_.epsilon <= 0.0) {
        config_.epsilon = constants::SOLVER_EPSILON;
    }
    config_.max_iterations = std::max(config_.max_iterations, 1);
}

double TradeSolver::invariant(double y, double order_size,
                              double liquidity, Tau tau) noexcept {
    const auto&  table = NormalTable::instance();
    const double s     = liquidity * std::sqrt(tau.value);
    const double d     = y - order_size;
    const double z     = d / s;
    return d * table.cdf(z) + s * table.pdf(z) - y;
}

Result<SolveResult>
TradeSolver::solve(double order_size, double liquidity, Tau tau) const {
    if (!std::isfinite(order_size) || order_size <= 0.0) {
        return make_error(ErrorCode::InvalidAmount,
                          fmt::format("order size {} is not a positive amount", order_size));
    }
    if (!std::isfinite(liquidity) || liquidity <= 0.0) {
        return make_error(ErrorCode::InsufficientLiquidity,
                          fmt::format("liquidity parameter {}", liquidity));
    }
    if (!std::isfinite(tau.value) || tau.value < 0.0) {
        return make_error(ErrorCode::InvalidAmount,
                          fmt::format("tau {} outside [0, inf)", tau.value));
    }

    // Fully concentrated liquidity: no curve, no slippage.
    if (tau.value == 0.0) {
        return SolveResult{
            .execution_amount = order_size,
            .slippage         = 0.0,
            .residual         = 0.0,
            .iterations       = 0,
            .converged        = true,
        };
    }

    const auto&  table = NormalTable::instance();
    const double s     = liquidity * std::sqrt(tau.value);
    if (!std::isfinite(s) || s <= 0.0) {
        return make_error(ErrorCode::InsufficientLiquidity,
                          fmt::format("curve width L*sqrt(tau) = {}", s));
    }

    double y         = 0.0;
    bool   converged = false;
    int    iter      = 0;

    while (iter < config_.max_iterations) {
        const double d     = y - order_size;
        const double z     = d / s;
        const double cdf_z = table.cdf(z);
        const double f     = d * cdf_z + s * table.pdf(z) - y;
        const double df    = cdf_z - 1.0;
        ++iter;

        if (std::abs(df) < FLAT_DERIVATIVE) {
            break;
        }

        const double step   = f / df;
        const double next_y = std::max(0.0, y - step);
        const double delta  = std::abs(next_y - y);
        y = next_y;

        if (delta < config_.epsilon) {
            converged = true;
            break;
        }
    }

    const double execution = std::clamp(order_size - y, 0.0, order_size);
    return SolveResult{
        .execution_amount = execution,
        .slippage         = order_size - execution,
        .residual         = std::abs(invariant(y, order_size, liquidity, tau)),
        .iterations       = iter,
        .converged        = converged,
    };
}

} // namespace flash::amm
