#pragma once

#include <cstddef>
#include <cstdint>

/// @file include/flash/constants.hpp
/// @brief Reference constants for the Flash Settlement Core.
///
/// Every tunable in the config structs defaults to one of these values.

namespace flash::constants {

// ─── Concentration Parameter ──────────────────────────────────────────────────

/// Scale constant K in tau = K · (time_left / T_ref).
static constexpr double TAU_SCALE = 0.0001;

/// Reference window T_ref in seconds.
static constexpr double TAU_REFERENCE_WINDOW_S = 60.0;

// ─── AMM Trade Solver ─────────────────────────────────────────────────────────

/// Newton–Raphson stopping tolerance on |Δy| (amount units).
static constexpr double SOLVER_EPSILON = 1e-4;

/// Hard iteration cap. Hitting it is not an error; the result is flagged.
static constexpr int SOLVER_MAX_ITERATIONS = 10;

/// Half-width of the z-range covered by the normal lookup table.
static constexpr double NORMAL_TABLE_Z_MAX = 8.0;

/// Table resolution: samples per unit of z.
static constexpr std::size_t NORMAL_TABLE_SAMPLES_PER_UNIT = 1024;

/// Default market liquidity parameter L.
static constexpr double DEFAULT_LIQUIDITY = 10'000.0;

// ─── Market Lifecycle ─────────────────────────────────────────────────────────

/// Longest window that still counts as a flash market (4 hours).
static constexpr double FLASH_HORIZON_S = 14'400.0;

static constexpr std::size_t MIN_OUTCOMES = 2;
static constexpr std::size_t MAX_OUTCOMES = 10;

/// Probability vectors must sum to 1 within this tolerance.
static constexpr double PROBABILITY_EPSILON = 1e-9;

/// Storage of a resolved market is kept at least this long.
static constexpr std::int64_t DISPUTE_WINDOW_MS = 300'000;

/// Share of a child market's executed volume credited to its parent.
static constexpr double ROLLUP_SHARE = 0.5;

// ─── Leverage ─────────────────────────────────────────────────────────────────

/// Global effective-leverage cap. Chains clamp to it.
static constexpr double GLOBAL_LEVERAGE_CAP = 500.0;

/// Largest base leverage a position may request before chaining.
static constexpr double MAX_BASE_LEVERAGE = 100.0;

/// Minimum collateral / stake ratio for any committing operation.
static constexpr double LIQUIDATION_THRESHOLD = 0.80;

/// Maximum number of steps in a leverage chain.
static constexpr std::size_t MAX_CHAIN_STEPS = 5;

/// Bonus constant in (1 + tau · TAU_BONUS).
static constexpr double TAU_BONUS = 1500.0;

/// Reference step multipliers (upper bound of each step's range).
static constexpr double AMPLIFY_A_MULTIPLIER = 1.5;
static constexpr double AMPLIFY_B_MULTIPLIER = 1.2;
static constexpr double AMPLIFY_C_MULTIPLIER = 1.1;

/// Default wall-clock budget for one chain-step collaborator call.
static constexpr std::int64_t CHAIN_STEP_TIMEOUT_MS = 500;

// ─── Resolution ───────────────────────────────────────────────────────────────

/// Proof path budget, measured from entry into Resolving.
static constexpr std::int64_t PROOF_BUDGET_MS = 3'000;

/// Outer resolution deadline (consensus window), from entry into Resolving.
static constexpr std::int64_t CONSENSUS_WINDOW_MS = 10'000;

/// Number of distinct agreeing attestations required.
static constexpr std::size_t ATTESTATION_QUORUM = 3;

} // namespace flash::constants
