#pragma once

/// @file include/flash/types.hpp
/// @brief Shared primitive types for the Flash Settlement Core.
///
/// Defines the identifier aliases, lifecycle enumerations and the Eigen-based
/// probability vector used throughout the core.

#include <Eigen/Dense>

#include <cstdint>
#include <string>
#include <string_view>

namespace flash {

// ─── Identifiers ──────────────────────────────────────────────────────────────

using MarketId   = std::uint64_t;
using PositionId = std::uint64_t;

/// Opaque user reference. The core never owns or dereferences users.
using UserId = std::string;

/// Milliseconds on the core's clock (see clock.hpp).
using TimestampMs = std::int64_t;

/// Sentinel for "no market"; ids handed out by the registry start at 1.
static constexpr MarketId NO_MARKET = 0;

// ─── Strong Scalar Types ──────────────────────────────────────────────────────

/// Concentration parameter τ ≥ 0. Smaller τ ⇒ less slippage.
struct Tau {
    double value;
};

// ─── Linear Algebra Aliases ───────────────────────────────────────────────────

/// Implied probabilities of a market's outcome set, in outcome order.
using ProbabilityVector = Eigen::VectorXd;

// ─── Lifecycle Enumerations ───────────────────────────────────────────────────

enum class MarketStatus : std::uint8_t {
    Open,
    Resolving,
    Resolved,
    Disputed,
};

enum class PositionStatus : std::uint8_t {
    Open,
    Closed,
    Liquidated,
};

/// Generalised borrow / liquidate / stake chain actions.
enum class ChainAction : std::uint8_t {
    AmplifyA,  ///< borrow-equivalent, ≈1.5x
    AmplifyB,  ///< liquidate-for-bonus-equivalent, ≈1.2x
    AmplifyC,  ///< stake-for-boost-equivalent, ≈1.1x
};

/// Free-form market category (sport, esports, macro print, ...).
using Category = std::string;

[[nodiscard]] std::string_view to_string(MarketStatus s) noexcept;
[[nodiscard]] std::string_view to_string(PositionStatus s) noexcept;
[[nodiscard]] std::string_view to_string(ChainAction a) noexcept;

} // namespace flash
