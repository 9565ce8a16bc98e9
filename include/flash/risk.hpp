#pragma once

/// @file include/flash/risk.hpp
/// @brief Risk Controller: read-only gate plus the audited global risk state.
///
/// # Module: Risk Controller
///
/// ## Responsibility
/// `check()` is consulted before every trade commit and before every chain
/// step. In order it rejects:
///   1. the emergency pause        → `EmergencyPause`
///   2. leverage above the market ceiling → `LeverageExceedsCeiling`
///   3. leverage above the global cap     → `LeverageExceedsGlobalCap`
///   4. collateral / stake below the liquidation threshold
///                                 → `UndercollateralizedPosition`
///
/// ## Shared State
/// `GlobalRiskState` holds the only process-wide mutable configuration. Readers
/// take an immutable `RiskSnapshot` once per operation and evaluate against it,
/// so a concurrent pause can never produce a torn read. Writers replace the
/// snapshot under an exclusive lock and append to the audit trail.
///
/// ## NOT Responsible For
/// - Mutating markets or positions (liquidation is the engine's job).

#include "flash/clock.hpp"
#include "flash/constants.hpp"
#include "flash/error.hpp"
#include "flash/types.hpp"

#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace flash::risk {

// ─── RiskConfig ───────────────────────────────────────────────────────────────

struct RiskConfig {
    double global_leverage_cap   = constants::GLOBAL_LEVERAGE_CAP;
    double liquidation_threshold = constants::LIQUIDATION_THRESHOLD;
    double max_base_leverage     = constants::MAX_BASE_LEVERAGE;
    bool   paused                = false;

    /// Actors allowed to pause / unpause.
    std::vector<std::string> admins;

    [[nodiscard]] bool is_admin(std::string_view actor) const noexcept;
};

/// Immutable view of the risk configuration at one instant.
using RiskSnapshot = std::shared_ptr<const RiskConfig>;

// ─── RiskRequest ──────────────────────────────────────────────────────────────

/// Everything the gate needs to judge one committing operation.
struct RiskRequest {
    double leverage{1.0};        ///< Leverage that would be in force after commit
    double market_ceiling{0.0};  ///< Current ceiling of the target market
    double collateral{0.0};
    double stake{0.0};
};

/// collateral / stake; 0 for a non-positive or non-finite stake.
[[nodiscard]] double collateral_ratio(double collateral, double stake) noexcept;

/// Pure gate. Never mutates anything.
///
/// # Errors
/// See the module comment for the order. A non-finite or sub-1 leverage, or a
/// non-positive stake, is `InvalidAmount`.
[[nodiscard]] Status check(const RiskConfig& cfg, const RiskRequest& req);

// ─── Audit ────────────────────────────────────────────────────────────────────

struct AuditEntry {
    TimestampMs at{0};
    std::string actor;
    bool        paused{false};  ///< State after the change
    std::string reason;
};

// ─── GlobalRiskState ──────────────────────────────────────────────────────────

class GlobalRiskState {
public:
    GlobalRiskState(RiskConfig initial, const Clock& clock);

    GlobalRiskState(const GlobalRiskState&)            = delete;
    GlobalRiskState& operator=(const GlobalRiskState&) = delete;

    /// Current configuration. Cheap; safe from any thread.
    [[nodiscard]] RiskSnapshot snapshot() const;

    [[nodiscard]] bool paused() const;

    /// Engage the emergency halt.
    ///
    /// # Errors
    /// `Unauthorized` if `actor` is not an admin.
    [[nodiscard]] Status pause(std::string_view actor, std::string reason);

    /// Lift the emergency halt. Same authorisation as pause().
    [[nodiscard]] Status unpause(std::string_view actor, std::string reason);

    [[nodiscard]] std::vector<AuditEntry> audit_trail() const;

private:
    Status set_paused(bool paused, std::string_view actor, std::string reason);

    mutable std::shared_mutex mutex_;
    RiskSnapshot              current_;
    std::vector<AuditEntry>   audit_;
    const Clock&              clock_;
};

} // namespace flash::risk
