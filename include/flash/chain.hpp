#pragma once

/// @file include/flash/chain.hpp
/// @brief Leverage Chain Executor: bounded multiplicative amplification.
///
/// # Module: Leverage Chain
///
/// ## Responsibility
/// Turn a base leverage plus an ordered list of at most five amplification
/// steps into an effective leverage:
///
///     L_eff = min( base · Π mᵢ · (1 + τ · TAU_BONUS), GLOBAL_CAP )
///
/// With `BonusMode::PerStep` the bonus multiplies every step instead.
///
/// ## Atomicity
/// `ChainExecutor::execute` performs each step through a `StepCollaborator`.
/// Applied steps are kept in a transaction log; if a step fails, times out or
/// is vetoed by the risk gate, the log is replayed in reverse through
/// `revert()` and the operation reports failure. No partial leverage is ever
/// returned.
///
/// ## Guarantees
/// - `evaluate_chain` is pure: same inputs give bit-identical output.
/// - Six or more steps are rejected with `ChainTooLong`, never truncated.
/// - The cap is a clamp, not an error.

#include "flash/constants.hpp"
#include "flash/error.hpp"
#include "flash/types.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace flash::chain {

// ─── ChainStep ────────────────────────────────────────────────────────────────

/// Closed multiplier range accepted for one action kind.
struct MultiplierRange {
    double min;
    double max;
};

/// A ≈1.5x, B ≈1.2x, C ≈1.1x; every range starts at 1.0.
[[nodiscard]] MultiplierRange range_for(ChainAction action) noexcept;

class ChainStep {
public:
    /// Build a step. Without `multiplier` the reference value (top of the
    /// range) is used.
    ///
    /// # Errors
    /// `InvalidAmount` if `multiplier` is not finite or outside the range.
    [[nodiscard]] static Result<ChainStep>
    make(ChainAction action, std::optional<double> multiplier = std::nullopt);

    [[nodiscard]] ChainAction action() const noexcept { return action_; }
    [[nodiscard]] double      multiplier() const noexcept { return multiplier_; }

private:
    ChainStep(ChainAction action, double multiplier) noexcept
        : action_(action), multiplier_(multiplier) {}

    ChainAction action_;
    double      multiplier_;
};

// ─── ChainConfig ──────────────────────────────────────────────────────────────

enum class BonusMode : std::uint8_t {
    OnceAfterChain,  ///< bonus applied a single time after every step
    PerStep,         ///< bonus applied after each step
};

struct ChainConfig {
    std::size_t max_steps         = constants::MAX_CHAIN_STEPS;
    double      global_cap        = constants::GLOBAL_LEVERAGE_CAP;
    double      max_base_leverage = constants::MAX_BASE_LEVERAGE;
    double      tau_bonus         = constants::TAU_BONUS;
    BonusMode   bonus_mode        = BonusMode::OnceAfterChain;

    /// Wall-clock budget for each collaborator apply/revert call.
    std::chrono::milliseconds step_timeout{constants::CHAIN_STEP_TIMEOUT_MS};
};

/// Effective leverage of `steps` applied to `base_leverage`.
///
/// # Errors
/// - `ChainTooLong` if `steps.size() > cfg.max_steps`.
/// - `InvalidAmount` if `base_leverage` is not finite or below 1.
/// - `LeverageExceedsCeiling` if `base_leverage > cfg.max_base_leverage`.
[[nodiscard]] Result<double>
evaluate_chain(double base_leverage, std::span<const ChainStep> steps, Tau tau,
               const ChainConfig& cfg = ChainConfig{});

// ─── Step collaborator ────────────────────────────────────────────────────────

/// One borrow / liquidate / stake equivalent as seen by the external system.
struct StepRequest {
    MarketId    market{NO_MARKET};
    PositionId  position{0};
    std::size_t index{0};            ///< Position of the step in the chain
    ChainAction action{ChainAction::AmplifyA};
    double      multiplier{1.0};
    double      leverage_before{1.0};
    double      leverage_after{1.0};
};

/// Proof that a step was applied; handed back to revert().
struct StepReceipt {
    std::size_t index{0};
    std::string reference;
};

/// External executor of chain steps. Calls may be slow or fail; the
/// executor bounds each one with `ChainConfig::step_timeout`.
class StepCollaborator {
public:
    virtual ~StepCollaborator() = default;

    /// Apply one step. `std::nullopt` means the step was refused.
    virtual std::optional<StepReceipt> apply(const StepRequest& request) = 0;

    /// Undo a previously applied step. Returns false if the undo failed.
    virtual bool revert(const StepReceipt& receipt) = 0;

    /// Void a step whose apply() did not answer in time. If that apply()
    /// later succeeds anyway, the executor reverts its receipt on the worker.
    virtual void cancel(const StepRequest& request) noexcept { (void)request; }
};

// ─── ChainExecutor ────────────────────────────────────────────────────────────

struct ChainContext {
    MarketId   market{NO_MARKET};
    PositionId position{0};
    double     base_leverage{1.0};
    Tau        tau{0.0};
};

struct ChainOutcome {
    double                   effective_leverage{1.0};
    std::vector<StepReceipt> receipts;
};

/// Consulted with the running leverage before every step and once for the
/// final value. A failed Status vetoes the chain. An empty gate admits all.
using RiskGate = std::function<Status(double leverage)>;

class ChainExecutor {
public:
    ChainExecutor(ChainConfig config, std::shared_ptr<StepCollaborator> collaborator);

    /// Run the chain atomically.
    ///
    /// # Errors
    /// - Everything `evaluate_chain` reports, before any collaborator call.
    /// - The gate's own error if it vetoes a step (after unwinding).
    /// - `ChainStepFailed` if a collaborator call fails or times out
    ///   (after unwinding).
    [[nodiscard]] Result<ChainOutcome>
    execute(const ChainContext& ctx, std::span<const ChainStep> steps,
            const RiskGate& gate) const;

    [[nodiscard]] const ChainConfig& config() const noexcept { return config_; }

private:
    /// Revert `journal` newest-first. Returns the number of reverts that failed.
    std::size_t unwind(const std::vector<StepReceipt>& journal) const;

    ChainConfig                       config_;
    std::shared_ptr<StepCollaborator> collaborator_;
};

} // namespace flash::chain
