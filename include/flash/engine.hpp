#pragma once

/// @file include/flash/engine.hpp
/// @brief Settlement Engine: public API of the Flash Settlement Core.
///
/// # Module: Settlement Engine
///
/// ## Responsibility
/// Orchestrate the per-market flow:
///   create → feed / quote / trade → chain leverage → Resolving →
///   proof | quorum | dispute → payouts → ledger → reclaim
///
/// ## Usage
/// ```cpp
/// ManualClock clock{0};
/// SettlementEngine engine(EngineConfig{}, clock, collaborators, sources);
/// auto id    = engine.create_market({.title = "M1", .time_left_s = 30,
///                                    .outcomes = {"Yes", "No"}});
/// auto fill  = engine.trade({.market = *id, .user = "u1", .outcome = "Yes",
///                            .amount = 100, .leverage = 100, .collateral = 100});
/// auto chain = engine.chain_leverage(fill->position, steps);
/// ```
///
/// ## Concurrency
/// Every operation on one market runs under that market's slot mutex, so
/// operations on a market are linearised while different markets proceed in
/// parallel. Quotes solve outside the lock. Proof verification runs on a
/// worker thread with no lock held. Ledger and governance calls happen after
/// the lock is released.
///
/// ## Guarantees
/// - A failed operation leaves market and position state unchanged.
/// - A market is finalised once; its settlement record is emitted once.
/// - A position is closed once, by payout or by liquidation.

#include "flash/amm.hpp"
#include "flash/chain.hpp"
#include "flash/clock.hpp"
#include "flash/collaborators.hpp"
#include "flash/error.hpp"
#include "flash/market.hpp"
#include "flash/registry.hpp"
#include "flash/resolver.hpp"
#include "flash/risk.hpp"

#include <memory>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace flash::core {

// ─── EngineConfig ─────────────────────────────────────────────────────────────

struct EngineConfig {
    amm::SolverConfig        solver{};
    chain::ChainConfig       chain{};
    resolver::ResolverConfig resolver{};
    risk::RiskConfig         risk{};

    /// Resolved markets are kept at least this long before reclaim.
    TimestampMs dispute_window_ms = constants::DISPUTE_WINDOW_MS;

    /// Share of a child's traded volume rolled up into its parent, in [0, 1].
    /// Out-of-range values are clamped.
    double rollup_share = constants::ROLLUP_SHARE;
};

/// External systems the engine talks to. Any of them may be null: without a
/// verifier every proof fails, without a step collaborator every non-empty
/// chain fails, and null sinks drop their events.
struct Collaborators {
    std::shared_ptr<resolver::ProofVerifier> verifier;
    std::shared_ptr<chain::StepCollaborator> steps;
    std::shared_ptr<Ledger>                  ledger;
    std::shared_ptr<Governance>              governance;
};

// ─── Requests & receipts ──────────────────────────────────────────────────────

struct TradeRequest {
    MarketId    market{NO_MARKET};
    UserId      user;
    std::string outcome;
    double      amount{0.0};
    double      leverage{1.0};    ///< Base leverage, ≤ min(ceiling, 100)
    double      collateral{0.0};
    double      max_slippage{1.0};  ///< Fraction of the order; 1.0 = no bound
};

struct Quote {
    amm::SolveResult fill;
    Tau              tau{0.0};
    double           odds{0.0};              ///< Odds of the outcome before the fill
    double           leverage_ceiling{0.0};
};

struct TradeReceipt {
    PositionId       position{0};
    amm::SolveResult fill;
    Tau              tau{0.0};
    double           entry_odds{0.0};
};

struct ChainReceipt {
    PositionId  position{0};
    double      effective_leverage{1.0};
    std::size_t steps{0};
};

struct QuantumRequest {
    MarketId market{NO_MARKET};
    UserId   user;
    double   amount{0.0};
    double   leverage{1.0};      ///< ≤ min(ceiling, 100)
    double   collateral{0.0};
};

struct QuantumReceipt {
    PositionId          position{0};
    double              exposure{0.0};
    std::vector<double> weights;    ///< Outcome probabilities at entry
};

struct AttestationProgress {
    std::size_t agreeing{0};    ///< Votes for the attested outcome so far
    bool        finalized{false};
};

struct TickReport {
    std::size_t expired{0};     ///< Open → Resolving
    std::size_t disputed{0};    ///< Resolving → Disputed
    std::size_t reclaimed{0};   ///< Resolved markets dropped from the arena
};

// ─── SettlementEngine ─────────────────────────────────────────────────────────

class SettlementEngine {
public:
    SettlementEngine(EngineConfig config, const Clock& clock,
                     Collaborators collaborators,
                     resolver::AttestationRegistry sources);

    SettlementEngine(const SettlementEngine&)            = delete;
    SettlementEngine& operator=(const SettlementEngine&) = delete;

    // ── Markets ───────────────────────────────────────────────────────────────

    /// # Errors
    /// `InvalidMarketSpec`; `MarketNotFound` for an unknown parent.
    [[nodiscard]] Result<MarketId> create_market(market::MarketSpec spec);

    [[nodiscard]] Result<market::MarketRecord> market(MarketId id) const;

    [[nodiscard]] std::size_t market_count() const;

    /// Ingest one feed snapshot.
    ///
    /// # Errors
    /// `MarketNotFound`, `FeedMismatch`, `MarketNotOpen`.
    [[nodiscard]] Status apply_feed(const FeedSnapshot& snapshot);

    // ── Trading ───────────────────────────────────────────────────────────────

    /// Price an order without committing it. Solves outside the market lock.
    ///
    /// # Errors
    /// `MarketNotFound`, `MarketExpired`, `InvalidOutcome`, solver errors.
    [[nodiscard]] Result<Quote>
    quote(MarketId market, std::string_view outcome, double amount) const;

    /// Solve and commit a trade, opening a position.
    ///
    /// # Errors
    /// `MarketNotFound`, `MarketExpired`, `InvalidOutcome`, `InvalidAmount`,
    /// `LeverageExceedsCeiling`, risk errors, solver errors,
    /// `SlippageExceeded`.
    [[nodiscard]] Result<TradeReceipt> trade(const TradeRequest& request);

    /// Set the effective leverage of an open position, once, before expiry.
    /// The market stays locked while the step collaborator runs, so the
    /// collaborator must not call back into the engine for the same market.
    ///
    /// # Errors
    /// `PositionNotFound`, `PositionClosed`, `LeverageAlreadySet`,
    /// `MarketExpired`, chain and risk errors.
    [[nodiscard]] Result<ChainReceipt>
    chain_leverage(PositionId position, std::span<const chain::ChainStep> steps);

    /// Re-mark a position's collateral and liquidate it if it fell below the
    /// threshold.
    ///
    /// # Errors
    /// `PositionNotFound`, `PositionClosed`, `InvalidAmount`,
    /// `PositionHealthy` (state unchanged).
    [[nodiscard]] Status mark_position(PositionId position, double collateral);

    [[nodiscard]] Result<market::Position> position(PositionId id) const;

    /// Open a quantum position: `amount * leverage` of exposure weighted by
    /// the current outcome probabilities. It takes no liquidity from the curve
    /// and collapses when the market is finalised.
    ///
    /// # Errors
    /// `MarketNotFound`, `MarketExpired`, `InvalidAmount`,
    /// `LeverageExceedsCeiling`, risk errors.
    [[nodiscard]] Result<QuantumReceipt> open_quantum(const QuantumRequest& request);

    [[nodiscard]] Result<market::QuantumPosition> quantum_position(PositionId id) const;

    // ── Resolution ────────────────────────────────────────────────────────────

    /// Verify a proof (off-lock, bounded) and finalise on success.
    ///
    /// # Errors
    /// Admission errors (see resolver.hpp); `ProofInvalid` if verification
    /// fails or times out, which closes the proof path.
    [[nodiscard]] Status submit_proof(MarketId market, const resolver::CryptoProof& proof);

    /// Record one attestation; finalises when the quorum agrees.
    [[nodiscard]] Result<AttestationProgress>
    submit_attestation(MarketId market, const resolver::Attestation& attestation);

    /// Dispatch either resolution form. Returns the market status afterwards.
    [[nodiscard]] Result<MarketStatus>
    resolve(MarketId market, const resolver::ResolutionProof& proof);

    /// Governance decision for a Disputed market.
    ///
    /// # Errors
    /// `MarketNotFound`, `InvalidOutcome`, `AlreadyResolved`,
    /// `MarketNotResolving` (market is not Disputed).
    [[nodiscard]] Status apply_governance_ruling(MarketId market, std::string_view outcome,
                                                 std::string_view authority);

    [[nodiscard]] Result<std::optional<resolver::Finalization>>
    finalization(MarketId market) const;

    /// Advance clocks: expire, escalate disputes, reclaim storage.
    TickReport tick();

    /// Drop a resolved market whose dispute window has elapsed.
    ///
    /// # Errors
    /// `MarketNotFound`, `MarketNotResolving` (not Resolved),
    /// `DisputeWindowOpen`.
    [[nodiscard]] Status reclaim(MarketId market);

    // ── Administration ────────────────────────────────────────────────────────

    [[nodiscard]] Status pause(std::string_view actor, std::string reason);
    [[nodiscard]] Status unpause(std::string_view actor, std::string reason);

    [[nodiscard]] const risk::GlobalRiskState& risk_state() const noexcept { return risk_; }
    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] market::SlotPtr find_slot(MarketId id) const;

    /// Dispute notices raised under a slot mutex. Declare before the lock so
    /// they reach governance after it is released.
    class PendingEscalations {
    public:
        explicit PendingEscalations(const SettlementEngine& engine) : engine_(engine) {}
        ~PendingEscalations() {
            for (const auto& notice : notices_) engine_.escalate(notice);
        }
        PendingEscalations(const PendingEscalations&)            = delete;
        PendingEscalations& operator=(const PendingEscalations&) = delete;

        void push(DisputeNotice notice) { notices_.push_back(std::move(notice)); }

    private:
        const SettlementEngine&    engine_;
        std::vector<DisputeNotice> notices_;
    };

    struct SlotTransitions {
        bool expired{false};    ///< Open → Resolving
        bool disputed{false};   ///< Resolving → Disputed
    };

    /// Bring a slot up to date with `now`: run its clock, mirror a Resolving
    /// transition into its resolver state and escalate a consensus window
    /// that ran out. Transitions are stamped with the instant they became
    /// due. Slot mutex must be held.
    SlotTransitions sync_slot(market::MarketSlot& slot, TimestampMs now,
                              PendingEscalations& pending) const;

    /// Finalise under the slot mutex and close positions; returns what must be
    /// emitted once the mutex is released.
    [[nodiscard]] Result<SettlementRecord>
    finalize_locked(market::MarketSlot& slot, std::size_t outcome,
                    resolver::ResolutionPath path, const crypto::Digest& commitment,
                    TimestampMs now);

    void emit(const SettlementRecord& record) const;
    void escalate(const DisputeNotice& notice) const;
    void rollup(std::optional<MarketId> parent, double amount);

    EngineConfig                  config_;
    const Clock&                  clock_;
    Collaborators                 collaborators_;
    resolver::AttestationRegistry sources_;
    amm::TradeSolver              solver_;
    chain::ChainExecutor          chain_;
    risk::GlobalRiskState         risk_;
    market::MarketRegistry        registry_;
};

} // namespace flash::core
