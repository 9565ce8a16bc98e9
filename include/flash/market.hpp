#pragma once

/// @file include/flash/market.hpp
/// @brief Market Lifecycle: the time-boxed market and its positions.
///
/// # Module: Market Lifecycle
///
/// ## State Machine
///   Open ──(time_left hits 0 | event concluded)──▶ Resolving
///   Resolving ──(proof | quorum)──▶ Resolved
///   Resolving ──(outer deadline)──▶ Disputed ──(governance ruling)──▶ Resolved
///
/// ## Invariants
/// - Outcome probabilities sum to 1 ± PROBABILITY_EPSILON after every update.
/// - `time_left` is never negative and never increases.
/// - The outcome set is fixed at creation; once Resolved nothing about the
///   outcomes changes again.
/// - The leverage ceiling follows the duration tier of the current
///   `time_left`; a tighter window never lowers it.
///
/// ## Ownership
/// A Market owns its Outcomes. The parent is referenced by id only; rollup
/// volume is pushed by the engine, never pulled through a live reference.
///
/// ## NOT Responsible For
/// - Locking (see registry.hpp: one mutex per market slot).
/// - Pricing (see amm.hpp) and proof checking (see resolver.hpp).

#include "flash/constants.hpp"
#include "flash/crypto.hpp"
#include "flash/error.hpp"
#include "flash/types.hpp"

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace flash::market {

// ─── Outcome ──────────────────────────────────────────────────────────────────

struct Outcome {
    std::string   name;
    double        probability{0.0};  ///< Current implied probability
    double        odds{0.0};         ///< 1 / probability
    double        volume{0.0};       ///< Cumulative backed volume
    std::uint64_t backers{0};        ///< Number of accepted trades
};

// ─── MarketSpec ───────────────────────────────────────────────────────────────

/// Creation request. Validated by Market::create.
struct MarketSpec {
    std::string              title;
    Category                 category;
    double                   time_left_s{0.0};
    std::vector<std::string> outcomes;
    std::optional<MarketId>  parent;
    double                   liquidity{constants::DEFAULT_LIQUIDITY};
};

// ─── MarketRecord ─────────────────────────────────────────────────────────────

/// Language-agnostic persisted shape of one market.
struct MarketRecord {
    MarketId                     id{NO_MARKET};
    std::optional<MarketId>      parent_id;
    std::string                  title;
    Category                     category;
    std::vector<Outcome>         outcomes;
    double                       tau{0.0};
    double                       time_left{0.0};
    double                       volume{0.0};
    double                       rollup_volume{0.0};
    double                       liquidity{0.0};
    double                       leverage_ceiling{0.0};
    MarketStatus                 status{MarketStatus::Open};
    std::optional<std::string>   proof_hash;       ///< hex commitment, once resolved
    std::optional<std::size_t>   winning_outcome;
};

// ─── Position ─────────────────────────────────────────────────────────────────

struct Position {
    PositionId            id{0};
    UserId                owner;
    MarketId              market{NO_MARKET};
    std::size_t           outcome{0};
    double                stake{0.0};            ///< Executed amount at entry
    double                collateral{0.0};       ///< Collateral posted with the trade
    double                base_leverage{1.0};
    std::optional<double> effective_leverage;    ///< Set once by the chain executor
    double                entry_odds{0.0};
    PositionStatus        status{PositionStatus::Open};
    std::optional<double> payout;                ///< Set when closed by resolution

    /// Leverage that applies at payout.
    [[nodiscard]] double leverage() const noexcept {
        return effective_leverage.value_or(base_leverage);
    }
};

/// Leveraged exposure spread over every outcome of a market. Its weights are
/// the outcome probabilities at entry; it collapses once, at finalisation,
/// paying `exposure() * weights[winner]`.
struct QuantumPosition {
    PositionId            id{0};
    UserId                owner;
    MarketId              market{NO_MARKET};
    double                stake{0.0};
    double                collateral{0.0};
    double                leverage{1.0};
    std::vector<double>   weights;
    PositionStatus        status{PositionStatus::Open};
    std::optional<std::size_t> collapsed_outcome;
    std::optional<double> payout;

    [[nodiscard]] double exposure() const noexcept { return stake * leverage; }
};

/// Leverage ceiling for a market with `time_left_s` seconds remaining:
/// ≤60 s → 500, ≤600 s → 250, ≤1800 s → 150, ≤3600 s → 100, else 75.
[[nodiscard]] double leverage_ceiling_for(double time_left_s) noexcept;

// ─── Market ───────────────────────────────────────────────────────────────────

class Market {
public:
    /// Validate `spec` and build an Open market.
    ///
    /// # Errors
    /// `InvalidMarketSpec` if the title is empty, `time_left` is outside
    /// (0, FLASH_HORIZON_S], there are fewer than 2 or more than 10 outcomes,
    /// an outcome name is empty or repeated, or liquidity is negative or not
    /// finite.
    [[nodiscard]] static Result<Market>
    create(MarketId id, MarketSpec spec, TimestampMs now);

    // ── Accessors ─────────────────────────────────────────────────────────────

    [[nodiscard]] MarketId                 id() const noexcept { return id_; }
    [[nodiscard]] std::optional<MarketId>  parent() const noexcept { return parent_; }
    [[nodiscard]] const std::string&       title() const noexcept { return title_; }
    [[nodiscard]] const Category&          category() const noexcept { return category_; }
    [[nodiscard]] const std::vector<Outcome>& outcomes() const noexcept { return outcomes_; }
    [[nodiscard]] std::size_t              outcome_count() const noexcept { return outcomes_.size(); }
    [[nodiscard]] ProbabilityVector        probabilities() const;
    [[nodiscard]] std::optional<std::size_t> outcome_index(std::string_view name) const noexcept;

    [[nodiscard]] Tau          tau() const noexcept;
    [[nodiscard]] double       time_left() const noexcept { return time_left_; }
    [[nodiscard]] double       volume() const noexcept { return volume_; }
    [[nodiscard]] double       rollup_volume() const noexcept { return rollup_volume_; }
    [[nodiscard]] double       liquidity() const noexcept { return liquidity_; }
    [[nodiscard]] double       leverage_ceiling() const noexcept { return leverage_ceiling_; }
    [[nodiscard]] MarketStatus status() const noexcept { return status_; }

    /// Per-outcome curve depth handed to the trade solver: liquidity / n.
    [[nodiscard]] double outcome_liquidity() const noexcept;

    [[nodiscard]] TimestampMs                opened_at() const noexcept { return opened_at_; }
    [[nodiscard]] std::optional<TimestampMs> resolving_at() const noexcept { return resolving_at_; }
    [[nodiscard]] std::optional<TimestampMs> resolved_at() const noexcept { return resolved_at_; }
    [[nodiscard]] std::optional<std::size_t> winning_outcome() const noexcept { return winner_; }
    [[nodiscard]] const std::optional<crypto::Digest>& commitment() const noexcept { return commitment_; }

    /// True while trades may commit: Open and time_left > 0.
    [[nodiscard]] bool accepts_trades() const noexcept;

    [[nodiscard]] MarketRecord record() const;

    // ── Time ──────────────────────────────────────────────────────────────────

    /// Count down by the clock time elapsed since the last update. Enters
    /// Resolving when time_left reaches zero, stamped with the instant it did
    /// rather than `now`. Returns true on that transition.
    bool sync_clock(TimestampMs now) noexcept;

    /// Feed-driven countdown. Larger values than the current time_left are
    /// ignored. Returns true if the market entered Resolving.
    bool apply_time_left(double time_left_s, TimestampMs now) noexcept;

    /// Early termination: the tracked real-world event concluded.
    ///
    /// # Errors
    /// `MarketNotOpen` unless the market is Open.
    [[nodiscard]] Status conclude(TimestampMs now);

    // ── Prices & volume ───────────────────────────────────────────────────────

    /// Replace implied probabilities from the feed. Values are floored at a
    /// small positive probability and renormalised.
    ///
    /// # Errors
    /// `FeedMismatch` on size mismatch or a negative / non-finite entry;
    /// `MarketNotOpen` unless Open.
    [[nodiscard]] Status apply_probabilities(std::span<const double> implied);

    /// Commit a solved fill against `outcome`: bump its probability by
    /// execution / liquidity, renormalise, refresh odds, add volume.
    ///
    /// # Errors
    /// `InvalidOutcome`, `InvalidAmount`, `MarketExpired` (time_left = 0),
    /// `MarketNotOpen`.
    [[nodiscard]] Status record_fill(std::size_t outcome, double execution_amount);

    /// Informational rollup from a child market. Never touches outcomes.
    void add_rollup(double amount) noexcept;

    // ── Resolution transitions ────────────────────────────────────────────────

    /// Resolving | Disputed → Resolved. Permanent.
    ///
    /// # Errors
    /// `AlreadyResolved` if Resolved, `MarketNotResolving` if Open,
    /// `InvalidOutcome` for an out-of-range index.
    [[nodiscard]] Status finalize(std::size_t winner, const crypto::Digest& commitment,
                                  TimestampMs now);

    /// Resolving → Disputed.
    [[nodiscard]] Status mark_disputed(TimestampMs now);

    /// Resolved and the dispute window has elapsed.
    [[nodiscard]] bool reclaimable(TimestampMs now,
                                   TimestampMs dispute_window_ms = constants::DISPUTE_WINDOW_MS) const noexcept;

private:
    Market() = default;

    void enter_resolving(TimestampMs now) noexcept;
    void refresh_odds() noexcept;
    void set_probabilities(const ProbabilityVector& p) noexcept;

    MarketId                       id_{NO_MARKET};
    std::optional<MarketId>        parent_;
    std::string                    title_;
    Category                       category_;
    std::vector<Outcome>           outcomes_;
    double                         time_left_{0.0};
    double                         volume_{0.0};
    double                         rollup_volume_{0.0};
    double                         liquidity_{0.0};
    double                         leverage_ceiling_{0.0};
    MarketStatus                   status_{MarketStatus::Open};
    TimestampMs                    opened_at_{0};
    TimestampMs                    last_tick_at_{0};
    std::optional<TimestampMs>     resolving_at_;
    std::optional<TimestampMs>     resolved_at_;
    std::optional<std::size_t>     winner_;
    std::optional<crypto::Digest>  commitment_;
};

} // namespace flash::market
