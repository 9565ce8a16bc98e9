#pragma once

/// @file include/flash/collaborators.hpp
/// @brief Shapes exchanged with the systems around the core.
///
/// The core never fetches: the feed pushes `FeedSnapshot`s in, and the core
/// pushes `SettlementRecord`s to the ledger and `DisputeNotice`s to
/// governance. Sinks are called with no market lock held, exactly once per
/// event.

#include "flash/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace flash {

// ─── Market data feed ─────────────────────────────────────────────────────────

struct FeedSnapshot {
    MarketId                 market{NO_MARKET};
    std::string              event_id;
    double                   time_remaining_s{0.0};
    std::vector<std::string> outcome_candidates;     ///< Must match the market, in order
    std::vector<double>      implied_probabilities;  ///< Empty: leave prices alone
    bool                     event_concluded{false};
};

// ─── Ledger ───────────────────────────────────────────────────────────────────

struct Payout {
    PositionId position{0};
    UserId     owner;
    double     amount{0.0};
};

struct SettlementRecord {
    MarketId            market_id{NO_MARKET};
    std::size_t         outcome{0};
    std::string         outcome_name;
    std::string         path;             ///< "Proof", "Consensus" or "Governance"
    std::string         commitment_hex;
    std::vector<Payout> payouts;
};

class Ledger {
public:
    virtual ~Ledger() = default;
    virtual void emit(const SettlementRecord& record) = 0;
};

// ─── Governance ───────────────────────────────────────────────────────────────

struct DisputeNotice {
    MarketId                 market{NO_MARKET};
    std::string              title;
    TimestampMs              resolving_at{0};
    TimestampMs              disputed_at{0};
    std::size_t              attestations{0};  ///< Votes collected before escalation
    bool                     proof_failed{false};
};

class Governance {
public:
    virtual ~Governance() = default;
    virtual void escalate(const DisputeNotice& notice) = 0;
};

} // namespace flash
