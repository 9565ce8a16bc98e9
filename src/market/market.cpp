/// @file src/market/market.cpp
/// @brief Market: lifecycle state machine, prices and volume.

#include "flash/market.hpp"
#include "flash/log.hpp"
#include "flash/tau.hpp"

#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <unordered_set>

namespace flash::market {

namespace {

/// Feed probabilities are floored here so that odds stay finite.
constexpr double PROBABILITY_FLOOR = 1e-6;

constexpr std::string_view COMPONENT = "market";

} // namespace

// ─── leverage_ceiling_for ─────────────────────────────────────────────────────

double leverage_ceiling_for(double time_left_s) noexcept {
    if (std::isnan(time_left_s) || time_left_s <= 60.0) return 500.0;
    if (time_left_s <= 600.0)  return 250.0;
    if (time_left_s <= 1800.0) return 150.0;
    if (time_left_s <= 3600.0) return 100.0;
    return 75.0;
}

// ─── Market::create ───────────────────────────────────────────────────────────

Result<Market> Market::create(MarketId id, MarketSpec spec, TimestampMs now) {
    if (spec.title.empty()) {
        return make_error(ErrorCode::InvalidMarketSpec, "empty title");
    }
    if (!std::isfinite(spec.time_left_s) || spec.time_left_s <= 0.0 ||
        spec.time_left_s > constants::FLASH_HORIZON_S) {
        return make_error(ErrorCode::InvalidMarketSpec,
                          fmt::format("time_left {}s is not a flash window", spec.time_left_s));
    }
    if (spec.outcomes.size() < constants::MIN_OUTCOMES ||
        spec.outcomes.size() > constants::MAX_OUTCOMES) {
        return make_error(ErrorCode::InvalidMarketSpec,
                          fmt::format("{} outcomes, need {}..{}", spec.outcomes.size(),
                                      constants::MIN_OUTCOMES, constants::MAX_OUTCOMES));
    }
    if (!std::isfinite(spec.liquidity) || spec.liquidity < 0.0) {
        return make_error(ErrorCode::InvalidMarketSpec,
                          fmt::format("liquidity {}", spec.liquidity));
    }

    std::unordered_set<std::string_view> seen;
    for (const auto& name : spec.outcomes) {
        if (name.empty() || !seen.insert(name).second) {
            return make_error(ErrorCode::InvalidMarketSpec,
                              fmt::format("outcome name '{}' empty or repeated", name));
        }
    }

    Market m;
    m.id_        = id;
    m.parent_    = spec.parent;
    m.title_     = std::move(spec.title);
    m.category_  = std::move(spec.category);
    m.time_left_ = spec.time_left_s;
    m.liquidity_ = spec.liquidity;
    m.leverage_ceiling_ = leverage_ceiling_for(spec.time_left_s);
    m.opened_at_    = now;
    m.last_tick_at_ = now;

    const double n = static_cast<double>(spec.outcomes.size());
    m.outcomes_.reserve(spec.outcomes.size());
    for (auto& name : spec.outcomes) {
        m.outcomes_.push_back(Outcome{
            .name        = std::move(name),
            .probability = 1.0 / n,
            .odds        = n,
            .volume      = 0.0,
            .backers     = 0,
        });
    }
    return m;
}

// ─── Accessors ────────────────────────────────────────────────────────────────

ProbabilityVector Market::probabilities() const {
    ProbabilityVector p(static_cast<Eigen::Index>(outcomes_.size()));
    for (std::size_t i = 0; i < outcomes_.size(); ++i) {
        p(static_cast<Eigen::Index>(i)) = outcomes_[i].probability;
    }
    return p;
}

std::optional<std::size_t> Market::outcome_index(std::string_view name) const noexcept {
    for (std::size_t i = 0; i < outcomes_.size(); ++i) {
        if (outcomes_[i].name == name) return i;
    }
    return std::nullopt;
}

Tau Market::tau() const noexcept {
    return tau::ConcentrationCalculator::compute(time_left_);
}

double Market::outcome_liquidity() const noexcept {
    if (outcomes_.empty()) return 0.0;
    return liquidity_ / static_cast<double>(outcomes_.size());
}

bool Market::accepts_trades() const noexcept {
    return status_ == MarketStatus::Open && time_left_ > 0.0;
}

MarketRecord Market::record() const {
    MarketRecord r;
    r.id               = id_;
    r.parent_id        = parent_;
    r.title            = title_;
    r.category         = category_;
    r.outcomes         = outcomes_;
    r.tau              = tau().value;
    r.time_left        = time_left_;
    r.volume           = volume_;
    r.rollup_volume    = rollup_volume_;
    r.liquidity        = liquidity_;
    r.leverage_ceiling = leverage_ceiling_;
    r.status           = status_;
    r.winning_outcome  = winner_;
    if (commitment_) {
        r.proof_hash = crypto::to_hex(*commitment_);
    }
    return r;
}

// ─── Time ─────────────────────────────────────────────────────────────────────

void Market::enter_resolving(TimestampMs now) noexcept {
    status_       = MarketStatus::Resolving;
    resolving_at_ = now;
    log::info(COMPONENT, "market {} '{}' Open -> Resolving (time_left={:.3f}s, volume={:.4f})",
              id_, title_, time_left_, volume_);
}

bool Market::sync_clock(TimestampMs now) noexcept {
    if (status_ != MarketStatus::Open) return false;
    if (now <= last_tick_at_) return false;

    const double elapsed_s = static_cast<double>(now - last_tick_at_) / 1000.0;
    if (elapsed_s >= time_left_) {
        // Stamp the instant the clock ran out, not the instant it was noticed.
        const auto expired_at = last_tick_at_
            + static_cast<TimestampMs>(std::ceil(time_left_ * 1000.0));
        return apply_time_left(0.0, std::min(expired_at, now));
    }
    last_tick_at_ = now;
    return apply_time_left(time_left_ - elapsed_s, now);
}

bool Market::apply_time_left(double time_left_s, TimestampMs now) noexcept {
    if (status_ != MarketStatus::Open) return false;
    if (std::isnan(time_left_s)) return false;

    if (time_left_s < time_left_) {
        time_left_ = std::max(0.0, time_left_s);
        leverage_ceiling_ = std::max(leverage_ceiling_, leverage_ceiling_for(time_left_));
    }
    last_tick_at_ = std::max(last_tick_at_, now);

    if (time_left_ <= 0.0) {
        enter_resolving(now);
        return true;
    }
    return false;
}

Status Market::conclude(TimestampMs now) {
    if (status_ != MarketStatus::Open) {
        return make_error(ErrorCode::MarketNotOpen,
                          fmt::format("market {} is {}", id_, to_string(status_)));
    }
    log::info(COMPONENT, "market {} event concluded early", id_);
    enter_resolving(now);
    return ok();
}

// ─── Prices & volume ──────────────────────────────────────────────────────────

void Market::set_probabilities(const ProbabilityVector& p) noexcept {
    for (std::size_t i = 0; i < outcomes_.size(); ++i) {
        outcomes_[i].probability = p(static_cast<Eigen::Index>(i));
    }
    refresh_odds();
}

void Market::refresh_odds() noexcept {
    for (auto& o : outcomes_) {
        o.odds = o.probability > 0.0 ? 1.0 / o.probability : 0.0;
    }
}

Status Market::apply_probabilities(std::span<const double> implied) {
    if (status_ != MarketStatus::Open) {
        return make_error(ErrorCode::MarketNotOpen,
                          fmt::format("market {} is {}", id_, to_string(status_)));
    }
    if (implied.size() != outcomes_.size()) {
        return make_error(ErrorCode::FeedMismatch,
                          fmt::format("{} probabilities for {} outcomes",
                                      implied.size(), outcomes_.size()));
    }

    ProbabilityVector p(static_cast<Eigen::Index>(implied.size()));
    for (std::size_t i = 0; i < implied.size(); ++i) {
        if (!std::isfinite(implied[i]) || implied[i] < 0.0) {
            return make_error(ErrorCode::FeedMismatch,
                              fmt::format("probability[{}] = {}", i, implied[i]));
        }
        p(static_cast<Eigen::Index>(i)) = std::max(implied[i], PROBABILITY_FLOOR);
    }
    p /= p.sum();
    set_probabilities(p);
    return ok();
}

Status Market::record_fill(std::size_t outcome, double execution_amount) {
    if (status_ != MarketStatus::Open) {
        return make_error(ErrorCode::MarketNotOpen,
                          fmt::format("market {} is {}", id_, to_string(status_)));
    }
    if (time_left_ <= 0.0) {
        return make_error(ErrorCode::MarketExpired, fmt::format("market {}", id_));
    }
    if (outcome >= outcomes_.size()) {
        return make_error(ErrorCode::InvalidOutcome,
                          fmt::format("outcome {} of {}", outcome, outcomes_.size()));
    }
    if (!std::isfinite(execution_amount) || execution_amount < 0.0) {
        return make_error(ErrorCode::InvalidAmount,
                          fmt::format("execution amount {}", execution_amount));
    }

    if (liquidity_ > 0.0 && execution_amount > 0.0) {
        ProbabilityVector p = probabilities();
        p(static_cast<Eigen::Index>(outcome)) += execution_amount / liquidity_;
        p /= p.sum();
        set_probabilities(p);
    }

    auto& o = outcomes_[outcome];
    o.volume += execution_amount;
    ++o.backers;
    volume_  += execution_amount;
    return ok();
}

void Market::add_rollup(double amount) noexcept {
    if (std::isfinite(amount) && amount > 0.0) {
        rollup_volume_ += amount;
    }
}

// ─── Resolution transitions ───────────────────────────────────────────────────

Status Market::finalize(std::size_t winner, const crypto::Digest& commitment,
                        TimestampMs now) {
    if (status_ == MarketStatus::Resolved) {
        return make_error(ErrorCode::AlreadyResolved, fmt::format("market {}", id_));
    }
    if (status_ == MarketStatus::Open) {
        return make_error(ErrorCode::MarketNotResolving, fmt::format("market {} still Open", id_));
    }
    if (winner >= outcomes_.size()) {
        return make_error(ErrorCode::InvalidOutcome,
                          fmt::format("outcome {} of {}", winner, outcomes_.size()));
    }

    const MarketStatus from = status_;
    status_      = MarketStatus::Resolved;
    winner_      = winner;
    commitment_  = commitment;
    resolved_at_ = now;
    log::info(COMPONENT, "market {} {} -> Resolved: '{}' (commitment {})",
              id_, to_string(from), outcomes_[winner].name, crypto::to_hex(commitment));
    return ok();
}

Status Market::mark_disputed(TimestampMs now) {
    if (status_ == MarketStatus::Resolved) {
        return make_error(ErrorCode::AlreadyResolved, fmt::format("market {}", id_));
    }
    if (status_ != MarketStatus::Resolving) {
        return make_error(ErrorCode::MarketNotResolving,
                          fmt::format("market {} is {}", id_, to_string(status_)));
    }
    status_ = MarketStatus::Disputed;
    log::info(COMPONENT, "market {} Resolving -> Disputed after {} ms",
              id_, now - resolving_at_.value_or(now));
    return ok();
}

bool Market::reclaimable(TimestampMs now, TimestampMs dispute_window_ms) const noexcept {
    if (status_ != MarketStatus::Resolved || !resolved_at_) return false;
    return now - *resolved_at_ >= dispute_window_ms;
}

} // namespace flash::market
