/// @file src/core/settlement_engine.cpp
/// @brief Settlement Engine: per-market orchestration of the core.

#include "flash/engine.hpp"
#include "flash/log.hpp"

#include "deadline.hpp"

#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <mutex>

namespace flash::core {

namespace {

constexpr std::string_view COMPONENT = "engine";

Error market_not_found(MarketId id) {
    return make_error(ErrorCode::MarketNotFound, fmt::format("market {}", id));
}

Error position_not_found(PositionId id) {
    return make_error(ErrorCode::PositionNotFound, fmt::format("position {}", id));
}

/// Winners receive stake + stake · leverage · (odds − 1); losers nothing.
double payout_for(const market::Position& p, bool won) noexcept {
    if (!won) return 0.0;
    return p.stake + p.stake * p.leverage() * (p.entry_odds - 1.0);
}

} // namespace

// ─── Construction ─────────────────────────────────────────────────────────────

SettlementEngine::SettlementEngine(EngineConfig config, const Clock& clock,
                                   Collaborators collaborators,
                                   resolver::AttestationRegistry sources)
    : config_(std::move(config))
    , clock_(clock)
    , collaborators_(std::move(collaborators))
    , sources_(std::move(sources))
    , solver_(config_.solver)
    , chain_(config_.chain, collaborators_.steps)
    , risk_(config_.risk, clock_)
{}

market::SlotPtr SettlementEngine::find_slot(MarketId id) const {
    return registry_.find(id);
}

SettlementEngine::SlotTransitions
SettlementEngine::sync_slot(market::MarketSlot& slot, TimestampMs now,
                            PendingEscalations& pending) const {
    auto& m     = slot.market;
    auto& state = slot.resolution;

    SlotTransitions changed;
    changed.expired = m.sync_clock(now);
    if (!state.resolving_at && m.resolving_at()) {
        state.resolving_at = m.resolving_at();
    }

    if (m.status() != MarketStatus::Resolving) return changed;
    const auto decision = resolver::decide(state, now, config_.resolver);
    if (!std::holds_alternative<resolver::EscalateDispute>(decision)) return changed;

    const TimestampMs resolving_at = state.resolving_at.value_or(now);
    const TimestampMs disputed_at  =
        std::min(now, resolving_at + config_.resolver.consensus_window_ms);
    if (auto st = m.mark_disputed(disputed_at); !st) {
        log::error(COMPONENT, "market {} could not enter Disputed: {}",
                   m.id(), st.error().to_string());
        return changed;
    }
    state.disputed   = true;
    changed.disputed = true;
    log::warn(COMPONENT, "market {} disputed: proof {}, {} attestation(s) short of quorum {}",
              m.id(), state.proof_failed ? "failed" : "absent",
              state.attestations.size(), config_.resolver.quorum);
    pending.push(DisputeNotice{
        .market       = m.id(),
        .title        = m.title(),
        .resolving_at = resolving_at,
        .disputed_at  = disputed_at,
        .attestations = state.attestations.size(),
        .proof_failed = state.proof_failed,
    });
    return changed;
}

// ─── Markets ──────────────────────────────────────────────────────────────────

Result<MarketId> SettlementEngine::create_market(market::MarketSpec spec) {
    if (spec.parent && !find_slot(*spec.parent)) {
        return market_not_found(*spec.parent);
    }

    const MarketId id = registry_.next_market_id();
    auto created = market::Market::create(id, std::move(spec), clock_.now());
    if (!created) {
        log::debug(COMPONENT, "create rejected: {}", created.error().to_string());
        return created.error();
    }

    auto slot = std::make_shared<market::MarketSlot>(std::move(*created));
    const auto& m = slot->market;
    log::info(COMPONENT, "market {} created: '{}' [{}] {} outcomes, {:.0f}s left, ceiling {}x{}",
              id, m.title(), m.category(), m.outcome_count(), m.time_left(),
              m.leverage_ceiling(),
              m.parent() ? fmt::format(", parent {}", *m.parent()) : std::string{});

    if (!registry_.insert(std::move(slot))) {
        return make_error(ErrorCode::InvalidMarketSpec, fmt::format("market id {} in use", id));
    }
    return id;
}

Result<market::MarketRecord> SettlementEngine::market(MarketId id) const {
    auto slot = find_slot(id);
    if (!slot) return market_not_found(id);
    PendingEscalations pending(*this);
    std::lock_guard lock(slot->mutex);
    sync_slot(*slot, clock_.now(), pending);
    return slot->market.record();
}

std::size_t SettlementEngine::market_count() const {
    return registry_.size();
}

Status SettlementEngine::apply_feed(const FeedSnapshot& snapshot) {
    auto slot = find_slot(snapshot.market);
    if (!slot) return market_not_found(snapshot.market);

    const TimestampMs now = clock_.now();
    PendingEscalations pending(*this);
    std::lock_guard lock(slot->mutex);
    auto& m = slot->market;

    if (snapshot.outcome_candidates.size() != m.outcome_count()) {
        return make_error(ErrorCode::FeedMismatch,
                          fmt::format("event '{}': {} candidates for {} outcomes",
                                      snapshot.event_id, snapshot.outcome_candidates.size(),
                                      m.outcome_count()));
    }
    for (std::size_t i = 0; i < m.outcome_count(); ++i) {
        if (snapshot.outcome_candidates[i] != m.outcomes()[i].name) {
            return make_error(ErrorCode::FeedMismatch,
                              fmt::format("event '{}': candidate {} is '{}', expected '{}'",
                                          snapshot.event_id, i, snapshot.outcome_candidates[i],
                                          m.outcomes()[i].name));
        }
    }

    sync_slot(*slot, now, pending);
    if (m.status() != MarketStatus::Open) {
        return make_error(ErrorCode::MarketNotOpen,
                          fmt::format("market {} is {}", m.id(), to_string(m.status())));
    }

    if (!snapshot.implied_probabilities.empty()) {
        if (auto st = m.apply_probabilities(snapshot.implied_probabilities); !st) {
            return st.error();
        }
    }
    m.apply_time_left(snapshot.time_remaining_s, now);
    if (snapshot.event_concluded && m.status() == MarketStatus::Open) {
        if (auto st = m.conclude(now); !st) return st.error();
    }
    sync_slot(*slot, now, pending);
    return ok();
}

// ─── Trading ──────────────────────────────────────────────────────────────────

Result<Quote>
SettlementEngine::quote(MarketId id, std::string_view outcome, double amount) const {
    auto slot = find_slot(id);
    if (!slot) return market_not_found(id);

    Tau    tau{0.0};
    double liquidity = 0.0;
    double odds      = 0.0;
    double ceiling   = 0.0;
    {
        PendingEscalations pending(*this);
        std::lock_guard lock(slot->mutex);
        sync_slot(*slot, clock_.now(), pending);
        const auto& m = slot->market;
        if (!m.accepts_trades()) {
            return make_error(ErrorCode::MarketExpired, fmt::format("market {}", id));
        }
        const auto idx = m.outcome_index(outcome);
        if (!idx) {
            return make_error(ErrorCode::InvalidOutcome, fmt::format("outcome '{}'", outcome));
        }
        tau       = m.tau();
        liquidity = m.outcome_liquidity();
        odds      = m.outcomes()[*idx].odds;
        ceiling   = m.leverage_ceiling();
    }

    auto fill = solver_.solve(amount, liquidity, tau);
    if (!fill) return fill.error();
    return Quote{
        .fill             = *fill,
        .tau              = tau,
        .odds             = odds,
        .leverage_ceiling = ceiling,
    };
}

Result<TradeReceipt> SettlementEngine::trade(const TradeRequest& req) {
    auto slot = find_slot(req.market);
    if (!slot) return market_not_found(req.market);

    const TimestampMs        now  = clock_.now();
    const risk::RiskSnapshot limits = risk_.snapshot();

    TradeReceipt            receipt;
    std::optional<MarketId> parent;
    {
        PendingEscalations pending(*this);
        std::lock_guard lock(slot->mutex);
        auto& m = slot->market;
        sync_slot(*slot, now, pending);

        if (!m.accepts_trades()) {
            log::debug(COMPONENT, "trade on market {} rejected: {} with {:.3f}s left",
                       m.id(), to_string(m.status()), m.time_left());
            return make_error(ErrorCode::MarketExpired, fmt::format("market {}", m.id()));
        }
        const auto idx = m.outcome_index(req.outcome);
        if (!idx) {
            return make_error(ErrorCode::InvalidOutcome, fmt::format("outcome '{}'", req.outcome));
        }
        if (!std::isfinite(req.amount) || req.amount <= 0.0) {
            return make_error(ErrorCode::InvalidAmount, fmt::format("amount {}", req.amount));
        }
        if (!std::isfinite(req.max_slippage) || req.max_slippage < 0.0) {
            return make_error(ErrorCode::InvalidAmount,
                              fmt::format("max_slippage {}", req.max_slippage));
        }

        const double base_cap = std::min(m.leverage_ceiling(), limits->max_base_leverage);
        if (req.leverage > base_cap) {
            return make_error(ErrorCode::LeverageExceedsCeiling,
                              fmt::format("base leverage {}x > {}x", req.leverage, base_cap));
        }
        if (auto verdict = risk::check(*limits, risk::RiskRequest{
                .leverage       = req.leverage,
                .market_ceiling = m.leverage_ceiling(),
                .collateral     = req.collateral,
                .stake          = req.amount,
            }); !verdict) {
            log::debug(COMPONENT, "trade on market {} vetoed: {}",
                       m.id(), verdict.error().to_string());
            return verdict.error();
        }

        auto fill = solver_.solve(req.amount, m.outcome_liquidity(), m.tau());
        if (!fill) return fill.error();
        if (fill->low_confidence()) {
            log::warn(COMPONENT, "market {} solve hit the iteration cap (residual {:.3e})",
                      m.id(), fill->residual);
        }
        if (fill->execution_amount <= 0.0) {
            return make_error(ErrorCode::InsufficientLiquidity,
                              fmt::format("order {} absorbed entirely by the curve", req.amount));
        }
        const double slippage = fill->slippage / req.amount;
        if (slippage > req.max_slippage) {
            return make_error(ErrorCode::SlippageExceeded,
                              fmt::format("{:.4f} > {:.4f}", slippage, req.max_slippage));
        }

        const double entry_odds = m.outcomes()[*idx].odds;
        if (auto st = m.record_fill(*idx, fill->execution_amount); !st) return st.error();

        const PositionId pid = registry_.next_position_id();
        slot->positions.emplace(pid, market::Position{
            .id            = pid,
            .owner         = req.user,
            .market        = m.id(),
            .outcome       = *idx,
            .stake         = fill->execution_amount,
            .collateral    = req.collateral,
            .base_leverage = req.leverage,
            .entry_odds    = entry_odds,
        });
        registry_.index_position(pid, m.id());

        log::debug(COMPONENT, "market {} fill: {} x{} on '{}' executed {:.6f} of {} (odds {:.4f})",
                   m.id(), req.user, req.leverage, req.outcome,
                   fill->execution_amount, req.amount, entry_odds);

        parent  = m.parent();
        receipt = TradeReceipt{
            .position   = pid,
            .fill       = *fill,
            .tau        = m.tau(),
            .entry_odds = entry_odds,
        };
    }

    rollup(parent, receipt.fill.execution_amount * std::clamp(config_.rollup_share, 0.0, 1.0));
    return receipt;
}

void SettlementEngine::rollup(std::optional<MarketId> parent, double amount) {
    if (!parent) return;
    auto slot = find_slot(*parent);
    if (!slot) {
        log::debug(COMPONENT, "parent {} gone; rollup of {} dropped", *parent, amount);
        return;
    }
    std::lock_guard lock(slot->mutex);
    slot->market.add_rollup(amount);
}

Result<ChainReceipt>
SettlementEngine::chain_leverage(PositionId pid, std::span<const chain::ChainStep> steps) {
    const auto mid = registry_.market_of(pid);
    if (!mid) return position_not_found(pid);
    auto slot = find_slot(*mid);
    if (!slot) return position_not_found(pid);

    const TimestampMs now = clock_.now();
    PendingEscalations pending(*this);
    std::lock_guard lock(slot->mutex);
    auto& m = slot->market;
    sync_slot(*slot, now, pending);

    const auto it = slot->positions.find(pid);
    if (it == slot->positions.end()) return position_not_found(pid);
    auto& pos = it->second;

    if (pos.status != PositionStatus::Open) {
        return make_error(ErrorCode::PositionClosed,
                          fmt::format("position {} is {}", pid, to_string(pos.status)));
    }
    if (pos.effective_leverage) {
        return make_error(ErrorCode::LeverageAlreadySet,
                          fmt::format("position {} already at {}x", pid, *pos.effective_leverage));
    }
    if (!m.accepts_trades()) {
        return make_error(ErrorCode::MarketExpired, fmt::format("market {}", m.id()));
    }

    const double ceiling    = m.leverage_ceiling();
    const double stake      = pos.stake;
    const double collateral = pos.collateral;
    const chain::RiskGate gate = [this, ceiling, stake, collateral](double leverage) -> Status {
        // Fresh snapshot per step: a pause mid-chain stops the next step.
        const risk::RiskSnapshot snapshot = risk_.snapshot();
        return risk::check(*snapshot, risk::RiskRequest{
            .leverage       = leverage,
            .market_ceiling = ceiling,
            .collateral     = collateral,
            .stake          = stake,
        });
    };

    auto outcome = chain_.execute(chain::ChainContext{
        .market        = m.id(),
        .position      = pid,
        .base_leverage = pos.base_leverage,
        .tau           = m.tau(),
    }, steps, gate);
    if (!outcome) return outcome.error();

    pos.effective_leverage = outcome->effective_leverage;
    return ChainReceipt{
        .position           = pid,
        .effective_leverage = outcome->effective_leverage,
        .steps              = steps.size(),
    };
}

Status SettlementEngine::mark_position(PositionId pid, double collateral) {
    const auto mid = registry_.market_of(pid);
    if (!mid) return position_not_found(pid);
    auto slot = find_slot(*mid);
    if (!slot) return position_not_found(pid);

    PendingEscalations pending(*this);
    std::lock_guard lock(slot->mutex);
    sync_slot(*slot, clock_.now(), pending);
    const auto it = slot->positions.find(pid);
    if (it == slot->positions.end()) return position_not_found(pid);
    auto& pos = it->second;

    if (!std::isfinite(collateral) || collateral < 0.0) {
        return make_error(ErrorCode::InvalidAmount, fmt::format("collateral {}", collateral));
    }
    if (pos.status != PositionStatus::Open) {
        return make_error(ErrorCode::PositionClosed,
                          fmt::format("position {} is {}", pid, to_string(pos.status)));
    }

    const risk::RiskSnapshot limits = risk_.snapshot();
    const double ratio = risk::collateral_ratio(collateral, pos.stake);
    if (ratio >= limits->liquidation_threshold) {
        return make_error(ErrorCode::PositionHealthy,
                          fmt::format("collateral ratio {:.4f} >= {:.4f}",
                                      ratio, limits->liquidation_threshold));
    }

    pos.collateral = collateral;
    pos.status     = PositionStatus::Liquidated;
    pos.payout     = 0.0;
    log::info(COMPONENT, "position {} on market {} liquidated: ratio {:.4f} < {:.4f}",
              pid, pos.market, ratio, limits->liquidation_threshold);
    return ok();
}

Result<market::Position> SettlementEngine::position(PositionId pid) const {
    const auto mid = registry_.market_of(pid);
    if (!mid) return position_not_found(pid);
    auto slot = find_slot(*mid);
    if (!slot) return position_not_found(pid);

    PendingEscalations pending(*this);
    std::lock_guard lock(slot->mutex);
    sync_slot(*slot, clock_.now(), pending);
    const auto it = slot->positions.find(pid);
    if (it == slot->positions.end()) return position_not_found(pid);
    return it->second;
}

// ─── Quantum positions ────────────────────────────────────────────────────────

Result<QuantumReceipt> SettlementEngine::open_quantum(const QuantumRequest& req) {
    auto slot = find_slot(req.market);
    if (!slot) return market_not_found(req.market);

    const TimestampMs        now    = clock_.now();
    const risk::RiskSnapshot limits = risk_.snapshot();

    PendingEscalations pending(*this);
    std::lock_guard lock(slot->mutex);
    auto& m = slot->market;
    sync_slot(*slot, now, pending);

    if (!m.accepts_trades()) {
        return make_error(ErrorCode::MarketExpired, fmt::format("market {}", m.id()));
    }
    if (!std::isfinite(req.amount) || req.amount <= 0.0) {
        return make_error(ErrorCode::InvalidAmount, fmt::format("amount {}", req.amount));
    }
    const double cap = std::min(m.leverage_ceiling(), limits->max_base_leverage);
    if (!std::isfinite(req.leverage) || req.leverage < 1.0 || req.leverage > cap) {
        return make_error(ErrorCode::LeverageExceedsCeiling,
                          fmt::format("quantum leverage {}x outside [1, {}]", req.leverage, cap));
    }
    if (auto verdict = risk::check(*limits, risk::RiskRequest{
            .leverage       = req.leverage,
            .market_ceiling = m.leverage_ceiling(),
            .collateral     = req.collateral,
            .stake          = req.amount,
        }); !verdict) {
        return verdict.error();
    }

    std::vector<double> weights;
    weights.reserve(m.outcome_count());
    for (const auto& o : m.outcomes()) weights.push_back(o.probability);

    const PositionId pid = registry_.next_position_id();
    const auto& q = slot->quanta.emplace(pid, market::QuantumPosition{
        .id         = pid,
        .owner      = req.user,
        .market     = m.id(),
        .stake      = req.amount,
        .collateral = req.collateral,
        .leverage   = req.leverage,
        .weights    = weights,
    }).first->second;
    registry_.index_position(pid, m.id());

    log::debug(COMPONENT, "market {} quantum position {}: {} x{} over {} outcome(s), exposure {:.4f}",
               m.id(), pid, req.user, req.leverage, weights.size(), q.exposure());
    return QuantumReceipt{
        .position = pid,
        .exposure = q.exposure(),
        .weights  = std::move(weights),
    };
}

Result<market::QuantumPosition> SettlementEngine::quantum_position(PositionId pid) const {
    const auto mid = registry_.market_of(pid);
    if (!mid) return position_not_found(pid);
    auto slot = find_slot(*mid);
    if (!slot) return position_not_found(pid);

    PendingEscalations pending(*this);
    std::lock_guard lock(slot->mutex);
    sync_slot(*slot, clock_.now(), pending);
    const auto it = slot->quanta.find(pid);
    if (it == slot->quanta.end()) return position_not_found(pid);
    return it->second;
}

// ─── Resolution ───────────────────────────────────────────────────────────────

Result<SettlementRecord>
SettlementEngine::finalize_locked(market::MarketSlot& slot, std::size_t outcome,
                                  resolver::ResolutionPath path,
                                  const crypto::Digest& commitment, TimestampMs now) {
    auto& m = slot.market;
    if (auto st = m.finalize(outcome, commitment, now); !st) return st.error();

    const std::string_view path_label = resolver::path_name(path);
    SettlementRecord record{
        .market_id      = m.id(),
        .outcome        = outcome,
        .outcome_name   = m.outcomes()[outcome].name,
        .path           = std::string(path_label),
        .commitment_hex = crypto::to_hex(commitment),
    };
    slot.resolution.final = resolver::Finalization{
        .outcome    = outcome,
        .path       = std::move(path),
        .commitment = commitment,
        .at         = now,
    };

    double total = 0.0;
    for (auto& [pid, pos] : slot.positions) {
        if (pos.status != PositionStatus::Open) continue;
        const double amount = payout_for(pos, pos.outcome == outcome);
        pos.status = PositionStatus::Closed;
        pos.payout = amount;
        total += amount;
        record.payouts.push_back(Payout{.position = pid, .owner = pos.owner, .amount = amount});
    }
    for (auto& [pid, q] : slot.quanta) {
        if (q.status != PositionStatus::Open) continue;
        const double weight = outcome < q.weights.size() ? q.weights[outcome] : 0.0;
        const double amount = q.exposure() * weight;
        q.status            = PositionStatus::Closed;
        q.collapsed_outcome = outcome;
        q.payout            = amount;
        total += amount;
        record.payouts.push_back(Payout{.position = pid, .owner = q.owner, .amount = amount});
    }

    log::info(COMPONENT, "market {} resolved via {} to '{}': {} payout(s), total {:.4f}",
              m.id(), record.path, record.outcome_name, record.payouts.size(), total);
    return record;
}

Status SettlementEngine::submit_proof(MarketId id, const resolver::CryptoProof& proof) {
    auto slot = find_slot(id);
    if (!slot) return market_not_found(id);

    std::size_t claimed = 0;
    {
        const TimestampMs now = clock_.now();
        PendingEscalations pending(*this);
        std::lock_guard lock(slot->mutex);
        sync_slot(*slot, now, pending);
        auto admitted = resolver::admit_proof(proof, slot->market, slot->resolution,
                                              now, config_.resolver);
        if (!admitted) {
            log::debug(COMPONENT, "market {} proof refused: {}", id, admitted.error().to_string());
            return admitted.error();
        }
        claimed = *admitted;
        slot->resolution.proof_in_flight = true;
    }

    // Verification runs with no market lock held.
    bool valid = false;
    if (auto verifier = collaborators_.verifier) {
        auto verdict = detail::run_with_deadline(
            [verifier, bytes = proof.bytes, inputs = proof.inputs] {
                return verifier->verify(bytes, inputs);
            },
            config_.resolver.verify_timeout, "proof verification");
        valid = verdict.value_or(false);
    } else {
        log::warn(COMPONENT, "market {}: no proof verifier configured", id);
    }

    SettlementRecord record;
    {
        const TimestampMs now = clock_.now();
        std::lock_guard lock(slot->mutex);
        auto& state = slot->resolution;
        state.proof_in_flight = false;

        if (state.final) {
            return make_error(ErrorCode::AlreadyResolved,
                              fmt::format("market {} resolved via {} meanwhile",
                                          id, resolver::path_name(state.final->path)));
        }
        if (slot->market.status() != MarketStatus::Resolving) {
            return make_error(ErrorCode::MarketNotResolving,
                              fmt::format("market {} is {}", id, to_string(slot->market.status())));
        }
        if (!valid) {
            state.proof_failed = true;
            log::warn(COMPONENT, "market {} proof failed verification; falling back to attestations", id);
            return make_error(ErrorCode::ProofInvalid, fmt::format("market {}", id));
        }

        const auto commitment = resolver::proof_commitment(proof.bytes);
        if (!commitment) {
            state.proof_failed = true;
            return make_error(ErrorCode::ProofInvalid, "could not hash proof bytes");
        }
        auto settled = finalize_locked(*slot, claimed, resolver::ProofPath{*commitment},
                                       *commitment, now);
        if (!settled) return settled.error();
        record = std::move(*settled);
    }

    emit(record);
    return ok();
}

Result<AttestationProgress>
SettlementEngine::submit_attestation(MarketId id, const resolver::Attestation& att) {
    auto slot = find_slot(id);
    if (!slot) return market_not_found(id);

    AttestationProgress             progress;
    std::optional<SettlementRecord> record;
    {
        const TimestampMs now = clock_.now();
        PendingEscalations pending(*this);
        std::lock_guard lock(slot->mutex);
        sync_slot(*slot, now, pending);
        auto& state = slot->resolution;

        auto admitted = resolver::admit_attestation(att, slot->market, state, sources_,
                                                    now, config_.resolver);
        if (!admitted) {
            log::debug(COMPONENT, "market {} attestation from '{}' refused: {}",
                       id, att.source_id, admitted.error().to_string());
            return admitted.error();
        }
        state.attestations.emplace(att.source_id, *admitted);
        progress.agreeing = state.supporters(admitted->outcome).size();

        const auto decision = resolver::decide(state, now, config_.resolver);
        if (const auto* fin = std::get_if<resolver::FinalizeConsensus>(&decision)) {
            const auto commitment = resolver::consensus_commitment(state, fin->outcome);
            if (!commitment) {
                return make_error(ErrorCode::ConsensusQuorumNotReached,
                                  "could not hash attestation signatures");
            }
            auto settled = finalize_locked(*slot, fin->outcome,
                                           resolver::ConsensusPath{fin->sources},
                                           *commitment, now);
            if (!settled) return settled.error();
            record = std::move(*settled);
            progress.finalized = true;
        }
    }

    if (record) emit(*record);
    return progress;
}

Result<MarketStatus>
SettlementEngine::resolve(MarketId id, const resolver::ResolutionProof& proof) {
    if (const auto* crypto_proof = std::get_if<resolver::CryptoProof>(&proof)) {
        if (auto st = submit_proof(id, *crypto_proof); !st) return st.error();
    } else {
        const auto& batch = std::get<std::vector<resolver::Attestation>>(proof);
        std::optional<Error> first_error;
        std::size_t accepted = 0;
        for (const auto& att : batch) {
            auto progress = submit_attestation(id, att);
            if (!progress) {
                if (!first_error) first_error = progress.error();
                if (progress.code() == ErrorCode::AlreadyResolved ||
                    progress.code() == ErrorCode::MarketNotFound) {
                    break;
                }
                continue;
            }
            ++accepted;
            if (progress->finalized) break;
        }
        if (accepted == 0 && first_error) return *first_error;
    }

    auto record = market(id);
    if (!record) return record.error();
    return record->status;
}

Status SettlementEngine::apply_governance_ruling(MarketId id, std::string_view outcome,
                                                 std::string_view authority) {
    auto slot = find_slot(id);
    if (!slot) return market_not_found(id);

    SettlementRecord record;
    {
        const TimestampMs now = clock_.now();
        PendingEscalations pending(*this);
        std::lock_guard lock(slot->mutex);
        sync_slot(*slot, now, pending);
        auto& m = slot->market;

        if (m.status() == MarketStatus::Resolved) {
            return make_error(ErrorCode::AlreadyResolved, fmt::format("market {}", id));
        }
        if (m.status() != MarketStatus::Disputed) {
            return make_error(ErrorCode::MarketNotResolving,
                              fmt::format("market {} is {}, not Disputed", id, to_string(m.status())));
        }
        const auto idx = m.outcome_index(outcome);
        if (!idx) {
            return make_error(ErrorCode::InvalidOutcome, fmt::format("outcome '{}'", outcome));
        }
        const auto commitment = resolver::governance_commitment(id, *idx, authority);
        if (!commitment) {
            return make_error(ErrorCode::InvalidOutcome, "could not hash ruling");
        }
        auto settled = finalize_locked(*slot, *idx,
                                       resolver::GovernancePath{std::string(authority)},
                                       *commitment, now);
        if (!settled) return settled.error();
        record = std::move(*settled);
    }

    emit(record);
    return ok();
}

Result<std::optional<resolver::Finalization>>
SettlementEngine::finalization(MarketId id) const {
    auto slot = find_slot(id);
    if (!slot) return market_not_found(id);
    PendingEscalations pending(*this);
    std::lock_guard lock(slot->mutex);
    sync_slot(*slot, clock_.now(), pending);
    return slot->resolution.final;
}

// ─── Time ─────────────────────────────────────────────────────────────────────

TickReport SettlementEngine::tick() {
    TickReport            report;
    std::vector<MarketId> reclaimable;
    const TimestampMs     now = clock_.now();

    {
        PendingEscalations pending(*this);
        for (const auto& slot : registry_.all()) {
            std::lock_guard lock(slot->mutex);
            const auto changed = sync_slot(*slot, now, pending);
            if (changed.expired)  ++report.expired;
            if (changed.disputed) ++report.disputed;
            if (slot->market.reclaimable(now, config_.dispute_window_ms)) {
                reclaimable.push_back(slot->market.id());
            }
        }
    }

    for (const MarketId id : reclaimable) {
        if (registry_.erase(id)) {
            ++report.reclaimed;
            log::info(COMPONENT, "market {} reclaimed", id);
        }
    }
    return report;
}

Status SettlementEngine::reclaim(MarketId id) {
    auto slot = find_slot(id);
    if (!slot) return market_not_found(id);
    {
        std::lock_guard lock(slot->mutex);
        const auto& m = slot->market;
        if (m.status() != MarketStatus::Resolved) {
            return make_error(ErrorCode::MarketNotResolving,
                              fmt::format("market {} is {}", id, to_string(m.status())));
        }
        if (!m.reclaimable(clock_.now(), config_.dispute_window_ms)) {
            return make_error(ErrorCode::DisputeWindowOpen, fmt::format("market {}", id));
        }
    }
    if (registry_.erase(id)) {
        log::info(COMPONENT, "market {} reclaimed", id);
    }
    return ok();
}

// ─── Sinks ────────────────────────────────────────────────────────────────────

void SettlementEngine::emit(const SettlementRecord& record) const {
    if (!collaborators_.ledger) {
        log::warn(COMPONENT, "market {}: no ledger configured, settlement not emitted",
                  record.market_id);
        return;
    }
    try {
        collaborators_.ledger->emit(record);
    } catch (const std::exception& ex) {
        log::error(COMPONENT, "market {}: ledger emit failed: {}", record.market_id, ex.what());
    }
}

void SettlementEngine::escalate(const DisputeNotice& notice) const {
    if (!collaborators_.governance) {
        log::warn(COMPONENT, "market {}: no governance collaborator, awaiting manual ruling",
                  notice.market);
        return;
    }
    try {
        collaborators_.governance->escalate(notice);
    } catch (const std::exception& ex) {
        log::error(COMPONENT, "market {}: governance escalation failed: {}",
                   notice.market, ex.what());
    }
}

// ─── Administration ───────────────────────────────────────────────────────────

Status SettlementEngine::pause(std::string_view actor, std::string reason) {
    return risk_.pause(actor, std::move(reason));
}

Status SettlementEngine::unpause(std::string_view actor, std::string reason) {
    return risk_.unpause(actor, std::move(reason));
}

} // namespace flash::core
