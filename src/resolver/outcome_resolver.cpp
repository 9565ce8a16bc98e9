/// @file src/resolver/outcome_resolver.cpp
/// @brief Resolution decision function, input admission and commitment hashes.

#include "flash/resolver.hpp"
#include "flash/market.hpp"

#include <fmt/format.h>

namespace flash::resolver {

namespace {

/// Shared status gate for proofs and attestations.
Status require_resolving(const market::Market& m) {
    switch (m.status()) {
        case MarketStatus::Resolving:
            return ok();
        case MarketStatus::Resolved:
            return make_error(ErrorCode::AlreadyResolved, fmt::format("market {}", m.id()));
        case MarketStatus::Open:
        case MarketStatus::Disputed:
            break;
    }
    return make_error(ErrorCode::MarketNotResolving,
                      fmt::format("market {} is {}", m.id(), to_string(m.status())));
}

/// Active window of a market: [opened_at, resolving_at + consensus window].
bool within_active_window(const market::Market& m, TimestampMs resolving_at,
                          TimestampMs ts, const ResolverConfig& cfg) noexcept {
    return ts >= m.opened_at() && ts <= resolving_at + cfg.consensus_window_ms;
}

} // namespace

// ─── path_name ────────────────────────────────────────────────────────────────

std::string_view path_name(const ResolutionPath& path) noexcept {
    switch (path.index()) {
        case 0: return "Proof";
        case 1: return "Consensus";
        case 2: return "Governance";
        default: return "?";
    }
}

// ─── ResolutionState ──────────────────────────────────────────────────────────

std::vector<std::string> ResolutionState::supporters(std::size_t outcome) const {
    std::vector<std::string> out;
    for (const auto& [source, vote] : attestations) {
        if (vote.outcome == outcome) out.push_back(source);
    }
    return out;
}

// ─── decide ───────────────────────────────────────────────────────────────────

Decision decide(const ResolutionState& state, TimestampMs now, const ResolverConfig& cfg) {
    if (state.final) return Settled{};
    if (state.disputed) return AwaitGovernance{};

    // Quorum wins as soon as it exists, even with the proof path still open.
    std::map<std::size_t, std::size_t> tally;
    for (const auto& [source, vote] : state.attestations) {
        ++tally[vote.outcome];
    }
    for (const auto& [outcome, votes] : tally) {
        if (votes >= cfg.quorum) {
            return FinalizeConsensus{.outcome = outcome, .sources = state.supporters(outcome)};
        }
    }

    const TimestampMs elapsed = now - state.resolving_at.value_or(now);
    if (elapsed >= cfg.consensus_window_ms) {
        return EscalateDispute{};
    }
    if (!state.proof_failed && elapsed < cfg.proof_budget_ms) {
        return AwaitProof{};
    }
    return AwaitAttestations{};
}

// ─── admit_proof ──────────────────────────────────────────────────────────────

Result<std::size_t>
admit_proof(const CryptoProof& proof, const market::Market& m,
            const ResolutionState& state, TimestampMs now,
            const ResolverConfig& cfg) {
    if (auto gate = require_resolving(m); !gate) return gate.error();

    const TimestampMs resolving_at = state.resolving_at.value_or(now);
    if (state.proof_failed) {
        return make_error(ErrorCode::ProofWindowClosed, "an earlier proof failed verification");
    }
    if (state.proof_in_flight) {
        return make_error(ErrorCode::ProofWindowClosed, "another proof is being verified");
    }
    if (now - resolving_at >= cfg.proof_budget_ms) {
        return make_error(ErrorCode::ProofWindowClosed,
                          fmt::format("{} ms into resolution, budget {} ms",
                                      now - resolving_at, cfg.proof_budget_ms));
    }

    if (proof.inputs.market_id != m.id()) {
        return make_error(ErrorCode::ProofInvalid,
                          fmt::format("proof is for market {}, not {}",
                                      proof.inputs.market_id, m.id()));
    }
    if (!within_active_window(m, resolving_at, proof.inputs.timestamp, cfg)) {
        return make_error(ErrorCode::ProofInvalid,
                          fmt::format("timestamp {} outside active window", proof.inputs.timestamp));
    }
    for (std::size_t i = 0; i < m.outcome_count(); ++i) {
        const auto h = outcome_hash(m.outcomes()[i].name);
        if (h && crypto::equal(*h, proof.inputs.outcome_hash)) {
            return i;
        }
    }
    return make_error(ErrorCode::ProofInvalid, "outcome hash matches no outcome");
}

// ─── admit_attestation ────────────────────────────────────────────────────────

Result<AcceptedAttestation>
admit_attestation(const Attestation& att, const market::Market& m,
                  const ResolutionState& state, const AttestationRegistry& registry,
                  TimestampMs now, const ResolverConfig& cfg) {
    if (auto gate = require_resolving(m); !gate) return gate.error();

    const TimestampMs resolving_at = state.resolving_at.value_or(now);
    if (now - resolving_at >= cfg.consensus_window_ms) {
        return make_error(ErrorCode::ProofWindowClosed,
                          fmt::format("consensus window of {} ms elapsed", cfg.consensus_window_ms));
    }
    if (att.market_id != m.id()) {
        return make_error(ErrorCode::AttestationRejected,
                          fmt::format("attestation is for market {}", att.market_id));
    }
    if (!registry.knows(att.source_id)) {
        return make_error(ErrorCode::AttestationRejected,
                          fmt::format("unknown source '{}'", att.source_id));
    }
    if (!registry.verify(att)) {
        return make_error(ErrorCode::AttestationRejected,
                          fmt::format("bad signature from '{}'", att.source_id));
    }
    if (!within_active_window(m, resolving_at, att.timestamp, cfg)) {
        return make_error(ErrorCode::AttestationRejected,
                          fmt::format("timestamp {} outside active window", att.timestamp));
    }
    const auto outcome = m.outcome_index(att.outcome);
    if (!outcome) {
        return make_error(ErrorCode::InvalidOutcome, fmt::format("outcome '{}'", att.outcome));
    }
    if (state.attestations.contains(att.source_id)) {
        return make_error(ErrorCode::DuplicateAttestation,
                          fmt::format("source '{}' already attested", att.source_id));
    }
    return AcceptedAttestation{
        .outcome   = *outcome,
        .timestamp = att.timestamp,
        .signature = att.signature,
    };
}

// ─── Commitments ──────────────────────────────────────────────────────────────

std::optional<crypto::Digest> proof_commitment(std::span<const std::uint8_t> proof_bytes) noexcept {
    return crypto::sha256(proof_bytes);
}

std::optional<crypto::Digest> consensus_commitment(const ResolutionState& state,
                                                   std::size_t outcome) {
    std::vector<std::uint8_t> buf;
    for (const auto& [source, vote] : state.attestations) {
        if (vote.outcome != outcome) continue;
        buf.insert(buf.end(), vote.signature.begin(), vote.signature.end());
    }
    return crypto::sha256(std::span<const std::uint8_t>(buf));
}

std::optional<crypto::Digest> governance_commitment(MarketId market, std::size_t outcome,
                                                    std::string_view authority) {
    return crypto::sha256(fmt::format("governance|{}|{}|{}", market, outcome, authority));
}

} // namespace flash::resolver
