#include <gtest/gtest.h>
#include "flash/resolver.hpp"
#include "flash/market.hpp"
#include "flash/crypto.hpp"

#include <string>
#include <variant>
#include <vector>

using namespace flash;
using namespace flash::resolver;

// ─── Helpers ─────────────────────────────────────────────────────────────────

namespace {

constexpr TimestampMs OPENED    = 1'000;
constexpr TimestampMs RESOLVING = 31'000;
constexpr MarketId    MARKET    = 7;

market::Market resolving_market() {
    auto m = market::Market::create(MARKET, market::MarketSpec{
        .title       = "M1",
        .time_left_s = 30.0,
        .outcomes    = {"Yes", "No"},
    }, OPENED);
    EXPECT_TRUE(m.has_value());
    m->apply_time_left(0.0, RESOLVING);
    return std::move(m).value();
}

ResolutionState fresh_state() {
    ResolutionState s;
    s.resolving_at = RESOLVING;
    return s;
}

CryptoProof proof_for(std::string_view outcome, MarketId market = MARKET,
                      TimestampMs ts = RESOLVING + 100) {
    CryptoProof p;
    p.inputs.market_id    = market;
    p.inputs.outcome_hash = *outcome_hash(outcome);
    p.inputs.timestamp    = ts;
    p.bytes = HmacProofVerifier::prove("proof-key", p.inputs);
    return p;
}

AttestationRegistry three_sources() {
    AttestationRegistry reg;
    reg.add_source("alpha", "ka");
    reg.add_source("beta", "kb");
    reg.add_source("gamma", "kc");
    reg.add_source("delta", "kd");
    return reg;
}

Attestation signed_vote(std::string source, std::string_view key, std::string outcome,
                        TimestampMs ts = RESOLVING + 200, MarketId market = MARKET) {
    Attestation att{
        .source_id = std::move(source),
        .market_id = market,
        .outcome   = std::move(outcome),
        .timestamp = ts,
    };
    AttestationRegistry::sign(att, key);
    return att;
}

void accept(ResolutionState& state, const Attestation& att, std::size_t outcome) {
    state.attestations.emplace(att.source_id, AcceptedAttestation{
        .outcome   = outcome,
        .timestamp = att.timestamp,
        .signature = att.signature,
    });
}

} // namespace

// ─── Proof material ──────────────────────────────────────────────────────────

TEST(Resolver_PublicInputs, EncodingLayout) {
    PublicInputs in{.market_id = 0x0102, .outcome_hash = {}, .timestamp = 0x0A0B};
    in.outcome_hash.fill(0xEE);
    const auto bytes = in.encode();
    ASSERT_EQ(bytes.size(), 48u);
    EXPECT_EQ(bytes[6], 0x01);
    EXPECT_EQ(bytes[7], 0x02);
    EXPECT_EQ(bytes[8], 0xEE);
    EXPECT_EQ(bytes[39], 0xEE);
    EXPECT_EQ(bytes[46], 0x0A);
    EXPECT_EQ(bytes[47], 0x0B);
}

TEST(Resolver_HmacVerifier, AcceptsOwnProof) {
    HmacProofVerifier v("proof-key");
    const auto p = proof_for("Yes");
    EXPECT_TRUE(v.verify(p.bytes, p.inputs));
}

TEST(Resolver_HmacVerifier, RejectsRebinding) {
    HmacProofVerifier v("proof-key");
    auto p = proof_for("Yes");
    p.inputs.outcome_hash = *outcome_hash("No");
    EXPECT_FALSE(v.verify(p.bytes, p.inputs));
}

TEST(Resolver_HmacVerifier, RejectsWrongKeyAndTruncation) {
    HmacProofVerifier v("other-key");
    auto p = proof_for("Yes");
    EXPECT_FALSE(v.verify(p.bytes, p.inputs));

    HmacProofVerifier right("proof-key");
    p.bytes.pop_back();
    EXPECT_FALSE(right.verify(p.bytes, p.inputs));
}

TEST(Resolver_Registry, SignAndVerify) {
    const auto reg = three_sources();
    auto att = signed_vote("alpha", "ka", "Yes");
    EXPECT_TRUE(reg.knows("alpha"));
    EXPECT_FALSE(reg.knows("omega"));
    EXPECT_TRUE(reg.verify(att));

    att.outcome = "No";
    EXPECT_FALSE(reg.verify(att));
}

TEST(Resolver_Registry, MessageFormat) {
    Attestation att{.source_id = "alpha", .market_id = 7, .outcome = "Yes", .timestamp = 123};
    EXPECT_EQ(AttestationRegistry::message(att), "7|Yes|123|alpha");
}

// ─── decide ──────────────────────────────────────────────────────────────────

TEST(Resolver_Decide, ProofWindowFirst) {
    const auto state = fresh_state();
    EXPECT_TRUE(std::holds_alternative<AwaitProof>(decide(state, RESOLVING, ResolverConfig{})));
    EXPECT_TRUE(std::holds_alternative<AwaitProof>(decide(state, RESOLVING + 2'999, ResolverConfig{})));
}

TEST(Resolver_Decide, AttestationsAfterProofBudget) {
    const auto state = fresh_state();
    EXPECT_TRUE(std::holds_alternative<AwaitAttestations>(
        decide(state, RESOLVING + 3'000, ResolverConfig{})));
}

TEST(Resolver_Decide, FailedProofFallsBackImmediately) {
    auto state = fresh_state();
    state.proof_failed = true;
    EXPECT_TRUE(std::holds_alternative<AwaitAttestations>(
        decide(state, RESOLVING + 10, ResolverConfig{})));
}

TEST(Resolver_Decide, WindowElapsedEscalates) {
    const auto state = fresh_state();
    EXPECT_TRUE(std::holds_alternative<EscalateDispute>(
        decide(state, RESOLVING + 10'000, ResolverConfig{})));
}

TEST(Resolver_Decide, QuorumFinalizes) {
    auto state = fresh_state();
    accept(state, signed_vote("gamma", "kc", "No"), 1);
    accept(state, signed_vote("alpha", "ka", "No"), 1);
    accept(state, signed_vote("delta", "kd", "Yes"), 0);
    accept(state, signed_vote("beta", "kb", "No"), 1);

    const auto d = decide(state, RESOLVING + 4'000, ResolverConfig{});
    const auto* fin = std::get_if<FinalizeConsensus>(&d);
    ASSERT_NE(fin, nullptr);
    EXPECT_EQ(fin->outcome, 1u);
    EXPECT_EQ(fin->sources, (std::vector<std::string>{"alpha", "beta", "gamma"}));
}

TEST(Resolver_Decide, TwoVotesShortOfQuorum) {
    auto state = fresh_state();
    accept(state, signed_vote("alpha", "ka", "Yes"), 0);
    accept(state, signed_vote("beta", "kb", "Yes"), 0);
    accept(state, signed_vote("gamma", "kc", "No"), 1);
    EXPECT_TRUE(std::holds_alternative<AwaitAttestations>(
        decide(state, RESOLVING + 5'000, ResolverConfig{})));
    EXPECT_TRUE(std::holds_alternative<EscalateDispute>(
        decide(state, RESOLVING + 10'000, ResolverConfig{})));
}

TEST(Resolver_Decide, TerminalStates) {
    auto state = fresh_state();
    state.disputed = true;
    EXPECT_TRUE(std::holds_alternative<AwaitGovernance>(decide(state, RESOLVING, ResolverConfig{})));
    state.final = Finalization{.outcome = 0, .path = GovernancePath{"council"}};
    EXPECT_TRUE(std::holds_alternative<Settled>(decide(state, RESOLVING, ResolverConfig{})));
}

// ─── admit_proof ─────────────────────────────────────────────────────────────

TEST(Resolver_AdmitProof, ValidProofClaimsOutcome) {
    const auto m = resolving_market();
    auto r = admit_proof(proof_for("No"), m, fresh_state(), RESOLVING + 500, ResolverConfig{});
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, 1u);
}

TEST(Resolver_AdmitProof, ForeignMarketRejected) {
    const auto m = resolving_market();
    auto r = admit_proof(proof_for("Yes", 99), m, fresh_state(), RESOLVING + 500, ResolverConfig{});
    EXPECT_EQ(r.code(), ErrorCode::ProofInvalid);
}

TEST(Resolver_AdmitProof, TimestampOutsideActiveWindow) {
    const auto m = resolving_market();
    const auto early = proof_for("Yes", MARKET, OPENED - 1);
    const auto late  = proof_for("Yes", MARKET, RESOLVING + 10'001);
    EXPECT_EQ(admit_proof(early, m, fresh_state(), RESOLVING + 500, ResolverConfig{}).code(),
              ErrorCode::ProofInvalid);
    EXPECT_EQ(admit_proof(late, m, fresh_state(), RESOLVING + 500, ResolverConfig{}).code(),
              ErrorCode::ProofInvalid);
}

TEST(Resolver_AdmitProof, UnknownOutcomeHash) {
    const auto m = resolving_market();
    EXPECT_EQ(admit_proof(proof_for("Maybe"), m, fresh_state(), RESOLVING + 500,
                          ResolverConfig{}).code(),
              ErrorCode::ProofInvalid);
}

TEST(Resolver_AdmitProof, ProofWindowClosed) {
    const auto m = resolving_market();
    EXPECT_EQ(admit_proof(proof_for("Yes"), m, fresh_state(), RESOLVING + 3'000,
                          ResolverConfig{}).code(),
              ErrorCode::ProofWindowClosed);

    auto failed = fresh_state();
    failed.proof_failed = true;
    EXPECT_EQ(admit_proof(proof_for("Yes"), m, failed, RESOLVING + 10, ResolverConfig{}).code(),
              ErrorCode::ProofWindowClosed);

    auto busy = fresh_state();
    busy.proof_in_flight = true;
    EXPECT_EQ(admit_proof(proof_for("Yes"), m, busy, RESOLVING + 10, ResolverConfig{}).code(),
              ErrorCode::ProofWindowClosed);
}

TEST(Resolver_AdmitProof, OpenMarketNotResolving) {
    auto m = market::Market::create(MARKET, market::MarketSpec{
        .title = "open", .time_left_s = 30.0, .outcomes = {"Yes", "No"}}, OPENED);
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(admit_proof(proof_for("Yes"), *m, ResolutionState{}, OPENED + 10,
                          ResolverConfig{}).code(),
              ErrorCode::MarketNotResolving);
}

// ─── admit_attestation ───────────────────────────────────────────────────────

TEST(Resolver_AdmitAttestation, Accepted) {
    const auto m   = resolving_market();
    const auto reg = three_sources();
    auto r = admit_attestation(signed_vote("alpha", "ka", "No"), m, fresh_state(), reg,
                               RESOLVING + 100, ResolverConfig{});
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->outcome, 1u);
}

TEST(Resolver_AdmitAttestation, RejectionReasons) {
    const auto m   = resolving_market();
    const auto reg = three_sources();
    const auto now = RESOLVING + 100;
    const ResolverConfig cfg{};

    EXPECT_EQ(admit_attestation(signed_vote("omega", "ko", "Yes"), m, fresh_state(), reg, now, cfg).code(),
              ErrorCode::AttestationRejected);
    EXPECT_EQ(admit_attestation(signed_vote("alpha", "wrong", "Yes"), m, fresh_state(), reg, now, cfg).code(),
              ErrorCode::AttestationRejected);
    EXPECT_EQ(admit_attestation(signed_vote("alpha", "ka", "Yes", RESOLVING, 8), m, fresh_state(), reg, now, cfg).code(),
              ErrorCode::AttestationRejected);
    EXPECT_EQ(admit_attestation(signed_vote("alpha", "ka", "Yes", OPENED - 5), m, fresh_state(), reg, now, cfg).code(),
              ErrorCode::AttestationRejected);
    EXPECT_EQ(admit_attestation(signed_vote("alpha", "ka", "Maybe"), m, fresh_state(), reg, now, cfg).code(),
              ErrorCode::InvalidOutcome);
}

TEST(Resolver_AdmitAttestation, OneVotePerSource) {
    const auto m   = resolving_market();
    const auto reg = three_sources();
    auto state = fresh_state();
    accept(state, signed_vote("alpha", "ka", "Yes"), 0);
    EXPECT_EQ(admit_attestation(signed_vote("alpha", "ka", "No"), m, state, reg,
                                RESOLVING + 100, ResolverConfig{}).code(),
              ErrorCode::DuplicateAttestation);
}

TEST(Resolver_AdmitAttestation, AfterWindowClosed) {
    const auto m   = resolving_market();
    const auto reg = three_sources();
    EXPECT_EQ(admit_attestation(signed_vote("alpha", "ka", "Yes"), m, fresh_state(), reg,
                                RESOLVING + 10'000, ResolverConfig{}).code(),
              ErrorCode::ProofWindowClosed);
}

// ─── Commitments ─────────────────────────────────────────────────────────────

TEST(Resolver_Commitment, ConsensusIgnoresDissent) {
    auto with_dissent = fresh_state();
    auto without      = fresh_state();
    for (auto* s : {&with_dissent, &without}) {
        accept(*s, signed_vote("alpha", "ka", "No"), 1);
        accept(*s, signed_vote("beta", "kb", "No"), 1);
        accept(*s, signed_vote("gamma", "kc", "No"), 1);
    }
    accept(with_dissent, signed_vote("delta", "kd", "Yes"), 0);

    const auto a = consensus_commitment(with_dissent, 1);
    const auto b = consensus_commitment(without, 1);
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(*a, *b);
}

TEST(Resolver_Commitment, GovernanceBindsAuthority) {
    const auto a = governance_commitment(7, 0, "council");
    const auto b = governance_commitment(7, 0, "admin");
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_NE(*a, *b);
}

TEST(Resolver_Commitment, PathNames) {
    EXPECT_EQ(path_name(ResolutionPath{ProofPath{}}), "Proof");
    EXPECT_EQ(path_name(ResolutionPath{ConsensusPath{}}), "Consensus");
    EXPECT_EQ(path_name(ResolutionPath{GovernancePath{"x"}}), "Governance");
}
