/**
 * @file  fuzz_resolver.cpp
 * @brief libFuzzer target for proof and attestation admission
 *
 * Build:
 *   cmake -DFLASH_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_resolver
 *
 * Run for 60 seconds:
 *   ./fuzz_resolver -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort.
 *   2. An admitted proof claims an outcome index inside the market.
 *   3. Proofs and attestations bound to a foreign market are never admitted.
 *   4. An attestation with a forged signature is never admitted.
 *   5. The verifier accepts proof bytes only if they equal the keyed MAC.
 *
 * Fuzzer strategy:
 *   The leading bytes choose the market id, timestamp and outcome bytes of
 *   the claim; the remainder is used verbatim as proof bytes and as the
 *   attestation signature.
 */

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <string>

#include "flash/market.hpp"
#include "flash/resolver.hpp"

using namespace flash;
using namespace flash::resolver;

namespace {

constexpr MarketId    MARKET_ID = 7;
constexpr TimestampMs OPENED_AT = 1'000;
constexpr TimestampMs EXPIRED_AT = 31'000;

struct Fixture {
    market::Market      market;
    ResolutionState     state;
    AttestationRegistry registry;
    HmacProofVerifier   verifier{"fuzz-key"};
};

Fixture& fixture() {
    static Fixture f = [] {
        auto m = market::Market::create(MARKET_ID, market::MarketSpec{
            .title       = "fuzz",
            .category    = "fuzz",
            .time_left_s = 30.0,
            .outcomes    = {"Yes", "No", "Void"},
        }, OPENED_AT);
        if (!m.has_value()) __builtin_trap();
        (void)m->apply_time_left(0.0, EXPIRED_AT);

        Fixture out{.market = std::move(*m)};
        out.state.resolving_at = EXPIRED_AT;
        out.registry.add_source("s1", "k1");
        return out;
    }();
    return f;
}

} // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    constexpr size_t HEADER = sizeof(std::uint64_t) + sizeof(std::int64_t) + 1;
    if (size < HEADER) return 0;

    std::uint64_t market_id{};
    std::int64_t  timestamp{};
    std::memcpy(&market_id, data, sizeof(market_id));
    std::memcpy(&timestamp, data + sizeof(market_id), sizeof(timestamp));
    const std::uint8_t outcome_byte = data[HEADER - 1];
    const std::span<const std::uint8_t> rest(data + HEADER, size - HEADER);

    Fixture&          f   = fixture();
    const ResolverConfig cfg{};
    const TimestampMs now = EXPIRED_AT + 100;

    static constexpr const char* NAMES[] = {"Yes", "No", "Void", "Draw"};
    const std::string outcome = NAMES[outcome_byte % 4];

    // ── Proof admission ──────────────────────────────────────────────────────
    CryptoProof proof;
    proof.inputs.market_id = market_id;
    proof.inputs.timestamp = timestamp;
    if (auto h = outcome_hash(outcome)) proof.inputs.outcome_hash = *h;
    proof.bytes.assign(rest.begin(), rest.end());

    if (auto claimed = admit_proof(proof, f.market, f.state, now, cfg)) {
        if (*claimed >= f.market.outcome_count()) __builtin_trap();
        if (market_id != MARKET_ID) __builtin_trap();
    }
    if (f.verifier.verify(proof.bytes, proof.inputs)) {
        const auto expected = HmacProofVerifier::prove("fuzz-key", proof.inputs);
        if (expected != proof.bytes) __builtin_trap();
    }

    // ── Attestation admission ────────────────────────────────────────────────
    Attestation att{
        .source_id = "s1",
        .market_id = market_id,
        .outcome   = outcome,
        .timestamp = timestamp,
    };
    std::copy_n(rest.begin(), std::min(rest.size(), att.signature.size()), att.signature.begin());

    if (auto accepted = admit_attestation(att, f.market, f.state, f.registry, now, cfg)) {
        if (market_id != MARKET_ID) __builtin_trap();
        Attestation genuine = att;
        AttestationRegistry::sign(genuine, "k1");
        if (genuine.signature != att.signature) __builtin_trap();
    }

    return 0;
}
