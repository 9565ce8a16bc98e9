/// @file src/resolver/proof_material.cpp
/// @brief Public-input encoding, the HMAC reference verifier and attestation
///        signatures.

#include "flash/resolver.hpp"

#include <fmt/format.h>

namespace flash::resolver {

namespace {

void put_be64(std::vector<std::uint8_t>& out, std::uint64_t v) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        out.push_back(static_cast<std::uint8_t>((v >> shift) & 0xFFu));
    }
}

} // namespace

// ─── PublicInputs ─────────────────────────────────────────────────────────────

std::vector<std::uint8_t> PublicInputs::encode() const {
    std::vector<std::uint8_t> out;
    out.reserve(8 + crypto::DIGEST_SIZE + 8);
    put_be64(out, market_id);
    out.insert(out.end(), outcome_hash.begin(), outcome_hash.end());
    put_be64(out, static_cast<std::uint64_t>(timestamp));
    return out;
}

std::optional<crypto::Digest> outcome_hash(std::string_view outcome_name) noexcept {
    return crypto::sha256(outcome_name);
}

// ─── HmacProofVerifier ────────────────────────────────────────────────────────

bool HmacProofVerifier::verify(std::span<const std::uint8_t> proof,
                               const PublicInputs& inputs) const {
    const auto encoded  = inputs.encode();
    const auto expected = crypto::hmac_sha256(key_, encoded);
    if (!expected) return false;
    return crypto::equal(proof, *expected);
}

std::vector<std::uint8_t> HmacProofVerifier::prove(std::string_view key,
                                                   const PublicInputs& inputs) {
    const auto encoded = inputs.encode();
    const auto mac     = crypto::hmac_sha256(key, encoded);
    if (!mac) return {};
    return {mac->begin(), mac->end()};
}

// ─── AttestationRegistry ──────────────────────────────────────────────────────

void AttestationRegistry::add_source(std::string source_id, std::string key) {
    keys_.insert_or_assign(std::move(source_id), std::move(key));
}

bool AttestationRegistry::knows(std::string_view source_id) const noexcept {
    for (const auto& [id, key] : keys_) {
        if (id == source_id) return true;
    }
    return false;
}

std::string AttestationRegistry::message(const Attestation& att) {
    return fmt::format("{}|{}|{}|{}", att.market_id, att.outcome, att.timestamp, att.source_id);
}

bool AttestationRegistry::verify(const Attestation& att) const {
    const auto it = keys_.find(att.source_id);
    if (it == keys_.end()) return false;
    const auto expected = crypto::hmac_sha256(it->second, message(att));
    if (!expected) return false;
    return crypto::equal(att.signature, *expected);
}

void AttestationRegistry::sign(Attestation& att, std::string_view key) {
    if (auto mac = crypto::hmac_sha256(key, message(att))) {
        att.signature = *mac;
    }
}

} // namespace flash::resolver
