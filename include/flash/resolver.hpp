#pragma once

/// @file include/flash/resolver.hpp
/// @brief Outcome Resolver: proof path, attestation quorum, dispute.
///
/// # Module: Outcome Resolver
///
/// ## Sequencing (times measured from entry into Resolving)
///
///   [0, proof_budget)             proof path open; attestations collected
///   [proof_budget, window)        attestations only
///   window reached, no quorum     → Disputed (governance collaborator)
///
/// A proof that fails verification, or whose verification times out, closes
/// the proof path early. Whichever path completes first wins; the winning
/// `ResolutionPath` and its commitment hash are recorded once and never
/// replaced.
///
/// ## Decision Function
/// `decide()` is pure over `ResolutionState` and the current time. The engine
/// calls it after every resolver input and on every tick, then acts on the
/// returned `Decision` alternative. No virtual dispatch is involved in
/// choosing the path.
///
/// ## NOT Responsible For
/// - Locking the market (the engine holds the slot mutex).
/// - Running the verifier off-thread (the engine does, with a deadline).

#include "flash/constants.hpp"
#include "flash/crypto.hpp"
#include "flash/error.hpp"
#include "flash/types.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace flash::market { class Market; }

namespace flash::resolver {

// ─── Proof material ───────────────────────────────────────────────────────────

/// Public inputs bound into a cryptographic proof.
struct PublicInputs {
    MarketId       market_id{NO_MARKET};
    crypto::Digest outcome_hash{};
    TimestampMs    timestamp{0};

    /// Canonical byte encoding: market id (8, big-endian) ‖ outcome hash (32)
    /// ‖ timestamp (8, big-endian).
    [[nodiscard]] std::vector<std::uint8_t> encode() const;
};

/// SHA-256 of an outcome name, as carried in public inputs.
[[nodiscard]] std::optional<crypto::Digest> outcome_hash(std::string_view outcome_name) noexcept;

struct CryptoProof {
    std::vector<std::uint8_t> bytes;
    PublicInputs              inputs;
};

/// One signed claim from an attestation source.
struct Attestation {
    std::string    source_id;
    MarketId       market_id{NO_MARKET};
    std::string    outcome;
    TimestampMs    timestamp{0};
    crypto::Digest signature{};
};

/// Either a succinct proof or a batch of attestations.
using ResolutionProof = std::variant<CryptoProof, std::vector<Attestation>>;

// ─── Verifiers ────────────────────────────────────────────────────────────────

/// Cryptographic validity check for proof bytes against public inputs.
/// Implementations must be safe to call from a worker thread.
class ProofVerifier {
public:
    virtual ~ProofVerifier() = default;

    [[nodiscard]] virtual bool verify(std::span<const std::uint8_t> proof,
                                      const PublicInputs& inputs) const = 0;
};

/// Reference verifier: a proof is HMAC-SHA256(key, inputs.encode()).
class HmacProofVerifier final : public ProofVerifier {
public:
    explicit HmacProofVerifier(std::string key) : key_(std::move(key)) {}

    [[nodiscard]] bool verify(std::span<const std::uint8_t> proof,
                              const PublicInputs& inputs) const override;

    /// Produce the proof this verifier accepts. Empty on OpenSSL failure.
    [[nodiscard]] static std::vector<std::uint8_t>
    prove(std::string_view key, const PublicInputs& inputs);

private:
    std::string key_;
};

/// Known attestation sources and their HMAC keys.
class AttestationRegistry {
public:
    void add_source(std::string source_id, std::string key);

    [[nodiscard]] bool        knows(std::string_view source_id) const noexcept;
    [[nodiscard]] std::size_t size() const noexcept { return keys_.size(); }

    /// True if the signature matches the registered key of its source.
    [[nodiscard]] bool verify(const Attestation& att) const;

    /// Message signed by a source: "<market>|<outcome>|<timestamp>|<source>".
    [[nodiscard]] static std::string message(const Attestation& att);

    /// Fill `att.signature` with HMAC-SHA256(key, message(att)).
    static void sign(Attestation& att, std::string_view key);

private:
    std::unordered_map<std::string, std::string> keys_;
};

// ─── Resolution paths ─────────────────────────────────────────────────────────

struct ProofPath {
    crypto::Digest proof_hash{};
};

struct ConsensusPath {
    std::vector<std::string> sources;  ///< Agreeing sources, sorted
};

struct GovernancePath {
    std::string authority;
};

using ResolutionPath = std::variant<ProofPath, ConsensusPath, GovernancePath>;

[[nodiscard]] std::string_view path_name(const ResolutionPath& path) noexcept;

/// The recorded, immutable result of resolving a market.
struct Finalization {
    std::size_t    outcome{0};
    ResolutionPath path;
    crypto::Digest commitment{};
    TimestampMs    at{0};
};

// ─── ResolverConfig ───────────────────────────────────────────────────────────

struct ResolverConfig {
    TimestampMs proof_budget_ms     = constants::PROOF_BUDGET_MS;
    TimestampMs consensus_window_ms = constants::CONSENSUS_WINDOW_MS;
    std::size_t quorum              = constants::ATTESTATION_QUORUM;

    /// Wall-clock bound on a single verifier call.
    std::chrono::milliseconds verify_timeout{constants::PROOF_BUDGET_MS};
};

// ─── ResolutionState ──────────────────────────────────────────────────────────

struct AcceptedAttestation {
    std::size_t    outcome{0};
    TimestampMs    timestamp{0};
    crypto::Digest signature{};
};

/// Per-market resolver bookkeeping. Guarded by the market slot mutex.
struct ResolutionState {
    std::optional<TimestampMs> resolving_at;
    bool proof_failed{false};
    bool proof_in_flight{false};
    bool disputed{false};

    /// Keyed (and therefore ordered) by source id; one vote per source.
    std::map<std::string, AcceptedAttestation> attestations;

    std::optional<Finalization> final;

    /// Sources voting for `outcome`, in source order.
    [[nodiscard]] std::vector<std::string> supporters(std::size_t outcome) const;
};

// ─── Decision ─────────────────────────────────────────────────────────────────

struct AwaitProof {};
struct AwaitAttestations {};
struct FinalizeConsensus {
    std::size_t              outcome{0};
    std::vector<std::string> sources;
};
struct EscalateDispute {};
struct AwaitGovernance {};
struct Settled {};

using Decision = std::variant<AwaitProof, AwaitAttestations, FinalizeConsensus,
                              EscalateDispute, AwaitGovernance, Settled>;

/// Next step for a market given its resolver state at `now`.
/// Precondition: `state.resolving_at` is set.
[[nodiscard]] Decision decide(const ResolutionState& state, TimestampMs now,
                              const ResolverConfig& cfg);

// ─── Admission & commitments ──────────────────────────────────────────────────

/// Bind a proof to a market before spending time on verification.
/// Returns the outcome index the proof claims.
///
/// # Errors
/// - `AlreadyResolved`, `MarketNotResolving` by market status.
/// - `ProofWindowClosed` outside the proof budget, after a failed proof, or
///   while another proof is being verified.
/// - `ProofInvalid` for a foreign market id, an unknown outcome hash, or a
///   timestamp outside [opened_at, resolving_at + consensus window].
[[nodiscard]] Result<std::size_t>
admit_proof(const CryptoProof& proof, const market::Market& market,
            const ResolutionState& state, TimestampMs now,
            const ResolverConfig& cfg);

/// Validate one attestation for `market`.
///
/// # Errors
/// - `AlreadyResolved`, `MarketNotResolving` by market status.
/// - `ProofWindowClosed` once the consensus window has elapsed.
/// - `AttestationRejected` for a foreign market id, an unknown source, a bad
///   signature or a timestamp outside the active window.
/// - `InvalidOutcome` for an outcome name not in the market.
/// - `DuplicateAttestation` if the source already voted.
[[nodiscard]] Result<AcceptedAttestation>
admit_attestation(const Attestation& att, const market::Market& market,
                  const ResolutionState& state, const AttestationRegistry& registry,
                  TimestampMs now, const ResolverConfig& cfg);

[[nodiscard]] std::optional<crypto::Digest>
proof_commitment(std::span<const std::uint8_t> proof_bytes) noexcept;

/// SHA-256 over the supporters' signatures in source order.
[[nodiscard]] std::optional<crypto::Digest>
consensus_commitment(const ResolutionState& state, std::size_t outcome);

/// SHA-256 of "governance|<market>|<outcome>|<authority>".
[[nodiscard]] std::optional<crypto::Digest>
governance_commitment(MarketId market, std::size_t outcome, std::string_view authority);

} // namespace flash::resolver
