#pragma once

/// @file include/flash/error.hpp
/// @brief Error taxonomy and the reason-carrying Result<T> return type.
///
/// # Module: Errors
///
/// ## Responsibility
/// Every fallible core operation returns either a value or an `Error` naming
/// one enumerable `ErrorCode`; domain failures are never thrown. Only
/// allocation failure escapes as `std::bad_alloc`. Callers branch on the code;
/// the detail string is for logs only.
///
/// ## Propagation
/// - Solver and risk errors go straight back to the immediate caller.
/// - Resolver errors (`ProofInvalid`, `ConsensusQuorumNotReached`) drive the
///   internal fallback and surface only as the market status.
/// - `SolverNonConvergence` is informational: the solve still yields a value.

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace flash {

// ─── ErrorCode ────────────────────────────────────────────────────────────────

enum class ErrorCode : std::uint8_t {
    // Core taxonomy.
    InsufficientLiquidity,
    SolverNonConvergence,
    ChainTooLong,
    ChainStepFailed,
    LeverageExceedsCeiling,
    UndercollateralizedPosition,
    ProofInvalid,
    ConsensusQuorumNotReached,
    MarketExpired,

    // Operational.
    LeverageExceedsGlobalCap,
    EmergencyPause,
    MarketNotFound,
    PositionNotFound,
    InvalidOutcome,
    InvalidMarketSpec,
    InvalidAmount,
    MarketNotOpen,
    MarketNotResolving,
    AlreadyResolved,
    SlippageExceeded,
    LeverageAlreadySet,
    AttestationRejected,
    DuplicateAttestation,
    ProofWindowClosed,
    FeedMismatch,
    Unauthorized,
    PositionHealthy,
    PositionClosed,
    DisputeWindowOpen,
};

/// Stable, log-friendly name of an error code.
[[nodiscard]] std::string_view to_string(ErrorCode code) noexcept;

// ─── Error ────────────────────────────────────────────────────────────────────

struct Error {
    ErrorCode   code;
    std::string detail;

    /// "<CodeName>: <detail>" or just "<CodeName>".
    [[nodiscard]] std::string to_string() const;
};

[[nodiscard]] inline Error make_error(ErrorCode code, std::string detail = {}) {
    return Error{code, std::move(detail)};
}

// ─── Result ───────────────────────────────────────────────────────────────────

/// Value-or-Error return type. Reads like std::optional: test with
/// `has_value()` / `operator bool`, then dereference.
template <typename T>
class [[nodiscard]] Result {
public:
    Result(T value) : storage_(std::in_place_index<0>, std::move(value)) {}
    Result(Error error) : storage_(std::in_place_index<1>, std::move(error)) {}

    [[nodiscard]] bool has_value() const noexcept { return storage_.index() == 0; }
    explicit operator bool() const noexcept { return has_value(); }

    [[nodiscard]] T&       value() &       { return std::get<0>(storage_); }
    [[nodiscard]] const T& value() const&  { return std::get<0>(storage_); }
    [[nodiscard]] T&&      value() &&      { return std::get<0>(std::move(storage_)); }

    T&       operator*() &      { return value(); }
    const T& operator*() const& { return value(); }
    T*       operator->()       { return &value(); }
    const T* operator->() const { return &value(); }

    /// Precondition: !has_value().
    [[nodiscard]] const Error& error() const& { return std::get<1>(storage_); }

    /// Error code, precondition: !has_value().
    [[nodiscard]] ErrorCode code() const { return error().code; }

private:
    std::variant<T, Error> storage_;
};

/// Result of an operation that produces no value.
using Status = Result<std::monostate>;

[[nodiscard]] inline Status ok() { return std::monostate{}; }

} // namespace flash
