/// @file src/core/error.cpp
/// @brief ErrorCode names and Error formatting.

#include "flash/error.hpp"

#include <fmt/format.h>

namespace flash {

std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::InsufficientLiquidity:       return "InsufficientLiquidity";
        case ErrorCode::SolverNonConvergence:        return "SolverNonConvergence";
        case ErrorCode::ChainTooLong:                return "ChainTooLong";
        case ErrorCode::ChainStepFailed:             return "ChainStepFailed";
        case ErrorCode::LeverageExceedsCeiling:      return "LeverageExceedsCeiling";
        case ErrorCode::UndercollateralizedPosition: return "UndercollateralizedPosition";
        case ErrorCode::ProofInvalid:                return "ProofInvalid";
        case ErrorCode::ConsensusQuorumNotReached:   return "ConsensusQuorumNotReached";
        case ErrorCode::MarketExpired:               return "MarketExpired";
        case ErrorCode::LeverageExceedsGlobalCap:    return "LeverageExceedsGlobalCap";
        case ErrorCode::EmergencyPause:              return "EmergencyPause";
        case ErrorCode::MarketNotFound:              return "MarketNotFound";
        case ErrorCode::PositionNotFound:            return "PositionNotFound";
        case ErrorCode::InvalidOutcome:              return "InvalidOutcome";
        case ErrorCode::InvalidMarketSpec:           return "InvalidMarketSpec";
        case ErrorCode::InvalidAmount:               return "InvalidAmount";
        case ErrorCode::MarketNotOpen:               return "MarketNotOpen";
        case ErrorCode::MarketNotResolving:          return "MarketNotResolving";
        case ErrorCode::AlreadyResolved:             return "AlreadyResolved";
        case ErrorCode::SlippageExceeded:            return "SlippageExceeded";
        case ErrorCode::LeverageAlreadySet:          return "LeverageAlreadySet";
        case ErrorCode::AttestationRejected:         return "AttestationRejected";
        case ErrorCode::DuplicateAttestation:        return "DuplicateAttestation";
        case ErrorCode::ProofWindowClosed:           return "ProofWindowClosed";
        case ErrorCode::FeedMismatch:                return "FeedMismatch";
        case ErrorCode::Unauthorized:                return "Unauthorized";
        case ErrorCode::PositionHealthy:             return "PositionHealthy";
        case ErrorCode::PositionClosed:              return "PositionClosed";
        case ErrorCode::DisputeWindowOpen:           return "DisputeWindowOpen";
    }
    return "Unknown";
}

std::string Error::to_string() const {
    if (detail.empty()) return std::string(flash::to_string(code));
    return fmt::format("{}: {}", flash::to_string(code), detail);
}

} // namespace flash
