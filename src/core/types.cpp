/// @file src/core/types.cpp
/// @brief Names of the lifecycle enumerations.

#include "flash/types.hpp"

namespace flash {

std::string_view to_string(MarketStatus s) noexcept {
    switch (s) {
        case MarketStatus::Open:      return "Open";
        case MarketStatus::Resolving: return "Resolving";
        case MarketStatus::Resolved:  return "Resolved";
        case MarketStatus::Disputed:  return "Disputed";
    }
    return "Unknown";
}

std::string_view to_string(PositionStatus s) noexcept {
    switch (s) {
        case PositionStatus::Open:       return "Open";
        case PositionStatus::Closed:     return "Closed";
        case PositionStatus::Liquidated: return "Liquidated";
    }
    return "Unknown";
}

std::string_view to_string(ChainAction a) noexcept {
    switch (a) {
        case ChainAction::AmplifyA: return "Amplify-A";
        case ChainAction::AmplifyB: return "Amplify-B";
        case ChainAction::AmplifyC: return "Amplify-C";
    }
    return "Unknown";
}

} // namespace flash
