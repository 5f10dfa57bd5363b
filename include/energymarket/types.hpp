#pragma once

#include <cstdint>
#include <limits>
#include <string>

namespace energymarket {

using OrderId        = std::uint64_t;
using InstallationId = std::uint64_t;
using SettlementId   = std::uint64_t;
using Price          = std::uint64_t;   // value per energy unit
using Quantity       = std::uint64_t;   // energy units
using Amount         = std::uint64_t;   // value
using Capacity       = std::uint64_t;
using PartyId        = std::string;

enum class Side {
    Buy,
    Sell
};

enum class RejectReason {
    None,
    InvalidReference,
    InvalidQuantity,
    InvalidParty,
    InvalidCapacity,
    NotionalOverflow,
    CustodyOverflow,
    NotAuthorized,
    InsufficientPayment,
    NotInstalled,
    AlreadyMatched,
    AlreadyExecuted,
    NotMatched,
    TransferFailed
};

enum class ErrorCategory {
    None,
    Validation,     // bad input, caller may retry with corrected values
    StateConflict,  // caller's view of the order is stale
    Transfer        // settlement transfer refused after validation passed
};

// ids are arena positions, so the sentinels sit at the top of the range
static constexpr OrderId        INVALID_ORDER_ID        = std::numeric_limits<OrderId>::max();
static constexpr InstallationId INVALID_INSTALLATION_ID = std::numeric_limits<InstallationId>::max();
static constexpr SettlementId   INVALID_SETTLEMENT_ID   = 0;

inline bool has_party(const PartyId& party) { return !party.empty(); }

inline ErrorCategory category_of(RejectReason reason)
{
    switch (reason) {
    case RejectReason::None:
        return ErrorCategory::None;
    case RejectReason::AlreadyMatched:
    case RejectReason::AlreadyExecuted:
    case RejectReason::NotMatched:
        return ErrorCategory::StateConflict;
    case RejectReason::TransferFailed:
        return ErrorCategory::Transfer;
    default:
        return ErrorCategory::Validation;
    }
}

inline const char* to_string(RejectReason reason)
{
    switch (reason) {
    case RejectReason::None:                return "None";
    case RejectReason::InvalidReference:    return "InvalidReference";
    case RejectReason::InvalidQuantity:     return "InvalidQuantity";
    case RejectReason::InvalidParty:        return "InvalidParty";
    case RejectReason::InvalidCapacity:     return "InvalidCapacity";
    case RejectReason::NotionalOverflow:    return "NotionalOverflow";
    case RejectReason::CustodyOverflow:     return "CustodyOverflow";
    case RejectReason::NotAuthorized:       return "NotAuthorized";
    case RejectReason::InsufficientPayment: return "InsufficientPayment";
    case RejectReason::NotInstalled:        return "NotInstalled";
    case RejectReason::AlreadyMatched:      return "AlreadyMatched";
    case RejectReason::AlreadyExecuted:     return "AlreadyExecuted";
    case RejectReason::NotMatched:          return "NotMatched";
    case RejectReason::TransferFailed:      return "TransferFailed";
    }
    return "Unknown";
}

// false when a * b does not fit in an Amount
inline bool checked_multiply(std::uint64_t a, std::uint64_t b, Amount& out)
{
    if (a != 0 && b > std::numeric_limits<Amount>::max() / a) return false;
    out = a * b;
    return true;
}

}
