#ifndef MARKET_EVENTS_HPP
#define MARKET_EVENTS_HPP

#include "energymarket/types.hpp"
#include "energymarket/util/timestamp.hpp"

namespace energymarket::core {

using energymarket::util::Timestamp;

struct MatchEvent {
    OrderId   buyOrderId{INVALID_ORDER_ID};
    OrderId   sellOrderId{INVALID_ORDER_ID};
    PartyId   buyer{};
    PartyId   seller{};
    Quantity  quantity{0};
    Price     price{0};
    Timestamp timestamp{};
};

enum class PaymentDirection {
    Received,   // value entered custody
    Sent        // value left custody through the settlement gateway
};

struct PaymentEvent {
    PaymentDirection direction{PaymentDirection::Received};
    PartyId          party{};     // payer when Received, recipient when Sent
    Amount           amount{0};
    Timestamp        timestamp{};
};

}

#endif
