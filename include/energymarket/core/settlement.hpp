#ifndef SETTLEMENT_HPP
#define SETTLEMENT_HPP

#include "energymarket/types.hpp"
#include "energymarket/util/timestamp.hpp"

namespace energymarket::core {

using energymarket::util::Timestamp;

// record of one executed buy/sell pair
struct Settlement {
    SettlementId settlementId{INVALID_SETTLEMENT_ID};
    OrderId      buyOrderId{INVALID_ORDER_ID};
    OrderId      sellOrderId{INVALID_ORDER_ID};
    PartyId      buyer{};
    PartyId      seller{};
    Quantity     quantity{0};
    Price        price{0};
    Amount       amount{0};
    Timestamp    timestamp{};

    Settlement() = default;

    Settlement(SettlementId id,
               OrderId      buyOrderId,
               OrderId      sellOrderId,
               PartyId      buyer,
               PartyId      seller,
               Quantity     quantity,
               Price        price,
               Timestamp    ts);
};

}

#endif
