#ifndef ORDER_HPP
#define ORDER_HPP

#include <cstdint>

#include "energymarket/types.hpp"
#include "energymarket/util/timestamp.hpp"

namespace energymarket::core {

using energymarket::util::Timestamp;

struct Order {
    OrderId     orderId{INVALID_ORDER_ID};
    Side        side{Side::Buy};          // initiating side, never changes
    PartyId     buyer{};
    PartyId     seller{};
    Quantity    quantity{0};
    Price       price{0};                 // buy side adopts the seller's price on match
    bool        matched{false};
    bool        executed{false};
    OrderId     matchedOrderId{INVALID_ORDER_ID};
    Timestamp   timestamp{};

    Order() = default;

    Order(OrderId   id,
          Side      side,
          PartyId   initiator,
          Quantity  quantity,
          Price     price,
          Timestamp ts);

    // buy order still waiting for a seller
    bool is_open_buy() const { return side == Side::Buy && !has_party(seller); }

    // sell order still waiting for a buyer
    bool is_open_sell() const { return side == Side::Sell && !has_party(buyer); }

    const PartyId& initiator() const { return side == Side::Buy ? buyer : seller; }

    // quantity x price, the value owed once matched
    Amount notional() const { return quantity * price; }
};

} 

#endif
