#include <utility>

#include "energymarket/core/order.hpp"

namespace energymarket::core {

Order::Order(OrderId   id,
             Side      side_,
             PartyId   initiator,
             Quantity  quantity_,
             Price     price_,
             Timestamp ts)
    : orderId{id}
    , side{side_}
    , buyer{}
    , seller{}
    , quantity{quantity_}
    , price{price_}
    , matched{false}
    , executed{false}
    , matchedOrderId{INVALID_ORDER_ID}
    , timestamp{ts}
{
    if (side == Side::Buy) {
        buyer = std::move(initiator);
    } else {
        seller = std::move(initiator);
    }
}

} 
