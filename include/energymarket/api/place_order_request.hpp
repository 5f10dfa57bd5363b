#ifndef PLACE_ORDER_REQUEST_HPP
#define PLACE_ORDER_REQUEST_HPP

#include <string>
#include <utility>

#include "energymarket/types.hpp"

namespace energymarket::api {

struct PlaceOrderRequest {
    
    Side     side{Side::Buy};
    Quantity quantity{0};
    Price    price{0};
    PartyId  initiator{};

    PlaceOrderRequest() = default;

    PlaceOrderRequest(Side     side,
                      Quantity quantity,
                      Price    price,
                      PartyId  initiator)
    : side{side}
    , quantity{quantity}
    , price{price}
    , initiator{std::move(initiator)}
    {
    }
                    
};

} 

#endif
