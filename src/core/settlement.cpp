#include <utility>

#include "energymarket/core/settlement.hpp"

namespace energymarket::core {

Settlement::Settlement(SettlementId id,
                       OrderId      buyOrderId_,
                       OrderId      sellOrderId_,
                       PartyId      buyer_,
                       PartyId      seller_,
                       Quantity     quantity_,
                       Price        price_,
                       Timestamp    ts)
    : settlementId{id}
    , buyOrderId{buyOrderId_}
    , sellOrderId{sellOrderId_}
    , buyer{std::move(buyer_)}
    , seller{std::move(seller_)}
    , quantity{quantity_}
    , price{price_}
    , amount{quantity_ * price_}
    , timestamp{ts}
{
}

}
