#ifndef I_SETTLEMENT_GATEWAY_HPP
#define I_SETTLEMENT_GATEWAY_HPP

#include "energymarket/types.hpp"

namespace energymarket::settlement {

// Moves value out of the marketplace's custody. A refused transfer is
// reported through the return value, never by throwing.
class ISettlementGateway {
public:
    virtual ~ISettlementGateway() = default;

    virtual bool transfer(const PartyId& to, Amount amount) = 0;
};

}

#endif
