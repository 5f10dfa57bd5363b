#ifndef I_SETTLEMENT_REPOSITORY_HPP
#define I_SETTLEMENT_REPOSITORY_HPP

#include <cstddef>
#include <vector>
#include "energymarket/core/settlement.hpp"

namespace energymarket::report {

using energymarket::core::Settlement;
using energymarket::util::Timestamp;

class ISettlementRepository {
public:
    virtual ~ISettlementRepository() = default;

    virtual void add_settlement(const Settlement& settlement) = 0;

    // inclusive on both ends
    virtual std::vector<Settlement> settlements_between(Timestamp start, Timestamp end) = 0;

    virtual std::vector<Settlement> settlements_all() = 0;

    virtual std::size_t count() = 0;
};

} 

#endif
