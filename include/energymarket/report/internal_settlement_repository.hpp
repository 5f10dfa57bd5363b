#ifndef INTERNAL_SETTLEMENT_REPOSITORY_HPP
#define INTERNAL_SETTLEMENT_REPOSITORY_HPP

#include <vector>
#include <mutex>

#include "energymarket/report/i_settlement_repository.hpp"

namespace energymarket::report {

class InternalSettlementRepository : public ISettlementRepository {
public:
    void add_settlement(const Settlement& settlement) override;

    std::vector<Settlement> settlements_between(Timestamp start, Timestamp end) override;

    std::vector<Settlement> settlements_all() override;

    std::size_t count() override;

private:
    std::vector<Settlement> settlements_;  
    std::mutex mutex_;
};

}

#endif
