#include "energymarket/report/internal_settlement_repository.hpp"

namespace energymarket::report {

void InternalSettlementRepository::add_settlement(const Settlement& settlement) 
{
    std::lock_guard<std::mutex> lock(mutex_);
    settlements_.push_back(settlement);
}

std::vector<Settlement> InternalSettlementRepository::settlements_between(Timestamp start, Timestamp end) 
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Settlement> result;
    
    for (const auto& s : settlements_) {
        if (s.timestamp >= start && s.timestamp <= end) {
            result.push_back(s);
        }
    }
    return result;
}

std::vector<Settlement> InternalSettlementRepository::settlements_all() 
{
    std::lock_guard<std::mutex> lock(mutex_);
    return settlements_;
}

std::size_t InternalSettlementRepository::count()
{
    std::lock_guard<std::mutex> lock(mutex_);
    return settlements_.size();
}

} 
