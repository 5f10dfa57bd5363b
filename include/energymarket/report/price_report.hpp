#ifndef PRICE_REPORT_HPP
#define PRICE_REPORT_HPP

#include <vector>
#include <cstddef>
#include <limits>
#include <cmath>

#include "energymarket/core/settlement.hpp"

namespace energymarket::report {

// statistics over settlement prices, one sample per settlement
struct PriceStats {
    Price       minPrice    = std::numeric_limits<Price>::max();
    Price       maxPrice    = 0;
    double      avgPrice    = 0.0;
    double      stdDevPct   = 0.0;
    std::size_t settlementCount = 0;

    bool isValid() const {
        return settlementCount > 0;
    }
};

class PriceStatsReport {
public:
    using Settlement = energymarket::core::Settlement;

    PriceStatsReport() = default;

    static PriceStatsReport from_settlements(const std::vector<Settlement>& settlements);

    const PriceStats& stats() const noexcept { return stats_; }

private:
    PriceStats stats_;
};

} 

#endif
