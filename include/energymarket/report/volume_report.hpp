#ifndef VOLUME_REPORT_HPP
#define VOLUME_REPORT_HPP

#include <cstddef>
#include <vector>
#include "energymarket/core/settlement.hpp"

namespace energymarket::report {

using Settlement = energymarket::core::Settlement;

struct VolumeStats {
    Quantity    totalEnergy = 0;   // energy units settled
    Amount      totalValue  = 0;   // value paid to sellers
    std::size_t settlementCount = 0;
};

class VolumeReport {
public:

    VolumeReport() = default;

    static VolumeReport from_settlements(const std::vector<Settlement>& settlements);

    const VolumeStats& stats() const noexcept { return stats_; }

private:
    VolumeStats stats_;
};

} 

#endif
