#include "energymarket/report/volume_report.hpp"

namespace energymarket::report {

VolumeReport VolumeReport::from_settlements(const std::vector<Settlement>& settlements) 
{
    VolumeReport report;

    for (const auto& s : settlements) {
        report.stats_.totalEnergy += s.quantity;
        report.stats_.totalValue  += s.amount;
        report.stats_.settlementCount += 1;
    }

    return report;
}

} 
