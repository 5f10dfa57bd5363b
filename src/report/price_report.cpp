#include "energymarket/report/price_report.hpp"

namespace energymarket::report {

PriceStatsReport PriceStatsReport::from_settlements(const std::vector<Settlement>& settlements) 
{
    PriceStatsReport report;

    if (settlements.empty()) return report;

    double sumPrice = 0.0;
    double sumSquares = 0.0;

    for (const auto& s : settlements) {
        if (s.price < report.stats_.minPrice) {
            report.stats_.minPrice = s.price;
        }
        if (s.price > report.stats_.maxPrice) {
            report.stats_.maxPrice = s.price;
        }

        const double px = static_cast<double>(s.price);
        sumPrice += px;
        sumSquares += px * px;
        report.stats_.settlementCount += 1;
    }

    const double n = static_cast<double>(report.stats_.settlementCount);
    report.stats_.avgPrice = sumPrice / n;

    double variance = (sumSquares / n) - (report.stats_.avgPrice * report.stats_.avgPrice);
    if (variance < 0.0) variance = 0.0;  
    double stdDev = std::sqrt(variance);
    report.stats_.stdDevPct = (report.stats_.avgPrice > 0.0) ? (stdDev / report.stats_.avgPrice) * 100.0 : 0.0;
    return report;
}

} 
