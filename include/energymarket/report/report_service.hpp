#ifndef REPORT_SERVICE_HPP
#define REPORT_SERVICE_HPP

#include "energymarket/report/i_settlement_repository.hpp"
#include "energymarket/report/volume_report.hpp"
#include "energymarket/report/price_report.hpp"
#include "energymarket/util/timestamp.hpp" 

namespace energymarket::report {

class ReportService {
public:

    explicit ReportService(ISettlementRepository& repo)
        : repo_(repo) 
    {
    }

    VolumeReport volume_between(Timestamp start, Timestamp end);
    VolumeReport volume_all();

    PriceStatsReport price_between(Timestamp start, Timestamp end);
    PriceStatsReport price_all();

private:
    ISettlementRepository& repo_;
};

} 

#endif
