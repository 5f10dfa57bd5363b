#include "energymarket/report/report_service.hpp"

namespace energymarket::report {

VolumeReport ReportService::volume_between(Timestamp start, Timestamp end) 
{
    return VolumeReport::from_settlements(repo_.settlements_between(start, end));
}

VolumeReport ReportService::volume_all() 
{
    return VolumeReport::from_settlements(repo_.settlements_all());
}

PriceStatsReport ReportService::price_between(Timestamp start, Timestamp end) 
{
    return PriceStatsReport::from_settlements(repo_.settlements_between(start, end));
}

PriceStatsReport ReportService::price_all() 
{
    return PriceStatsReport::from_settlements(repo_.settlements_all());
}

} 
