#ifndef SYSTEMCLOCK_HPP
#define SYSTEMCLOCK_HPP

#include "energymarket/util/i_clock.hpp"

namespace energymarket::util {

class SystemClock : public IClock {
public:
    SystemClock() = default;
    ~SystemClock() override = default;

    Timestamp now() const override;
};

} 

#endif
