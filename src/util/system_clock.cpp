#include "energymarket/util/system_clock.hpp"

namespace energymarket::util {

    Timestamp SystemClock::now() const
    {
        return Timestamp::now();
    }

}
