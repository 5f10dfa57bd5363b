#ifndef ICLOCK_HPP
#define ICLOCK_HPP

#include "energymarket/util/timestamp.hpp"

namespace energymarket::util {

    class IClock {
    public:
        virtual ~IClock() = default;
        virtual Timestamp now() const = 0;
    };

} 

#endif
