#ifndef SIMULATED_CLOCK_HPP
#define SIMULATED_CLOCK_HPP

#include "energymarket/util/i_clock.hpp"

namespace energymarket::util {

// manually driven clock for tests and scripted sessions; starts at the epoch
class SimulatedClock : public IClock {
public:
    SimulatedClock();
    explicit SimulatedClock(const Timestamp& start);

    ~SimulatedClock() override = default;

    Timestamp now() const override;

    void set_time(const Timestamp& t);

    void advance_time(const Timestamp::duration& delta);

private:
    Timestamp current_;
}; 

}

#endif
