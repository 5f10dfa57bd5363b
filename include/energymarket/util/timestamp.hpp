#ifndef TIMESTAMP_HPP
#define TIMESTAMP_HPP

#include <chrono>
#include <cstdint>

namespace energymarket::util { 

// wall-clock instant; settlement records are reported against epoch time
class Timestamp {
public:
    using clock         = std::chrono::system_clock;
    using duration      = std::chrono::nanoseconds;
    using time_point    = std::chrono::time_point<clock, duration>;

    Timestamp();
    explicit Timestamp(const time_point& tp);

    static Timestamp now();
    static Timestamp from_nanos(std::int64_t nanosSinceEpoch);

    time_point value() const;

    std::int64_t nanos_since_epoch() const;

    Timestamp& operator+=(const duration& d);

private:
    time_point tp_;
};

bool operator==(const Timestamp& lhs, const Timestamp& rhs);
bool operator!=(const Timestamp& lhs, const Timestamp& rhs);
bool operator<(const Timestamp& lhs, const Timestamp& rhs);
bool operator<=(const Timestamp& lhs, const Timestamp& rhs);
bool operator>(const Timestamp& lhs, const Timestamp& rhs);
bool operator>=(const Timestamp& lhs, const Timestamp& rhs);

Timestamp::duration operator-(const Timestamp& lhs, const Timestamp& rhs);

}

#endif
