#include "energymarket/util/timestamp.hpp"

namespace energymarket::util {

    Timestamp::Timestamp() : tp_{} {}

    Timestamp::Timestamp(const time_point& tp) : tp_(tp) {}

    Timestamp Timestamp::now() {
        return Timestamp{
            std::chrono::time_point_cast<duration>(clock::now())
        };
    }

    Timestamp Timestamp::from_nanos(std::int64_t nanosSinceEpoch) {
        return Timestamp{time_point{duration{nanosSinceEpoch}}};
    }

    Timestamp::time_point Timestamp::value() const {
        return tp_;
    }

    std::int64_t Timestamp::nanos_since_epoch() const {
        return tp_.time_since_epoch().count();
    }

    Timestamp& Timestamp::operator+=(const duration& d) {
        tp_ += d;
        return *this;
    }

    bool operator==(const Timestamp& lhs, const Timestamp& rhs) {
        return lhs.value() == rhs.value();
    }

    bool operator!=(const Timestamp& lhs, const Timestamp& rhs) {
        return !(lhs == rhs);
    }

    bool operator<(const Timestamp& lhs, const Timestamp& rhs) {
        return lhs.value() < rhs.value();
    }

    bool operator<=(const Timestamp& lhs, const Timestamp& rhs) {
        return !(rhs < lhs);
    }

    bool operator>(const Timestamp& lhs, const Timestamp& rhs) {
        return rhs < lhs;
    }

    bool operator>=(const Timestamp& lhs, const Timestamp& rhs) {
        return !(lhs < rhs);
    }

    Timestamp::duration operator-(const Timestamp& lhs, const Timestamp& rhs) {
        return lhs.value() - rhs.value();
    }

}
