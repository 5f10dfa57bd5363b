#ifndef INSTALLATION_HPP
#define INSTALLATION_HPP

#include "energymarket/types.hpp"

namespace energymarket::core {

struct Installation {
    InstallationId installationId{INVALID_INSTALLATION_ID};
    PartyId        owner{};
    Capacity       capacity{0};
    bool           installed{false};
};

}

#endif
