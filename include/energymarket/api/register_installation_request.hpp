#ifndef REGISTER_INSTALLATION_REQUEST_HPP
#define REGISTER_INSTALLATION_REQUEST_HPP

#include <utility>

#include "energymarket/types.hpp"

namespace energymarket::api {

struct RegisterInstallationRequest {
    PartyId  owner{};
    Capacity capacity{0};
    Amount   payment{0};   // value sent with the registration, kept in custody

    RegisterInstallationRequest() = default;

    RegisterInstallationRequest(PartyId owner, Capacity capacity, Amount payment)
        : owner{std::move(owner)}
        , capacity{capacity}
        , payment{payment}
    {
    }
};

}

#endif
