#ifndef INSTALLATION_REGISTRY_HPP
#define INSTALLATION_REGISTRY_HPP

#include <cstddef>
#include <vector>

#include "energymarket/core/installation.hpp"

namespace energymarket::core {

class InstallationRegistry {
public:
    explicit InstallationRegistry(Amount unitRate);

    RejectReason validate_registration(const PartyId& owner, Capacity capacity, Amount payment) const;

    // INVALID_INSTALLATION_ID when validate_registration rejects
    InstallationId register_installation(PartyId owner, Capacity capacity, Amount payment);

    // nullptr when out of range or not installed
    const Installation* get(InstallationId installationId) const;

    std::size_t size() const noexcept { return installations_.size(); }

    Amount unit_rate() const noexcept { return unitRate_; }

private:
    Amount unitRate_;
    std::vector<Installation> installations_;
};

}

#endif
