#include "energymarket/core/installation_registry.hpp"

#include <utility>

namespace energymarket::core {

InstallationRegistry::InstallationRegistry(Amount unitRate)
    : unitRate_(unitRate)
    , installations_()
{
}

RejectReason InstallationRegistry::validate_registration(const PartyId& owner, Capacity capacity, Amount payment) const
{
    if (!has_party(owner)) return RejectReason::InvalidParty;
    if (capacity == 0) return RejectReason::InvalidCapacity;

    Amount required = 0;
    if (!checked_multiply(capacity, unitRate_, required)) return RejectReason::InvalidCapacity;
    if (payment < required) return RejectReason::InsufficientPayment;
    return RejectReason::None;
}

InstallationId InstallationRegistry::register_installation(PartyId owner, Capacity capacity, Amount payment)
{
    if (validate_registration(owner, capacity, payment) != RejectReason::None) {
        return INVALID_INSTALLATION_ID;
    }

    Installation inst;
    inst.installationId = static_cast<InstallationId>(installations_.size());
    inst.owner          = std::move(owner);
    inst.capacity       = capacity;
    inst.installed      = true;
    installations_.push_back(std::move(inst));
    return installations_.back().installationId;
}

const Installation* InstallationRegistry::get(InstallationId installationId) const
{
    if (installationId >= installations_.size()) return nullptr;
    const Installation& inst = installations_[installationId];
    if (!inst.installed) return nullptr;
    return &inst;
}

}
