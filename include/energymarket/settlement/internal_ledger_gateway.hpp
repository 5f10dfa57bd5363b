#ifndef INTERNAL_LEDGER_GATEWAY_HPP
#define INTERNAL_LEDGER_GATEWAY_HPP

#include <mutex>
#include <unordered_map>
#include <unordered_set>

#include "energymarket/settlement/i_settlement_gateway.hpp"

namespace energymarket::settlement {

// In-process ledger of participant balances. Recipients flagged as rejecting
// refuse every incoming transfer.
class InternalLedgerGateway : public ISettlementGateway {
public:
    bool transfer(const PartyId& to, Amount amount) override;

    void set_rejecting(const PartyId& party, bool rejecting);

    Amount balance_of(const PartyId& party) const;

private:
    std::unordered_map<PartyId, Amount> balances_;
    std::unordered_set<PartyId> rejecting_;
    mutable std::mutex mutex_;
};

}

#endif
