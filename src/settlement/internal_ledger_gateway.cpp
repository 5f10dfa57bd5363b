#include "energymarket/settlement/internal_ledger_gateway.hpp"

#include <limits>

namespace energymarket::settlement {

bool InternalLedgerGateway::transfer(const PartyId& to, Amount amount)
{
    if (!has_party(to)) return false;

    std::lock_guard<std::mutex> lock(mutex_);
    if (rejecting_.count(to) != 0) return false;

    Amount& balance = balances_[to];
    if (amount > std::numeric_limits<Amount>::max() - balance) return false;

    balance += amount;
    return true;
}

void InternalLedgerGateway::set_rejecting(const PartyId& party, bool rejecting)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (rejecting) {
        rejecting_.insert(party);
    } else {
        rejecting_.erase(party);
    }
}

Amount InternalLedgerGateway::balance_of(const PartyId& party) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = balances_.find(party);
    if (it == balances_.end()) return 0;
    return it->second;
}

}
