#ifndef MARKETPLACE_HPP
#define MARKETPLACE_HPP

#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

#include "energymarket/api/place_order_request.hpp"
#include "energymarket/api/register_installation_request.hpp"
#include "energymarket/core/installation_registry.hpp"
#include "energymarket/core/market_events.hpp"
#include "energymarket/core/order_book.hpp"
#include "energymarket/core/settlement.hpp"
#include "energymarket/util/i_clock.hpp"
#include "energymarket/settlement/i_settlement_gateway.hpp"
#include "energymarket/report/i_settlement_repository.hpp"

namespace energymarket::core {

using energymarket::api::PlaceOrderRequest;
using energymarket::api::RegisterInstallationRequest;
using energymarket::util::IClock;
using energymarket::settlement::ISettlementGateway;
using energymarket::report::ISettlementRepository;

struct MarketConfig {
    // upfront payment required per unit of registered capacity
    Amount installationUnitRate{1};
};

// Session object owning one order book, one installation registry and the
// value held in custody. Operations run one at a time; listeners are called
// after the operation has committed and released the market lock.
//
// Known gaps kept on purpose: a payment taken into custody is not refunded
// when its settlement transfer fails, and any amount paid above the
// settlement amount stays in custody.
class Marketplace {
public:
    using MatchListener   = std::function<void(const MatchEvent&)>;
    using PaymentListener = std::function<void(const PaymentEvent&)>;

    Marketplace(IClock& clock,
                ISettlementGateway& gateway,
                ISettlementRepository& settlementRepo,
                MarketConfig config = MarketConfig{});

    energymarket::RejectReason validate_place_order(const PlaceOrderRequest& req) const;
    energymarket::RejectReason validate_register_installation(const RegisterInstallationRequest& req) const;

    OrderId place_order(const PlaceOrderRequest& req);

    MatchResult match_order(OrderId buyOrderId);

    // the gateway is called with the market lock held; it must not call back
    energymarket::RejectReason execute_order(OrderId orderId, Amount payment, const PartyId& caller);

    InstallationId register_installation(const RegisterInstallationRequest& req);

    std::size_t order_count() const;
    std::optional<Order> get_order(OrderId orderId) const;
    std::vector<Order> orders() const;

    std::size_t installation_count() const;
    std::optional<Installation> get_installation(InstallationId installationId) const;

    Amount custody_balance() const;

    void register_match_listener(MatchListener listener);
    void register_payment_listener(PaymentListener listener);

private:
    struct PendingEvents {
        std::vector<MatchEvent>   matches;
        std::vector<PaymentEvent> payments;
    };

    OrderBook             book_;
    InstallationRegistry  registry_;
    Amount                custody_{0};
    SettlementId          nextSettlementId_{1};

    IClock&                 clock_;
    ISettlementGateway&     gateway_;
    ISettlementRepository&  settlementRepo_;

    std::vector<MatchListener>   matchListeners_;
    std::vector<PaymentListener> paymentListeners_;

    mutable std::mutex marketMutex_;
    mutable std::mutex listenersMutex_;

    energymarket::RejectReason validate_registration_locked(const RegisterInstallationRequest& req) const;
    bool take_into_custody(const PartyId& payer, Amount payment, PendingEvents& events);
    void publish(const PendingEvents& events);
}; 

}

#endif 
