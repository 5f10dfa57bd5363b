#include "energymarket/core/marketplace.hpp"

#include <limits>
#include <utility>

namespace energymarket::core {

Marketplace::Marketplace(IClock& clock,
                         ISettlementGateway& gateway,
                         ISettlementRepository& settlementRepo,
                         MarketConfig config)
    : book_()
    , registry_(config.installationUnitRate)
    , clock_(clock)
    , gateway_(gateway)
    , settlementRepo_(settlementRepo)
{
}

energymarket::RejectReason Marketplace::validate_place_order(const PlaceOrderRequest& req) const
{
    if (req.quantity == 0) return energymarket::RejectReason::InvalidQuantity;
    if (!has_party(req.initiator)) return energymarket::RejectReason::InvalidParty;

    Amount notional = 0;
    if (!checked_multiply(req.quantity, req.price, notional)) {
        return energymarket::RejectReason::NotionalOverflow;
    }
    return energymarket::RejectReason::None;
}

energymarket::RejectReason Marketplace::validate_register_installation(const RegisterInstallationRequest& req) const
{
    std::lock_guard<std::mutex> lock(marketMutex_);
    return validate_registration_locked(req);
}

OrderId Marketplace::place_order(const PlaceOrderRequest& req)
{
    auto vr = validate_place_order(req);
    if (vr != energymarket::RejectReason::None) return INVALID_ORDER_ID;

    std::lock_guard<std::mutex> lock(marketMutex_);
    return book_.add_order(req.side, req.initiator, req.quantity, req.price, clock_.now());
}

MatchResult Marketplace::match_order(OrderId buyOrderId)
{
    PendingEvents events;
    MatchResult result;
    {
        std::lock_guard<std::mutex> lock(marketMutex_);
        result = book_.match(buyOrderId);
        if (result.matched) {
            MatchEvent ev;
            ev.buyOrderId  = result.match.buyOrderId;
            ev.sellOrderId = result.match.sellOrderId;
            ev.buyer       = result.match.buyer;
            ev.seller      = result.match.seller;
            ev.quantity    = result.match.quantity;
            ev.price       = result.match.price;
            ev.timestamp   = clock_.now();
            events.matches.push_back(std::move(ev));
        }
    }

    publish(events);
    return result;
}

energymarket::RejectReason Marketplace::execute_order(OrderId orderId, Amount payment, const PartyId& caller)
{
    PendingEvents events;
    Settlement settlement;

    // 1) validate and settle under the market lock
    std::unique_lock<std::mutex> lock(marketMutex_);

    auto vr = book_.validate_execution(orderId, payment, caller);
    if (vr != energymarket::RejectReason::None) return vr;

    if (!take_into_custody(caller, payment, events)) {
        return energymarket::RejectReason::CustodyOverflow;
    }

    const Order& buy  = book_.buy_leg(orderId);
    const Order& sell = book_.sell_leg(orderId);
    const Amount amount = buy.notional();

    // 2) a refused transfer leaves both legs untouched; the payment stays in custody
    if (!gateway_.transfer(sell.seller, amount)) {
        lock.unlock();
        publish(events);
        return energymarket::RejectReason::TransferFailed;
    }

    custody_ -= amount;
    book_.mark_executed(orderId);

    const Timestamp ts = clock_.now();
    settlement = Settlement(nextSettlementId_++,
                            buy.orderId,
                            sell.orderId,
                            buy.buyer,
                            sell.seller,
                            buy.quantity,
                            buy.price,
                            ts);

    PaymentEvent sent;
    sent.direction = PaymentDirection::Sent;
    sent.party     = sell.seller;
    sent.amount    = amount;
    sent.timestamp = ts;
    events.payments.push_back(std::move(sent));

    // 3) release before external sinks
    lock.unlock();

    settlementRepo_.add_settlement(settlement);
    publish(events);
    return energymarket::RejectReason::None;
}

InstallationId Marketplace::register_installation(const RegisterInstallationRequest& req)
{
    PendingEvents events;
    InstallationId id = INVALID_INSTALLATION_ID;
    {
        std::lock_guard<std::mutex> lock(marketMutex_);
        if (validate_registration_locked(req) != energymarket::RejectReason::None) {
            return INVALID_INSTALLATION_ID;
        }
        if (!take_into_custody(req.owner, req.payment, events)) {
            return INVALID_INSTALLATION_ID;
        }
        id = registry_.register_installation(req.owner, req.capacity, req.payment);
    }

    publish(events);
    return id;
}

std::size_t Marketplace::order_count() const
{
    std::lock_guard<std::mutex> lock(marketMutex_);
    return book_.size();
}

std::optional<Order> Marketplace::get_order(OrderId orderId) const
{
    std::lock_guard<std::mutex> lock(marketMutex_);
    const Order* order = book_.find(orderId);
    if (!order) return std::nullopt;
    return *order;
}

std::vector<Order> Marketplace::orders() const
{
    std::lock_guard<std::mutex> lock(marketMutex_);
    return book_.orders();
}

std::size_t Marketplace::installation_count() const
{
    std::lock_guard<std::mutex> lock(marketMutex_);
    return registry_.size();
}

std::optional<Installation> Marketplace::get_installation(InstallationId installationId) const
{
    std::lock_guard<std::mutex> lock(marketMutex_);
    const Installation* inst = registry_.get(installationId);
    if (!inst) return std::nullopt;
    return *inst;
}

Amount Marketplace::custody_balance() const
{
    std::lock_guard<std::mutex> lock(marketMutex_);
    return custody_;
}

void Marketplace::register_match_listener(MatchListener listener)
{
    std::lock_guard<std::mutex> lock(listenersMutex_);
    matchListeners_.push_back(std::move(listener));
}

void Marketplace::register_payment_listener(PaymentListener listener)
{
    std::lock_guard<std::mutex> lock(listenersMutex_);
    paymentListeners_.push_back(std::move(listener));
}

// caller holds marketMutex_
energymarket::RejectReason Marketplace::validate_registration_locked(const RegisterInstallationRequest& req) const
{
    auto vr = registry_.validate_registration(req.owner, req.capacity, req.payment);
    if (vr != energymarket::RejectReason::None) return vr;
    if (req.payment > std::numeric_limits<Amount>::max() - custody_) {
        return energymarket::RejectReason::CustodyOverflow;
    }
    return energymarket::RejectReason::None;
}

// caller holds marketMutex_
bool Marketplace::take_into_custody(const PartyId& payer, Amount payment, PendingEvents& events)
{
    if (payment > std::numeric_limits<Amount>::max() - custody_) return false;
    custody_ += payment;

    PaymentEvent received;
    received.direction = PaymentDirection::Received;
    received.party     = payer;
    received.amount    = payment;
    received.timestamp = clock_.now();
    events.payments.push_back(std::move(received));
    return true;
}

void Marketplace::publish(const PendingEvents& events)
{
    if (events.matches.empty() && events.payments.empty()) return;

    std::vector<MatchListener>   matchListeners;
    std::vector<PaymentListener> paymentListeners;
    {
        std::lock_guard<std::mutex> lk(listenersMutex_);
        matchListeners   = matchListeners_;
        paymentListeners = paymentListeners_;
    }

    for (const auto& ev : events.matches) {
        for (auto& listener : matchListeners) listener(ev);
    }
    for (const auto& ev : events.payments) {
        for (auto& listener : paymentListeners) listener(ev);
    }
}

} 
