#include "energymarket/core/order_book.hpp"

#include <cassert>
#include <utility>

namespace energymarket::core {

OrderId OrderBook::add_order(Side side, PartyId initiator, Quantity quantity, Price price, Timestamp ts)
{
    assert(quantity > 0 && "[order book] add_order called with zero quantity");
    assert(has_party(initiator) && "[order book] add_order called without initiator");

    const OrderId id = static_cast<OrderId>(orders_.size());
    orders_.emplace_back(id, side, std::move(initiator), quantity, price, ts);
    return id;
}

RejectReason OrderBook::validate_match(OrderId buyOrderId) const
{
    const Order* buy = find(buyOrderId);
    if (!buy || buy->side != Side::Buy) return RejectReason::InvalidReference;
    if (buy->executed) return RejectReason::AlreadyExecuted;
    if (buy->matched) return RejectReason::AlreadyMatched;
    if (!buy->is_open_buy()) return RejectReason::InvalidReference;
    return RejectReason::None;
}

MatchResult OrderBook::match(OrderId buyOrderId)
{
    MatchResult result;
    result.reason = validate_match(buyOrderId);
    if (!result.ok()) return result;

    Order& buy = orders_[buyOrderId];
    Order* sell = find_first_sell_for(buy);
    if (!sell) return result;

    buy.matchedOrderId  = sell->orderId;
    sell->matchedOrderId = buy.orderId;
    buy.matched   = true;
    sell->matched = true;
    buy.seller  = sell->seller;
    sell->buyer = buy.buyer;

    // buyer pays the seller's quote, not its own bid
    buy.price = sell->price;

    result.matched = true;
    result.match.buyOrderId  = buy.orderId;
    result.match.sellOrderId = sell->orderId;
    result.match.buyer       = buy.buyer;
    result.match.seller      = sell->seller;
    result.match.quantity    = buy.quantity;
    result.match.price       = buy.price;
    return result;
}

RejectReason OrderBook::validate_execution(OrderId orderId, Amount payment, const PartyId& caller) const
{
    const Order* order = find(orderId);
    if (!order) return RejectReason::InvalidReference;
    if (!order->matched) return RejectReason::NotMatched;
    if (order->executed) return RejectReason::AlreadyExecuted;
    if (!has_party(caller) || caller != order->buyer) return RejectReason::NotAuthorized;

    // strictly greater: an exact payment is refused
    if (payment <= buy_leg(orderId).notional()) return RejectReason::InsufficientPayment;
    return RejectReason::None;
}

const Order& OrderBook::buy_leg(OrderId orderId) const
{
    const Order& order = orders_.at(orderId);
    assert(order.matched && "[order book] buy_leg called on unmatched order");
    return order.side == Side::Buy ? order : orders_.at(order.matchedOrderId);
}

const Order& OrderBook::sell_leg(OrderId orderId) const
{
    const Order& order = orders_.at(orderId);
    assert(order.matched && "[order book] sell_leg called on unmatched order");
    return order.side == Side::Sell ? order : orders_.at(order.matchedOrderId);
}

void OrderBook::mark_executed(OrderId orderId)
{
    Order& order = orders_.at(orderId);
    assert(order.matched && !order.executed && "[order book] mark_executed on unmatched or executed order");

    Order& other = orders_.at(order.matchedOrderId);
    order.executed = true;
    other.executed = true;
}

const Order* OrderBook::find(OrderId orderId) const
{
    if (orderId >= orders_.size()) return nullptr;
    return &orders_[orderId];
}

Order* OrderBook::find_first_sell_for(const Order& buy)
{
    for (auto& candidate : orders_) {
        if (!candidate.is_open_sell()) continue;
        if (candidate.matched) continue;
        if (candidate.quantity != buy.quantity) continue;
        if (candidate.price > buy.price) continue;
        return &candidate;
    }
    return nullptr;
}

} 
