#ifndef ORDER_BOOK_HPP
#define ORDER_BOOK_HPP

#include <cstddef>
#include <vector>

#include "energymarket/core/order.hpp"

namespace energymarket::core {

struct Match {
    OrderId  buyOrderId{INVALID_ORDER_ID};
    OrderId  sellOrderId{INVALID_ORDER_ID};
    PartyId  buyer{};
    PartyId  seller{};
    Quantity quantity{0};
    Price    price{0};    // settlement price, taken from the sell order
};

struct MatchResult {
    RejectReason reason{RejectReason::None};
    bool         matched{false};   // false with reason None: no candidate found
    Match        match{};

    bool ok() const { return reason == RejectReason::None; }
};

// Append-only arena of orders. An order's id is its index; orders are never
// removed and links between legs are stored as ids.
class OrderBook {
public:
    OrderBook() = default;

    OrderId add_order(Side side, PartyId initiator, Quantity quantity, Price price, Timestamp ts);

    RejectReason validate_match(OrderId buyOrderId) const;

    // first-fit: the lowest-id open sell order with equal quantity and price <= bid
    MatchResult match(OrderId buyOrderId);

    RejectReason validate_execution(OrderId orderId, Amount payment, const PartyId& caller) const;

    // both legs of a validated match; seller is the transfer recipient
    const Order& buy_leg(OrderId orderId) const;
    const Order& sell_leg(OrderId orderId) const;

    void mark_executed(OrderId orderId);

    const Order* find(OrderId orderId) const;

    std::size_t size() const noexcept { return orders_.size(); }

    const std::vector<Order>& orders() const noexcept { return orders_; }

private:
    std::vector<Order> orders_;

    Order* find_first_sell_for(const Order& buy);
};

} 

#endif
