#include "energymarket/core/marketplace.hpp"
#include "energymarket/settlement/internal_ledger_gateway.hpp"
#include "energymarket/report/internal_settlement_repository.hpp"
#include "energymarket/util/simulated_clock.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <chrono>
#include <limits>
#include <vector>

using namespace energymarket;
using namespace energymarket::core;
using energymarket::api::PlaceOrderRequest;
using energymarket::api::RegisterInstallationRequest;
using energymarket::report::InternalSettlementRepository;
using energymarket::settlement::ISettlementGateway;
using energymarket::settlement::InternalLedgerGateway;
using energymarket::util::SimulatedClock;
using ::testing::_;
using ::testing::Return;

class MockSettlementGateway : public ISettlementGateway {
public:
    MOCK_METHOD(bool, transfer, (const PartyId& to, Amount amount), (override));
};

class MarketplaceTest : public ::testing::Test {
protected:
    SimulatedClock clock;
    InternalLedgerGateway ledger;
    InternalSettlementRepository repo;
    Marketplace market{clock, ledger, repo};

    std::vector<MatchEvent> matches;
    std::vector<PaymentEvent> payments;

    void SetUp() override {
        market.register_match_listener([this](const MatchEvent& ev) { matches.push_back(ev); });
        market.register_payment_listener([this](const PaymentEvent& ev) { payments.push_back(ev); });
    }

    OrderId buy(const PartyId& who, Quantity qty, Price px) {
        return market.place_order(PlaceOrderRequest(Side::Buy, qty, px, who));
    }

    OrderId sell(const PartyId& who, Quantity qty, Price px) {
        return market.place_order(PlaceOrderRequest(Side::Sell, qty, px, who));
    }
};

// ---------- Placement ----------

TEST_F(MarketplaceTest, PlaceIncreasesCountByOne) {
    EXPECT_EQ(market.order_count(), 0u);
    EXPECT_EQ(buy("alice", 100, 50), 0u);
    EXPECT_EQ(market.order_count(), 1u);
    EXPECT_EQ(sell("bob", 1, 0), 1u);
    EXPECT_EQ(market.order_count(), 2u);

    auto order = market.get_order(1);
    ASSERT_TRUE(order.has_value());
    EXPECT_FALSE(order->matched);
    EXPECT_FALSE(order->executed);
    EXPECT_TRUE(payments.empty());
}

TEST_F(MarketplaceTest, PlacementStampsClockTime) {
    clock.advance_time(std::chrono::seconds(42));
    OrderId id = buy("alice", 1, 1);
    EXPECT_EQ(market.get_order(id)->timestamp, clock.now());
}

TEST_F(MarketplaceTest, RejectedPlacementAppendsNothing) {
    EXPECT_EQ(market.validate_place_order(PlaceOrderRequest(Side::Buy, 0, 10, "alice")),
              RejectReason::InvalidQuantity);
    EXPECT_EQ(market.validate_place_order(PlaceOrderRequest(Side::Sell, 10, 10, "")),
              RejectReason::InvalidParty);
    EXPECT_EQ(market.validate_place_order(PlaceOrderRequest(Side::Buy, 2, std::numeric_limits<Price>::max(), "alice")),
              RejectReason::NotionalOverflow);

    EXPECT_EQ(buy("alice", 0, 10), INVALID_ORDER_ID);
    EXPECT_EQ(sell("", 10, 10), INVALID_ORDER_ID);
    EXPECT_EQ(market.order_count(), 0u);
}

TEST_F(MarketplaceTest, GetOrderOutOfRangeIsEmpty) {
    EXPECT_FALSE(market.get_order(0).has_value());
}

// ---------- Scenarios ----------

TEST_F(MarketplaceTest, MatchThenExecuteSettlesAtSellerPrice) {
    ASSERT_EQ(buy("alice", 100, 50), 0u);
    ASSERT_EQ(sell("bob", 100, 40), 1u);

    MatchResult mr = market.match_order(0);
    ASSERT_TRUE(mr.ok());
    ASSERT_TRUE(mr.matched);

    auto b = market.get_order(0);
    auto s = market.get_order(1);
    EXPECT_EQ(b->price, 40u);
    EXPECT_TRUE(b->matched);
    EXPECT_TRUE(s->matched);
    EXPECT_EQ(b->matchedOrderId, 1u);
    EXPECT_EQ(s->matchedOrderId, 0u);

    ASSERT_EQ(matches.size(), 1u);
    EXPECT_EQ(matches[0].buyer, "alice");
    EXPECT_EQ(matches[0].seller, "bob");
    EXPECT_EQ(matches[0].quantity, 100u);
    EXPECT_EQ(matches[0].price, 40u);

    EXPECT_EQ(market.execute_order(0, 4001, "alice"), RejectReason::None);

    EXPECT_TRUE(market.get_order(0)->executed);
    EXPECT_TRUE(market.get_order(1)->executed);
    EXPECT_EQ(ledger.balance_of("bob"), 4000u);
    EXPECT_EQ(market.custody_balance(), 1u);  // excess is retained

    ASSERT_EQ(payments.size(), 2u);
    EXPECT_EQ(payments[0].direction, PaymentDirection::Received);
    EXPECT_EQ(payments[0].party, "alice");
    EXPECT_EQ(payments[0].amount, 4001u);
    EXPECT_EQ(payments[1].direction, PaymentDirection::Sent);
    EXPECT_EQ(payments[1].party, "bob");
    EXPECT_EQ(payments[1].amount, 4000u);

    auto settled = repo.settlements_all();
    ASSERT_EQ(settled.size(), 1u);
    EXPECT_EQ(settled[0].buyOrderId, 0u);
    EXPECT_EQ(settled[0].sellOrderId, 1u);
    EXPECT_EQ(settled[0].price, 40u);
    EXPECT_EQ(settled[0].amount, 4000u);
    EXPECT_NE(settled[0].settlementId, INVALID_SETTLEMENT_ID);
}

TEST_F(MarketplaceTest, QuantityMismatchLeavesBuyUnmatched) {
    buy("alice", 100, 50);
    sell("bob", 90, 40);

    MatchResult mr = market.match_order(0);
    EXPECT_TRUE(mr.ok());
    EXPECT_FALSE(mr.matched);
    EXPECT_FALSE(market.get_order(0)->matched);
    EXPECT_TRUE(matches.empty());

    RejectReason er = market.execute_order(0, 1'000'000, "alice");
    EXPECT_EQ(er, RejectReason::NotMatched);
    EXPECT_EQ(category_of(er), ErrorCategory::StateConflict);
    EXPECT_EQ(market.custody_balance(), 0u);
}

TEST_F(MarketplaceTest, EarlierSellWinsWhenTwoQualify) {
    buy("alice", 10, 50);
    sell("bob", 10, 48);
    sell("carol", 10, 20);

    MatchResult mr = market.match_order(0);
    ASSERT_TRUE(mr.matched);
    EXPECT_EQ(mr.match.sellOrderId, 1u);
    EXPECT_FALSE(market.get_order(2)->matched);
}

// ---------- Execution failures ----------

TEST_F(MarketplaceTest, OnlyBuyerMayExecute) {
    buy("alice", 100, 50);
    sell("bob", 100, 40);
    ASSERT_TRUE(market.match_order(0).matched);

    for (const PartyId caller : {"bob", "mallory", ""}) {
        RejectReason er = market.execute_order(0, std::numeric_limits<Amount>::max() / 2, caller);
        EXPECT_EQ(er, RejectReason::NotAuthorized) << caller;
        EXPECT_EQ(category_of(er), ErrorCategory::Validation);
    }
    EXPECT_FALSE(market.get_order(0)->executed);
    EXPECT_EQ(market.custody_balance(), 0u);
    EXPECT_TRUE(payments.empty());
}

TEST_F(MarketplaceTest, ExactPaymentIsInsufficient) {
    buy("alice", 100, 50);
    sell("bob", 100, 40);
    ASSERT_TRUE(market.match_order(0).matched);

    EXPECT_EQ(market.execute_order(0, 4000, "alice"), RejectReason::InsufficientPayment);
    EXPECT_EQ(market.execute_order(0, 3999, "alice"), RejectReason::InsufficientPayment);
    EXPECT_FALSE(market.get_order(1)->executed);
    EXPECT_EQ(ledger.balance_of("bob"), 0u);
}

TEST_F(MarketplaceTest, SecondExecutionIsStateConflict) {
    buy("alice", 10, 5);
    sell("bob", 10, 5);
    ASSERT_TRUE(market.match_order(0).matched);
    ASSERT_EQ(market.execute_order(0, 51, "alice"), RejectReason::None);

    EXPECT_EQ(market.execute_order(0, 51, "alice"), RejectReason::AlreadyExecuted);
    EXPECT_EQ(market.execute_order(1, 51, "alice"), RejectReason::AlreadyExecuted);
    EXPECT_EQ(market.match_order(0).reason, RejectReason::AlreadyExecuted);
    EXPECT_EQ(ledger.balance_of("bob"), 50u);
    EXPECT_EQ(repo.count(), 1u);
}

TEST_F(MarketplaceTest, SellLegIdExecutesThePair) {
    buy("alice", 10, 7);
    sell("bob", 10, 6);
    ASSERT_TRUE(market.match_order(0).matched);

    EXPECT_EQ(market.execute_order(1, 61, "alice"), RejectReason::None);
    EXPECT_TRUE(market.get_order(0)->executed);
    EXPECT_TRUE(market.get_order(1)->executed);
    EXPECT_EQ(ledger.balance_of("bob"), 60u);
}

TEST_F(MarketplaceTest, RefusedTransferKeepsOrdersAndStrandsPayment) {
    buy("alice", 100, 50);
    sell("bob", 100, 40);
    ASSERT_TRUE(market.match_order(0).matched);
    ledger.set_rejecting("bob", true);

    RejectReason er = market.execute_order(0, 4001, "alice");
    EXPECT_EQ(er, RejectReason::TransferFailed);
    EXPECT_EQ(category_of(er), ErrorCategory::Transfer);
    EXPECT_FALSE(market.get_order(0)->executed);
    EXPECT_FALSE(market.get_order(1)->executed);
    EXPECT_EQ(market.custody_balance(), 4001u);
    EXPECT_EQ(repo.count(), 0u);
    ASSERT_EQ(payments.size(), 1u);
    EXPECT_EQ(payments[0].direction, PaymentDirection::Received);

    // the pair can still settle later; the first payment is not returned
    ledger.set_rejecting("bob", false);
    EXPECT_EQ(market.execute_order(0, 4001, "alice"), RejectReason::None);
    EXPECT_TRUE(market.get_order(0)->executed);
    EXPECT_TRUE(market.get_order(1)->executed);
    EXPECT_EQ(market.custody_balance(), 4002u);
    EXPECT_EQ(ledger.balance_of("bob"), 4000u);
}

TEST(MarketplaceGateway, TransferGoesToSellerForSettlementAmount) {
    SimulatedClock clock;
    MockSettlementGateway gateway;
    InternalSettlementRepository repo;
    Marketplace market(clock, gateway, repo);

    market.place_order(PlaceOrderRequest(Side::Buy, 100, 50, "alice"));
    market.place_order(PlaceOrderRequest(Side::Sell, 100, 40, "bob"));
    ASSERT_TRUE(market.match_order(0).matched);

    EXPECT_CALL(gateway, transfer(PartyId("bob"), Amount(4000))).WillOnce(Return(false)).WillOnce(Return(true));

    EXPECT_EQ(market.execute_order(0, 5000, "alice"), RejectReason::TransferFailed);
    EXPECT_FALSE(market.get_order(0)->executed);
    EXPECT_EQ(market.execute_order(0, 5000, "alice"), RejectReason::None);
    EXPECT_TRUE(market.get_order(1)->executed);
    EXPECT_EQ(market.custody_balance(), 6000u);
}

TEST(MarketplaceGateway, RejectedExecutionNeverReachesGateway) {
    SimulatedClock clock;
    MockSettlementGateway gateway;
    InternalSettlementRepository repo;
    Marketplace market(clock, gateway, repo);

    EXPECT_CALL(gateway, transfer(_, _)).Times(0);

    market.place_order(PlaceOrderRequest(Side::Buy, 10, 10, "alice"));
    market.place_order(PlaceOrderRequest(Side::Sell, 10, 10, "bob"));
    EXPECT_EQ(market.execute_order(0, 1000, "alice"), RejectReason::NotMatched);
    ASSERT_TRUE(market.match_order(0).matched);
    EXPECT_EQ(market.execute_order(0, 1000, "bob"), RejectReason::NotAuthorized);
    EXPECT_EQ(market.execute_order(0, 100, "alice"), RejectReason::InsufficientPayment);
}

// ---------- Installations ----------

TEST_F(MarketplaceTest, RegistrationPaymentEntersCustody) {
    InstallationId id = market.register_installation(RegisterInstallationRequest("farm", 500, 600));
    ASSERT_EQ(id, 0u);
    EXPECT_EQ(market.installation_count(), 1u);
    EXPECT_EQ(market.custody_balance(), 600u);

    auto inst = market.get_installation(id);
    ASSERT_TRUE(inst.has_value());
    EXPECT_EQ(inst->owner, "farm");
    EXPECT_EQ(inst->capacity, 500u);
    EXPECT_TRUE(inst->installed);

    ASSERT_EQ(payments.size(), 1u);
    EXPECT_EQ(payments[0].party, "farm");
    EXPECT_EQ(payments[0].amount, 600u);
}

TEST_F(MarketplaceTest, UnderpaidRegistrationIsRejected) {
    RegisterInstallationRequest req("farm", 500, 499);
    EXPECT_EQ(market.validate_register_installation(req), RejectReason::InsufficientPayment);
    EXPECT_EQ(market.register_installation(req), INVALID_INSTALLATION_ID);
    EXPECT_EQ(market.installation_count(), 0u);
    EXPECT_EQ(market.custody_balance(), 0u);
    EXPECT_FALSE(market.get_installation(0).has_value());
}

TEST(MarketplaceConfig, UnitRateScalesRegistrationMinimum) {
    SimulatedClock clock;
    InternalLedgerGateway ledger;
    InternalSettlementRepository repo;
    MarketConfig config;
    config.installationUnitRate = 3;
    Marketplace market(clock, ledger, repo, config);

    EXPECT_EQ(market.register_installation(RegisterInstallationRequest("farm", 10, 29)), INVALID_INSTALLATION_ID);
    EXPECT_EQ(market.register_installation(RegisterInstallationRequest("farm", 10, 30)), 0u);
}

TEST_F(MarketplaceTest, FullCustodyRejectsFurtherPayments) {
    ASSERT_EQ(market.register_installation(RegisterInstallationRequest("farm", 1, std::numeric_limits<Amount>::max())), 0u);
    EXPECT_EQ(market.custody_balance(), std::numeric_limits<Amount>::max());

    RegisterInstallationRequest second("roof", 1, 5);
    RejectReason vr = market.validate_register_installation(second);
    EXPECT_EQ(vr, RejectReason::CustodyOverflow);
    EXPECT_EQ(category_of(vr), ErrorCategory::Validation);
    EXPECT_EQ(market.register_installation(second), INVALID_INSTALLATION_ID);
    EXPECT_EQ(market.installation_count(), 1u);

    buy("alice", 1, 4);
    sell("bob", 1, 4);
    ASSERT_TRUE(market.match_order(0).matched);
    EXPECT_EQ(market.execute_order(0, 5, "alice"), RejectReason::CustodyOverflow);
    EXPECT_FALSE(market.get_order(0)->executed);
    EXPECT_FALSE(market.get_order(1)->executed);
    EXPECT_EQ(ledger.balance_of("bob"), 0u);
    EXPECT_EQ(payments.size(), 1u);
}

// ---------- Isolation ----------

TEST(MarketplaceIsolation, InstancesDoNotShareState) {
    SimulatedClock clock;
    InternalLedgerGateway ledger;
    InternalSettlementRepository repoA;
    InternalSettlementRepository repoB;
    Marketplace a(clock, ledger, repoA);
    Marketplace b(clock, ledger, repoB);

    a.place_order(PlaceOrderRequest(Side::Buy, 1, 1, "alice"));
    EXPECT_EQ(a.order_count(), 1u);
    EXPECT_EQ(b.order_count(), 0u);
    EXPECT_EQ(b.match_order(0).reason, RejectReason::InvalidReference);
}

TEST(MarketplaceIsolation, NoListenersIsFine) {
    SimulatedClock clock;
    InternalLedgerGateway ledger;
    InternalSettlementRepository repo;
    Marketplace market(clock, ledger, repo);

    market.place_order(PlaceOrderRequest(Side::Buy, 2, 3, "alice"));
    market.place_order(PlaceOrderRequest(Side::Sell, 2, 3, "bob"));
    EXPECT_TRUE(market.match_order(0).matched);
    EXPECT_EQ(market.execute_order(0, 7, "alice"), RejectReason::None);
}
