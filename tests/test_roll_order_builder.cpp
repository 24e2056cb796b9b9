#include "../include/core/errors.hpp"
#include "../include/core/request_correlator.hpp"
#include "../include/core/timer_service.hpp"
#include "../include/gateway/mock_gateway.hpp"
#include "../include/logging/async_logger.hpp"
#include "../include/market/chain_cache.hpp"
#include "../include/market/contract_resolver.hpp"
#include "../include/orders/combo_order.hpp"
#include "../include/orders/order_tracker.hpp"
#include "../include/orders/roll_order_builder.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>

using namespace rolldesk;
using namespace rolldesk::orders;
using namespace std::chrono_literals;
using gateway::MockGateway;
using Kind = gateway::MockGateway::RequestKind;

#define TEST(name) void name()
#define RUN_TEST(name)                                                                                                 \
    do {                                                                                                               \
        std::cout << "  " << #name << "... ";                                                                          \
        name();                                                                                                        \
        std::cout << "PASSED\n";                                                                                       \
    } while (0)

#define ASSERT_EQ(a, b) assert((a) == (b))
#define ASSERT_TRUE(x) assert(x)
#define ASSERT_FALSE(x) assert(!(x))

struct Fixture {
    logging::AsyncLogger logger;
    MockGateway gw;
    core::TimerService timers;
    core::RequestCorrelator correlator;
    market::ChainCache chains;
    market::ContractResolver resolver;
    OrderTracker tracker;
    RollOrderBuilder builder;

    Fixture()
        : correlator(timers, logger), resolver(gw, correlator, chains, logger), tracker(logger),
          builder(gw, correlator, resolver, tracker, logger) {
        gw.set_event_handler([this](const gateway::GatewayEvent& e) { correlator.dispatch(e); });
        correlator.advance_order_ids(1000);
    }

    ~Fixture() { timers.shutdown(); }
};

// con_id encodes the strike so legs can be told apart
ContractId leg_con_id(double strike) {
    return 800'000'000 + static_cast<ContractId>(strike * 10);
}

void resolve_all(const MockGateway::SentRequest& r, MockGateway& gw) {
    if (r.kind != Kind::ContractDetails) return;
    gateway::Contract listed = r.contract;
    listed.con_id = leg_con_id(r.contract.strike);
    gw.emit(gateway::ContractDetailsEvent{r.id, listed});
}

RollOrderRequest short_put_roll() {
    RollOrderRequest req;
    req.symbol = "qqq";
    req.close_leg = RollLeg{"20260220", 594, OptionRight::Put};
    req.open_leg = RollLeg{"20260227", 590, OptionRight::Put};
    req.direction = PositionDirection::Short;
    req.limit_price = 0.85;
    return req;
}

// ============================================================================
// Combo construction
// ============================================================================

TEST(short_roll_buys_close_sells_open) {
    auto combo = build_combo_contract(short_put_roll(), 11, 22);
    ASSERT_EQ(combo.sec_type, gateway::SecType::Combo);
    ASSERT_EQ(combo.legs.size(), 2u);
    ASSERT_EQ(combo.legs[0].con_id, 11);
    ASSERT_EQ(combo.legs[0].action, OrderAction::Buy);
    ASSERT_EQ(combo.legs[1].con_id, 22);
    ASSERT_EQ(combo.legs[1].action, OrderAction::Sell);
    ASSERT_EQ(combo.legs[1].ratio, 1);
}

TEST(long_roll_sells_close_buys_open) {
    auto req = short_put_roll();
    req.direction = PositionDirection::Long;
    auto combo = build_combo_contract(req, 11, 22);
    ASSERT_EQ(combo.legs[0].action, OrderAction::Sell);
    ASSERT_EQ(combo.legs[1].action, OrderAction::Buy);
}

TEST(roll_description) {
    auto req = short_put_roll();
    ASSERT_EQ(describe_roll(req), "+Feb20 594P → -Feb27 590P");
    req.direction = PositionDirection::Long;
    ASSERT_EQ(describe_roll(req), "-Feb20 594P → +Feb27 590P");
}

TEST(validation) {
    ASSERT_EQ(validate(short_put_roll()), "");

    auto same = short_put_roll();
    same.open_leg = same.close_leg;
    ASSERT_EQ(validate(same), "close and open legs are the same contract");

    auto bad_expiry = short_put_roll();
    bad_expiry.open_leg.expiry = "2026-02-27";
    ASSERT_FALSE(validate(bad_expiry).empty());

    auto bad_strike = short_put_roll();
    bad_strike.close_leg.strike = 0;
    ASSERT_FALSE(validate(bad_strike).empty());
}

// ============================================================================
// Placement
// ============================================================================

TEST(places_one_combo_per_account) {
    Fixture f;
    f.gw.set_responder(resolve_all);

    auto updates = f.builder.place_roll_order(short_put_roll(), {{"DU1000001", 2}, {"DU1000002", 1}, {"DU1000003", 0}});

    ASSERT_EQ(updates.size(), 2u);
    ASSERT_EQ(updates[0].account, "DU1000001");
    ASSERT_EQ(updates[0].order_id, 1000);
    ASSERT_EQ(updates[0].status, "PendingSubmit");
    ASSERT_EQ(updates[0].remaining, 2.0);
    ASSERT_EQ(updates[1].account, "DU1000002");
    ASSERT_EQ(updates[1].order_id, 1001);

    auto placed = f.gw.requests_of(Kind::PlaceOrder);
    ASSERT_EQ(placed.size(), 2u);
    const auto& combo = placed[0].contract;
    ASSERT_EQ(combo.symbol, "QQQ");
    ASSERT_EQ(combo.legs[0].con_id, leg_con_id(594));
    ASSERT_EQ(combo.legs[0].action, OrderAction::Buy);
    ASSERT_EQ(combo.legs[1].con_id, leg_con_id(590));
    ASSERT_EQ(combo.legs[1].action, OrderAction::Sell);

    const auto& order = placed[0].order;
    ASSERT_EQ(order.action, OrderAction::Buy);
    ASSERT_EQ(order.order_type, gateway::OrderType::Limit);
    ASSERT_EQ(order.limit_price, 0.85);
    ASSERT_EQ(order.total_quantity, 2.0);
    ASSERT_EQ(order.account, "DU1000001");
    ASSERT_TRUE(order.transmit);

    ASSERT_EQ(f.builder.combo_description(1001).value(), "+Feb20 594P → -Feb27 590P");
    ASSERT_FALSE(f.builder.combo_description(999).has_value());
    ASSERT_EQ(f.builder.orders_placed(), 2u);

    // Tracked before sending, so a status event finds the account and label
    auto tracked = f.tracker.last_status(1000);
    ASSERT_TRUE(tracked.has_value());
    ASSERT_EQ(tracked->account, "DU1000001");
    ASSERT_EQ(tracked->status, "PendingSubmit");
    ASSERT_EQ(tracked->symbol, "QQQ +Feb20 594P → -Feb27 590P");
    ASSERT_EQ(f.tracker.size(), 2u);

    // Legs resolve from the roll range
    for (const auto& r : f.gw.requests_of(Kind::ContractDetails)) {
        ASSERT_TRUE(r.id >= config::ranges::ROLL_BASE);
    }
}

TEST(failed_leg_submits_nothing) {
    Fixture f;
    f.gw.set_responder([](const MockGateway::SentRequest& r, MockGateway& gw) {
        if (r.kind != Kind::ContractDetails) return;
        if (strike_key(r.contract.strike) == strike_key(590)) {
            gw.emit(gateway::ContractDetailsEndEvent{r.id});
            return;
        }
        resolve_all(r, gw);
    });

    bool threw = false;
    try {
        f.builder.place_roll_order(short_put_roll(), {{"DU1000001", 2}});
    } catch (const LegResolutionFailedError& e) {
        threw = e.code() == ErrorCode::LegResolutionFailed;
        ASSERT_TRUE(std::string(e.what()).find("open leg") != std::string::npos);
    }
    ASSERT_TRUE(threw);
    ASSERT_EQ(f.gw.count(Kind::PlaceOrder), 0u);
    ASSERT_EQ(f.builder.orders_placed(), 0u);
}

TEST(leg_send_failure_submits_nothing) {
    Fixture f;
    f.gw.set_responder([](const MockGateway::SentRequest& r, MockGateway& gw) {
        if (r.kind != Kind::ContractDetails) return;
        if (strike_key(r.contract.strike) == strike_key(594)) {
            throw std::runtime_error("gateway write failed");
        }
        resolve_all(r, gw);
    });

    bool threw = false;
    try {
        f.builder.place_roll_order(short_put_roll(), {{"DU1000001", 2}});
    } catch (const LegResolutionFailedError& e) {
        std::string what = e.what();
        threw = what.find("close leg") != std::string::npos && what.find("gateway write failed") != std::string::npos;
    }
    ASSERT_TRUE(threw);
    ASSERT_EQ(f.gw.count(Kind::PlaceOrder), 0u);
    ASSERT_EQ(f.tracker.size(), 0u);
}

TEST(no_positive_quantity_sends_nothing) {
    Fixture f;
    f.gw.set_responder(resolve_all);

    auto updates = f.builder.place_roll_order(short_put_roll(), {{"DU1000001", 0}, {"DU1000002", -1}});
    ASSERT_TRUE(updates.empty());
    ASSERT_EQ(f.gw.requests().size(), 0u);
}

TEST(invalid_request_rejected_before_gateway) {
    Fixture f;
    auto req = short_put_roll();
    req.open_leg = req.close_leg;

    bool threw = false;
    try {
        f.builder.place_roll_order(req, {{"DU1000001", 1}});
    } catch (const DeskError& e) {
        threw = e.code() == ErrorCode::InvalidRequest;
    }
    ASSERT_TRUE(threw);
    ASSERT_EQ(f.gw.requests().size(), 0u);
}

TEST(disconnected_gateway_throws) {
    Fixture f;
    f.gw.set_connected(false);
    bool threw = false;
    try {
        f.builder.place_roll_order(short_put_roll(), {{"DU1000001", 1}});
    } catch (const NotConnectedError&) {
        threw = true;
    }
    ASSERT_TRUE(threw);
    ASSERT_EQ(f.gw.requests().size(), 0u);
}

int main() {
    std::cout << "\n=== Roll Order Builder Tests ===\n\n";

    std::cout << "Combo construction:\n";
    RUN_TEST(short_roll_buys_close_sells_open);
    RUN_TEST(long_roll_sells_close_buys_open);
    RUN_TEST(roll_description);
    RUN_TEST(validation);

    std::cout << "\nPlacement:\n";
    RUN_TEST(places_one_combo_per_account);
    RUN_TEST(failed_leg_submits_nothing);
    RUN_TEST(leg_send_failure_submits_nothing);
    RUN_TEST(no_positive_quantity_sends_nothing);
    RUN_TEST(invalid_request_rejected_before_gateway);
    RUN_TEST(disconnected_gateway_throws);

    std::cout << "\n=== All Roll Order Builder Tests Passed! ===\n";
    return 0;
}
