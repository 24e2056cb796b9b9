#include "../include/market/option_greek.hpp"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <vector>

using namespace rolldesk;
using namespace rolldesk::market;
namespace tick = rolldesk::gateway::tick;

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
#define ASSERT_NEAR(a, b, eps) assert(std::fabs((a) - (b)) < (eps))

OptionGreek make(double strike, OptionRight right) {
    OptionGreek g;
    g.strike = strike;
    g.right = right;
    g.expiry = "20260220";
    return g;
}

gateway::TickOptionComputationEvent computation(int field, double iv, double delta, double gamma, double vega,
                                                double theta) {
    gateway::TickOptionComputationEvent e{1, field};
    e.implied_vol = iv;
    e.delta = delta;
    e.gamma = gamma;
    e.vega = vega;
    e.theta = theta;
    return e;
}

// ============================================================================
// Merge
// ============================================================================

TEST(merge_never_overwrites_with_zero) {
    auto cached = make(590, OptionRight::Call);
    cached.bid = 4.10;
    cached.ask = 4.30;
    cached.delta = 0.48;
    cached.implied_vol = 0.21;
    cached.open_interest = 1200;

    auto incoming = make(590, OptionRight::Call);
    incoming.last = 4.20;

    cached.merge_from(incoming);
    ASSERT_EQ(cached.bid, 4.10);
    ASSERT_EQ(cached.ask, 4.30);
    ASSERT_EQ(cached.last, 4.20);
    ASSERT_EQ(cached.delta, 0.48);
    ASSERT_EQ(cached.implied_vol, 0.21);
    ASSERT_EQ(cached.open_interest, 1200);
}

TEST(merge_takes_newer_present_values) {
    auto cached = make(590, OptionRight::Put);
    cached.bid = 3.00;
    cached.delta = -0.40;

    auto incoming = make(590, OptionRight::Put);
    incoming.bid = 3.25;
    incoming.delta = -0.42;
    incoming.theta = -0.15;

    cached.merge_from(incoming);
    ASSERT_EQ(cached.bid, 3.25);
    ASSERT_EQ(cached.delta, -0.42);
    ASSERT_EQ(cached.theta, -0.15);
}

TEST(merge_is_idempotent) {
    auto g = make(595, OptionRight::Call);
    g.bid = 1.5;
    g.gamma = 0.02;
    auto copy = g;

    g.merge_from(copy);
    ASSERT_TRUE(g == copy);
    g.merge_from(copy);
    ASSERT_TRUE(g == copy);
}

TEST(mark_prefers_midpoint) {
    auto g = make(590, OptionRight::Call);
    ASSERT_EQ(g.mark(), 0.0);
    g.last = 4.0;
    ASSERT_EQ(g.mark(), 4.0);
    g.bid = 4.1;
    ASSERT_EQ(g.mark(), 4.0);  // one-sided: last
    g.ask = 4.3;
    ASSERT_NEAR(g.mark(), 4.2, 1e-9);
}

TEST(ordering_is_strike_then_call_first) {
    std::vector<OptionGreek> v = {make(595, OptionRight::Put), make(590, OptionRight::Put),
                                  make(595, OptionRight::Call), make(590, OptionRight::Call)};
    std::sort(v.begin(), v.end(), greek_order);

    ASSERT_EQ(v[0].strike, 590.0);
    ASSERT_EQ(v[0].right, OptionRight::Call);
    ASSERT_EQ(v[1].strike, 590.0);
    ASSERT_EQ(v[1].right, OptionRight::Put);
    ASSERT_EQ(v[2].strike, 595.0);
    ASSERT_EQ(v[2].right, OptionRight::Call);
    ASSERT_EQ(v[3].right, OptionRight::Put);
}

// ============================================================================
// Tick appliers
// ============================================================================

TEST(tick_price_maps_live_and_delayed) {
    auto g = make(590, OptionRight::Call);
    ASSERT_TRUE(apply_tick_price(g, tick::BID, 4.1));
    ASSERT_TRUE(apply_tick_price(g, tick::DELAYED_ASK, 4.3));
    ASSERT_TRUE(apply_tick_price(g, tick::DELAYED_LAST, 4.2));
    ASSERT_FALSE(apply_tick_price(g, 55, 9.9));

    ASSERT_EQ(g.bid, 4.1);
    ASSERT_EQ(g.ask, 4.3);
    ASSERT_EQ(g.last, 4.2);
}

TEST(tick_price_ignores_sentinels) {
    auto g = make(590, OptionRight::Call);
    g.bid = 4.1;
    apply_tick_price(g, tick::BID, -1.0);
    apply_tick_price(g, tick::BID, std::numeric_limits<double>::max());
    apply_tick_price(g, tick::BID, 0.0);
    ASSERT_EQ(g.bid, 4.1);
}

TEST(close_fills_last_only_when_unknown) {
    auto g = make(590, OptionRight::Call);
    apply_tick_price(g, tick::CLOSE, 3.9);
    ASSERT_EQ(g.last, 3.9);

    g.last = 4.2;
    apply_tick_price(g, tick::DELAYED_CLOSE, 3.8);
    ASSERT_EQ(g.last, 4.2);
}

TEST(open_interest_from_size_ticks) {
    auto g = make(590, OptionRight::Put);
    ASSERT_TRUE(apply_tick_size(g, tick::OPTION_PUT_OPEN_INTEREST, 3456));
    ASSERT_EQ(g.open_interest, 3456);
    ASSERT_FALSE(apply_tick_size(g, 0, 100));
    ASSERT_EQ(g.open_interest, 3456);
}

TEST(model_computation_overwrites) {
    auto g = make(590, OptionRight::Call);
    apply_option_computation(g, computation(tick::BID_OPTION, 0.25, 0.50, 0.01, 0.30, -0.20));
    ASSERT_EQ(g.implied_vol, 0.25);

    apply_option_computation(g, computation(tick::MODEL_OPTION, 0.22, 0.48, 0.012, 0.31, -0.18));
    ASSERT_EQ(g.implied_vol, 0.22);
    ASSERT_EQ(g.delta, 0.48);
    ASSERT_EQ(g.theta, -0.18);
}

TEST(fallback_computation_never_displaces_model) {
    auto g = make(590, OptionRight::Call);
    apply_option_computation(g, computation(tick::DELAYED_MODEL_OPTION, 0.22, 0.48, 0.012, 0.31, -0.18));
    apply_option_computation(g, computation(tick::LAST_OPTION, 0.30, 0.55, 0.02, 0.40, -0.25));

    ASSERT_EQ(g.implied_vol, 0.22);
    ASSERT_EQ(g.delta, 0.48);
    ASSERT_EQ(g.gamma, 0.012);
    ASSERT_EQ(g.vega, 0.31);
}

TEST(merge_keeps_model_greeks_over_fallback) {
    auto cached = make(590, OptionRight::Call);
    apply_option_computation(cached, computation(tick::MODEL_OPTION, 0.20, 0.45, 0.012, 0.31, -0.18));
    ASSERT_TRUE(cached.is_model(OptionGreek::MODEL_DELTA));

    // A later refresh that only saw bid/ask computations
    auto refresh = make(590, OptionRight::Call);
    refresh.bid = 4.05;
    apply_option_computation(refresh, computation(tick::BID_OPTION, 0.25, 0.40, 0.02, 0.35, -0.22));
    ASSERT_FALSE(refresh.is_model(OptionGreek::MODEL_DELTA));

    cached.merge_from(refresh);
    ASSERT_EQ(cached.bid, 4.05);
    ASSERT_EQ(cached.delta, 0.45);
    ASSERT_EQ(cached.implied_vol, 0.20);
    ASSERT_EQ(cached.gamma, 0.012);
    ASSERT_EQ(cached.theta, -0.18);

    // A newer model value still replaces the old one
    auto model = make(590, OptionRight::Call);
    apply_option_computation(model, computation(tick::DELAYED_MODEL_OPTION, 0.21, 0.47, 0.011, 0.30, -0.17));
    cached.merge_from(model);
    ASSERT_EQ(cached.delta, 0.47);
    ASSERT_EQ(cached.implied_vol, 0.21);
}

TEST(merge_marks_model_greeks_it_takes) {
    auto cached = make(595, OptionRight::Put);
    apply_option_computation(cached, computation(tick::LAST_OPTION, 0.30, -0.50, 0.02, 0.40, -0.25));

    auto model = make(595, OptionRight::Put);
    gateway::TickOptionComputationEvent e{1, tick::MODEL_OPTION};
    e.delta = -0.46;
    apply_option_computation(model, e);

    cached.merge_from(model);
    ASSERT_EQ(cached.delta, -0.46);
    ASSERT_TRUE(cached.is_model(OptionGreek::MODEL_DELTA));
    // Fields the model did not send keep the fallback and stay replaceable
    ASSERT_EQ(cached.implied_vol, 0.30);
    ASSERT_FALSE(cached.is_model(OptionGreek::MODEL_IV));

    auto fallback = make(595, OptionRight::Put);
    apply_option_computation(fallback, computation(tick::ASK_OPTION, 0.28, -0.52, 0.02, 0.40, -0.25));
    cached.merge_from(fallback);
    ASSERT_EQ(cached.delta, -0.46);
    ASSERT_EQ(cached.implied_vol, 0.28);
}

TEST(computation_rejects_no_data_values) {
    auto g = make(590, OptionRight::Call);
    gateway::TickOptionComputationEvent e{1, tick::MODEL_OPTION};
    e.implied_vol = -1.0;
    e.delta = std::nan("");
    e.gamma = 1e300;
    e.theta = 0.0;
    ASSERT_TRUE(apply_option_computation(g, e));
    ASSERT_FALSE(g.has_greeks());

    ASSERT_FALSE(apply_option_computation(g, computation(50, 0.2, 0.5, 0.01, 0.3, -0.1)));
    ASSERT_FALSE(g.has_data());
}

int main() {
    std::cout << "\n=== Option Greek Tests ===\n\n";

    std::cout << "Merge:\n";
    RUN_TEST(merge_never_overwrites_with_zero);
    RUN_TEST(merge_takes_newer_present_values);
    RUN_TEST(merge_is_idempotent);
    RUN_TEST(mark_prefers_midpoint);
    RUN_TEST(ordering_is_strike_then_call_first);

    std::cout << "\nTick appliers:\n";
    RUN_TEST(tick_price_maps_live_and_delayed);
    RUN_TEST(tick_price_ignores_sentinels);
    RUN_TEST(close_fills_last_only_when_unknown);
    RUN_TEST(open_interest_from_size_ticks);
    RUN_TEST(model_computation_overwrites);
    RUN_TEST(fallback_computation_never_displaces_model);
    RUN_TEST(merge_keeps_model_greeks_over_fallback);
    RUN_TEST(merge_marks_model_greeks_it_takes);
    RUN_TEST(computation_rejects_no_data_values);

    std::cout << "\n=== All Option Greek Tests Passed! ===\n";
    return 0;
}
