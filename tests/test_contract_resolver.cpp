#include "../include/core/errors.hpp"
#include "../include/core/request_correlator.hpp"
#include "../include/core/timer_service.hpp"
#include "../include/gateway/mock_gateway.hpp"
#include "../include/logging/async_logger.hpp"
#include "../include/market/chain_cache.hpp"
#include "../include/market/contract_resolver.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>

using namespace rolldesk;
using namespace rolldesk::market;
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
    ChainCache chains;
    ContractResolver resolver;

    explicit Fixture(std::chrono::milliseconds timeout = 2000ms)
        : correlator(timers, logger), resolver(gw, correlator, chains, logger, make_config(timeout)) {
        gw.set_event_handler([this](const gateway::GatewayEvent& e) { correlator.dispatch(e); });
    }

    ~Fixture() { timers.shutdown(); }

    static ResolverConfig make_config(std::chrono::milliseconds timeout) {
        ResolverConfig cfg;
        cfg.timeout = timeout;
        return cfg;
    }
};

// Answers every details request with one listing, con_id derived from the strike
void answer_details(const MockGateway::SentRequest& r, MockGateway& gw) {
    if (r.kind != Kind::ContractDetails) return;
    gateway::Contract listed = r.contract;
    listed.con_id = r.contract.sec_type == gateway::SecType::Option
                        ? 700'000'000 + static_cast<ContractId>(r.contract.strike * 10)
                        : 320'227'571;
    gw.emit(gateway::ContractDetailsEvent{r.id, listed});
    gw.emit(gateway::ContractDetailsEndEvent{r.id});
}

// ============================================================================
// Resolution
// ============================================================================

TEST(resolves_underlying_and_caches) {
    Fixture f;
    f.gw.set_responder(answer_details);

    ASSERT_EQ(f.resolver.resolve_underlying("qqq"), 320'227'571);
    ASSERT_EQ(f.gw.count(Kind::ContractDetails), 1u);

    auto sent = f.gw.requests_of(Kind::ContractDetails).front();
    ASSERT_EQ(sent.contract.symbol, "QQQ");
    ASSERT_EQ(sent.contract.sec_type, gateway::SecType::Stock);
    ASSERT_TRUE(sent.id >= config::ranges::CONTRACT_BASE && sent.id < config::ranges::ROLL_BASE);

    // Cache hit sends nothing
    ASSERT_EQ(f.resolver.resolve_underlying("QQQ"), 320'227'571);
    ASSERT_EQ(f.gw.count(Kind::ContractDetails), 1u);
    ASSERT_EQ(f.resolver.cached_underlying("QQQ").value(), 320'227'571);
    ASSERT_EQ(f.correlator.pending_count(), 0u);
}

TEST(resolves_option_with_trading_class) {
    Fixture f;
    ChainParams weekly;
    weekly.exchange = "SMART";
    weekly.trading_class = "QQQ";
    weekly.expirations = {"20260220"};
    weekly.strikes = {594};
    f.chains.put("QQQ", {weekly});
    f.gw.set_responder(answer_details);

    auto con_id = f.resolver.resolve_option("QQQ", "20260220", 594, OptionRight::Put, core::RequestCategory::Roll);
    ASSERT_EQ(con_id, 700'005'940);

    auto sent = f.gw.requests_of(Kind::ContractDetails).front();
    ASSERT_EQ(sent.contract.trading_class, "QQQ");
    ASSERT_EQ(sent.contract.right, OptionRight::Put);
    ASSERT_TRUE(sent.id >= config::ranges::ROLL_BASE);

    ASSERT_TRUE(f.resolver.cached_option("QQQ", "20260220", 594.0, OptionRight::Put).has_value());
    ASSERT_FALSE(f.resolver.cached_option("QQQ", "20260220", 594.0, OptionRight::Call).has_value());
}

TEST(concurrent_resolutions_share_one_request) {
    Fixture f;

    auto first = f.resolver.resolve_underlying_async("SPY");
    auto second = f.resolver.resolve_underlying_async("spy");
    ASSERT_EQ(f.gw.count(Kind::ContractDetails), 1u);

    auto id = f.gw.requests_of(Kind::ContractDetails).front().id;
    gateway::Contract listed = gateway::Contract::stock("SPY");
    listed.con_id = 756'733;
    f.gw.emit(gateway::ContractDetailsEvent{id, listed});

    ASSERT_EQ(first.get(), 756'733);
    ASSERT_EQ(second.get(), 756'733);
    ASSERT_EQ(f.resolver.cache_size(), 1u);
}

TEST(resolving_option_twice_sends_one_request) {
    Fixture f;
    f.gw.set_responder(answer_details);

    auto first = f.resolver.resolve_option("QQQ", "20260220", 590, OptionRight::Call);
    auto second = f.resolver.resolve_option("qqq", "20260220", 590.0, OptionRight::Call);

    ASSERT_EQ(first, 700'005'900);
    ASSERT_EQ(second, first);
    ASSERT_EQ(f.gw.count(Kind::ContractDetails), 1u);
    ASSERT_EQ(f.correlator.pending_count(), 0u);
}

TEST(first_listing_wins) {
    Fixture f;
    f.gw.set_responder([](const MockGateway::SentRequest& r, MockGateway& gw) {
        gateway::Contract a = r.contract;
        a.con_id = 111;
        gateway::Contract b = r.contract;
        b.con_id = 222;
        gw.emit(gateway::ContractDetailsEvent{r.id, a});
        gw.emit(gateway::ContractDetailsEvent{r.id, b});
        gw.emit(gateway::ContractDetailsEndEvent{r.id});
    });

    ASSERT_EQ(f.resolver.resolve_option("QQQ", "20260220", 590, OptionRight::Call), 111);
}

// ============================================================================
// Failures
// ============================================================================

TEST(details_end_without_listing_is_not_found) {
    Fixture f;
    f.gw.set_responder([](const MockGateway::SentRequest& r, MockGateway& gw) {
        gw.emit(gateway::ContractDetailsEndEvent{r.id});
    });

    bool threw = false;
    try {
        f.resolver.resolve_option("QQQ", "20260220", 591.5, OptionRight::Put);
    } catch (const ContractNotFoundError& e) {
        threw = e.code() == ErrorCode::ContractNotFound;
    }
    ASSERT_TRUE(threw);
    ASSERT_EQ(f.resolver.cache_size(), 0u);
}

TEST(gateway_error_is_not_found) {
    Fixture f;
    f.gw.set_responder([](const MockGateway::SentRequest& r, MockGateway& gw) {
        gw.emit(gateway::GatewayErrorEvent{r.id, gateway::error_code::DELAYED_DATA_NOTICE, "delayed"});
        gw.emit(gateway::GatewayErrorEvent{r.id, gateway::error_code::NO_SECURITY_DEFINITION,
                                           "No security definition has been found for the request"});
    });

    bool threw = false;
    try {
        f.resolver.resolve_underlying("NOPE");
    } catch (const ContractNotFoundError& e) {
        std::string what = e.what();
        threw = what.find("code 200") != std::string::npos;
    }
    ASSERT_TRUE(threw);

    // Failures are not cached; a retry goes back to the gateway
    f.gw.set_responder(answer_details);
    ASSERT_EQ(f.resolver.resolve_underlying("NOPE"), 320'227'571);
    ASSERT_EQ(f.gw.count(Kind::ContractDetails), 2u);
}

TEST(silence_times_out) {
    Fixture f(40ms);

    bool threw = false;
    try {
        f.resolver.resolve_option("QQQ", "20260220", 590, OptionRight::Call);
    } catch (const ResolutionTimeoutError& e) {
        threw = e.code() == ErrorCode::ResolutionTimeout;
    }
    ASSERT_TRUE(threw);
    ASSERT_EQ(f.correlator.timeout_count(), 1u);
    ASSERT_EQ(f.correlator.pending_count(), 0u);

    // A late answer is dropped
    auto id = f.gw.requests_of(Kind::ContractDetails).front().id;
    gateway::Contract late = gateway::Contract::stock("QQQ");
    late.con_id = 5;
    ASSERT_FALSE(f.correlator.dispatch(gateway::ContractDetailsEvent{id, late}));
}

TEST(disconnected_gateway_throws_before_sending) {
    Fixture f;
    f.gw.set_connected(false);

    bool threw = false;
    try {
        f.resolver.resolve_underlying("QQQ");
    } catch (const NotConnectedError&) {
        threw = true;
    }
    ASSERT_TRUE(threw);
    ASSERT_EQ(f.gw.requests().size(), 0u);
}

TEST(failed_registration_releases_key) {
    // A zero timeout is refused by the correlator after the key went in flight
    Fixture f(0ms);
    f.gw.set_responder(answer_details);

    for (int attempt = 0; attempt < 2; ++attempt) {
        bool threw = false;
        try {
            f.resolver.resolve_underlying("QQQ");
        } catch (const DeskError& e) {
            threw = e.code() == ErrorCode::InvalidRequest;
        }
        ASSERT_TRUE(threw);
    }
    ASSERT_EQ(f.gw.count(Kind::ContractDetails), 0u);
    ASSERT_EQ(f.resolver.cache_size(), 0u);
}

TEST(failed_send_releases_key) {
    Fixture f;
    f.gw.set_responder([](const MockGateway::SentRequest& r, MockGateway&) {
        if (r.kind == Kind::ContractDetails) throw std::runtime_error("socket closed");
    });

    bool threw = false;
    try {
        f.resolver.resolve_underlying("QQQ");
    } catch (const std::runtime_error& e) {
        threw = std::string(e.what()) == "socket closed";
    }
    ASSERT_TRUE(threw);
    ASSERT_EQ(f.correlator.pending_count(), 0u);

    // The next attempt starts a fresh request instead of joining the failed one
    f.gw.set_responder(answer_details);
    ASSERT_EQ(f.resolver.resolve_underlying("QQQ"), 320'227'571);
    ASSERT_EQ(f.gw.count(Kind::ContractDetails), 2u);
}

TEST(describe_labels) {
    ASSERT_EQ(ContractResolver::describe(gateway::Contract::stock("QQQ")), "QQQ");
    ASSERT_EQ(ContractResolver::describe(gateway::Contract::option("QQQ", "20260220", 590, OptionRight::Put, "SMART")),
              "QQQ 20260220 590P");
}

int main() {
    std::cout << "\n=== Contract Resolver Tests ===\n\n";

    std::cout << "Resolution:\n";
    RUN_TEST(resolves_underlying_and_caches);
    RUN_TEST(resolves_option_with_trading_class);
    RUN_TEST(concurrent_resolutions_share_one_request);
    RUN_TEST(resolving_option_twice_sends_one_request);
    RUN_TEST(first_listing_wins);

    std::cout << "\nFailures:\n";
    RUN_TEST(details_end_without_listing_is_not_found);
    RUN_TEST(gateway_error_is_not_found);
    RUN_TEST(silence_times_out);
    RUN_TEST(disconnected_gateway_throws_before_sending);
    RUN_TEST(failed_registration_releases_key);
    RUN_TEST(failed_send_releases_key);
    RUN_TEST(describe_labels);

    std::cout << "\n=== All Contract Resolver Tests Passed! ===\n";
    return 0;
}
