#include "../include/core/errors.hpp"
#include "../include/core/request_correlator.hpp"
#include "../include/core/timer_service.hpp"
#include "../include/gateway/mock_gateway.hpp"
#include "../include/logging/async_logger.hpp"
#include "../include/market/chain_cache.hpp"
#include "../include/market/contract_resolver.hpp"
#include "../include/market/option_chain_service.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>
#include <vector>

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

template <typename Cond>
bool wait_for(Cond cond, std::chrono::milliseconds deadline = 2000ms) {
    auto until = std::chrono::steady_clock::now() + deadline;
    while (std::chrono::steady_clock::now() < until) {
        if (cond()) return true;
        std::this_thread::sleep_for(1ms);
    }
    return cond();
}

constexpr ContractId QQQ_CON_ID = 320'227'571;

struct Fixture {
    logging::AsyncLogger logger;
    MockGateway gw;
    core::TimerService timers;
    core::RequestCorrelator correlator;
    ChainCache chains;
    ContractResolver resolver;
    OptionChainService service;

    explicit Fixture(std::chrono::milliseconds chain_timeout = 2000ms)
        : correlator(timers, logger), resolver(gw, correlator, chains, logger),
          service(gw, correlator, resolver, chains, logger, ChainServiceConfig{chain_timeout}) {
        gw.set_event_handler([this](const gateway::GatewayEvent& e) { correlator.dispatch(e); });
    }

    ~Fixture() { timers.shutdown(); }
};

gateway::ChainParameterEvent smart_listing(RequestId id) {
    return gateway::ChainParameterEvent{
        id, "SMART", QQQ_CON_ID, "QQQ", "100", {"20260227", "20260220"}, {595, 590, 592.5}};
}

gateway::ChainParameterEvent cboe_listing(RequestId id) {
    return gateway::ChainParameterEvent{id, "CBOE", QQQ_CON_ID, "QQQ", "100", {"20260220", "20260306"}, {585, 590}};
}

/// Resolves the underlying; chain requests are handled by `chain_reply`
template <typename ChainReply>
MockGateway::Responder responder(ChainReply chain_reply) {
    return [chain_reply](const MockGateway::SentRequest& r, MockGateway& gw) {
        if (r.kind == Kind::ContractDetails) {
            gateway::Contract listed = r.contract;
            listed.con_id = QQQ_CON_ID;
            gw.emit(gateway::ContractDetailsEvent{r.id, listed});
        } else if (r.kind == Kind::ChainParameters) {
            chain_reply(r, gw);
        }
    };
}

// ============================================================================
// Fetch and cache
// ============================================================================

TEST(collects_every_listing_until_end) {
    Fixture f;
    f.gw.set_responder(responder([](const MockGateway::SentRequest& r, MockGateway& gw) {
        gw.emit(smart_listing(r.id));
        gw.emit(cboe_listing(r.id));
        gw.emit(gateway::ChainParameterEndEvent{r.id});
    }));

    auto chain = f.service.get_chain("qqq");
    ASSERT_EQ(chain.size(), 2u);
    ASSERT_EQ(chain[0].exchange, "SMART");
    ASSERT_EQ(chain[0].expirations, (std::vector<std::string>{"20260220", "20260227"}));
    ASSERT_EQ(chain[0].strikes, (std::vector<double>{590, 592.5, 595}));
    ASSERT_EQ(ChainCache::all_expirations(chain).size(), 3u);

    auto sent = f.gw.requests_of(Kind::ChainParameters).front();
    ASSERT_EQ(sent.symbol, "QQQ");
    ASSERT_EQ(sent.underlying_con_id, QQQ_CON_ID);
    ASSERT_TRUE(sent.id >= config::ranges::CHAIN_BASE && sent.id < config::ranges::CONTRACT_BASE);
    ASSERT_EQ(f.correlator.pending_count(), 0u);
}

TEST(fresh_cache_answers_without_gateway) {
    Fixture f;
    f.gw.set_responder(responder([](const MockGateway::SentRequest& r, MockGateway& gw) {
        gw.emit(smart_listing(r.id));
        gw.emit(gateway::ChainParameterEndEvent{r.id});
    }));

    f.service.get_chain("QQQ");
    size_t sent = f.gw.requests().size();
    auto again = f.service.get_chain("QQQ");
    ASSERT_EQ(again.size(), 1u);
    ASSERT_EQ(f.gw.requests().size(), sent);

    f.service.get_chain("QQQ", true);
    ASSERT_EQ(f.gw.count(Kind::ChainParameters), 2u);
    // Underlying id came from the resolver cache the second time
    ASSERT_EQ(f.gw.count(Kind::ContractDetails), 1u);
}

TEST(empty_chain_is_not_cached) {
    Fixture f;
    f.gw.set_responder(responder([](const MockGateway::SentRequest& r, MockGateway& gw) {
        gw.emit(gateway::ChainParameterEndEvent{r.id});
    }));

    ASSERT_TRUE(f.service.get_chain("QQQ").empty());
    ASSERT_FALSE(f.chains.get_any("QQQ").has_value());
    ASSERT_TRUE(f.service.get_chain("QQQ").empty());
    ASSERT_EQ(f.gw.count(Kind::ChainParameters), 2u);
}

TEST(timeout_returns_partial_chain) {
    Fixture f(50ms);
    f.gw.set_responder(responder([](const MockGateway::SentRequest& r, MockGateway& gw) {
        gw.emit(smart_listing(r.id));
    }));

    auto chain = f.service.get_chain("QQQ");
    ASSERT_EQ(chain.size(), 1u);
    ASSERT_TRUE(f.chains.get_fresh("QQQ").has_value());
    ASSERT_EQ(f.correlator.timeout_count(), 1u);
}

TEST(gateway_error_ends_fetch) {
    Fixture f;
    f.gw.set_responder(responder([](const MockGateway::SentRequest& r, MockGateway& gw) {
        gw.emit(gateway::GatewayErrorEvent{r.id, 321, "Error validating request"});
    }));

    ASSERT_TRUE(f.service.get_chain("QQQ").empty());
    ASSERT_EQ(f.service.in_flight(), 0u);
}

// ============================================================================
// Coalescing and failures
// ============================================================================

TEST(concurrent_callers_share_one_fetch) {
    Fixture f;
    f.gw.set_responder(responder([](const MockGateway::SentRequest&, MockGateway&) {}));

    std::vector<ChainParams> a, b;
    std::thread first([&]() { a = f.service.get_chain("QQQ"); });
    ASSERT_TRUE(wait_for([&]() { return f.gw.count(Kind::ChainParameters) == 1; }));
    std::thread second([&]() { b = f.service.get_chain("qqq"); });
    std::this_thread::sleep_for(20ms);
    ASSERT_EQ(f.service.in_flight(), 1u);

    auto id = f.gw.requests_of(Kind::ChainParameters).front().id;
    f.gw.emit(smart_listing(id));
    f.gw.emit(gateway::ChainParameterEndEvent{id});
    first.join();
    second.join();

    ASSERT_EQ(f.gw.count(Kind::ChainParameters), 1u);
    ASSERT_EQ(a.size(), 1u);
    ASSERT_EQ(b.size(), 1u);
    ASSERT_EQ(a[0].strikes, b[0].strikes);
}

TEST(unresolvable_underlying_propagates) {
    Fixture f;
    f.gw.set_responder([](const MockGateway::SentRequest& r, MockGateway& gw) {
        if (r.kind == Kind::ContractDetails) gw.emit(gateway::ContractDetailsEndEvent{r.id});
    });

    bool threw = false;
    try {
        f.service.get_chain("ZZZZ");
    } catch (const ContractNotFoundError&) {
        threw = true;
    }
    ASSERT_TRUE(threw);
    ASSERT_EQ(f.gw.count(Kind::ChainParameters), 0u);
    ASSERT_EQ(f.service.in_flight(), 0u);
}

TEST(disconnected_gateway_throws) {
    Fixture f;
    f.gw.set_connected(false);
    bool threw = false;
    try {
        f.service.get_chain("QQQ");
    } catch (const NotConnectedError&) {
        threw = true;
    }
    ASSERT_TRUE(threw);
    ASSERT_EQ(f.gw.requests().size(), 0u);
}

int main() {
    std::cout << "\n=== Option Chain Service Tests ===\n\n";

    std::cout << "Fetch and cache:\n";
    RUN_TEST(collects_every_listing_until_end);
    RUN_TEST(fresh_cache_answers_without_gateway);
    RUN_TEST(empty_chain_is_not_cached);
    RUN_TEST(timeout_returns_partial_chain);
    RUN_TEST(gateway_error_ends_fetch);

    std::cout << "\nCoalescing and failures:\n";
    RUN_TEST(concurrent_callers_share_one_fetch);
    RUN_TEST(unresolvable_underlying_propagates);
    RUN_TEST(disconnected_gateway_throws);

    std::cout << "\n=== All Option Chain Service Tests Passed! ===\n";
    return 0;
}
