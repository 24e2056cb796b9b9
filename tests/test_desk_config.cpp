#include "../include/config/desk_config.hpp"
#include "../include/core/errors.hpp"

#include <cassert>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>
#include <unistd.h>

using namespace rolldesk;
using namespace rolldesk::config;
using namespace std::chrono_literals;

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

// Returns the ConfigError message, or "" when parsing succeeded
std::string config_error(const std::string& text) {
    try {
        parse_config(text);
    } catch (const ConfigError& e) {
        return e.what();
    }
    return "";
}

TEST(empty_object_gives_defaults) {
    auto cfg = parse_config("{}");
    ASSERT_EQ(cfg.correlator.quote_base, ranges::QUOTE_BASE);
    ASSERT_EQ(cfg.correlator.range_width, ranges::RANGE_WIDTH);
    ASSERT_EQ(cfg.correlator.history_base, ranges::HISTORY_BASE);
    ASSERT_TRUE(cfg.correlator.ranges_disjoint());
    ASSERT_EQ(cfg.snapshot.burst_size, snapshot::BURST_SIZE);
    ASSERT_EQ(cfg.snapshot.settle, 1500ms);
    ASSERT_EQ(cfg.snapshot.hard_timeout, 8000ms);
    ASSERT_EQ(cfg.ttls.greeks, 30'000ms);
    ASSERT_EQ(cfg.ttls.chain, 300'000ms);
    ASSERT_EQ(cfg.quotes.timeout, 3000ms);
    ASSERT_EQ(cfg.resolver.timeout, 10'000ms);
    ASSERT_EQ(cfg.chains.timeout, 15'000ms);
    ASSERT_EQ(cfg.accounts.managed_accounts_timeout, 10'000ms);
    ASSERT_EQ(cfg.accounts.summary_timeout, 15'000ms);
    ASSERT_EQ(cfg.accounts.positions_timeout, 15'000ms);
    ASSERT_EQ(cfg.accounts.alias_timeout, 5000ms);
    ASSERT_EQ(cfg.accounts.summary_group, "All");
    ASSERT_EQ(cfg.historical.timeout, 10'000ms);
    ASSERT_EQ(cfg.preloader.symbols, (std::vector<std::string>{"QQQ", "TQQQ"}));
    ASSERT_EQ(cfg.preloader.interval, 30'000ms);
    ASSERT_EQ(cfg.logging.level, logging::LogLevel::Info);
    ASSERT_TRUE(cfg.alias_store_path.empty());
    ASSERT_EQ(cfg.rates.fallback_pct, 4.33);
}

TEST(full_config_overrides_everything) {
    auto cfg = parse_config(R"({
        "ranges":    { "width": 1000, "order_base": 1, "quote_base": 5000, "chain_base": 6000,
                       "contract_base": 7000, "roll_base": 8000, "account_base": 9000,
                       "history_base": 10000 },
        "snapshot":  { "burst_size": 4, "burst_delay_ms": 20, "settle_ms": 900,
                       "hard_timeout_ms": 5000, "exchange": "CBOE" },
        "ttl":       { "greeks_ms": 10000, "chain_ms": 60000 },
        "timeouts":  { "quote_ms": 1000, "resolution_ms": 2000, "chain_ms": 3000,
                       "managed_accounts_ms": 4000, "account_summary_ms": 5000, "positions_ms": 6000,
                       "account_alias_ms": 700, "historical_ms": 8000 },
        "preloader": { "symbols": ["spy", " qqq ", "SPY", ""], "interval_ms": 45000,
                       "num_expirations": 2, "strike_radius": 10, "fallback_half_width": 3 },
        "logging":   { "level": "debug", "file": "desk.log" },
        "accounts":  { "alias_store": "/tmp/aliases.json", "summary_group": "Family",
                       "summary_tags": "NetLiquidation" },
        "rates":     { "fred_api_key": "abc123", "ttl_ms": 3600000 }
    })");

    ASSERT_EQ(cfg.correlator.range_width, 1000);
    ASSERT_EQ(cfg.correlator.roll_base, 8000);
    ASSERT_EQ(cfg.correlator.account_base, 9000);
    ASSERT_EQ(cfg.correlator.history_base, 10000);
    ASSERT_EQ(cfg.snapshot.burst_size, 4u);
    ASSERT_EQ(cfg.snapshot.burst_delay, 20ms);
    ASSERT_EQ(cfg.snapshot.settle, 900ms);
    ASSERT_EQ(cfg.snapshot.exchange, "CBOE");
    ASSERT_EQ(cfg.resolver.exchange, "CBOE");
    ASSERT_EQ(cfg.quotes.exchange, "CBOE");
    ASSERT_EQ(cfg.ttls.greeks, 10'000ms);
    ASSERT_EQ(cfg.quotes.timeout, 1000ms);
    ASSERT_EQ(cfg.resolver.timeout, 2000ms);
    ASSERT_EQ(cfg.chains.timeout, 3000ms);
    ASSERT_EQ(cfg.accounts.managed_accounts_timeout, 4000ms);
    ASSERT_EQ(cfg.accounts.summary_timeout, 5000ms);
    ASSERT_EQ(cfg.accounts.positions_timeout, 6000ms);
    ASSERT_EQ(cfg.accounts.alias_timeout, 700ms);
    ASSERT_EQ(cfg.accounts.summary_group, "Family");
    ASSERT_EQ(cfg.accounts.summary_tags, "NetLiquidation");
    ASSERT_EQ(cfg.historical.timeout, 8000ms);
    ASSERT_EQ(cfg.historical.exchange, "CBOE");
    ASSERT_EQ(cfg.preloader.symbols, (std::vector<std::string>{"SPY", "QQQ"}));
    ASSERT_EQ(cfg.preloader.num_expirations, 2u);
    ASSERT_EQ(cfg.preloader.strike_radius, 10u);
    ASSERT_EQ(cfg.preloader.fallback_half_width, 3u);
    ASSERT_EQ(cfg.logging.level, logging::LogLevel::Debug);
    ASSERT_EQ(cfg.logging.file, "desk.log");
    ASSERT_EQ(cfg.alias_store_path, "/tmp/aliases.json");
    ASSERT_EQ(cfg.rates.api_key, "abc123");
    ASSERT_EQ(cfg.rates.ttl, 3'600'000ms);
}

TEST(malformed_documents_rejected) {
    ASSERT_FALSE(config_error("{ not json").empty());
    ASSERT_FALSE(config_error("[1, 2]").empty());
    ASSERT_FALSE(config_error(R"({"snapshot": 5})").empty());
    ASSERT_FALSE(config_error(R"({"snapshot": {"settle_ms": "fast"}})").empty());
    ASSERT_FALSE(config_error(R"({"preloader": {"symbols": "QQQ"}})").empty());
}

TEST(invalid_values_rejected) {
    ASSERT_FALSE(config_error(R"({"snapshot": {"settle_ms": 0}})").empty());
    ASSERT_FALSE(config_error(R"({"timeouts": {"quote_ms": -5}})").empty());
    ASSERT_FALSE(config_error(R"({"snapshot": {"burst_size": 0}})").empty());
    ASSERT_FALSE(config_error(R"({"ranges": {"width": 0}})").empty());
    ASSERT_FALSE(config_error(R"({"timeouts": {"historical_ms": 0}})").empty());
    ASSERT_FALSE(config_error(R"({"accounts": {"summary_tags": ""}})").empty());
    ASSERT_TRUE(config_error(R"({"ranges": {"history_base": 40000005}})").find("overlap") != std::string::npos);
    ASSERT_TRUE(config_error(R"({"ranges": {"chain_base": 10000005}})").find("overlap") != std::string::npos);
    ASSERT_TRUE(config_error(R"({"logging": {"level": "loud"}})").find("loud") != std::string::npos);
}

TEST(load_from_file) {
    char path[] = "/tmp/rolldesk_config_XXXXXX";
    int fd = mkstemp(path);
    ASSERT_TRUE(fd >= 0);
    close(fd);
    {
        std::ofstream out(path);
        out << R"({"preloader": {"symbols": ["tqqq"]}})";
    }

    auto cfg = load_config(path);
    ASSERT_EQ(cfg.preloader.symbols, (std::vector<std::string>{"TQQQ"}));
    std::remove(path);

    bool threw = false;
    try {
        load_config("/nonexistent/rolldesk.json");
    } catch (const ConfigError& e) {
        threw = std::string(e.what()).find("Cannot open config file") != std::string::npos;
    }
    ASSERT_TRUE(threw);
}

int main() {
    std::cout << "\n=== Desk Config Tests ===\n\n";

    RUN_TEST(empty_object_gives_defaults);
    RUN_TEST(full_config_overrides_everything);
    RUN_TEST(malformed_documents_rejected);
    RUN_TEST(invalid_values_rejected);
    RUN_TEST(load_from_file);

    std::cout << "\n=== All Desk Config Tests Passed! ===\n";
    return 0;
}
