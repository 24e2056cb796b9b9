#pragma once

#include "../account/account_service.hpp"
#include "../core/request_correlator.hpp"
#include "../logging/async_logger.hpp"
#include "../market/contract_resolver.hpp"
#include "../market/historical_service.hpp"
#include "../market/option_chain_service.hpp"
#include "../market/option_preloader.hpp"
#include "../market/quote_service.hpp"
#include "../market/snapshot_collector.hpp"
#include "../rates/fed_funds_client.hpp"
#include "defaults.hpp"

#include <chrono>
#include <string>

namespace rolldesk {
namespace config {

struct CacheTtls {
    std::chrono::milliseconds greeks{ttl::GREEKS_MS};
    std::chrono::milliseconds chain{ttl::CHAIN_MS};
};

struct LoggingConfig {
    logging::LogLevel level = logging::LogLevel::Info;
    std::string file;  // empty: stderr
};

/**
 * DeskConfig - everything the TradingDesk and the tool need
 *
 * JSON layout (every key optional, durations in milliseconds):
 * {
 *   "ranges":    { "width": 9999999, "order_base": 1, "quote_base": 10000000, ... },
 *   "snapshot":  { "burst_size": 10, "burst_delay_ms": 50, "settle_ms": 1500,
 *                  "hard_timeout_ms": 8000, "exchange": "SMART" },
 *   "ttl":       { "greeks_ms": 30000, "chain_ms": 300000 },
 *   "timeouts":  { "quote_ms": 3000, "resolution_ms": 10000, "chain_ms": 15000,
 *                  "managed_accounts_ms": 10000, "account_summary_ms": 15000,
 *                  "positions_ms": 15000, "account_alias_ms": 5000, "historical_ms": 10000 },
 *   "preloader": { "symbols": ["QQQ", "TQQQ"], "interval_ms": 30000,
 *                  "num_expirations": 3, "strike_radius": 40 },
 *   "logging":   { "level": "info", "file": "rolldesk.log" },
 *   "accounts":  { "alias_store": "aliases.json", "summary_group": "All",
 *                  "summary_tags": "NetLiquidation,AvailableFunds" },
 *   "rates":     { "fred_api_key": "...", "ttl_ms": 86400000 }
 * }
 */
struct DeskConfig {
    core::CorrelatorConfig correlator;
    market::SnapshotConfig snapshot;
    CacheTtls ttls;
    market::ResolverConfig resolver;
    market::QuoteServiceConfig quotes;
    market::ChainServiceConfig chains;
    market::PreloaderConfig preloader;
    market::HistoricalServiceConfig historical;
    account::AccountServiceConfig accounts;
    LoggingConfig logging;
    std::string alias_store_path;  // empty: aliases are not persisted
    ::rolldesk::rates::RatesConfig rates;
};

/// Throws ConfigError on malformed JSON, wrong value types or invalid values
DeskConfig parse_config(const std::string& json_text);

/// Throws ConfigError when the file cannot be read, then as parse_config
DeskConfig load_config(const std::string& path);

}  // namespace config
}  // namespace rolldesk
