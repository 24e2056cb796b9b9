#pragma once

#include <cstddef>
#include <cstdint>

/**
 * Centralized configuration defaults for the desk.
 *
 * All default values are defined here to avoid duplication across:
 * - DeskConfig and its sub-configs
 * - the JSON config loader
 * - the demo tool
 *
 * Naming:
 * - _MS suffix: milliseconds
 * - _BASE suffix: first id of a request-id range
 */

namespace rolldesk::config {

// =============================================================================
// Request id ranges (disjoint, purely for readable logs)
// =============================================================================
// Id 0 is reserved, so order ids start at 1 and every range stops one short
// of the next base.
namespace ranges {
constexpr int64_t RANGE_WIDTH = 9'999'999;
constexpr int64_t ORDER_BASE = 1;              // re-based by the gateway's next valid id
constexpr int64_t QUOTE_BASE = 10'000'000;
constexpr int64_t CHAIN_BASE = 20'000'000;
constexpr int64_t CONTRACT_BASE = 30'000'000;
constexpr int64_t ROLL_BASE = 40'000'000;
constexpr int64_t ACCOUNT_BASE = 50'000'000;
constexpr int64_t HISTORY_BASE = 60'000'000;
} // namespace ranges

// =============================================================================
// Snapshot batches (option greeks)
// =============================================================================
namespace snapshot {
constexpr size_t BURST_SIZE = 10;
constexpr int64_t BURST_DELAY_MS = 50;
// Quiet period after the last tick; observed between 500 and 1500 in the field
constexpr int64_t SETTLE_MS = 1500;
constexpr int64_t HARD_TIMEOUT_MS = 8000;
} // namespace snapshot

// =============================================================================
// Cache TTLs
// =============================================================================
namespace ttl {
constexpr int64_t GREEKS_MS = 30'000;
constexpr int64_t CHAIN_MS = 5 * 60'000;
constexpr int64_t RATE_MS = 24 * 60 * 60'000;
} // namespace ttl

// =============================================================================
// Per-request timeouts
// =============================================================================
namespace timeouts {
constexpr int64_t QUOTE_MS = 3000;
constexpr int64_t RESOLUTION_MS = 10'000;
constexpr int64_t CHAIN_MS = 15'000;
constexpr int64_t MANAGED_ACCOUNTS_MS = 10'000;
constexpr int64_t ACCOUNT_SUMMARY_MS = 15'000;
constexpr int64_t POSITIONS_MS = 15'000;
constexpr int64_t ACCOUNT_ALIAS_MS = 5000;
constexpr int64_t HISTORICAL_MS = 10'000;
} // namespace timeouts

// =============================================================================
// Accounts
// =============================================================================
namespace accounts {
constexpr const char* SUMMARY_GROUP = "All";
constexpr const char* SUMMARY_TAGS = "NetLiquidation,AvailableFunds,TotalCashValue,GrossPositionValue";
// Account update key carrying the operator-assigned alias
constexpr const char* ALIAS_KEY = "AccountOrGroup";
} // namespace accounts

// =============================================================================
// Historical bars
// =============================================================================
namespace historical {
constexpr const char* DURATION = "1 Y";
constexpr const char* BAR_SIZE = "1 day";
constexpr const char* WHAT_TO_SHOW = "TRADES";
} // namespace historical

// =============================================================================
// Background preloader
// =============================================================================
namespace preloader {
constexpr int64_t INTERVAL_MS = 30'000;
constexpr size_t NUM_EXPIRATIONS = 3;
constexpr size_t STRIKE_RADIUS = 40;      // strikes each side of spot
constexpr size_t FALLBACK_HALF_WIDTH = 5; // 11 strikes around the chain midpoint
} // namespace preloader

// =============================================================================
// Benchmark rate
// =============================================================================
namespace rates {
constexpr double FALLBACK_FED_FUNDS_PCT = 4.33;
constexpr int64_t HTTP_TIMEOUT_S = 10;
} // namespace rates

} // namespace rolldesk::config
