#pragma once

#include "chain_cache.hpp"
#include "greeks_cache.hpp"

#include <chrono>

namespace rolldesk {
namespace market {

/**
 * MarketDataCaches - the process-wide market-data caches
 *
 * Built once by the owner and handed to every desk; a desk rebuilt after a
 * reconnect keeps serving what was cached before.
 */
struct MarketDataCaches {
    GreeksCache greeks;
    ChainCache chains;

    MarketDataCaches() = default;
    MarketDataCaches(std::chrono::milliseconds greeks_ttl, std::chrono::milliseconds chain_ttl)
        : greeks(greeks_ttl), chains(chain_ttl) {}
};

}  // namespace market
}  // namespace rolldesk
