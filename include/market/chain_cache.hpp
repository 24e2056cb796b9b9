#pragma once

#include "../config/defaults.hpp"
#include "../types.hpp"
#include "../util/string_utils.hpp"

#include <algorithm>
#include <chrono>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace rolldesk {
namespace market {

/**
 * One options series of an underlying as listed on one exchange.
 * Expirations and strikes are kept sorted ascending.
 */
struct ChainParams {
    std::string exchange;
    ContractId underlying_con_id = INVALID_CONTRACT_ID;
    std::string trading_class;
    std::string multiplier;
    std::vector<std::string> expirations;
    std::vector<double> strikes;

    bool has_expiry(const std::string& expiry) const {
        return std::binary_search(expirations.begin(), expirations.end(), expiry);
    }

    bool has_strike(double strike) const {
        StrikeKey k = strike_key(strike);
        return std::any_of(strikes.begin(), strikes.end(), [k](double s) { return strike_key(s) == k; });
    }

    void normalize() {
        std::sort(expirations.begin(), expirations.end());
        expirations.erase(std::unique(expirations.begin(), expirations.end()), expirations.end());
        std::sort(strikes.begin(), strikes.end());
        strikes.erase(std::unique(strikes.begin(), strikes.end(),
                                  [](double a, double b) { return strike_key(a) == strike_key(b); }),
                      strikes.end());
    }
};

struct CachedChain {
    std::string underlying;
    std::vector<ChainParams> params;
    std::chrono::steady_clock::time_point fetched_at;
};

/**
 * ChainCache - per-underlying chain parameters with a medium TTL
 *
 * Written only by OptionChainService after an end-of-parameters signal; read
 * by the resolver (trading class) and the preloader (expiry/strike windows).
 * Entries are replaced on refresh, never deleted.
 */
class ChainCache {
public:
    using Clock = std::chrono::steady_clock;

    explicit ChainCache(std::chrono::milliseconds ttl = std::chrono::milliseconds(config::ttl::CHAIN_MS))
        : ttl_(ttl) {}

    /// Cached params younger than the TTL
    std::optional<std::vector<ChainParams>> get_fresh(const std::string& symbol) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = chains_.find(util::to_upper(symbol));
        if (it == chains_.end() || Clock::now() - it->second.fetched_at >= ttl_) {
            return std::nullopt;
        }
        return it->second.params;
    }

    /// Cached params of any age
    std::optional<std::vector<ChainParams>> get_any(const std::string& symbol) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = chains_.find(util::to_upper(symbol));
        if (it == chains_.end()) return std::nullopt;
        return it->second.params;
    }

    void put(const std::string& symbol, std::vector<ChainParams> params) {
        for (auto& p : params) {
            p.normalize();
        }
        std::string key = util::to_upper(symbol);
        std::lock_guard<std::mutex> lock(mutex_);
        CachedChain& chain = chains_[key];
        chain.underlying = key;
        chain.params = std::move(params);
        chain.fetched_at = Clock::now();
    }

    /**
     * Trading class of the series listing (expiry, strike). Prefers the
     * SMART listing when several series carry the contract. Empty when no
     * chain data is cached or no series matches.
     */
    std::string find_trading_class(const std::string& symbol, const std::string& expiry, double strike) const {
        auto params = get_any(symbol);
        if (!params) return "";

        const ChainParams* match = nullptr;
        for (const auto& p : *params) {
            if (!p.has_expiry(expiry) || !p.has_strike(strike) || p.trading_class.empty()) continue;
            if (p.exchange == "SMART") return p.trading_class;
            if (!match) match = &p;
        }
        return match ? match->trading_class : "";
    }

    /// Union of expirations across every series, sorted
    static std::vector<std::string> all_expirations(const std::vector<ChainParams>& params) {
        std::set<std::string> merged;
        for (const auto& p : params) {
            merged.insert(p.expirations.begin(), p.expirations.end());
        }
        return {merged.begin(), merged.end()};
    }

    /// Union of strikes across every series listing the expiry (all series if none do), sorted
    static std::vector<double> strikes_for(const std::vector<ChainParams>& params, const std::string& expiry) {
        std::set<StrikeKey> keys;
        std::vector<double> out;
        bool any_listing = std::any_of(params.begin(), params.end(),
                                       [&](const ChainParams& p) { return p.has_expiry(expiry); });
        for (const auto& p : params) {
            if (any_listing && !p.has_expiry(expiry)) continue;
            for (double s : p.strikes) {
                if (keys.insert(strike_key(s)).second) out.push_back(s);
            }
        }
        std::sort(out.begin(), out.end());
        return out;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return chains_.size();
    }

private:
    std::chrono::milliseconds ttl_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, CachedChain> chains_;
};

}  // namespace market
}  // namespace rolldesk
