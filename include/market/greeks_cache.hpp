#pragma once

#include "../config/defaults.hpp"
#include "../util/string_utils.hpp"
#include "option_greek.hpp"

#include <algorithm>
#include <chrono>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace rolldesk {
namespace market {

enum class CacheState : uint8_t { Missing = 0, Stale, Fresh };

inline const char* cache_state_to_string(CacheState state) {
    switch (state) {
    case CacheState::Missing:
        return "missing";
    case CacheState::Stale:
        return "stale";
    case CacheState::Fresh:
        return "fresh";
    }
    return "?";
}

struct GreeksLookup {
    CacheState state = CacheState::Missing;
    std::vector<OptionGreek> greeks;  // sorted, strike asc then call/put
    int64_t age_ms = 0;
};

/**
 * GreeksCache - latest merged snapshot per (symbol, expiry)
 *
 * Each key holds every (strike, right) ever fetched for it. Batches are merged
 * field by field (OptionGreek::merge_from), so a partial refresh never erases
 * values an earlier batch obtained, and the order in which batches land does
 * not matter for fields that only one batch knows.
 *
 * Entries are never deleted; staleness is purely a function of age.
 *
 * Thread-safe: a single mutex guards the map; no caller ever waits on the
 * gateway while holding it.
 */
class GreeksCache {
public:
    using Clock = std::chrono::steady_clock;

    explicit GreeksCache(std::chrono::milliseconds ttl = std::chrono::milliseconds(config::ttl::GREEKS_MS))
        : ttl_(ttl) {}

    /**
     * Subset of the entry for the requested strikes (all strikes when the
     * list is empty), plus whether the entry is fresh, stale or absent.
     */
    GreeksLookup lookup(const std::string& symbol, const std::string& expiry, const std::vector<double>& strikes) const {
        GreeksLookup result;
        std::set<StrikeKey> wanted;
        for (double s : strikes) {
            wanted.insert(strike_key(s));
        }

        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(make_key(symbol, expiry));
        if (it == entries_.end()) return result;

        const Entry& entry = it->second;
        result.age_ms = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - entry.fetched_at).count();
        result.state = result.age_ms < ttl_.count() ? CacheState::Fresh : CacheState::Stale;

        // std::map iteration is already strike asc, call before put
        for (const auto& [pair, greek] : entry.greeks) {
            if (wanted.empty() || wanted.count(pair.strike)) {
                result.greeks.push_back(greek);
            }
        }
        return result;
    }

    /// Everything cached for the key regardless of age; empty when absent
    std::vector<OptionGreek> get_all(const std::string& symbol, const std::string& expiry) const {
        return lookup(symbol, expiry, {}).greeks;
    }

    void merge(const std::string& symbol, const std::string& expiry, const std::vector<OptionGreek>& batch) {
        std::lock_guard<std::mutex> lock(mutex_);
        Entry& entry = entries_[make_key(symbol, expiry)];
        for (const auto& incoming : batch) {
            auto [it, inserted] = entry.greeks.emplace(pair_key(incoming), incoming);
            if (!inserted) {
                it->second.merge_from(incoming);
            }
        }
        entry.fetched_at = Clock::now();
    }

    bool contains(const std::string& symbol, const std::string& expiry) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.count(make_key(symbol, expiry)) > 0;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    std::chrono::milliseconds ttl() const { return ttl_; }

private:
    struct Entry {
        std::map<PairKey, OptionGreek> greeks;
        Clock::time_point fetched_at;
    };

    static std::string make_key(const std::string& symbol, const std::string& expiry) {
        return util::to_upper(symbol) + "|" + expiry;
    }

    std::chrono::milliseconds ttl_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
};

}  // namespace market
}  // namespace rolldesk
