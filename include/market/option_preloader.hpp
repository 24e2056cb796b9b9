#pragma once

#include "../config/defaults.hpp"
#include "../logging/async_logger.hpp"
#include "option_chain_service.hpp"
#include "quote_service.hpp"
#include "snapshot_collector.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace rolldesk {
namespace market {

struct PreloaderConfig {
    std::vector<std::string> symbols{"QQQ", "TQQQ"};
    std::chrono::milliseconds interval{config::preloader::INTERVAL_MS};
    size_t num_expirations = config::preloader::NUM_EXPIRATIONS;
    size_t strike_radius = config::preloader::STRIKE_RADIUS;
    size_t fallback_half_width = config::preloader::FALLBACK_HALF_WIDTH;
};

/**
 * OptionPreloader - keeps near-the-money greeks warm for a watch-list
 *
 * Periodic cycle, per symbol:
 *   1. chain parameters (cache-first)
 *   2. spot price (last, else midpoint), remembered in the price cache
 *   3. nearest N expirations, standard strikes (whole or half dollar) within
 *      strike_radius of the first strike >= spot, or the middle strikes of
 *      the chain when no price is available
 *   4. force-refresh greeks one expiration at a time
 *
 * Cycles never overlap: a cycle still running when the next one is due
 * suppresses it (counted in cycles_skipped) instead of queueing it.
 *
 * The on-demand worker handles enqueue_preload() independently of the cycle,
 * so an operator view for an off-list symbol is not stuck behind a 30 s cycle.
 */
class OptionPreloader {
public:
    OptionPreloader(OptionChainService& chains, QuoteService& quotes, SnapshotCollector& collector,
                    logging::AsyncLogger& logger, PreloaderConfig config = {});
    ~OptionPreloader();

    OptionPreloader(const OptionPreloader&) = delete;
    OptionPreloader& operator=(const OptionPreloader&) = delete;

    /// Runs a cycle immediately, then every interval. No-op if already running.
    void start();
    void stop();

    /// stop() plus the on-demand worker; waits for a job already running
    void shutdown();
    bool is_running() const { return running_.load(std::memory_order_acquire); }

    /// One full pass over the watch-list. Returns false if a cycle was already running.
    bool run_cycle();

    /// Force-refresh greeks for one (symbol, expiry, strikes) now, on the calling thread
    bool request_preload(const std::string& symbol, const std::string& expiry, const std::vector<double>& strikes);

    /// Queue an on-demand preload; requests for a key already queued are merged
    void enqueue_preload(const std::string& symbol, const std::string& expiry, const std::vector<double>& strikes);

    /// Last spot price seen by a cycle, if any
    std::optional<Money> cached_price(const std::string& symbol) const;

    uint64_t cycles_completed() const { return cycles_completed_.load(std::memory_order_relaxed); }
    uint64_t cycles_skipped() const { return cycles_skipped_.load(std::memory_order_relaxed); }
    uint64_t on_demand_completed() const { return on_demand_completed_.load(std::memory_order_relaxed); }
    const PreloaderConfig& config() const { return config_; }

    // Selection helpers (pure)
    static std::vector<std::string> select_expirations(const std::vector<std::string>& sorted_expirations, size_t n);
    static std::vector<double> select_strikes(const std::vector<double>& strikes, std::optional<Money> price,
                                              size_t radius, size_t fallback_half_width);

private:
    struct OnDemand {
        std::string symbol;
        std::string expiry;
        std::vector<double> strikes;
    };

    void preload_symbol(const std::string& symbol);
    void cycle_loop();
    void on_demand_loop();

    OptionChainService& chains_;
    QuoteService& quotes_;
    SnapshotCollector& collector_;
    logging::AsyncLogger& logger_;
    PreloaderConfig config_;

    std::atomic<bool> running_;
    std::atomic<bool> cycle_active_;
    std::thread cycle_thread_;
    std::mutex cycle_mutex_;
    std::condition_variable cycle_cv_;

    mutable std::mutex price_mutex_;
    std::unordered_map<std::string, Money> prices_;

    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<std::string> queue_order_;
    std::unordered_map<std::string, OnDemand> queued_;
    bool queue_stopping_;
    std::thread on_demand_thread_;

    std::atomic<uint64_t> cycles_completed_;
    std::atomic<uint64_t> cycles_skipped_;
    std::atomic<uint64_t> on_demand_completed_;
};

}  // namespace market
}  // namespace rolldesk
