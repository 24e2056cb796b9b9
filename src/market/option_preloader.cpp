#include "../../include/market/option_preloader.hpp"

#include "../../include/core/errors.hpp"
#include "../../include/util/string_utils.hpp"

#include <algorithm>
#include <set>

namespace rolldesk::market {

OptionPreloader::OptionPreloader(OptionChainService& chains, QuoteService& quotes, SnapshotCollector& collector,
                                 logging::AsyncLogger& logger, PreloaderConfig config)
    : chains_(chains), quotes_(quotes), collector_(collector), logger_(logger), config_(std::move(config)),
      running_(false), cycle_active_(false), queue_stopping_(false), cycles_completed_(0), cycles_skipped_(0),
      on_demand_completed_(0) {
    for (auto& s : config_.symbols) {
        s = util::to_upper(s);
    }
    on_demand_thread_ = std::thread([this]() { on_demand_loop(); });
}

OptionPreloader::~OptionPreloader() {
    shutdown();
}

void OptionPreloader::shutdown() {
    stop();
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        queue_stopping_ = true;
        queue_order_.clear();
        queued_.clear();
    }
    queue_cv_.notify_all();
    if (on_demand_thread_.joinable()) {
        on_demand_thread_.join();
    }
}

// =============================================================================
// Periodic cycle
// =============================================================================

void OptionPreloader::start() {
    if (running_.exchange(true, std::memory_order_acq_rel)) return;

    std::string list;
    for (const auto& s : config_.symbols) {
        list += (list.empty() ? "" : ", ") + s;
    }
    LOGF_INFO(logger_, Preloader, "starting preloader for %s every %lld ms", list.c_str(),
              static_cast<long long>(config_.interval.count()));
    cycle_thread_ = std::thread([this]() { cycle_loop(); });
}

void OptionPreloader::stop() {
    if (!running_.exchange(false, std::memory_order_acq_rel)) return;
    {
        std::lock_guard<std::mutex> lock(cycle_mutex_);
    }
    cycle_cv_.notify_all();
    if (cycle_thread_.joinable()) {
        cycle_thread_.join();
    }
    LOG_INFO(logger_, Preloader, "preloader stopped");
}

void OptionPreloader::cycle_loop() {
    auto next_due = std::chrono::steady_clock::now();
    while (running_.load(std::memory_order_acquire)) {
        auto started = std::chrono::steady_clock::now();
        run_cycle();

        // Ticks that fell inside an overrunning cycle are dropped, not queued
        next_due += config_.interval;
        auto now = std::chrono::steady_clock::now();
        while (next_due <= now) {
            next_due += config_.interval;
            cycles_skipped_.fetch_add(1, std::memory_order_relaxed);
            LOGF_WARN(logger_, Preloader, "cycle took %lld ms, suppressing overlapping cycle",
                      static_cast<long long>(
                          std::chrono::duration_cast<std::chrono::milliseconds>(now - started).count()));
        }

        std::unique_lock<std::mutex> lock(cycle_mutex_);
        cycle_cv_.wait_until(lock, next_due, [this]() { return !running_.load(std::memory_order_acquire); });
    }
}

bool OptionPreloader::run_cycle() {
    if (cycle_active_.exchange(true, std::memory_order_acq_rel)) {
        cycles_skipped_.fetch_add(1, std::memory_order_relaxed);
        LOG_WARN(logger_, Preloader, "previous cycle still running, skipping");
        return false;
    }

    for (const auto& symbol : config_.symbols) {
        try {
            preload_symbol(symbol);
        } catch (const std::exception& e) {
            LOGF_WARN(logger_, Preloader, "failed to preload %s: %s", symbol.c_str(), e.what());
        }
    }

    cycles_completed_.fetch_add(1, std::memory_order_relaxed);
    cycle_active_.store(false, std::memory_order_release);
    return true;
}

void OptionPreloader::preload_symbol(const std::string& symbol) {
    // 1. Chain parameters
    std::vector<ChainParams> params = chains_.get_chain(symbol);
    if (params.empty()) {
        LOGF_WARN(logger_, Preloader, "no chain params for %s", symbol.c_str());
        return;
    }

    // 2. Spot price; a failed quote is not fatal
    std::optional<Money> price;
    try {
        StockQuote q = quotes_.get_stock_quote(symbol);
        if (q.last > 0) {
            price = q.last;
        } else if (q.bid > 0 && q.ask > 0) {
            price = (q.bid + q.ask) / 2.0;
        }
    } catch (const DeskError& e) {
        LOGF_DEBUG(logger_, Preloader, "quote for %s unavailable: %s", symbol.c_str(), e.what());
    }
    if (price) {
        std::lock_guard<std::mutex> lock(price_mutex_);
        prices_[symbol] = *price;
    }

    // 3. Window
    auto expirations = select_expirations(ChainCache::all_expirations(params), config_.num_expirations);
    std::vector<double> all_strikes;
    {
        std::set<StrikeKey> seen;
        for (const auto& p : params) {
            for (double s : p.strikes) {
                if (seen.insert(strike_key(s)).second) all_strikes.push_back(s);
            }
        }
        std::sort(all_strikes.begin(), all_strikes.end());
    }
    auto strikes = select_strikes(all_strikes, price, config_.strike_radius, config_.fallback_half_width);
    if (expirations.empty() || strikes.empty()) {
        LOGF_WARN(logger_, Preloader, "%s: empty preload window", symbol.c_str());
        return;
    }

    for (const auto& exp : expirations) {
        std::string classes;
        for (const auto& p : params) {
            if (p.has_expiry(exp)) {
                classes += (classes.empty() ? "" : ", ") + p.exchange + "/" + p.trading_class;
            }
        }
        LOGF_DEBUG(logger_, Preloader, "expiry %s listed in %s", exp.c_str(), classes.c_str());
    }

    // 4. Greeks, one expiration at a time
    for (const auto& exp : expirations) {
        try {
            auto greeks = collector_.get_option_greeks(symbol, exp, strikes, true);
            size_t with_price = static_cast<size_t>(
                std::count_if(greeks.begin(), greeks.end(), [](const OptionGreek& g) { return g.bid > 0 || g.ask > 0; }));
            LOGF_INFO(logger_, Preloader, "cached %s %s: %zu/%zu with data", symbol.c_str(), exp.c_str(), with_price,
                      greeks.size());
        } catch (const DeskError& e) {
            LOGF_WARN(logger_, Preloader, "greeks error for %s %s: %s", symbol.c_str(), exp.c_str(), e.what());
        }
    }
}

// =============================================================================
// On-demand
// =============================================================================

bool OptionPreloader::request_preload(const std::string& symbol, const std::string& expiry,
                                      const std::vector<double>& strikes) {
    const std::string sym = util::to_upper(symbol);
    LOGF_INFO(logger_, Preloader, "on-demand preload: %s %s (%zu strikes)", sym.c_str(), expiry.c_str(),
              strikes.size());
    try {
        collector_.get_option_greeks(sym, expiry, strikes, true);
        on_demand_completed_.fetch_add(1, std::memory_order_relaxed);
        return true;
    } catch (const DeskError& e) {
        LOGF_WARN(logger_, Preloader, "on-demand failed: %s %s: %s", sym.c_str(), expiry.c_str(), e.what());
        return false;
    }
}

void OptionPreloader::enqueue_preload(const std::string& symbol, const std::string& expiry,
                                      const std::vector<double>& strikes) {
    const std::string sym = util::to_upper(symbol);
    const std::string key = sym + "|" + expiry;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (queue_stopping_) return;
        auto it = queued_.find(key);
        if (it != queued_.end()) {
            auto& merged = it->second.strikes;
            for (double s : strikes) {
                bool present = std::any_of(merged.begin(), merged.end(),
                                           [s](double m) { return strike_key(m) == strike_key(s); });
                if (!present) merged.push_back(s);
            }
            return;
        }
        queued_.emplace(key, OnDemand{sym, expiry, strikes});
        queue_order_.push_back(key);
    }
    queue_cv_.notify_one();
}

void OptionPreloader::on_demand_loop() {
    while (true) {
        OnDemand job;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this]() { return queue_stopping_ || !queue_order_.empty(); });
            if (queue_stopping_) return;
            std::string key = queue_order_.front();
            queue_order_.pop_front();
            job = std::move(queued_.at(key));
            queued_.erase(key);
        }
        request_preload(job.symbol, job.expiry, job.strikes);
    }
}

std::optional<Money> OptionPreloader::cached_price(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(price_mutex_);
    auto it = prices_.find(util::to_upper(symbol));
    if (it == prices_.end()) return std::nullopt;
    return it->second;
}

// =============================================================================
// Selection
// =============================================================================

std::vector<std::string> OptionPreloader::select_expirations(const std::vector<std::string>& sorted_expirations,
                                                             size_t n) {
    size_t count = std::min(n, sorted_expirations.size());
    return {sorted_expirations.begin(), sorted_expirations.begin() + static_cast<std::ptrdiff_t>(count)};
}

std::vector<double> OptionPreloader::select_strikes(const std::vector<double>& strikes, std::optional<Money> price,
                                                    size_t radius, size_t fallback_half_width) {
    // Standard strikes only: whole or half dollar
    std::vector<double> standard;
    for (double s : strikes) {
        if (strike_key(s) % 500 == 0) standard.push_back(s);
    }
    std::sort(standard.begin(), standard.end());
    if (standard.empty()) return standard;

    const size_t n = standard.size();
    size_t start = 0;
    size_t end = 0;
    if (price) {
        auto it = std::lower_bound(standard.begin(), standard.end(), *price);
        size_t center = it == standard.end() ? n - 1 : static_cast<size_t>(it - standard.begin());
        start = center > radius ? center - radius : 0;
        end = std::min(n, center + radius + 1);
    } else {
        size_t mid = n / 2;
        start = mid > fallback_half_width ? mid - fallback_half_width : 0;
        end = std::min(n, mid + fallback_half_width + 1);
    }
    return {standard.begin() + static_cast<std::ptrdiff_t>(start), standard.begin() + static_cast<std::ptrdiff_t>(end)};
}

}  // namespace rolldesk::market
