#include "../../include/market/snapshot_collector.hpp"

#include "../../include/core/errors.hpp"
#include "../../include/util/string_utils.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <utility>

namespace rolldesk::market {

using core::TimerService;

struct SnapshotCollector::Batch {
    std::string symbol;
    std::string expiry;
    std::string key;
    std::set<StrikeKey> strike_keys;

    // Send order; contracts[i] belongs to ids[i]
    std::vector<RequestId> ids;
    std::vector<gateway::Contract> contracts;
    std::unordered_map<RequestId, PairKey> pairs;
    std::map<PairKey, OptionGreek> records;

    std::set<RequestId> done;
    size_t next_to_send = 0;
    size_t errors = 0;
    uint64_t ticks = 0;
    uint64_t settle_generation = 0;
    bool finished = false;

    TimerService::TimerId settle_timer = TimerService::INVALID_TIMER;
    TimerService::TimerId hard_timer = TimerService::INVALID_TIMER;
    TimerService::TimerId burst_timer = TimerService::INVALID_TIMER;
    std::chrono::steady_clock::time_point started;

    std::promise<BatchResult> promise;
    std::shared_future<BatchResult> future;
    std::mutex mutex;
};

SnapshotCollector::SnapshotCollector(gateway::IGateway& gateway, core::RequestCorrelator& correlator,
                                     core::TimerService& timers, GreeksCache& cache, const ChainCache& chains,
                                     logging::AsyncLogger& logger, SnapshotConfig config)
    : gateway_(gateway), correlator_(correlator), timers_(timers), cache_(cache), chains_(chains), logger_(logger),
      config_(std::move(config)), batches_started_(0), batches_finished_(0) {
    if (config_.burst_size == 0) {
        throw ConfigError("snapshot burst size must be positive");
    }
}

SnapshotCollector::~SnapshotCollector() {
    std::vector<std::shared_ptr<Batch>> open;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [key, batches] : in_flight_) {
            open.insert(open.end(), batches.begin(), batches.end());
        }
    }
    // Waiters get whatever arrived so far
    for (auto& batch : open) {
        finish(batch, BatchOutcome::HardTimeout);
    }
}

void SnapshotCollector::set_stale_hook(StaleHook hook) {
    std::lock_guard<std::mutex> lock(mutex_);
    stale_hook_ = std::move(hook);
}

size_t SnapshotCollector::in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = 0;
    for (const auto& [key, batches] : in_flight_) {
        n += batches.size();
    }
    return n;
}

// =============================================================================
// Cache-first read
// =============================================================================

std::vector<OptionGreek> SnapshotCollector::get_option_greeks(const std::string& symbol, const std::string& expiry,
                                                              const std::vector<double>& strikes,
                                                              bool force_refresh) {
    const std::string sym = util::to_upper(symbol);

    if (!force_refresh) {
        GreeksLookup lookup = cache_.lookup(sym, expiry, strikes);
        if (lookup.state == CacheState::Fresh) {
            return std::move(lookup.greeks);
        }
        if (lookup.state == CacheState::Stale) {
            LOGF_DEBUG(logger_, Greeks, "%s %s stale (%lld ms), serving cached %zu records", sym.c_str(),
                       expiry.c_str(), static_cast<long long>(lookup.age_ms), lookup.greeks.size());
            StaleHook hook;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                hook = stale_hook_;
            }
            if (hook) {
                hook(sym, expiry, strikes);
            }
            return std::move(lookup.greeks);
        }
    }

    BatchResult result = fetch(sym, expiry, strikes).get();

    // A joined batch may cover more strikes than asked for
    std::set<StrikeKey> wanted;
    for (double s : strikes) {
        wanted.insert(strike_key(s));
    }
    std::vector<OptionGreek> out;
    for (const auto& g : result.greeks) {
        if (wanted.count(g.key())) out.push_back(g);
    }
    return out;
}

// =============================================================================
// Batch lifecycle
// =============================================================================

std::shared_future<BatchResult> SnapshotCollector::fetch(const std::string& symbol, const std::string& expiry,
                                                         const std::vector<double>& strikes) {
    const std::string sym = util::to_upper(symbol);

    std::set<StrikeKey> keys;
    std::vector<double> unique_strikes;
    for (double s : strikes) {
        if (keys.insert(strike_key(s)).second) unique_strikes.push_back(s);
    }
    std::sort(unique_strikes.begin(), unique_strikes.end());

    if (unique_strikes.empty()) {
        std::promise<BatchResult> empty;
        empty.set_value(BatchResult{});
        return empty.get_future().share();
    }

    auto batch = std::make_shared<Batch>();
    batch->symbol = sym;
    batch->expiry = expiry;
    batch->key = sym + "|" + expiry;
    batch->strike_keys = keys;
    batch->future = batch->promise.get_future().share();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = in_flight_.find(batch->key);
        if (it != in_flight_.end()) {
            for (const auto& running : it->second) {
                if (std::includes(running->strike_keys.begin(), running->strike_keys.end(), keys.begin(),
                                  keys.end())) {
                    LOGF_DEBUG(logger_, Greeks, "joining in-flight batch for %s", batch->key.c_str());
                    return running->future;
                }
            }
        }

        if (!gateway_.is_connected()) {
            throw NotConnectedError("option greeks " + batch->key);
        }

        for (double strike : unique_strikes) {
            for (OptionRight right : {OptionRight::Call, OptionRight::Put}) {
                RequestId id = correlator_.allocate_id(core::RequestCategory::Quote);
                auto contract = gateway::Contract::option(sym, expiry, strike, right, config_.exchange);
                contract.trading_class = chains_.find_trading_class(sym, expiry, strike);

                OptionGreek record;
                record.strike = strike;
                record.right = right;
                record.expiry = expiry;

                PairKey pair{strike_key(strike), right};
                batch->ids.push_back(id);
                batch->contracts.push_back(std::move(contract));
                batch->pairs.emplace(id, pair);
                batch->records.emplace(pair, record);
            }
        }
        in_flight_[batch->key].push_back(batch);
    }
    batches_started_.fetch_add(1, std::memory_order_relaxed);

    // Per-request ceiling sits past the batch ceiling; the hard timer normally wins
    const auto request_timeout = config_.hard_timeout + config_.settle;
    for (RequestId id : batch->ids) {
        correlator_.register_request(
            id, core::RequestCategory::Quote,
            [this, batch, id](const gateway::GatewayEvent& event) { on_event(batch, id, event); },
            [this, batch, id]() { mark_done(batch, id); }, request_timeout);
    }

    {
        std::lock_guard<std::mutex> lock(batch->mutex);
        batch->started = std::chrono::steady_clock::now();
        batch->hard_timer = timers_.schedule_after(config_.hard_timeout,
                                                   [this, batch]() { finish(batch, BatchOutcome::HardTimeout); });
    }

    LOGF_INFO(logger_, Greeks, "requesting greeks for %s %s: %zu strikes x 2 = %zu contracts (ids %lld-%lld)",
              sym.c_str(), expiry.c_str(), unique_strikes.size(), batch->ids.size(),
              static_cast<long long>(batch->ids.front()), static_cast<long long>(batch->ids.back()));

    // Settle timer is not armed here: the first tick can take several seconds
    send_next_burst(batch);
    return batch->future;
}

void SnapshotCollector::send_next_burst(const std::shared_ptr<Batch>& batch) {
    std::vector<std::pair<RequestId, gateway::Contract>> burst;
    {
        std::lock_guard<std::mutex> lock(batch->mutex);
        if (batch->finished) return;
        batch->burst_timer = TimerService::INVALID_TIMER;

        size_t end = std::min(batch->next_to_send + config_.burst_size, batch->ids.size());
        for (size_t i = batch->next_to_send; i < end; ++i) {
            burst.emplace_back(batch->ids[i], batch->contracts[i]);
        }
        batch->next_to_send = end;
    }

    // Another component may have switched the type since the last burst
    gateway_.req_market_data_type(gateway::MarketDataType::Frozen);
    for (const auto& [id, contract] : burst) {
        gateway_.req_market_data(id, contract, true);
    }

    std::lock_guard<std::mutex> lock(batch->mutex);
    if (batch->finished || batch->next_to_send >= batch->ids.size()) return;
    batch->burst_timer = timers_.schedule_after(config_.burst_delay, [this, batch]() { send_next_burst(batch); });
}

void SnapshotCollector::on_event(const std::shared_ptr<Batch>& batch, RequestId id,
                                 const gateway::GatewayEvent& event) {
    if (std::holds_alternative<gateway::SnapshotEndEvent>(event)) {
        mark_done(batch, id);
        return;
    }

    if (const auto* err = std::get_if<gateway::GatewayErrorEvent>(&event)) {
        if (gateway::is_informational_error(err->code)) return;
        size_t errors = 0;
        std::string label;
        {
            std::lock_guard<std::mutex> lock(batch->mutex);
            if (batch->finished) return;
            errors = ++batch->errors;
            auto pit = batch->pairs.find(id);
            if (pit != batch->pairs.end()) {
                const OptionGreek& rec = batch->records[pit->second];
                label = format_strike(rec.strike) + right_to_char(rec.right);
            }
        }
        // No data for this contract; siblings carry on
        if (errors <= 3) {
            LOGF_WARN(logger_, Greeks, "%s %s %s: code=%d %s", batch->symbol.c_str(), batch->expiry.c_str(),
                      label.c_str(), err->code, err->message.c_str());
        }
        mark_done(batch, id);
        return;
    }

    std::lock_guard<std::mutex> lock(batch->mutex);
    if (batch->finished) return;
    auto pit = batch->pairs.find(id);
    if (pit == batch->pairs.end()) return;
    OptionGreek& rec = batch->records[pit->second];

    if (const auto* price = std::get_if<gateway::TickPriceEvent>(&event)) {
        apply_tick_price(rec, price->tick_type, price->value);
    } else if (const auto* size = std::get_if<gateway::TickSizeEvent>(&event)) {
        apply_tick_size(rec, size->tick_type, size->size);
    } else if (const auto* comp = std::get_if<gateway::TickOptionComputationEvent>(&event)) {
        apply_option_computation(rec, *comp);
    } else {
        return;
    }

    if (++batch->ticks == 1) {
        LOGF_DEBUG(logger_, Greeks, "%s %s: first tick after %lld ms", batch->symbol.c_str(), batch->expiry.c_str(),
                   static_cast<long long>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                              std::chrono::steady_clock::now() - batch->started)
                                              .count()));
    }
    arm_settle_locked(batch);
}

void SnapshotCollector::arm_settle_locked(const std::shared_ptr<Batch>& batch) {
    timers_.cancel(batch->settle_timer);
    uint64_t generation = ++batch->settle_generation;
    batch->settle_timer = timers_.schedule_after(config_.settle, [this, batch, generation]() {
        {
            std::lock_guard<std::mutex> lock(batch->mutex);
            // A tick re-armed the timer while this callback was already due
            if (batch->settle_generation != generation) return;
        }
        finish(batch, BatchOutcome::Settled);
    });
}

void SnapshotCollector::mark_done(const std::shared_ptr<Batch>& batch, RequestId id) {
    bool all_done = false;
    {
        std::lock_guard<std::mutex> lock(batch->mutex);
        if (batch->finished) return;
        if (!batch->done.insert(id).second) return;
        all_done = batch->done.size() == batch->ids.size();
    }
    correlator_.complete(id);
    if (all_done) {
        finish(batch, BatchOutcome::AllCompleted);
    }
}

void SnapshotCollector::finish(const std::shared_ptr<Batch>& batch, BatchOutcome outcome) {
    BatchResult result;
    std::vector<RequestId> to_cancel;
    std::vector<RequestId> all_ids;
    std::vector<TimerService::TimerId> timers;
    {
        std::lock_guard<std::mutex> lock(batch->mutex);
        if (batch->finished) return;
        batch->finished = true;

        timers = {batch->settle_timer, batch->hard_timer, batch->burst_timer};
        batch->settle_timer = batch->hard_timer = batch->burst_timer = TimerService::INVALID_TIMER;

        for (size_t i = 0; i < batch->next_to_send; ++i) {
            if (!batch->done.count(batch->ids[i])) to_cancel.push_back(batch->ids[i]);
        }
        all_ids = batch->ids;

        result.greeks.reserve(batch->records.size());
        for (const auto& [pair, rec] : batch->records) {
            result.greeks.push_back(rec);
            if (rec.has_data()) ++result.stats.with_data;
        }
        result.stats.outcome = outcome;
        result.stats.requests = batch->ids.size();
        result.stats.sent = batch->next_to_send;
        result.stats.completed = batch->done.size();
        result.stats.errors = batch->errors;
        result.stats.ticks = batch->ticks;
        result.stats.elapsed_ms =
            std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - batch->started)
                .count();
    }

    for (auto timer : timers) {
        timers_.cancel(timer);
    }
    for (RequestId id : to_cancel) {
        gateway_.cancel_market_data(id);
    }
    for (RequestId id : all_ids) {
        correlator_.complete(id);
    }

    std::sort(result.greeks.begin(), result.greeks.end(), greek_order);
    cache_.merge(batch->symbol, batch->expiry, result.greeks);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = in_flight_.find(batch->key);
        if (it != in_flight_.end()) {
            auto& list = it->second;
            list.erase(std::remove(list.begin(), list.end(), batch), list.end());
            if (list.empty()) in_flight_.erase(it);
        }
    }
    batches_finished_.fetch_add(1, std::memory_order_relaxed);

    LOGF_INFO(logger_, Greeks, "%s %s finished (%s) in %lld ms: %zu/%zu with data, %zu completed, %zu errors",
              batch->symbol.c_str(), batch->expiry.c_str(), batch_outcome_to_string(outcome),
              static_cast<long long>(result.stats.elapsed_ms), result.stats.with_data, result.stats.requests,
              result.stats.completed, result.stats.errors);

    batch->promise.set_value(std::move(result));
}

}  // namespace rolldesk::market
