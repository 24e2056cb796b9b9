#pragma once

#include "../config/defaults.hpp"
#include "../core/request_correlator.hpp"
#include "../core/timer_service.hpp"
#include "../gateway/igateway.hpp"
#include "../logging/async_logger.hpp"
#include "chain_cache.hpp"
#include "greeks_cache.hpp"
#include "option_greek.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace rolldesk {
namespace market {

struct SnapshotConfig {
    size_t burst_size = config::snapshot::BURST_SIZE;
    std::chrono::milliseconds burst_delay{config::snapshot::BURST_DELAY_MS};
    std::chrono::milliseconds settle{config::snapshot::SETTLE_MS};
    std::chrono::milliseconds hard_timeout{config::snapshot::HARD_TIMEOUT_MS};
    std::string exchange = "SMART";
};

// What ended a batch
enum class BatchOutcome : uint8_t { AllCompleted = 0, Settled, HardTimeout };

inline const char* batch_outcome_to_string(BatchOutcome outcome) {
    switch (outcome) {
    case BatchOutcome::AllCompleted:
        return "all-completed";
    case BatchOutcome::Settled:
        return "settled";
    case BatchOutcome::HardTimeout:
        return "hard-timeout";
    }
    return "?";
}

struct BatchStats {
    BatchOutcome outcome = BatchOutcome::AllCompleted;
    size_t requests = 0;
    size_t sent = 0;
    size_t completed = 0;  // snapshot_end or error
    size_t errors = 0;
    size_t with_data = 0;
    uint64_t ticks = 0;
    int64_t elapsed_ms = 0;
};

struct BatchResult {
    std::vector<OptionGreek> greeks;  // every requested pair, strike asc, call before put
    BatchStats stats;
};

/**
 * SnapshotCollector - batched option snapshots with dual-timer completion
 *
 * For (symbol, expiry, strikes) one snapshot request is sent per
 * (strike, right), in bursts of burst_size separated by burst_delay, with the
 * market data type switched to Frozen before every burst. Ticks merge into a
 * per-pair record.
 *
 * Option snapshots have no reliable "all reported" signal, so a batch ends on
 * the first of:
 *   - every request reported snapshot_end or a (non-informational) error
 *   - settle timer: no tick for `settle`; armed by the first tick, re-armed
 *     by every tick
 *   - hard timeout: `hard_timeout` after the batch started
 *
 * Finalisation runs exactly once: still-open requests are cancelled, every
 * id is released from the correlator, records are sorted and merged into the
 * GreeksCache, and the shared future is fulfilled.
 *
 * A caller that stops waiting does not cancel anything; the batch still
 * lands in the cache.
 */
class SnapshotCollector {
public:
    using StaleHook =
        std::function<void(const std::string& symbol, const std::string& expiry, const std::vector<double>& strikes)>;

    SnapshotCollector(gateway::IGateway& gateway, core::RequestCorrelator& correlator, core::TimerService& timers,
                      GreeksCache& cache, const ChainCache& chains, logging::AsyncLogger& logger,
                      SnapshotConfig config = {});
    ~SnapshotCollector();

    SnapshotCollector(const SnapshotCollector&) = delete;
    SnapshotCollector& operator=(const SnapshotCollector&) = delete;

    /**
     * Cache-first greeks read.
     *
     * Fresh entry (and !force_refresh): cached subset, no gateway traffic.
     * Stale entry (and !force_refresh): cached subset, stale hook invoked so a
     *   background refresh can be queued.
     * Missing entry or force_refresh: blocks on a batch.
     *
     * Throws NotConnectedError only when a batch would have to be sent.
     */
    std::vector<OptionGreek> get_option_greeks(const std::string& symbol, const std::string& expiry,
                                               const std::vector<double>& strikes, bool force_refresh = false);

    /**
     * Start a batch, or join an in-flight batch for the same (symbol, expiry)
     * whose strikes cover the requested ones.
     */
    std::shared_future<BatchResult> fetch(const std::string& symbol, const std::string& expiry,
                                          const std::vector<double>& strikes);

    void set_stale_hook(StaleHook hook);

    size_t in_flight() const;
    uint64_t batches_started() const { return batches_started_.load(std::memory_order_relaxed); }
    uint64_t batches_finished() const { return batches_finished_.load(std::memory_order_relaxed); }
    const SnapshotConfig& config() const { return config_; }

private:
    struct Batch;

    void send_next_burst(const std::shared_ptr<Batch>& batch);
    void on_event(const std::shared_ptr<Batch>& batch, RequestId id, const gateway::GatewayEvent& event);
    void mark_done(const std::shared_ptr<Batch>& batch, RequestId id);
    void arm_settle_locked(const std::shared_ptr<Batch>& batch);
    void finish(const std::shared_ptr<Batch>& batch, BatchOutcome outcome);

    gateway::IGateway& gateway_;
    core::RequestCorrelator& correlator_;
    core::TimerService& timers_;
    GreeksCache& cache_;
    const ChainCache& chains_;
    logging::AsyncLogger& logger_;
    SnapshotConfig config_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<std::shared_ptr<Batch>>> in_flight_;
    StaleHook stale_hook_;

    std::atomic<uint64_t> batches_started_;
    std::atomic<uint64_t> batches_finished_;
};

}  // namespace market
}  // namespace rolldesk
