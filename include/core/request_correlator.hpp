#pragma once

#include "../config/defaults.hpp"
#include "../gateway/gateway_events.hpp"
#include "../logging/async_logger.hpp"
#include "../types.hpp"
#include "errors.hpp"
#include "timer_service.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace rolldesk {
namespace core {

// =============================================================================
// Request categories
// =============================================================================

enum class RequestCategory : uint8_t { Quote = 0, Chain, Contract, Order, Roll, Account, History };

constexpr size_t REQUEST_CATEGORY_COUNT = 7;

inline const char* request_category_to_string(RequestCategory category) {
    switch (category) {
    case RequestCategory::Quote:
        return "quote";
    case RequestCategory::Chain:
        return "chain";
    case RequestCategory::Contract:
        return "contract";
    case RequestCategory::Order:
        return "order";
    case RequestCategory::Roll:
        return "roll";
    case RequestCategory::Account:
        return "account";
    case RequestCategory::History:
        return "history";
    }
    return "?";
}

/**
 * First id of every category range. Ranges are [base, base + width) and must
 * not overlap.
 */
struct CorrelatorConfig {
    int64_t range_width = config::ranges::RANGE_WIDTH;
    int64_t order_base = config::ranges::ORDER_BASE;
    int64_t quote_base = config::ranges::QUOTE_BASE;
    int64_t chain_base = config::ranges::CHAIN_BASE;
    int64_t contract_base = config::ranges::CONTRACT_BASE;
    int64_t roll_base = config::ranges::ROLL_BASE;
    int64_t account_base = config::ranges::ACCOUNT_BASE;
    int64_t history_base = config::ranges::HISTORY_BASE;

    int64_t base_of(RequestCategory category) const {
        switch (category) {
        case RequestCategory::Quote:
            return quote_base;
        case RequestCategory::Chain:
            return chain_base;
        case RequestCategory::Contract:
            return contract_base;
        case RequestCategory::Order:
            return order_base;
        case RequestCategory::Roll:
            return roll_base;
        case RequestCategory::Account:
            return account_base;
        case RequestCategory::History:
            return history_base;
        }
        return quote_base;
    }

    /// True when no two ranges intersect
    bool ranges_disjoint() const;
};

/**
 * RequestCorrelator - id allocation and per-id routing of gateway events
 *
 * Every pending request owns exactly one entry: an event handler, a timeout
 * handler and a timer. The entry is removed exactly once, either by complete()
 * or by its timer; whichever comes second is a no-op.
 *
 * Handlers are invoked without the correlator lock held. An event handler may
 * call complete() on its own id.
 *
 * Usage:
 *   auto id = correlator.allocate_id(RequestCategory::Quote);
 *   correlator.register_request(id, RequestCategory::Quote,
 *       [&](const GatewayEvent& e) { ... correlator.complete(id); },
 *       [&]() { ... },                      // timed out, entry already removed
 *       std::chrono::milliseconds(3000));
 *   gateway.req_market_data(id, contract, true);
 */
class RequestCorrelator {
public:
    using EventHandler = std::function<void(const gateway::GatewayEvent&)>;
    using TimeoutHandler = std::function<void()>;

    RequestCorrelator(TimerService& timers, logging::AsyncLogger& logger, CorrelatorConfig config = {});
    ~RequestCorrelator();

    RequestCorrelator(const RequestCorrelator&) = delete;
    RequestCorrelator& operator=(const RequestCorrelator&) = delete;

    /**
     * Next id in the category's range. Strictly increasing until the range is
     * exhausted, then wraps to the base, skipping ids that are still pending.
     */
    RequestId allocate_id(RequestCategory category);

    /**
     * Attach handlers to an id. A positive timeout is required; the timeout
     * handler runs on the timer thread after the entry has been removed.
     */
    void register_request(RequestId id, RequestCategory category, EventHandler on_event, TimeoutHandler on_timeout,
                          std::chrono::milliseconds timeout);

    /// Remove the entry and cancel its timer. Returns false if already gone.
    bool complete(RequestId id);

    /**
     * Route events of an id-less stream (managed accounts, positions, account
     * updates) to a pending id. Returns false when another pending request
     * already owns the stream. The binding ends with the request.
     */
    bool bind_stream(gateway::EventStream stream, RequestId id);

    /**
     * Route an event to the owner of its request id, or of its stream when the
     * event carries no id. Returns false if no owner.
     */
    bool dispatch(const gateway::GatewayEvent& event);

    /// Re-base the order range at the gateway's next valid order id (never backwards)
    void advance_order_ids(OrderId next_valid_id);

    bool is_pending(RequestId id) const;
    size_t pending_count() const;
    uint64_t timeout_count() const { return timeouts_.load(std::memory_order_relaxed); }
    const CorrelatorConfig& config() const { return config_; }

private:
    struct Pending {
        RequestId id;
        RequestCategory category;
        std::chrono::steady_clock::time_point created_at;
        EventHandler on_event;
        TimeoutHandler on_timeout;
        TimerService::TimerId timer = TimerService::INVALID_TIMER;
    };

    void on_timer(RequestId id);
    void unbind_locked(RequestId id);

    TimerService& timers_;
    logging::AsyncLogger& logger_;
    CorrelatorConfig config_;

    mutable std::mutex mutex_;
    std::unordered_map<RequestId, std::shared_ptr<Pending>> pending_;
    std::array<int64_t, REQUEST_CATEGORY_COUNT> next_ids_;
    std::array<RequestId, gateway::EVENT_STREAM_COUNT> stream_owners_{};
    std::atomic<uint64_t> timeouts_;
};

}  // namespace core
}  // namespace rolldesk
