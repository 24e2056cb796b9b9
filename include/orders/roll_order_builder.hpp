#pragma once

#include "../core/request_correlator.hpp"
#include "../gateway/igateway.hpp"
#include "../logging/async_logger.hpp"
#include "../market/contract_resolver.hpp"
#include "combo_order.hpp"
#include "order_tracker.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace rolldesk {
namespace orders {

/**
 * RollOrderBuilder - resolves both legs, then submits one combo per account
 *
 * All-or-nothing per leg pair: both contract ids are resolved concurrently
 * before anything is sent, and if either fails no order is placed
 * (LegResolutionFailedError). A combo with a single resolved leg would leave
 * an unintended naked position.
 *
 * Each order gets a fresh id from the correlator's order range; the combo
 * description is kept by order id because the gateway never echoes a
 * readable label. Every order is registered with the tracker before it is
 * sent, so its status events find the account and label.
 */
class RollOrderBuilder {
public:
    RollOrderBuilder(gateway::IGateway& gateway, core::RequestCorrelator& correlator,
                     market::ContractResolver& resolver, OrderTracker& tracker, logging::AsyncLogger& logger);

    /**
     * Throws DeskError(InvalidRequest) for a malformed request,
     * NotConnectedError, or LegResolutionFailedError.
     */
    std::vector<OrderStatusUpdate> place_roll_order(const RollOrderRequest& request,
                                                    const AccountQuantities& quantities);

    std::optional<std::string> combo_description(OrderId order_id) const;

    uint64_t orders_placed() const;

private:
    gateway::IGateway& gateway_;
    core::RequestCorrelator& correlator_;
    market::ContractResolver& resolver_;
    OrderTracker& tracker_;
    logging::AsyncLogger& logger_;

    mutable std::mutex mutex_;
    std::unordered_map<OrderId, std::string> descriptions_;
    uint64_t orders_placed_ = 0;
};

}  // namespace orders
}  // namespace rolldesk
