#pragma once

#include "../core/request_correlator.hpp"
#include "../gateway/igateway.hpp"
#include "../logging/async_logger.hpp"
#include "combo_order.hpp"
#include "order_tracker.hpp"

#include <string>
#include <vector>

namespace rolldesk {
namespace orders {

struct BatchOrderRequest {
    std::string symbol;
    OrderAction action = OrderAction::Buy;
    gateway::OrderType order_type = gateway::OrderType::Market;
    Money limit_price = 0.0;  // required for limit orders
    bool outside_rth = false;
};

struct OptionBatchOrderRequest {
    std::string symbol;
    std::string expiry;  // YYYYMMDD
    double strike = 0.0;
    OptionRight right = OptionRight::Call;
    OrderAction action = OrderAction::Buy;
    gateway::OrderType order_type = gateway::OrderType::Limit;
    Money limit_price = 0.0;
    std::string exchange = "SMART";
    bool outside_rth = false;
};

/// "QQQ 20250321 590P"
inline std::string describe_option(const OptionBatchOrderRequest& request) {
    return request.symbol + " " + request.expiry + " " + format_strike(request.strike) + right_to_char(request.right);
}

/**
 * BatchOrderBuilder - one single-leg order per account
 *
 * The same stock or option order is sent for every account with a positive
 * quantity; each gets its own id from the order range and is registered with
 * the tracker. Nothing waits for the gateway: the returned updates are the
 * PendingSubmit state, later statuses reach the tracker's listeners.
 */
class BatchOrderBuilder {
public:
    BatchOrderBuilder(gateway::IGateway& gateway, core::RequestCorrelator& correlator, OrderTracker& tracker,
                      logging::AsyncLogger& logger);

    /// Throws DeskError(InvalidRequest) for a malformed request, NotConnectedError
    std::vector<OrderStatusUpdate> place_batch_orders(const BatchOrderRequest& request,
                                                      const AccountQuantities& quantities);

    std::vector<OrderStatusUpdate> place_option_batch_orders(const OptionBatchOrderRequest& request,
                                                             const AccountQuantities& quantities);

private:
    std::vector<OrderStatusUpdate> place_per_account(const gateway::Contract& contract, const gateway::Order& base,
                                                     const std::string& label, const AccountQuantities& quantities);

    gateway::IGateway& gateway_;
    core::RequestCorrelator& correlator_;
    OrderTracker& tracker_;
    logging::AsyncLogger& logger_;
};

}  // namespace orders
}  // namespace rolldesk
