#include "../../include/orders/batch_order_builder.hpp"

#include "../../include/core/errors.hpp"
#include "../../include/util/string_utils.hpp"
#include "../../include/util/time_utils.hpp"

#include <cmath>

namespace rolldesk::orders {

namespace {

/// Empty when the price fits the order type
std::string check_price(gateway::OrderType type, Money limit_price) {
    if (type != gateway::OrderType::Limit) return "";
    if (!std::isfinite(limit_price) || limit_price <= 0.0) return "limit order needs a positive limit price";
    return "";
}

gateway::Order base_order(OrderAction action, gateway::OrderType type, Money limit_price, bool outside_rth) {
    gateway::Order order;
    order.action = action;
    order.order_type = type;
    order.limit_price = type == gateway::OrderType::Limit ? limit_price : 0.0;
    order.transmit = true;
    order.outside_rth = outside_rth;
    return order;
}

}  // namespace

BatchOrderBuilder::BatchOrderBuilder(gateway::IGateway& gateway, core::RequestCorrelator& correlator,
                                     OrderTracker& tracker, logging::AsyncLogger& logger)
    : gateway_(gateway), correlator_(correlator), tracker_(tracker), logger_(logger) {}

std::vector<OrderStatusUpdate> BatchOrderBuilder::place_batch_orders(const BatchOrderRequest& raw_request,
                                                                     const AccountQuantities& quantities) {
    BatchOrderRequest request = raw_request;
    request.symbol = util::to_upper(util::trim(request.symbol));

    std::string problem = request.symbol.empty() ? "symbol is empty" : check_price(request.order_type,
                                                                                    request.limit_price);
    if (!problem.empty()) {
        throw DeskError(ErrorCode::InvalidRequest, "batch " + request.symbol + ": " + problem);
    }
    if (!gateway_.is_connected()) {
        throw NotConnectedError("batch order " + request.symbol);
    }

    gateway::Contract contract = gateway::Contract::stock(request.symbol);
    return place_per_account(contract,
                             base_order(request.action, request.order_type, request.limit_price,
                                        request.outside_rth),
                             request.symbol, quantities);
}

std::vector<OrderStatusUpdate> BatchOrderBuilder::place_option_batch_orders(const OptionBatchOrderRequest& raw_request,
                                                                            const AccountQuantities& quantities) {
    OptionBatchOrderRequest request = raw_request;
    request.symbol = util::to_upper(util::trim(request.symbol));

    std::string problem;
    if (request.symbol.empty()) problem = "symbol is empty";
    else if (!util::is_valid_expiry(request.expiry)) problem = "expiry is not YYYYMMDD";
    else if (!(request.strike > 0)) problem = "strike must be positive";
    else problem = check_price(request.order_type, request.limit_price);
    if (!problem.empty()) {
        throw DeskError(ErrorCode::InvalidRequest, "option batch " + request.symbol + ": " + problem);
    }
    if (!gateway_.is_connected()) {
        throw NotConnectedError("option batch order " + request.symbol);
    }

    gateway::Contract contract = gateway::Contract::option(request.symbol, request.expiry, request.strike,
                                                           request.right, request.exchange);
    contract.multiplier = "100";
    return place_per_account(contract,
                             base_order(request.action, request.order_type, request.limit_price,
                                        request.outside_rth),
                             describe_option(request), quantities);
}

std::vector<OrderStatusUpdate> BatchOrderBuilder::place_per_account(const gateway::Contract& contract,
                                                                    const gateway::Order& base,
                                                                    const std::string& label,
                                                                    const AccountQuantities& quantities) {
    std::vector<OrderStatusUpdate> results;
    for (const auto& [account, qty] : quantities) {
        if (qty <= 0) continue;

        OrderId order_id = correlator_.allocate_id(core::RequestCategory::Order);
        gateway::Order order = base;
        order.total_quantity = static_cast<double>(qty);
        order.account = account;

        tracker_.track(order_id, account, label, order.total_quantity);
        gateway_.place_order(order_id, contract, order);

        OrderStatusUpdate update;
        update.order_id = order_id;
        update.account = account;
        update.status = "PendingSubmit";
        update.remaining = order.total_quantity;
        update.symbol = label;
        results.push_back(std::move(update));

        LOGF_INFO(logger_, Orders, "placed order #%lld for %s: %s %lld %s %s", static_cast<long long>(order_id),
                  account.c_str(), action_to_string(order.action), static_cast<long long>(qty), label.c_str(),
                  gateway::order_type_to_string(order.order_type));
    }
    if (results.empty()) {
        LOGF_WARN(logger_, Orders, "batch %s: no account with a positive quantity", label.c_str());
    }
    return results;
}

}  // namespace rolldesk::orders
