#include "../../include/orders/roll_order_builder.hpp"

#include "../../include/core/errors.hpp"
#include "../../include/util/string_utils.hpp"

#include <future>

namespace rolldesk::orders {

namespace {

struct LegOutcome {
    ContractId con_id = INVALID_CONTRACT_ID;
    std::string error;
};

LegOutcome await_leg(std::shared_future<ContractId>& future) {
    LegOutcome out;
    try {
        out.con_id = future.get();
    } catch (const std::exception& e) {
        // Anything the resolution threw, including a broken promise
        out.error = e.what();
    }
    return out;
}

}  // namespace

RollOrderBuilder::RollOrderBuilder(gateway::IGateway& gateway, core::RequestCorrelator& correlator,
                                   market::ContractResolver& resolver, OrderTracker& tracker,
                                   logging::AsyncLogger& logger)
    : gateway_(gateway), correlator_(correlator), resolver_(resolver), tracker_(tracker), logger_(logger) {}

std::vector<OrderStatusUpdate> RollOrderBuilder::place_roll_order(const RollOrderRequest& raw_request,
                                                                  const AccountQuantities& quantities) {
    RollOrderRequest request = raw_request;
    request.symbol = util::to_upper(request.symbol);

    std::string problem = validate(request);
    if (!problem.empty()) {
        throw DeskError(ErrorCode::InvalidRequest, "roll " + request.symbol + ": " + problem);
    }
    if (!gateway_.is_connected()) {
        throw NotConnectedError("roll order " + request.symbol);
    }

    std::vector<std::pair<std::string, int64_t>> targets;
    for (const auto& [account, qty] : quantities) {
        if (qty > 0) targets.emplace_back(account, qty);
    }
    if (targets.empty()) {
        LOGF_WARN(logger_, Orders, "roll %s: no account with a positive quantity", request.symbol.c_str());
        return {};
    }

    const std::string description = describe_roll(request);

    // Both resolutions are in flight before either is awaited
    auto close_future = resolver_.resolve_option_async(request.symbol, request.close_leg.expiry,
                                                       request.close_leg.strike, request.close_leg.right,
                                                       core::RequestCategory::Roll);
    auto open_future = resolver_.resolve_option_async(request.symbol, request.open_leg.expiry,
                                                      request.open_leg.strike, request.open_leg.right,
                                                      core::RequestCategory::Roll);

    LegOutcome close_leg = await_leg(close_future);
    LegOutcome open_leg = await_leg(open_future);

    if (!close_leg.error.empty() || !open_leg.error.empty()) {
        std::string detail = request.symbol + " " + description + ":";
        if (!close_leg.error.empty()) detail += " close leg: " + close_leg.error + ";";
        if (!open_leg.error.empty()) detail += " open leg: " + open_leg.error + ";";
        LOGF_ERROR(logger_, Orders, "roll aborted, nothing submitted: %s", detail.c_str());
        throw LegResolutionFailedError(detail);
    }

    gateway::Contract combo = build_combo_contract(request, close_leg.con_id, open_leg.con_id);

    const std::string label = request.symbol + " " + description;

    std::vector<OrderStatusUpdate> results;
    for (const auto& [account, qty] : targets) {
        OrderId order_id = correlator_.allocate_id(core::RequestCategory::Order);

        gateway::Order order;
        order.action = OrderAction::Buy;
        order.order_type = gateway::OrderType::Limit;
        order.total_quantity = static_cast<double>(qty);
        order.limit_price = request.limit_price;
        order.account = account;
        order.transmit = true;
        order.outside_rth = request.outside_rth;

        {
            std::lock_guard<std::mutex> lock(mutex_);
            descriptions_[order_id] = description;
            ++orders_placed_;
        }
        tracker_.track(order_id, account, label, order.total_quantity);
        gateway_.place_order(order_id, combo, order);

        OrderStatusUpdate update;
        update.order_id = order_id;
        update.account = account;
        update.status = "PendingSubmit";
        update.remaining = static_cast<double>(qty);
        update.symbol = label;
        results.push_back(std::move(update));

        LOGF_INFO(logger_, Orders, "placed roll #%lld for %s: %lldx %s %s @ %.2f", static_cast<long long>(order_id),
                  account.c_str(), static_cast<long long>(qty), request.symbol.c_str(), description.c_str(),
                  request.limit_price);
    }
    return results;
}

std::optional<std::string> RollOrderBuilder::combo_description(OrderId order_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = descriptions_.find(order_id);
    if (it == descriptions_.end()) return std::nullopt;
    return it->second;
}

uint64_t RollOrderBuilder::orders_placed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return orders_placed_;
}

}  // namespace rolldesk::orders
