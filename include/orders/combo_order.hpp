#pragma once

#include "../gateway/gateway_types.hpp"
#include "../types.hpp"
#include "../util/time_utils.hpp"

#include <cmath>
#include <cstdint>
#include <map>
#include <string>

namespace rolldesk {
namespace orders {

struct RollLeg {
    std::string expiry;  // YYYYMMDD
    double strike = 0.0;
    OptionRight right = OptionRight::Put;
};

/**
 * One roll: close an existing option position and open another on the same
 * underlying, as a single two-leg combo at one net limit price.
 */
struct RollOrderRequest {
    std::string symbol;
    RollLeg close_leg;
    RollLeg open_leg;
    PositionDirection direction = PositionDirection::Short;  // of the position being closed
    Money limit_price = 0.0;                                 // net, per combo
    bool outside_rth = true;
    std::string exchange = "SMART";
};

// account id -> number of combos; accounts with quantity <= 0 are skipped
using AccountQuantities = std::map<std::string, int64_t>;

struct OrderStatusUpdate {
    OrderId order_id = 0;
    std::string account;
    std::string status;
    double filled = 0.0;
    double remaining = 0.0;
    Money avg_fill_price = 0.0;
    std::string symbol;
};

/// Buy to close a short, sell to close a long
inline OrderAction close_action(PositionDirection direction) {
    return direction == PositionDirection::Short ? OrderAction::Buy : OrderAction::Sell;
}

/**
 * Two-leg BAG contract; the open leg always trades opposite to the close leg.
 */
inline gateway::Contract build_combo_contract(const RollOrderRequest& request, ContractId close_con_id,
                                              ContractId open_con_id) {
    gateway::Contract combo;
    combo.symbol = request.symbol;
    combo.sec_type = gateway::SecType::Combo;
    combo.exchange = request.exchange;
    combo.currency = "USD";

    OrderAction close = close_action(request.direction);

    gateway::ComboLeg leg1;
    leg1.con_id = close_con_id;
    leg1.ratio = 1;
    leg1.action = close;
    leg1.exchange = request.exchange;

    gateway::ComboLeg leg2;
    leg2.con_id = open_con_id;
    leg2.ratio = 1;
    leg2.action = inverse(close);
    leg2.exchange = request.exchange;

    combo.legs = {leg1, leg2};
    return combo;
}

inline std::string describe_leg(const RollLeg& leg) {
    return util::format_expiry_short(leg.expiry) + " " + format_strike(leg.strike) + right_to_char(leg.right);
}

/**
 * "+Mar7 590P → -Mar14 585P": '+' marks the leg bought, '-' the leg sold.
 */
inline std::string describe_roll(const RollOrderRequest& request) {
    const bool short_position = request.direction == PositionDirection::Short;
    std::string close_prefix = short_position ? "+" : "-";
    std::string open_prefix = short_position ? "-" : "+";
    return close_prefix + describe_leg(request.close_leg) + " → " + open_prefix + describe_leg(request.open_leg);
}

/// Empty when valid, otherwise the first problem found
inline std::string validate(const RollOrderRequest& request) {
    if (request.symbol.empty()) return "symbol is empty";
    if (!util::is_valid_expiry(request.close_leg.expiry)) return "close leg expiry is not YYYYMMDD";
    if (!util::is_valid_expiry(request.open_leg.expiry)) return "open leg expiry is not YYYYMMDD";
    if (!(request.close_leg.strike > 0)) return "close leg strike must be positive";
    if (!(request.open_leg.strike > 0)) return "open leg strike must be positive";
    if (!std::isfinite(request.limit_price)) return "limit price is not a number";
    if (request.close_leg.expiry == request.open_leg.expiry &&
        strike_key(request.close_leg.strike) == strike_key(request.open_leg.strike) &&
        request.close_leg.right == request.open_leg.right) {
        return "close and open legs are the same contract";
    }
    return "";
}

}  // namespace orders
}  // namespace rolldesk
