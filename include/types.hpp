#pragma once

#include <cmath>
#include <cstdio>
#include <cstdint>
#include <limits>
#include <string>

namespace rolldesk {

// Gateway request ids and order ids share the same numeric space (int32 on the wire)
using RequestId = int64_t;
using OrderId = int64_t;
using ContractId = int64_t;
using Timestamp = uint64_t;

// Prices and greeks arrive from the gateway as doubles; 0 means "unknown"
using Money = double;

constexpr RequestId INVALID_REQUEST_ID = 0;
constexpr ContractId INVALID_CONTRACT_ID = 0;

// The gateway marks unset doubles with DBL_MAX; anything this large is not data
constexpr double GATEWAY_UNSET_THRESHOLD = 1e100;

enum class OptionRight : uint8_t { Call = 0, Put = 1 };

enum class OrderAction : uint8_t { Buy = 0, Sell = 1 };

// Sign of an existing option position
enum class PositionDirection : uint8_t { Long = 0, Short = 1 };

inline char right_to_char(OptionRight right) {
    return right == OptionRight::Call ? 'C' : 'P';
}

inline bool parse_right(char c, OptionRight& out) {
    switch (c) {
    case 'C':
    case 'c':
        out = OptionRight::Call;
        return true;
    case 'P':
    case 'p':
        out = OptionRight::Put;
        return true;
    default:
        return false;
    }
}

inline const char* action_to_string(OrderAction action) {
    return action == OrderAction::Buy ? "BUY" : "SELL";
}

inline OrderAction inverse(OrderAction action) {
    return action == OrderAction::Buy ? OrderAction::Sell : OrderAction::Buy;
}

inline const char* direction_to_string(PositionDirection direction) {
    return direction == PositionDirection::Long ? "LONG" : "SHORT";
}

/**
 * Strikes are compared on a 1/1000 grid so that 590, 590.0 and a strike that went
 * through a JSON round trip all land on the same key.
 */
using StrikeKey = int64_t;

inline StrikeKey strike_key(double strike) {
    return static_cast<StrikeKey>(std::llround(strike * 1000.0));
}

inline bool is_gateway_value(double v) {
    return std::isfinite(v) && std::fabs(v) < GATEWAY_UNSET_THRESHOLD;
}

/**
 * Format a strike the way operators read it: "590", "592.5".
 */
inline std::string format_strike(double strike) {
    char buf[32];
    if (std::fabs(strike - std::round(strike)) < 1e-9) {
        std::snprintf(buf, sizeof(buf), "%lld", static_cast<long long>(std::llround(strike)));
    } else {
        std::snprintf(buf, sizeof(buf), "%.1f", strike);
    }
    return buf;
}

}  // namespace rolldesk
