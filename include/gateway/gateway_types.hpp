#pragma once

#include "../types.hpp"

#include <string>
#include <vector>

namespace rolldesk {
namespace gateway {

enum class SecType : uint8_t { Stock = 0, Option, Combo };

inline const char* sec_type_to_string(SecType type) {
    switch (type) {
    case SecType::Stock:
        return "STK";
    case SecType::Option:
        return "OPT";
    case SecType::Combo:
        return "BAG";
    }
    return "STK";
}

// Market data type switch sent before snapshot requests
enum class MarketDataType : uint8_t {
    Live = 1,
    Frozen = 2,        // last snapshot from the close when the market is shut
    Delayed = 3,
    DelayedFrozen = 4
};

struct ComboLeg {
    ContractId con_id = INVALID_CONTRACT_ID;
    int ratio = 1;
    OrderAction action = OrderAction::Buy;
    std::string exchange = "SMART";
};

/**
 * Contract description sent with a request.
 *
 * Only the fields relevant to sec_type are meaningful; con_id is filled by the
 * gateway in contract details replies and by us when a leg is already resolved.
 */
struct Contract {
    ContractId con_id = INVALID_CONTRACT_ID;
    std::string symbol;
    SecType sec_type = SecType::Stock;
    std::string exchange = "SMART";
    std::string currency = "USD";

    // Options
    std::string expiry;  // YYYYMMDD
    double strike = 0.0;
    OptionRight right = OptionRight::Call;
    std::string trading_class;
    std::string multiplier;

    // Combos
    std::vector<ComboLeg> legs;

    static Contract stock(const std::string& symbol) {
        Contract c;
        c.symbol = symbol;
        c.sec_type = SecType::Stock;
        return c;
    }

    static Contract option(const std::string& symbol, const std::string& expiry, double strike, OptionRight right,
                           const std::string& exchange = "SMART") {
        Contract c;
        c.symbol = symbol;
        c.sec_type = SecType::Option;
        c.exchange = exchange;
        c.expiry = expiry;
        c.strike = strike;
        c.right = right;
        return c;
    }
};

enum class OrderType : uint8_t { Market = 0, Limit };

inline const char* order_type_to_string(OrderType type) {
    return type == OrderType::Market ? "MKT" : "LMT";
}

struct Order {
    OrderAction action = OrderAction::Buy;
    OrderType order_type = OrderType::Limit;
    double total_quantity = 0.0;
    Money limit_price = 0.0;
    std::string account;
    bool transmit = true;
    bool outside_rth = false;
};

/**
 * Historical bar query. end_date_time empty means "until now"; strings use the
 * gateway's own spellings ("1 Y", "1 day", "TRADES").
 */
struct HistoricalQuery {
    std::string end_date_time;
    std::string duration;
    std::string bar_size;
    std::string what_to_show;
    bool use_rth = true;
};

}  // namespace gateway
}  // namespace rolldesk
