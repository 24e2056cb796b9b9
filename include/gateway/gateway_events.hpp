#pragma once

#include "gateway_types.hpp"

#include <optional>
#include <type_traits>
#include <string>
#include <variant>
#include <vector>

namespace rolldesk {
namespace gateway {

// =============================================================================
// Gateway numbering
// =============================================================================

// tick_price types (live, then delayed)
namespace tick {
constexpr int BID = 1;
constexpr int ASK = 2;
constexpr int LAST = 4;
constexpr int CLOSE = 9;
constexpr int DELAYED_BID = 68;
constexpr int DELAYED_ASK = 69;
constexpr int DELAYED_LAST = 70;
constexpr int DELAYED_CLOSE = 75;

// tick_size types carrying open interest
constexpr int OPTION_CALL_OPEN_INTEREST = 27;
constexpr int OPTION_PUT_OPEN_INTEREST = 28;
constexpr int FUTURES_OPEN_INTEREST = 86;

// tick_option_computation fields
constexpr int BID_OPTION = 10;
constexpr int ASK_OPTION = 11;
constexpr int LAST_OPTION = 12;
constexpr int MODEL_OPTION = 13;
constexpr int DELAYED_BID_OPTION = 80;
constexpr int DELAYED_ASK_OPTION = 81;
constexpr int DELAYED_LAST_OPTION = 82;
constexpr int DELAYED_MODEL_OPTION = 83;
} // namespace tick

namespace error_code {
constexpr int NO_SECURITY_DEFINITION = 200;
constexpr int NOT_CONNECTED = 504;
constexpr int DELAYED_DATA_NOTICE = 10167;
} // namespace error_code

/**
 * Informational notices (farm status, delayed-data banners) arrive as errors but
 * do not end the request they mention.
 */
inline bool is_informational_error(int code) {
    return (code >= 2100 && code <= 2199) || code == error_code::DELAYED_DATA_NOTICE;
}

// =============================================================================
// Events
// =============================================================================

struct TickPriceEvent {
    RequestId id;
    int tick_type;
    double value;
};

struct TickSizeEvent {
    RequestId id;
    int tick_type;
    double size;
};

struct TickOptionComputationEvent {
    RequestId id;
    int field;
    std::optional<double> implied_vol;
    std::optional<double> delta;
    std::optional<double> option_price;
    std::optional<double> pv_dividend;
    std::optional<double> gamma;
    std::optional<double> vega;
    std::optional<double> theta;
    std::optional<double> underlying_price;
};

struct SnapshotEndEvent {
    RequestId id;
};

struct ContractDetailsEvent {
    RequestId id;
    Contract contract;
};

struct ContractDetailsEndEvent {
    RequestId id;
};

struct ChainParameterEvent {
    RequestId id;
    std::string exchange;
    ContractId underlying_con_id;
    std::string trading_class;
    std::string multiplier;
    std::vector<std::string> expirations;
    std::vector<double> strikes;
};

struct ChainParameterEndEvent {
    RequestId id;
};

struct GatewayErrorEvent {
    RequestId id;  // <= 0 for connection-level errors
    int code;
    std::string message;
};

struct NextValidIdEvent {
    OrderId next_id;
};

// Accounts

struct ManagedAccountsEvent {
    std::string accounts;  // comma separated
};

struct AccountSummaryEvent {
    RequestId id;
    std::string account;
    std::string tag;
    std::string value;
    std::string currency;
};

struct AccountSummaryEndEvent {
    RequestId id;
};

struct AccountValueEvent {
    std::string key;
    std::string value;
    std::string currency;
    std::string account;
};

struct AccountDownloadEndEvent {
    std::string account;
};

struct PositionEvent {
    std::string account;
    Contract contract;
    double position;
    double avg_cost;
};

struct PositionEndEvent {};

// Orders

struct OrderStatusEvent {
    OrderId order_id;
    std::string status;
    double filled;
    double remaining;
    double avg_fill_price;
};

// Historical data

struct HistoricalBarEvent {
    RequestId id;
    std::string time;  // YYYYMMDD for daily bars, "YYYYMMDD HH:MM:SS" intraday
    double open;
    double high;
    double low;
    double close;
    double volume;
};

struct HistoricalDataEndEvent {
    RequestId id;
};

using GatewayEvent =
    std::variant<TickPriceEvent, TickSizeEvent, TickOptionComputationEvent, SnapshotEndEvent, ContractDetailsEvent,
                 ContractDetailsEndEvent, ChainParameterEvent, ChainParameterEndEvent, GatewayErrorEvent,
                 NextValidIdEvent, ManagedAccountsEvent, AccountSummaryEvent, AccountSummaryEndEvent,
                 AccountValueEvent, AccountDownloadEndEvent, PositionEvent, PositionEndEvent, OrderStatusEvent,
                 HistoricalBarEvent, HistoricalDataEndEvent>;

/**
 * Request id an event belongs to, or INVALID_REQUEST_ID for unsolicited events
 * (those without an id field).
 */
inline RequestId event_request_id(const GatewayEvent& event) {
    return std::visit(
        [](const auto& e) -> RequestId {
            if constexpr (requires { e.id; }) {
                return e.id;
            } else {
                return INVALID_REQUEST_ID;
            }
        },
        event);
}

/**
 * Replies the gateway sends without a request id. Only one request per stream
 * can be outstanding, so the stream itself identifies the owner.
 */
enum class EventStream : uint8_t { None = 0, ManagedAccounts, Positions, AccountUpdates };

constexpr size_t EVENT_STREAM_COUNT = 4;

inline const char* event_stream_to_string(EventStream stream) {
    switch (stream) {
    case EventStream::None:
        return "none";
    case EventStream::ManagedAccounts:
        return "managed-accounts";
    case EventStream::Positions:
        return "positions";
    case EventStream::AccountUpdates:
        return "account-updates";
    }
    return "?";
}

inline EventStream event_stream(const GatewayEvent& event) {
    if (std::holds_alternative<ManagedAccountsEvent>(event)) return EventStream::ManagedAccounts;
    if (std::holds_alternative<PositionEvent>(event) || std::holds_alternative<PositionEndEvent>(event)) {
        return EventStream::Positions;
    }
    if (std::holds_alternative<AccountValueEvent>(event) || std::holds_alternative<AccountDownloadEndEvent>(event)) {
        return EventStream::AccountUpdates;
    }
    return EventStream::None;
}

}  // namespace gateway
}  // namespace rolldesk
