#pragma once

#include "gateway_events.hpp"
#include "gateway_types.hpp"

#include <functional>
#include <string>

namespace rolldesk {
namespace gateway {

/**
 * IGateway - the brokerage transport seen from the desk
 *
 * One connection, many in-flight numbered requests. Session management
 * (connect, authentication, reconnect) lives behind this interface; the desk
 * only sends numbered requests and receives numbered events.
 *
 * Events may be delivered on any thread, including synchronously from inside a
 * request call. Implementations must not hold their own locks while invoking
 * the event handler.
 */
class IGateway {
public:
    using EventHandler = std::function<void(const GatewayEvent&)>;

    virtual ~IGateway() = default;

    // =========================================================================
    // Session
    // =========================================================================

    virtual bool is_connected() const = 0;

    /// Single sink for every event; set once before any request is sent
    virtual void set_event_handler(EventHandler handler) = 0;

    // =========================================================================
    // Market data
    // =========================================================================

    virtual void req_market_data_type(MarketDataType type) = 0;

    /// snapshot=true asks for a one-shot snapshot; it may still stream ticks
    virtual void req_market_data(RequestId id, const Contract& contract, bool snapshot) = 0;

    virtual void cancel_market_data(RequestId id) = 0;

    // =========================================================================
    // Reference data
    // =========================================================================

    virtual void req_contract_details(RequestId id, const Contract& contract) = 0;

    virtual void req_chain_parameters(RequestId id, const std::string& symbol, SecType underlying_type,
                                      ContractId underlying_con_id) = 0;

    // =========================================================================
    // Orders
    // =========================================================================

    virtual void place_order(OrderId id, const Contract& contract, const Order& order) = 0;

    // =========================================================================
    // Accounts
    // =========================================================================
    // Managed accounts, positions and account updates reply without a request
    // id; only one of each may be outstanding.

    virtual void req_managed_accounts() = 0;

    virtual void req_account_summary(RequestId id, const std::string& group, const std::string& tags) = 0;
    virtual void cancel_account_summary(RequestId id) = 0;

    virtual void req_positions() = 0;
    virtual void cancel_positions() = 0;

    /// Streams AccountValue events for one account until unsubscribed
    virtual void req_account_updates(bool subscribe, const std::string& account) = 0;

    // =========================================================================
    // Historical data
    // =========================================================================

    virtual void req_historical_data(RequestId id, const Contract& contract, const HistoricalQuery& query) = 0;
    virtual void cancel_historical_data(RequestId id) = 0;
};

}  // namespace gateway
}  // namespace rolldesk
