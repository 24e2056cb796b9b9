#pragma once

#include "account/account_service.hpp"
#include "account/alias_cache.hpp"
#include "config/desk_config.hpp"
#include "core/request_correlator.hpp"
#include "core/timer_service.hpp"
#include "gateway/igateway.hpp"
#include "logging/async_logger.hpp"
#include "market/contract_resolver.hpp"
#include "market/historical_service.hpp"
#include "market/market_data_caches.hpp"
#include "market/option_chain_service.hpp"
#include "market/option_preloader.hpp"
#include "market/quote_service.hpp"
#include "market/snapshot_collector.hpp"
#include "orders/batch_order_builder.hpp"
#include "orders/order_tracker.hpp"
#include "orders/roll_order_builder.hpp"
#include "rates/fed_funds_client.hpp"
#include "types.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace rolldesk {

/**
 * TradingDesk - one gateway session's worth of market-data and order plumbing
 *
 * Owns the timer thread, the request correlator and every service, and wires
 * the gateway's event stream into the correlator:
 *
 *   gateway event ──► NextValidId ──► correlator.advance_order_ids
 *                 ├─► OrderStatus ──► order tracker ──► listeners
 *                 ├─► error, id <= 0 ──► logged (connection level)
 *                 └─► everything else ──► correlator.dispatch ──► owner
 *                                         (by request id, or by stream for
 *                                          account and position replies)
 *
 * The caches are borrowed so they outlive the desk. A stale greeks read
 * schedules a background preload for the same window.
 *
 * Blocking calls must not be made from the gateway's delivery thread.
 */
class TradingDesk {
public:
    using HttpGet = rates::FedFundsClient::HttpGet;

    TradingDesk(gateway::IGateway& gateway, market::MarketDataCaches& caches, logging::AsyncLogger& logger,
                config::DeskConfig config = {}, HttpGet http_get = {});
    ~TradingDesk();

    TradingDesk(const TradingDesk&) = delete;
    TradingDesk& operator=(const TradingDesk&) = delete;

    // ========================================
    // Quotes
    // ========================================

    market::StockQuote get_stock_quote(const std::string& symbol);
    std::map<std::string, Money> get_quotes(const std::vector<std::string>& symbols);
    std::map<std::string, Money> get_option_quotes(const std::vector<market::OptionQuoteRequest>& contracts);

    // ========================================
    // Chains and greeks
    // ========================================

    std::vector<market::ChainParams> get_option_chain(const std::string& symbol, bool force_refresh = false);

    std::vector<market::OptionGreek> get_option_greeks(const std::string& symbol, const std::string& expiry,
                                                       const std::vector<double>& strikes,
                                                       bool force_refresh = false);

    /// Cache only, regardless of age; empty when nothing was ever fetched
    std::vector<market::OptionGreek> get_cached_greeks(const std::string& symbol, const std::string& expiry) const;

    /// Last underlying price seen by the preloader
    std::optional<Money> get_cached_stock_price(const std::string& symbol) const;

    // ========================================
    // Orders
    // ========================================

    std::vector<orders::OrderStatusUpdate> place_roll_order(const orders::RollOrderRequest& request,
                                                            const orders::AccountQuantities& quantities);
    std::optional<std::string> combo_description(OrderId order_id) const;

    std::vector<orders::OrderStatusUpdate> place_batch_orders(const orders::BatchOrderRequest& request,
                                                              const orders::AccountQuantities& quantities);
    std::vector<orders::OrderStatusUpdate> place_option_batch_orders(const orders::OptionBatchOrderRequest& request,
                                                                     const orders::AccountQuantities& quantities);

    /// Listeners run on the gateway's delivery thread
    orders::OrderTracker::ListenerId add_order_status_listener(orders::OrderTracker::Listener listener);
    bool remove_order_status_listener(orders::OrderTracker::ListenerId id);
    std::optional<orders::OrderStatusUpdate> last_order_status(OrderId order_id) const;

    // ========================================
    // Historical data
    // ========================================

    std::vector<market::Bar> get_historical_data(const market::HistoricalRequest& request);

    // ========================================
    // Preloader
    // ========================================

    void start_preloader();
    void stop_preloader();
    bool request_preload(const std::string& symbol, const std::string& expiry, const std::vector<double>& strikes);

    // ========================================
    // Session and accounts
    // ========================================

    /// Drops identity-scoped state; market-data caches are kept
    void on_gateway_disconnected();

    std::vector<std::string> request_managed_accounts();
    std::vector<account::AccountSummary> request_account_summary();
    std::vector<account::Position> request_positions();

    /// Fetch aliases from the gateway, then cache and persist them
    std::map<std::string, std::string> request_account_aliases(const std::vector<std::string>& account_ids);

    /// Session alias, else the persisted one
    std::optional<std::string> account_alias(const std::string& account_id) const;
    std::map<std::string, std::string> account_aliases(const std::vector<std::string>& account_ids) const;
    void set_account_aliases(const std::map<std::string, std::string>& aliases);

    // ========================================
    // Benchmark rate
    // ========================================

    double fed_funds_rate();
    double margin_rate(Money loan);
    Money estimate_daily_interest(Money loan);

    // Components, for tools and tests
    core::RequestCorrelator& correlator() { return correlator_; }
    market::SnapshotCollector& collector() { return collector_; }
    market::OptionPreloader& preloader() { return preloader_; }
    const config::DeskConfig& desk_config() const { return config_; }

private:
    void on_gateway_event(const gateway::GatewayEvent& event);

    config::DeskConfig config_;
    gateway::IGateway& gateway_;
    market::MarketDataCaches& caches_;
    logging::AsyncLogger& logger_;

    // Declaration order is construction order; the services depend on the
    // timer thread and the correlator.
    core::TimerService timers_;
    core::RequestCorrelator correlator_;
    market::ContractResolver resolver_;
    market::OptionChainService chains_;
    market::QuoteService quotes_;
    market::SnapshotCollector collector_;
    market::OptionPreloader preloader_;
    market::HistoricalService history_;
    orders::OrderTracker tracker_;
    orders::RollOrderBuilder roll_builder_;
    orders::BatchOrderBuilder batch_builder_;
    account::AccountService accounts_;

    account::AccountAliasCache aliases_;
    std::unique_ptr<account::AliasStore> alias_store_;
    std::map<std::string, std::string> persisted_aliases_;
    mutable std::mutex persisted_mutex_;

    rates::FedFundsClient rates_;
};

}  // namespace rolldesk
