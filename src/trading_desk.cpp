#include "../include/trading_desk.hpp"

#include <utility>
#include <variant>

namespace rolldesk {

TradingDesk::TradingDesk(gateway::IGateway& gateway, market::MarketDataCaches& caches, logging::AsyncLogger& logger,
                         config::DeskConfig config, HttpGet http_get)
    : config_(std::move(config)), gateway_(gateway), caches_(caches), logger_(logger),
      correlator_(timers_, logger_, config_.correlator),
      resolver_(gateway_, correlator_, caches_.chains, logger_, config_.resolver),
      chains_(gateway_, correlator_, resolver_, caches_.chains, logger_, config_.chains),
      quotes_(gateway_, correlator_, caches_.chains, logger_, config_.quotes),
      collector_(gateway_, correlator_, timers_, caches_.greeks, caches_.chains, logger_, config_.snapshot),
      preloader_(chains_, quotes_, collector_, logger_, config_.preloader),
      history_(gateway_, correlator_, logger_, config_.historical), tracker_(logger_),
      roll_builder_(gateway_, correlator_, resolver_, tracker_, logger_),
      batch_builder_(gateway_, correlator_, tracker_, logger_),
      accounts_(gateway_, correlator_, logger_, config_.accounts),
      rates_(config_.rates, logger_, std::move(http_get)) {
    if (!config_.alias_store_path.empty()) {
        alias_store_ = std::make_unique<account::AliasStore>(config_.alias_store_path, logger_);
        persisted_aliases_ = alias_store_->load();
    }

    collector_.set_stale_hook([this](const std::string& symbol, const std::string& expiry,
                                     const std::vector<double>& strikes) {
        preloader_.enqueue_preload(symbol, expiry, strikes);
    });

    gateway_.set_event_handler([this](const gateway::GatewayEvent& event) { on_gateway_event(event); });

    LOGF_INFO(logger_, System, "desk ready: burst %zu/%lldms, settle %lldms, hard timeout %lldms",
              config_.snapshot.burst_size, static_cast<long long>(config_.snapshot.burst_delay.count()),
              static_cast<long long>(config_.snapshot.settle.count()),
              static_cast<long long>(config_.snapshot.hard_timeout.count()));
}

TradingDesk::~TradingDesk() {
    // An on-demand job still waiting on a batch needs the timers to finish it
    preloader_.shutdown();
    gateway_.set_event_handler({});
    // No timer callback may run once the services start to go away
    timers_.shutdown();
}

void TradingDesk::on_gateway_event(const gateway::GatewayEvent& event) {
    if (const auto* next = std::get_if<gateway::NextValidIdEvent>(&event)) {
        correlator_.advance_order_ids(next->next_id);
        return;
    }
    if (const auto* status = std::get_if<gateway::OrderStatusEvent>(&event)) {
        tracker_.on_status(*status);
        return;
    }
    if (const auto* err = std::get_if<gateway::GatewayErrorEvent>(&event)) {
        if (err->id <= 0) {
            if (gateway::is_informational_error(err->code)) {
                LOGF_DEBUG(logger_, Gateway, "notice %d: %s", err->code, err->message.c_str());
            } else {
                LOGF_WARN(logger_, Gateway, "connection error %d: %s", err->code, err->message.c_str());
            }
            return;
        }
    }
    if (!correlator_.dispatch(event)) {
        auto stream = gateway::event_stream(event);
        if (stream != gateway::EventStream::None) {
            LOGF_DEBUG(logger_, Gateway, "unrequested %s event", gateway::event_stream_to_string(stream));
        } else {
            LOGF_DEBUG(logger_, Gateway, "event for unknown request %lld",
                       static_cast<long long>(gateway::event_request_id(event)));
        }
    }
}

// ============================================================================
// Quotes
// ============================================================================

market::StockQuote TradingDesk::get_stock_quote(const std::string& symbol) {
    return quotes_.get_stock_quote(symbol);
}

std::map<std::string, Money> TradingDesk::get_quotes(const std::vector<std::string>& symbols) {
    return quotes_.get_quotes(symbols);
}

std::map<std::string, Money> TradingDesk::get_option_quotes(const std::vector<market::OptionQuoteRequest>& contracts) {
    return quotes_.get_option_quotes(contracts);
}

// ============================================================================
// Chains and greeks
// ============================================================================

std::vector<market::ChainParams> TradingDesk::get_option_chain(const std::string& symbol, bool force_refresh) {
    return chains_.get_chain(symbol, force_refresh);
}

std::vector<market::OptionGreek> TradingDesk::get_option_greeks(const std::string& symbol, const std::string& expiry,
                                                                const std::vector<double>& strikes,
                                                                bool force_refresh) {
    return collector_.get_option_greeks(symbol, expiry, strikes, force_refresh);
}

std::vector<market::OptionGreek> TradingDesk::get_cached_greeks(const std::string& symbol,
                                                                const std::string& expiry) const {
    return caches_.greeks.get_all(symbol, expiry);
}

std::optional<Money> TradingDesk::get_cached_stock_price(const std::string& symbol) const {
    return preloader_.cached_price(symbol);
}

// ============================================================================
// Orders
// ============================================================================

std::vector<orders::OrderStatusUpdate> TradingDesk::place_roll_order(const orders::RollOrderRequest& request,
                                                                     const orders::AccountQuantities& quantities) {
    return roll_builder_.place_roll_order(request, quantities);
}

std::optional<std::string> TradingDesk::combo_description(OrderId order_id) const {
    return roll_builder_.combo_description(order_id);
}

std::vector<orders::OrderStatusUpdate> TradingDesk::place_batch_orders(const orders::BatchOrderRequest& request,
                                                                       const orders::AccountQuantities& quantities) {
    return batch_builder_.place_batch_orders(request, quantities);
}

std::vector<orders::OrderStatusUpdate> TradingDesk::place_option_batch_orders(
    const orders::OptionBatchOrderRequest& request, const orders::AccountQuantities& quantities) {
    return batch_builder_.place_option_batch_orders(request, quantities);
}

orders::OrderTracker::ListenerId TradingDesk::add_order_status_listener(orders::OrderTracker::Listener listener) {
    return tracker_.add_listener(std::move(listener));
}

bool TradingDesk::remove_order_status_listener(orders::OrderTracker::ListenerId id) {
    return tracker_.remove_listener(id);
}

std::optional<orders::OrderStatusUpdate> TradingDesk::last_order_status(OrderId order_id) const {
    return tracker_.last_status(order_id);
}

// ============================================================================
// Historical data
// ============================================================================

std::vector<market::Bar> TradingDesk::get_historical_data(const market::HistoricalRequest& request) {
    return history_.get_historical_data(request);
}

// ============================================================================
// Preloader
// ============================================================================

void TradingDesk::start_preloader() {
    preloader_.start();
}

void TradingDesk::stop_preloader() {
    preloader_.stop();
}

bool TradingDesk::request_preload(const std::string& symbol, const std::string& expiry,
                                  const std::vector<double>& strikes) {
    return preloader_.request_preload(symbol, expiry, strikes);
}

// ============================================================================
// Session and accounts
// ============================================================================

void TradingDesk::on_gateway_disconnected() {
    size_t dropped = aliases_.size();
    aliases_.clear();
    LOGF_INFO(logger_, Accounts, "gateway disconnected: cleared %zu session aliases", dropped);
}

std::vector<std::string> TradingDesk::request_managed_accounts() {
    return accounts_.request_managed_accounts();
}

std::vector<account::AccountSummary> TradingDesk::request_account_summary() {
    return accounts_.request_account_summary();
}

std::vector<account::Position> TradingDesk::request_positions() {
    return accounts_.request_positions();
}

std::map<std::string, std::string> TradingDesk::request_account_aliases(const std::vector<std::string>& account_ids) {
    auto aliases = accounts_.request_account_aliases(account_ids);
    if (!aliases.empty()) {
        set_account_aliases(aliases);
    }
    return aliases;
}

std::optional<std::string> TradingDesk::account_alias(const std::string& account_id) const {
    if (auto alias = aliases_.get(account_id)) {
        return alias;
    }
    std::lock_guard<std::mutex> lock(persisted_mutex_);
    auto it = persisted_aliases_.find(account_id);
    if (it == persisted_aliases_.end()) return std::nullopt;
    return it->second;
}

std::map<std::string, std::string> TradingDesk::account_aliases(const std::vector<std::string>& account_ids) const {
    std::map<std::string, std::string> out;
    for (const auto& id : account_ids) {
        if (auto alias = account_alias(id)) {
            out.emplace(id, *alias);
        }
    }
    return out;
}

void TradingDesk::set_account_aliases(const std::map<std::string, std::string>& aliases) {
    aliases_.set_many(aliases);
    if (!alias_store_) return;

    std::lock_guard<std::mutex> lock(persisted_mutex_);
    for (const auto& [id, alias] : aliases) {
        if (!alias.empty()) persisted_aliases_[id] = alias;
    }
    if (!alias_store_->save(persisted_aliases_)) {
        LOG_WARN(logger_, Accounts, "aliases kept for this session only");
    }
}

// ============================================================================
// Benchmark rate
// ============================================================================

double TradingDesk::fed_funds_rate() {
    return rates_.get_rate();
}

double TradingDesk::margin_rate(Money loan) {
    return rates::margin_rate(loan, rates_.get_rate());
}

Money TradingDesk::estimate_daily_interest(Money loan) {
    return rates::estimate_daily_interest(loan, rates_.get_rate());
}

}  // namespace rolldesk
