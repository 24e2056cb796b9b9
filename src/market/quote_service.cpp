#include "../../include/market/quote_service.hpp"

#include "../../include/core/errors.hpp"
#include "../../include/market/option_greek.hpp"
#include "../../include/util/string_utils.hpp"

#include <atomic>
#include <mutex>
#include <set>
#include <utility>

namespace rolldesk::market {

std::string OptionQuoteRequest::key() const {
    return util::to_upper(symbol) + "|" + expiry + "|" + format_strike(strike) + "|" + right_to_char(right);
}

struct QuoteService::Snapshot {
    RequestId id = INVALID_REQUEST_ID;
    std::string label;
    std::promise<StockQuote> promise;
    std::mutex mutex;
    StockQuote quote;
    std::atomic<bool> finished{false};
};

QuoteService::QuoteService(gateway::IGateway& gateway, core::RequestCorrelator& correlator, const ChainCache& chains,
                           logging::AsyncLogger& logger, QuoteServiceConfig config)
    : gateway_(gateway), correlator_(correlator), chains_(chains), logger_(logger), config_(std::move(config)) {}

StockQuote QuoteService::get_stock_quote(const std::string& symbol) {
    if (!gateway_.is_connected()) {
        throw NotConnectedError("quote " + symbol);
    }
    auto contract = gateway::Contract::stock(util::to_upper(symbol));
    contract.exchange = config_.exchange;
    // Delayed-frozen so a closed market still yields the last close
    return request_snapshot(contract, gateway::MarketDataType::DelayedFrozen).get();
}

std::map<std::string, Money> QuoteService::get_quotes(const std::vector<std::string>& symbols) {
    std::map<std::string, Money> results;
    std::set<std::string> unique;
    for (const auto& s : symbols) {
        unique.insert(util::to_upper(s));
    }
    if (unique.empty()) return results;

    if (!gateway_.is_connected()) {
        throw NotConnectedError("quotes");
    }

    std::vector<std::pair<std::string, std::shared_future<StockQuote>>> pending;
    for (const auto& symbol : unique) {
        auto contract = gateway::Contract::stock(symbol);
        contract.exchange = config_.exchange;
        pending.emplace_back(symbol, request_snapshot(contract, gateway::MarketDataType::DelayedFrozen));
    }

    for (auto& [symbol, future] : pending) {
        results[symbol] = future.get().price();
    }
    return results;
}

std::map<std::string, Money> QuoteService::get_option_quotes(const std::vector<OptionQuoteRequest>& contracts) {
    std::map<std::string, Money> results;
    if (contracts.empty()) return results;

    if (!gateway_.is_connected()) {
        throw NotConnectedError("option quotes");
    }

    std::vector<std::pair<std::string, std::shared_future<StockQuote>>> pending;
    std::set<std::string> seen;
    for (const auto& req : contracts) {
        std::string key = req.key();
        if (!seen.insert(key).second) continue;

        auto contract =
            gateway::Contract::option(util::to_upper(req.symbol), req.expiry, req.strike, req.right, config_.exchange);
        contract.trading_class = chains_.find_trading_class(req.symbol, req.expiry, req.strike);
        pending.emplace_back(key, request_snapshot(contract, gateway::MarketDataType::Frozen));
    }

    for (auto& [key, future] : pending) {
        StockQuote q = future.get();
        results[key] = (q.bid > 0 && q.ask > 0) ? (q.bid + q.ask) / 2.0 : q.last;
    }
    LOGF_INFO(logger_, Quotes, "option quotes: %zu contracts", results.size());
    return results;
}

// =============================================================================
// Snapshot plumbing
// =============================================================================

std::shared_future<StockQuote> QuoteService::request_snapshot(const gateway::Contract& contract,
                                                              gateway::MarketDataType data_type) {
    auto snap = std::make_shared<Snapshot>();
    snap->quote.symbol = contract.symbol;
    snap->label = contract.sec_type == gateway::SecType::Option
                      ? contract.symbol + " " + contract.expiry + " " + format_strike(contract.strike) +
                            right_to_char(contract.right)
                      : contract.symbol;
    auto future = snap->promise.get_future().share();

    snap->id = correlator_.allocate_id(core::RequestCategory::Quote);
    correlator_.register_request(
        snap->id, core::RequestCategory::Quote,
        [this, snap](const gateway::GatewayEvent& event) { on_event(snap, event); },
        [this, snap]() { finish(snap, "timeout"); }, config_.timeout);

    gateway_.req_market_data_type(data_type);
    LOGF_DEBUG(logger_, Quotes, "requesting quote for %s (request %lld)", snap->label.c_str(),
               static_cast<long long>(snap->id));
    gateway_.req_market_data(snap->id, contract, true);
    return future;
}

void QuoteService::on_event(const std::shared_ptr<Snapshot>& snap, const gateway::GatewayEvent& event) {
    if (const auto* tick = std::get_if<gateway::TickPriceEvent>(&event)) {
        std::lock_guard<std::mutex> lock(snap->mutex);
        apply_tick_price(snap->quote, tick->tick_type, tick->value);
    } else if (std::holds_alternative<gateway::SnapshotEndEvent>(event)) {
        finish(snap, "snapshot end");
    } else if (const auto* err = std::get_if<gateway::GatewayErrorEvent>(&event)) {
        if (gateway::is_informational_error(err->code)) return;
        LOGF_WARN(logger_, Quotes, "quote %s: gateway error %d %s", snap->label.c_str(), err->code,
                  err->message.c_str());
        finish(snap, "error");
    }
}

void QuoteService::finish(const std::shared_ptr<Snapshot>& snap, const char* reason) {
    if (snap->finished.exchange(true)) return;
    correlator_.complete(snap->id);
    gateway_.cancel_market_data(snap->id);

    StockQuote quote;
    {
        std::lock_guard<std::mutex> lock(snap->mutex);
        quote = snap->quote;
    }
    LOGF_DEBUG(logger_, Quotes, "quote %s (%s): last=%.2f bid=%.2f ask=%.2f", snap->label.c_str(), reason, quote.last,
               quote.bid, quote.ask);
    snap->promise.set_value(std::move(quote));
}

}  // namespace rolldesk::market
