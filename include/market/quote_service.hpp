#pragma once

#include "../config/defaults.hpp"
#include "../core/request_correlator.hpp"
#include "../gateway/igateway.hpp"
#include "../logging/async_logger.hpp"
#include "chain_cache.hpp"

#include <chrono>
#include <future>
#include <map>
#include <string>
#include <vector>

namespace rolldesk {
namespace market {

struct StockQuote {
    std::string symbol;
    Money bid = 0.0;
    Money ask = 0.0;
    Money last = 0.0;

    /// last, else midpoint, else whichever side is known, else 0
    Money price() const {
        if (last > 0) return last;
        if (bid > 0 && ask > 0) return (bid + ask) / 2.0;
        if (bid > 0) return bid;
        return ask > 0 ? ask : 0.0;
    }
};

struct OptionQuoteRequest {
    std::string symbol;
    std::string expiry;
    double strike = 0.0;
    OptionRight right = OptionRight::Call;

    /// "QQQ|20260220|590|P"
    std::string key() const;
};

struct QuoteServiceConfig {
    std::chrono::milliseconds timeout{config::timeouts::QUOTE_MS};
    std::string exchange = "SMART";
};

/**
 * QuoteService - single-contract snapshot quotes
 *
 * Each quote is one snapshot request that completes on snapshot_end, on a
 * per-contract error, or at the timeout with whatever prices arrived. A quote
 * never throws for missing data; only NotConnectedError escapes.
 *
 * Batch variants send every request first and then wait, so N symbols cost one
 * timeout at most, not N.
 */
class QuoteService {
public:
    QuoteService(gateway::IGateway& gateway, core::RequestCorrelator& correlator, const ChainCache& chains,
                 logging::AsyncLogger& logger, QuoteServiceConfig config = {});

    StockQuote get_stock_quote(const std::string& symbol);

    /// symbol -> price(); de-duplicated and upper-cased, failures map to 0
    std::map<std::string, Money> get_quotes(const std::vector<std::string>& symbols);

    /// OptionQuoteRequest::key() -> mark price (0 when nothing arrived)
    std::map<std::string, Money> get_option_quotes(const std::vector<OptionQuoteRequest>& contracts);

private:
    struct Snapshot;

    std::shared_future<StockQuote> request_snapshot(const gateway::Contract& contract,
                                                    gateway::MarketDataType data_type);
    void on_event(const std::shared_ptr<Snapshot>& snap, const gateway::GatewayEvent& event);
    void finish(const std::shared_ptr<Snapshot>& snap, const char* reason);

    gateway::IGateway& gateway_;
    core::RequestCorrelator& correlator_;
    const ChainCache& chains_;
    logging::AsyncLogger& logger_;
    QuoteServiceConfig config_;
};

}  // namespace market
}  // namespace rolldesk
