#pragma once

#include "../config/defaults.hpp"
#include "../core/request_correlator.hpp"
#include "../gateway/igateway.hpp"
#include "../logging/async_logger.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace rolldesk {
namespace market {

struct HistoricalRequest {
    std::string symbol;
    gateway::SecType sec_type = gateway::SecType::Stock;
    std::string end_date_time;  // empty: until now
    std::string duration = config::historical::DURATION;
    std::string bar_size = config::historical::BAR_SIZE;
    std::string what_to_show = config::historical::WHAT_TO_SHOW;
    bool use_rth = true;
};

struct Bar {
    std::string time;  // YYYY-MM-DD for daily bars, the gateway's stamp otherwise
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    double volume = 0.0;
};

struct HistoricalServiceConfig {
    std::chrono::milliseconds timeout{config::timeouts::HISTORICAL_MS};
    std::string exchange = "SMART";
};

/**
 * HistoricalService - OHLCV bars for one contract
 *
 * Bars arrive oldest first and are collected until the end event. A timeout
 * cancels the request and returns the bars received so far; with none
 * received it throws RequestTimeoutError.
 */
class HistoricalService {
public:
    HistoricalService(gateway::IGateway& gateway, core::RequestCorrelator& correlator, logging::AsyncLogger& logger,
                      HistoricalServiceConfig config = {});

    /**
     * Throws DeskError(InvalidRequest) for an empty symbol, NotConnectedError,
     * ContractNotFoundError for an unknown symbol, GatewayRejectedError for any
     * other rejection, RequestTimeoutError.
     */
    std::vector<Bar> get_historical_data(const HistoricalRequest& request);

private:
    gateway::IGateway& gateway_;
    core::RequestCorrelator& correlator_;
    logging::AsyncLogger& logger_;
    HistoricalServiceConfig config_;
};

}  // namespace market
}  // namespace rolldesk
