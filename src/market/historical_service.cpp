#include "../../include/market/historical_service.hpp"

#include "../../include/util/string_utils.hpp"
#include "../../include/util/time_utils.hpp"

#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <utility>

namespace rolldesk::market {

namespace {

struct BarFetch {
    std::string symbol;
    RequestId id = INVALID_REQUEST_ID;
    std::promise<std::vector<Bar>> promise;
    std::mutex mutex;
    std::vector<Bar> bars;
    std::atomic<bool> finished{false};

    void settle() {
        if (finished.exchange(true)) return;
        std::vector<Bar> out;
        {
            std::lock_guard<std::mutex> lock(mutex);
            out = std::move(bars);
        }
        promise.set_value(std::move(out));
    }

    void fail(std::exception_ptr error) {
        if (finished.exchange(true)) return;
        promise.set_exception(error);
    }

    size_t received() {
        std::lock_guard<std::mutex> lock(mutex);
        return bars.size();
    }
};

}  // namespace

HistoricalService::HistoricalService(gateway::IGateway& gateway, core::RequestCorrelator& correlator,
                                     logging::AsyncLogger& logger, HistoricalServiceConfig config)
    : gateway_(gateway), correlator_(correlator), logger_(logger), config_(std::move(config)) {}

std::vector<Bar> HistoricalService::get_historical_data(const HistoricalRequest& request) {
    const std::string symbol = util::to_upper(util::trim(request.symbol));
    if (symbol.empty()) {
        throw DeskError(ErrorCode::InvalidRequest, "historical data: symbol is empty");
    }
    if (!gateway_.is_connected()) {
        throw NotConnectedError("historical data " + symbol);
    }

    gateway::Contract contract;
    contract.symbol = symbol;
    contract.sec_type = request.sec_type;
    contract.exchange = config_.exchange;

    gateway::HistoricalQuery query;
    query.end_date_time = request.end_date_time;
    query.duration = request.duration;
    query.bar_size = request.bar_size;
    query.what_to_show = request.what_to_show;
    query.use_rth = request.use_rth;

    auto fetch = std::make_shared<BarFetch>();
    fetch->symbol = symbol;
    auto future = fetch->promise.get_future();

    fetch->id = correlator_.allocate_id(core::RequestCategory::History);
    const RequestId id = fetch->id;
    correlator_.register_request(
        id, core::RequestCategory::History,
        [this, fetch, id](const gateway::GatewayEvent& event) {
            if (const auto* bar = std::get_if<gateway::HistoricalBarEvent>(&event)) {
                std::lock_guard<std::mutex> lock(fetch->mutex);
                fetch->bars.push_back(Bar{util::format_bar_date(bar->time), bar->open, bar->high, bar->low,
                                          bar->close, bar->volume});
            } else if (std::holds_alternative<gateway::HistoricalDataEndEvent>(event)) {
                correlator_.complete(id);
                fetch->settle();
            } else if (const auto* err = std::get_if<gateway::GatewayErrorEvent>(&event)) {
                if (gateway::is_informational_error(err->code)) return;
                correlator_.complete(id);
                LOGF_WARN(logger_, History, "historical data %s rejected: %d %s", fetch->symbol.c_str(), err->code,
                          err->message.c_str());
                if (err->code == gateway::error_code::NO_SECURITY_DEFINITION) {
                    fetch->fail(std::make_exception_ptr(ContractNotFoundError(fetch->symbol)));
                } else {
                    fetch->fail(std::make_exception_ptr(
                        GatewayRejectedError("historical data " + fetch->symbol, err->code, err->message)));
                }
            }
        },
        [this, fetch, id]() {
            gateway_.cancel_historical_data(id);
            size_t received = fetch->received();
            if (received == 0) {
                fetch->fail(std::make_exception_ptr(RequestTimeoutError("historical data " + fetch->symbol)));
                return;
            }
            LOGF_WARN(logger_, History, "historical data %s timed out after %zu bars, returning partial",
                      fetch->symbol.c_str(), received);
            fetch->settle();
        },
        config_.timeout);

    LOGF_INFO(logger_, History, "requesting %s %s bars of %s (%s, request %lld)", query.duration.c_str(),
              query.bar_size.c_str(), symbol.c_str(), query.what_to_show.c_str(), static_cast<long long>(id));
    try {
        gateway_.req_historical_data(id, contract, query);
    } catch (const std::exception&) {
        correlator_.complete(id);
        throw;
    }

    std::vector<Bar> bars = future.get();
    LOGF_INFO(logger_, History, "historical data %s: %zu bars", symbol.c_str(), bars.size());
    return bars;
}

}  // namespace rolldesk::market
