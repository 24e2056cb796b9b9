#include "../../include/market/option_chain_service.hpp"

#include "../../include/util/string_utils.hpp"

#include <atomic>
#include <utility>

namespace rolldesk::market {

struct OptionChainService::Fetch {
    std::string symbol;
    RequestId id = INVALID_REQUEST_ID;
    std::promise<std::vector<ChainParams>> promise;
    std::mutex mutex;
    std::vector<ChainParams> results;
    std::atomic<bool> finished{false};
};

OptionChainService::OptionChainService(gateway::IGateway& gateway, core::RequestCorrelator& correlator,
                                       ContractResolver& resolver, ChainCache& cache, logging::AsyncLogger& logger,
                                       ChainServiceConfig config)
    : gateway_(gateway), correlator_(correlator), resolver_(resolver), cache_(cache), logger_(logger),
      config_(config) {}

std::vector<ChainParams> OptionChainService::get_chain(const std::string& raw_symbol, bool force_refresh) {
    const std::string symbol = util::to_upper(raw_symbol);

    if (!force_refresh) {
        if (auto cached = cache_.get_fresh(symbol)) {
            return *cached;
        }
    }

    auto fetch = std::make_shared<Fetch>();
    fetch->symbol = symbol;
    std::shared_future<std::vector<ChainParams>> future;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = in_flight_.find(symbol);
        if (it != in_flight_.end()) {
            future = it->second;
            fetch.reset();  // joiner
        } else {
            if (!gateway_.is_connected()) {
                throw NotConnectedError("option chain " + symbol);
            }
            future = fetch->promise.get_future().share();
            in_flight_.emplace(symbol, future);
        }
    }

    if (fetch) {
        ContractId con_id = INVALID_CONTRACT_ID;
        try {
            con_id = resolver_.resolve_underlying(symbol);
        } catch (const DeskError& e) {
            LOGF_WARN(logger_, Chains, "chain %s: underlying not resolved: %s", symbol.c_str(), e.what());
            fail(fetch, std::current_exception());
            throw;
        }
        try {
            start_fetch(fetch, con_id);
        } catch (const std::exception& e) {
            LOGF_ERROR(logger_, Chains, "chain %s: request not sent: %s", symbol.c_str(), e.what());
            correlator_.complete(fetch->id);
            fail(fetch, std::current_exception());
            throw;
        }
    }

    return future.get();
}

size_t OptionChainService::in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_.size();
}

void OptionChainService::start_fetch(const std::shared_ptr<Fetch>& fetch, ContractId underlying_con_id) {
    fetch->id = correlator_.allocate_id(core::RequestCategory::Chain);
    correlator_.register_request(
        fetch->id, core::RequestCategory::Chain,
        [this, fetch](const gateway::GatewayEvent& event) { on_event(fetch, event); },
        [this, fetch]() { finish(fetch, "timeout"); }, config_.timeout);

    LOGF_INFO(logger_, Chains, "requesting option chain for %s (conId %lld, request %lld)", fetch->symbol.c_str(),
              static_cast<long long>(underlying_con_id), static_cast<long long>(fetch->id));
    gateway_.req_chain_parameters(fetch->id, fetch->symbol, gateway::SecType::Stock, underlying_con_id);
}

void OptionChainService::on_event(const std::shared_ptr<Fetch>& fetch, const gateway::GatewayEvent& event) {
    if (const auto* param = std::get_if<gateway::ChainParameterEvent>(&event)) {
        ChainParams p;
        p.exchange = param->exchange;
        p.underlying_con_id = param->underlying_con_id;
        p.trading_class = param->trading_class;
        p.multiplier = param->multiplier;
        p.expirations = param->expirations;
        p.strikes = param->strikes;
        p.normalize();

        std::lock_guard<std::mutex> lock(fetch->mutex);
        fetch->results.push_back(std::move(p));
    } else if (std::holds_alternative<gateway::ChainParameterEndEvent>(event)) {
        finish(fetch, "end");
    } else if (const auto* err = std::get_if<gateway::GatewayErrorEvent>(&event)) {
        if (gateway::is_informational_error(err->code)) return;
        LOGF_WARN(logger_, Chains, "chain %s: gateway error %d %s", fetch->symbol.c_str(), err->code,
                  err->message.c_str());
        finish(fetch, "error");
    }
}

void OptionChainService::finish(const std::shared_ptr<Fetch>& fetch, const char* reason) {
    if (fetch->finished.exchange(true)) return;
    correlator_.complete(fetch->id);

    std::vector<ChainParams> results;
    {
        std::lock_guard<std::mutex> lock(fetch->mutex);
        results = fetch->results;
    }

    if (!results.empty()) {
        cache_.put(fetch->symbol, results);
    }
    LOGF_INFO(logger_, Chains, "chain %s finished (%s): %zu series", fetch->symbol.c_str(), reason, results.size());

    {
        std::lock_guard<std::mutex> lock(mutex_);
        in_flight_.erase(fetch->symbol);
    }
    fetch->promise.set_value(std::move(results));
}

void OptionChainService::fail(const std::shared_ptr<Fetch>& fetch, std::exception_ptr error) {
    if (fetch->finished.exchange(true)) return;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        in_flight_.erase(fetch->symbol);
    }
    fetch->promise.set_exception(error);
}

}  // namespace rolldesk::market
