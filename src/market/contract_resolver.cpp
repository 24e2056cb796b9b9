#include "../../include/market/contract_resolver.hpp"

#include "../../include/util/string_utils.hpp"

#include <atomic>
#include <utility>

namespace rolldesk::market {

struct ContractResolver::Resolution {
    std::string key;
    std::string label;
    RequestId id = INVALID_REQUEST_ID;
    std::promise<ContractId> promise;
    std::atomic<bool> finished{false};
};

ContractResolver::ContractResolver(gateway::IGateway& gateway, core::RequestCorrelator& correlator,
                                   const ChainCache& chains, logging::AsyncLogger& logger, ResolverConfig config)
    : gateway_(gateway), correlator_(correlator), chains_(chains), logger_(logger), config_(std::move(config)) {}

// =============================================================================
// Keys
// =============================================================================

std::string ContractResolver::underlying_key(const std::string& symbol) {
    return "STK:" + util::to_upper(symbol);
}

std::string ContractResolver::option_key(const std::string& symbol, const std::string& expiry, double strike,
                                         OptionRight right) {
    return "OPT:" + util::to_upper(symbol) + ":" + expiry + ":" + std::to_string(strike_key(strike)) + ":" +
           right_to_char(right);
}

std::string ContractResolver::describe(const gateway::Contract& contract) {
    if (contract.sec_type != gateway::SecType::Option) return contract.symbol;
    return contract.symbol + " " + contract.expiry + " " + format_strike(contract.strike) +
           right_to_char(contract.right);
}

// =============================================================================
// Public API
// =============================================================================

ContractId ContractResolver::resolve_underlying(const std::string& symbol) {
    return resolve_underlying_async(symbol).get();
}

ContractId ContractResolver::resolve_option(const std::string& symbol, const std::string& expiry, double strike,
                                            OptionRight right, core::RequestCategory category) {
    return resolve_option_async(symbol, expiry, strike, right, category).get();
}

std::shared_future<ContractId> ContractResolver::resolve_underlying_async(const std::string& symbol) {
    auto contract = gateway::Contract::stock(util::to_upper(symbol));
    contract.exchange = config_.exchange;
    contract.currency = config_.currency;
    return resolve(underlying_key(symbol), contract, core::RequestCategory::Contract);
}

std::shared_future<ContractId> ContractResolver::resolve_option_async(const std::string& symbol,
                                                                      const std::string& expiry, double strike,
                                                                      OptionRight right,
                                                                      core::RequestCategory category) {
    auto contract = gateway::Contract::option(util::to_upper(symbol), expiry, strike, right, config_.exchange);
    contract.currency = config_.currency;
    contract.trading_class = chains_.find_trading_class(symbol, expiry, strike);
    return resolve(option_key(symbol, expiry, strike, right), contract, category);
}

std::optional<ContractId> ContractResolver::cached_underlying(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_.find(underlying_key(symbol));
    if (it == cache_.end()) return std::nullopt;
    return it->second;
}

std::optional<ContractId> ContractResolver::cached_option(const std::string& symbol, const std::string& expiry,
                                                          double strike, OptionRight right) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_.find(option_key(symbol, expiry, strike, right));
    if (it == cache_.end()) return std::nullopt;
    return it->second;
}

size_t ContractResolver::cache_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

// =============================================================================
// Resolution
// =============================================================================

std::shared_future<ContractId> ContractResolver::resolve(const std::string& key, const gateway::Contract& contract,
                                                         core::RequestCategory category) {
    auto res = std::make_shared<Resolution>();
    res->key = key;
    res->label = describe(contract);

    std::shared_future<ContractId> future;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto hit = cache_.find(key);
        if (hit != cache_.end()) {
            std::promise<ContractId> ready;
            ready.set_value(hit->second);
            return ready.get_future().share();
        }
        auto pending = in_flight_.find(key);
        if (pending != in_flight_.end()) {
            return pending->second;
        }
        if (!gateway_.is_connected()) {
            throw NotConnectedError("resolve " + res->label);
        }
        future = res->promise.get_future().share();
        in_flight_.emplace(key, future);
    }

    // From here on the key is in flight; a failure must settle it so joiners
    // and later callers do not wait on an abandoned promise
    try {
        res->id = correlator_.allocate_id(category);
        correlator_.register_request(
            res->id, category, [this, res](const gateway::GatewayEvent& event) { on_event(res, event); },
            [this, res]() {
                LOGF_WARN(logger_, Correlator, "resolution of %s timed out", res->label.c_str());
                finish(res, INVALID_CONTRACT_ID, std::make_exception_ptr(ResolutionTimeoutError(res->label)));
            },
            config_.timeout);

        if (!contract.trading_class.empty()) {
            LOGF_DEBUG(logger_, Correlator, "resolving %s (trading class %s) as request %lld", res->label.c_str(),
                       contract.trading_class.c_str(), static_cast<long long>(res->id));
        } else {
            LOGF_DEBUG(logger_, Correlator, "resolving %s as request %lld", res->label.c_str(),
                       static_cast<long long>(res->id));
        }
        gateway_.req_contract_details(res->id, contract);
    } catch (const std::exception& e) {
        LOGF_ERROR(logger_, Correlator, "could not send resolution of %s: %s", res->label.c_str(), e.what());
        finish(res, INVALID_CONTRACT_ID, std::current_exception());
    }
    return future;
}

void ContractResolver::on_event(const std::shared_ptr<Resolution>& res, const gateway::GatewayEvent& event) {
    if (const auto* details = std::get_if<gateway::ContractDetailsEvent>(&event)) {
        // First listing wins; the trading class already narrowed the series
        if (details->contract.con_id != INVALID_CONTRACT_ID) {
            finish(res, details->contract.con_id, nullptr);
        }
    } else if (std::holds_alternative<gateway::ContractDetailsEndEvent>(event)) {
        finish(res, INVALID_CONTRACT_ID,
               std::make_exception_ptr(ContractNotFoundError(res->label + ": no contract details returned")));
    } else if (const auto* err = std::get_if<gateway::GatewayErrorEvent>(&event)) {
        if (gateway::is_informational_error(err->code)) return;
        LOGF_WARN(logger_, Correlator, "resolution of %s failed: code=%d %s", res->label.c_str(), err->code,
                  err->message.c_str());
        finish(res, INVALID_CONTRACT_ID,
               std::make_exception_ptr(ContractNotFoundError(res->label + ": " + err->message + " (code " +
                                                             std::to_string(err->code) + ")")));
    }
}

void ContractResolver::finish(const std::shared_ptr<Resolution>& res, ContractId con_id, std::exception_ptr error) {
    if (res->finished.exchange(true)) return;
    correlator_.complete(res->id);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!error) {
            cache_[res->key] = con_id;
        }
        in_flight_.erase(res->key);
    }

    if (error) {
        res->promise.set_exception(error);
    } else {
        LOGF_DEBUG(logger_, Correlator, "resolved %s -> conId %lld", res->label.c_str(),
                   static_cast<long long>(con_id));
        res->promise.set_value(con_id);
    }
}

}  // namespace rolldesk::market
