#pragma once

#include "../config/defaults.hpp"
#include "../core/errors.hpp"
#include "../core/request_correlator.hpp"
#include "../gateway/igateway.hpp"
#include "../logging/async_logger.hpp"
#include "chain_cache.hpp"

#include <chrono>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace rolldesk {
namespace market {

struct ResolverConfig {
    std::chrono::milliseconds timeout{config::timeouts::RESOLUTION_MS};
    std::string exchange = "SMART";
    std::string currency = "USD";
};

/**
 * ContractResolver - (symbol[, expiry, strike, right]) -> gateway contract id
 *
 * Contract ids never change for a given contract, so resolved ids are cached
 * for the process lifetime. Concurrent resolutions of the same contract share
 * one gateway request.
 *
 * Option resolution attaches the trading class from the ChainCache whenever
 * chain data for the underlying is cached; without it the gateway may pick a
 * different series that shares the symbol (weekly vs monthly).
 *
 * Failures:
 *   NotConnectedError       - thrown before any request is sent
 *   ContractNotFoundError   - gateway rejected the contract or returned none
 *   ResolutionTimeoutError  - no answer within the timeout
 */
class ContractResolver {
public:
    ContractResolver(gateway::IGateway& gateway, core::RequestCorrelator& correlator, const ChainCache& chains,
                     logging::AsyncLogger& logger, ResolverConfig config = {});

    ContractId resolve_underlying(const std::string& symbol);

    ContractId resolve_option(const std::string& symbol, const std::string& expiry, double strike, OptionRight right,
                              core::RequestCategory category = core::RequestCategory::Contract);

    std::shared_future<ContractId> resolve_underlying_async(const std::string& symbol);

    std::shared_future<ContractId>
    resolve_option_async(const std::string& symbol, const std::string& expiry, double strike, OptionRight right,
                         core::RequestCategory category = core::RequestCategory::Contract);

    std::optional<ContractId> cached_underlying(const std::string& symbol) const;
    std::optional<ContractId> cached_option(const std::string& symbol, const std::string& expiry, double strike,
                                            OptionRight right) const;

    size_t cache_size() const;

    /// Human-readable contract label used in errors and logs: "QQQ 20260220 590P"
    static std::string describe(const gateway::Contract& contract);

private:
    struct Resolution;

    static std::string underlying_key(const std::string& symbol);
    static std::string option_key(const std::string& symbol, const std::string& expiry, double strike,
                                  OptionRight right);

    std::shared_future<ContractId> resolve(const std::string& key, const gateway::Contract& contract,
                                           core::RequestCategory category);
    void on_event(const std::shared_ptr<Resolution>& res, const gateway::GatewayEvent& event);
    void finish(const std::shared_ptr<Resolution>& res, ContractId con_id, std::exception_ptr error);

    gateway::IGateway& gateway_;
    core::RequestCorrelator& correlator_;
    const ChainCache& chains_;
    logging::AsyncLogger& logger_;
    ResolverConfig config_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ContractId> cache_;
    std::unordered_map<std::string, std::shared_future<ContractId>> in_flight_;
};

}  // namespace market
}  // namespace rolldesk
