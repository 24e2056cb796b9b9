#pragma once

#include "../config/defaults.hpp"
#include "../core/request_correlator.hpp"
#include "../gateway/igateway.hpp"
#include "../logging/async_logger.hpp"
#include "chain_cache.hpp"
#include "contract_resolver.hpp"

#include <chrono>
#include <future>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace rolldesk {
namespace market {

struct ChainServiceConfig {
    std::chrono::milliseconds timeout{config::timeouts::CHAIN_MS};
};

/**
 * OptionChainService - fetches chain parameters into the ChainCache
 *
 * An underlying may be listed as several series (one record per exchange and
 * trading class); every record up to the explicit end-of-parameters event is
 * collected. If the end never arrives the timeout returns what was collected
 * so far, and an empty result is not cached.
 *
 * Concurrent callers for the same symbol share one fetch.
 */
class OptionChainService {
public:
    OptionChainService(gateway::IGateway& gateway, core::RequestCorrelator& correlator, ContractResolver& resolver,
                       ChainCache& cache, logging::AsyncLogger& logger, ChainServiceConfig config = {});

    /**
     * Cache-first read. On a miss (or with force_refresh) resolves the
     * underlying, sends one parameter request and blocks until the end signal
     * or the timeout.
     *
     * Throws NotConnectedError, and ContractNotFoundError /
     * ResolutionTimeoutError when the underlying cannot be resolved.
     */
    std::vector<ChainParams> get_chain(const std::string& symbol, bool force_refresh = false);

    size_t in_flight() const;

private:
    struct Fetch;

    void start_fetch(const std::shared_ptr<Fetch>& fetch, ContractId underlying_con_id);
    void on_event(const std::shared_ptr<Fetch>& fetch, const gateway::GatewayEvent& event);
    void finish(const std::shared_ptr<Fetch>& fetch, const char* reason);
    void fail(const std::shared_ptr<Fetch>& fetch, std::exception_ptr error);

    gateway::IGateway& gateway_;
    core::RequestCorrelator& correlator_;
    ContractResolver& resolver_;
    ChainCache& cache_;
    logging::AsyncLogger& logger_;
    ChainServiceConfig config_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_future<std::vector<ChainParams>>> in_flight_;
};

}  // namespace market
}  // namespace rolldesk
