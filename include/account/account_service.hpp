#pragma once

#include "../config/defaults.hpp"
#include "../core/request_correlator.hpp"
#include "../gateway/igateway.hpp"
#include "../logging/async_logger.hpp"
#include "../types.hpp"

#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace rolldesk {
namespace account {

struct AccountServiceConfig {
    std::chrono::milliseconds managed_accounts_timeout{config::timeouts::MANAGED_ACCOUNTS_MS};
    std::chrono::milliseconds summary_timeout{config::timeouts::ACCOUNT_SUMMARY_MS};
    std::chrono::milliseconds positions_timeout{config::timeouts::POSITIONS_MS};
    std::chrono::milliseconds alias_timeout{config::timeouts::ACCOUNT_ALIAS_MS};
    std::string summary_group = config::accounts::SUMMARY_GROUP;
    std::string summary_tags = config::accounts::SUMMARY_TAGS;
};

/**
 * Balances of one account. Known tags are parsed into the typed fields; every
 * tag the gateway sent is kept verbatim in values.
 */
struct AccountSummary {
    std::string account;
    std::string currency;
    Money net_liquidation = 0.0;
    Money available_funds = 0.0;
    Money total_cash_value = 0.0;
    Money gross_position_value = 0.0;
    std::map<std::string, std::string> values;
};

struct Position {
    std::string account;
    gateway::Contract contract;
    double quantity = 0.0;
    Money avg_cost = 0.0;
};

/**
 * AccountService - managed accounts, balances, positions and aliases
 *
 * Managed accounts, positions and account updates reply without a request id,
 * so each is bound to its request's stream in the correlator. Concurrent
 * callers of the managed-account and position reads share one request; alias
 * fetches run one account at a time.
 *
 * Every call blocks the caller and must not run on the gateway's delivery
 * thread.
 */
class AccountService {
public:
    AccountService(gateway::IGateway& gateway, core::RequestCorrelator& correlator, logging::AsyncLogger& logger,
                   AccountServiceConfig config = {});

    /// Account ids in gateway order. Throws NotConnectedError, RequestTimeoutError.
    std::vector<std::string> request_managed_accounts();

    /**
     * One summary per account, in the order first seen. A timeout returns the
     * accounts received so far and throws RequestTimeoutError only when none
     * arrived. A rejection throws GatewayRejectedError.
     */
    std::vector<AccountSummary> request_account_summary();

    /// Non-zero positions of every account; a timeout returns what arrived
    std::vector<Position> request_positions();

    /**
     * Operator-assigned alias per account, read from the account's update
     * stream. Accounts whose group name is their own id, or that time out,
     * are absent from the result.
     */
    std::map<std::string, std::string> request_account_aliases(const std::vector<std::string>& accounts);

private:
    template <typename T>
    struct Call;

    std::vector<std::string> fetch_managed_accounts();
    std::vector<Position> fetch_positions();
    std::optional<std::string> fetch_alias(const std::string& account);

    void ensure_connected(const char* what_for) const;

    gateway::IGateway& gateway_;
    core::RequestCorrelator& correlator_;
    logging::AsyncLogger& logger_;
    AccountServiceConfig config_;

    std::mutex mutex_;
    std::optional<std::shared_future<std::vector<std::string>>> accounts_in_flight_;
    std::optional<std::shared_future<std::vector<Position>>> positions_in_flight_;

    // One account-updates subscription at a time
    std::mutex updates_mutex_;
};

}  // namespace account
}  // namespace rolldesk
