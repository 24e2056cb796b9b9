#include "../../include/account/account_service.hpp"

#include "../../include/util/string_utils.hpp"

#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <iterator>
#include <utility>

namespace rolldesk::account {

template <typename T>
struct AccountService::Call {
    RequestId id = INVALID_REQUEST_ID;
    std::promise<T> promise;
    std::mutex mutex;
    T results{};
    std::atomic<bool> finished{false};

    /// Resolve with what was collected; false when already settled
    bool settle() {
        if (finished.exchange(true)) return false;
        T value;
        {
            std::lock_guard<std::mutex> lock(mutex);
            value = std::move(results);
        }
        promise.set_value(std::move(value));
        return true;
    }

    bool fail(std::exception_ptr error) {
        if (finished.exchange(true)) return false;
        promise.set_exception(error);
        return true;
    }
};

namespace {

/// One shared request for every concurrent caller of a slot
template <typename T, typename Fetch>
T coalesce(std::mutex& mutex, std::optional<std::shared_future<T>>& slot, Fetch fetch) {
    std::promise<T> promise;
    std::shared_future<T> future;
    bool owner = false;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (slot) {
            future = *slot;
        } else {
            future = promise.get_future().share();
            slot = future;
            owner = true;
        }
    }

    if (owner) {
        std::exception_ptr error;
        T value{};
        try {
            value = fetch();
        } catch (const std::exception&) {
            error = std::current_exception();
        }
        {
            std::lock_guard<std::mutex> lock(mutex);
            slot.reset();
        }
        if (error) {
            promise.set_exception(error);
        } else {
            promise.set_value(std::move(value));
        }
    }
    return future.get();
}

/// A send that throws releases the correlator entry before propagating
template <typename Send>
void send_registered(core::RequestCorrelator& correlator, RequestId id, Send send) {
    try {
        send();
    } catch (const std::exception&) {
        correlator.complete(id);
        throw;
    }
}

void bind_or_release(core::RequestCorrelator& correlator, gateway::EventStream stream, RequestId id) {
    if (!correlator.bind_stream(stream, id)) {
        correlator.complete(id);
        throw DeskError(ErrorCode::InvalidRequest,
                        std::string(gateway::event_stream_to_string(stream)) + " already requested");
    }
}

void apply_summary_tag(AccountSummary& summary, const gateway::AccountSummaryEvent& item) {
    summary.values[item.tag] = item.value;
    if (!item.currency.empty()) summary.currency = item.currency;

    const double value = std::strtod(item.value.c_str(), nullptr);
    if (item.tag == "NetLiquidation") summary.net_liquidation = value;
    else if (item.tag == "AvailableFunds") summary.available_funds = value;
    else if (item.tag == "TotalCashValue") summary.total_cash_value = value;
    else if (item.tag == "GrossPositionValue") summary.gross_position_value = value;
}

}  // namespace

AccountService::AccountService(gateway::IGateway& gateway, core::RequestCorrelator& correlator,
                               logging::AsyncLogger& logger, AccountServiceConfig config)
    : gateway_(gateway), correlator_(correlator), logger_(logger), config_(std::move(config)) {}

void AccountService::ensure_connected(const char* what_for) const {
    if (!gateway_.is_connected()) {
        throw NotConnectedError(what_for);
    }
}

// ============================================================================
// Managed accounts
// ============================================================================

std::vector<std::string> AccountService::request_managed_accounts() {
    ensure_connected("managed accounts");
    return coalesce(mutex_, accounts_in_flight_, [this]() { return fetch_managed_accounts(); });
}

std::vector<std::string> AccountService::fetch_managed_accounts() {
    using Accounts = std::vector<std::string>;
    auto call = std::make_shared<Call<Accounts>>();
    auto future = call->promise.get_future();

    call->id = correlator_.allocate_id(core::RequestCategory::Account);
    correlator_.register_request(
        call->id, core::RequestCategory::Account,
        [this, call](const gateway::GatewayEvent& event) {
            const auto* msg = std::get_if<gateway::ManagedAccountsEvent>(&event);
            if (!msg) return;
            {
                std::lock_guard<std::mutex> lock(call->mutex);
                call->results = util::split_list(msg->accounts);
            }
            correlator_.complete(call->id);
            call->settle();
        },
        [call]() { call->fail(std::make_exception_ptr(RequestTimeoutError("managed accounts"))); },
        config_.managed_accounts_timeout);
    bind_or_release(correlator_, gateway::EventStream::ManagedAccounts, call->id);

    LOGF_DEBUG(logger_, Accounts, "requesting managed accounts (request %lld)", static_cast<long long>(call->id));
    send_registered(correlator_, call->id, [this]() { gateway_.req_managed_accounts(); });

    Accounts accounts = future.get();
    LOGF_INFO(logger_, Accounts, "%zu managed accounts", accounts.size());
    return accounts;
}

// ============================================================================
// Account summary
// ============================================================================

std::vector<AccountSummary> AccountService::request_account_summary() {
    ensure_connected("account summary");

    using Summaries = std::vector<AccountSummary>;
    auto call = std::make_shared<Call<Summaries>>();
    auto future = call->promise.get_future();

    call->id = correlator_.allocate_id(core::RequestCategory::Account);
    const RequestId id = call->id;
    correlator_.register_request(
        id, core::RequestCategory::Account,
        [this, call, id](const gateway::GatewayEvent& event) {
            if (const auto* item = std::get_if<gateway::AccountSummaryEvent>(&event)) {
                std::lock_guard<std::mutex> lock(call->mutex);
                auto it = std::find_if(call->results.begin(), call->results.end(),
                                       [&](const AccountSummary& s) { return s.account == item->account; });
                if (it == call->results.end()) {
                    call->results.push_back(AccountSummary{item->account});
                    it = std::prev(call->results.end());
                }
                apply_summary_tag(*it, *item);
            } else if (std::holds_alternative<gateway::AccountSummaryEndEvent>(event)) {
                correlator_.complete(id);
                gateway_.cancel_account_summary(id);
                call->settle();
            } else if (const auto* err = std::get_if<gateway::GatewayErrorEvent>(&event)) {
                if (gateway::is_informational_error(err->code)) return;
                LOGF_WARN(logger_, Accounts, "account summary rejected: %d %s", err->code, err->message.c_str());
                correlator_.complete(id);
                call->fail(std::make_exception_ptr(
                    GatewayRejectedError("account summary", err->code, err->message)));
            }
        },
        [this, call, id]() {
            gateway_.cancel_account_summary(id);
            size_t received = 0;
            {
                std::lock_guard<std::mutex> lock(call->mutex);
                received = call->results.size();
            }
            if (received == 0) {
                call->fail(std::make_exception_ptr(RequestTimeoutError("account summary")));
                return;
            }
            LOGF_WARN(logger_, Accounts, "account summary timed out with %zu accounts, returning partial", received);
            call->settle();
        },
        config_.summary_timeout);

    LOGF_DEBUG(logger_, Accounts, "requesting account summary %s [%s] (request %lld)", config_.summary_group.c_str(),
               config_.summary_tags.c_str(), static_cast<long long>(id));
    send_registered(correlator_, id,
                    [this, id]() { gateway_.req_account_summary(id, config_.summary_group, config_.summary_tags); });

    return future.get();
}

// ============================================================================
// Positions
// ============================================================================

std::vector<Position> AccountService::request_positions() {
    ensure_connected("positions");
    return coalesce(mutex_, positions_in_flight_, [this]() { return fetch_positions(); });
}

std::vector<Position> AccountService::fetch_positions() {
    using Positions = std::vector<Position>;
    auto call = std::make_shared<Call<Positions>>();
    auto future = call->promise.get_future();

    call->id = correlator_.allocate_id(core::RequestCategory::Account);
    correlator_.register_request(
        call->id, core::RequestCategory::Account,
        [this, call](const gateway::GatewayEvent& event) {
            if (const auto* pos = std::get_if<gateway::PositionEvent>(&event)) {
                // Closed positions are reported with size zero
                if (pos->position == 0.0) return;
                std::lock_guard<std::mutex> lock(call->mutex);
                call->results.push_back(Position{pos->account, pos->contract, pos->position, pos->avg_cost});
            } else if (std::holds_alternative<gateway::PositionEndEvent>(event)) {
                correlator_.complete(call->id);
                gateway_.cancel_positions();
                call->settle();
            }
        },
        [this, call]() {
            gateway_.cancel_positions();
            LOG_WARN(logger_, Accounts, "positions timed out, returning partial");
            call->settle();
        },
        config_.positions_timeout);
    bind_or_release(correlator_, gateway::EventStream::Positions, call->id);

    send_registered(correlator_, call->id, [this]() { gateway_.req_positions(); });

    Positions positions = future.get();
    LOGF_INFO(logger_, Accounts, "%zu open positions", positions.size());
    return positions;
}

// ============================================================================
// Aliases
// ============================================================================

std::map<std::string, std::string> AccountService::request_account_aliases(const std::vector<std::string>& accounts) {
    ensure_connected("account aliases");

    std::map<std::string, std::string> aliases;
    for (const auto& account : accounts) {
        if (auto alias = fetch_alias(account)) {
            aliases.emplace(account, *alias);
        }
    }
    LOGF_INFO(logger_, Accounts, "fetched %zu aliases for %zu accounts", aliases.size(), accounts.size());
    return aliases;
}

std::optional<std::string> AccountService::fetch_alias(const std::string& account) {
    std::lock_guard<std::mutex> updates(updates_mutex_);

    using Alias = std::optional<std::string>;
    auto call = std::make_shared<Call<Alias>>();
    auto future = call->promise.get_future();

    call->id = correlator_.allocate_id(core::RequestCategory::Account);
    correlator_.register_request(
        call->id, core::RequestCategory::Account,
        [this, call, account](const gateway::GatewayEvent& event) {
            if (const auto* value = std::get_if<gateway::AccountValueEvent>(&event)) {
                if (value->key != config::accounts::ALIAS_KEY || value->account != account) return;
                // The group name defaults to the account id when no alias is set
                if (value->value.empty() || value->value == account) return;
                std::lock_guard<std::mutex> lock(call->mutex);
                call->results = value->value;
            } else if (const auto* end = std::get_if<gateway::AccountDownloadEndEvent>(&event)) {
                if (!end->account.empty() && end->account != account) return;
                correlator_.complete(call->id);
                call->settle();
            }
        },
        [this, call, account]() {
            LOGF_DEBUG(logger_, Accounts, "alias for %s timed out", account.c_str());
            call->settle();
        },
        config_.alias_timeout);
    bind_or_release(correlator_, gateway::EventStream::AccountUpdates, call->id);

    send_registered(correlator_, call->id, [this, &account]() { gateway_.req_account_updates(true, account); });

    Alias alias = future.get();
    gateway_.req_account_updates(false, account);
    if (alias) {
        LOGF_DEBUG(logger_, Accounts, "alias %s -> %s", account.c_str(), alias->c_str());
    }
    return alias;
}

}  // namespace rolldesk::account
