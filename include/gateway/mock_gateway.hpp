#pragma once

#include "igateway.hpp"

#include <algorithm>
#include <mutex>
#include <utility>
#include <vector>

namespace rolldesk {
namespace gateway {

/**
 * MockGateway - Test implementation
 *
 * Records every request for verification in tests. A scripted responder is
 * invoked synchronously after each request is recorded and may emit events
 * back through the registered handler, so tests can model any reply order
 * (including replies that arrive before the caller has sent its last burst).
 */
class MockGateway : public IGateway {
public:
    enum class RequestKind : uint8_t {
        MarketDataType,
        MarketData,
        CancelMarketData,
        ContractDetails,
        ChainParameters,
        PlaceOrder,
        ManagedAccounts,
        AccountSummary,
        CancelAccountSummary,
        Positions,
        CancelPositions,
        AccountUpdates,
        HistoricalData,
        CancelHistoricalData
    };

    struct SentRequest {
        RequestKind kind;
        RequestId id = INVALID_REQUEST_ID;
        Contract contract;
        bool snapshot = false;
        MarketDataType data_type = MarketDataType::Live;
        std::string symbol;
        ContractId underlying_con_id = INVALID_CONTRACT_ID;
        Order order;
        std::string group;
        std::string tags;
        std::string account;
        bool subscribe = false;
        HistoricalQuery query;
    };

    using Responder = std::function<void(const SentRequest&, MockGateway&)>;

    MockGateway() : connected_(true) {}

    // IGateway interface
    bool is_connected() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return connected_;
    }

    void set_event_handler(EventHandler handler) override {
        std::lock_guard<std::mutex> lock(mutex_);
        handler_ = std::move(handler);
    }

    void req_market_data_type(MarketDataType type) override {
        SentRequest r{RequestKind::MarketDataType};
        r.data_type = type;
        record(std::move(r));
    }

    void req_market_data(RequestId id, const Contract& contract, bool snapshot) override {
        SentRequest r{RequestKind::MarketData};
        r.id = id;
        r.contract = contract;
        r.snapshot = snapshot;
        record(std::move(r));
    }

    void cancel_market_data(RequestId id) override {
        SentRequest r{RequestKind::CancelMarketData};
        r.id = id;
        record(std::move(r));
    }

    void req_contract_details(RequestId id, const Contract& contract) override {
        SentRequest r{RequestKind::ContractDetails};
        r.id = id;
        r.contract = contract;
        record(std::move(r));
    }

    void req_chain_parameters(RequestId id, const std::string& symbol, SecType /*underlying_type*/,
                              ContractId underlying_con_id) override {
        SentRequest r{RequestKind::ChainParameters};
        r.id = id;
        r.symbol = symbol;
        r.underlying_con_id = underlying_con_id;
        record(std::move(r));
    }

    void place_order(OrderId id, const Contract& contract, const Order& order) override {
        SentRequest r{RequestKind::PlaceOrder};
        r.id = id;
        r.contract = contract;
        r.order = order;
        record(std::move(r));
    }

    void req_managed_accounts() override { record(SentRequest{RequestKind::ManagedAccounts}); }

    void req_account_summary(RequestId id, const std::string& group, const std::string& tags) override {
        SentRequest r{RequestKind::AccountSummary};
        r.id = id;
        r.group = group;
        r.tags = tags;
        record(std::move(r));
    }

    void cancel_account_summary(RequestId id) override {
        SentRequest r{RequestKind::CancelAccountSummary};
        r.id = id;
        record(std::move(r));
    }

    void req_positions() override { record(SentRequest{RequestKind::Positions}); }

    void cancel_positions() override { record(SentRequest{RequestKind::CancelPositions}); }

    void req_account_updates(bool subscribe, const std::string& account) override {
        SentRequest r{RequestKind::AccountUpdates};
        r.subscribe = subscribe;
        r.account = account;
        record(std::move(r));
    }

    void req_historical_data(RequestId id, const Contract& contract, const HistoricalQuery& query) override {
        SentRequest r{RequestKind::HistoricalData};
        r.id = id;
        r.contract = contract;
        r.query = query;
        record(std::move(r));
    }

    void cancel_historical_data(RequestId id) override {
        SentRequest r{RequestKind::CancelHistoricalData};
        r.id = id;
        record(std::move(r));
    }

    // Test helpers
    void set_connected(bool connected) {
        std::lock_guard<std::mutex> lock(mutex_);
        connected_ = connected;
    }

    void set_responder(Responder responder) {
        std::lock_guard<std::mutex> lock(mutex_);
        responder_ = std::move(responder);
    }

    /// Deliver an event to the handler on the calling thread
    void emit(const GatewayEvent& event) {
        EventHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            handler = handler_;
        }
        if (handler) {
            handler(event);
        }
    }

    std::vector<SentRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    std::vector<SentRequest> requests_of(RequestKind kind) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<SentRequest> out;
        for (const auto& r : requests_) {
            if (r.kind == kind) out.push_back(r);
        }
        return out;
    }

    size_t count(RequestKind kind) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<size_t>(std::count_if(requests_.begin(), requests_.end(),
                                                 [kind](const SentRequest& r) { return r.kind == kind; }));
    }

    bool was_cancelled(RequestId id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::any_of(requests_.begin(), requests_.end(), [id](const SentRequest& r) {
            return r.kind == RequestKind::CancelMarketData && r.id == id;
        });
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.clear();
    }

private:
    void record(SentRequest request) {
        Responder responder;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(request);
            responder = responder_;
        }
        if (responder) {
            responder(request, *this);
        }
    }

    mutable std::mutex mutex_;
    bool connected_;
    EventHandler handler_;
    Responder responder_;
    std::vector<SentRequest> requests_;
};

}  // namespace gateway
}  // namespace rolldesk
