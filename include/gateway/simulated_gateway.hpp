#pragma once

#include "igateway.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace rolldesk {
namespace gateway {

/**
 * SimulatedGateway - Synthetic gateway for the demo tool
 *
 * Answers every request asynchronously from its own delivery thread, the way
 * the real gateway does:
 * - Stock snapshots: bid/ask/last around a per-symbol spot, then snapshot end
 * - Option snapshots: bid/ask plus a model computation (Black-Scholes, flat
 *   rate 0), and no snapshot end, so batches complete by the settle timer
 * - Contract details: a stable synthetic contract id per description
 * - Chain parameters: the next weekly expirations on two listing exchanges
 * - Orders: Submitted, then Filled at the limit price (spot for market orders)
 * - Accounts: a fixed set of paper accounts with aliases, summary values and
 *   one stock position each
 * - Historical data: daily random-walk bars that end at the current spot
 *
 * Each reply is delayed by a small random latency. Cancelled requests stop
 * receiving queued events.
 */
class SimulatedGateway : public IGateway {
public:
    struct Config {
        std::chrono::milliseconds min_latency{2};
        std::chrono::milliseconds max_latency{40};
        size_t num_expirations = 6;
        double strike_span_pct = 0.15;  // strikes cover spot +-15%
        OrderId first_order_id = 1000;
        uint32_t seed = 42;
        std::vector<std::string> accounts = {"DU100001", "DU100002", "DU100003"};
        std::map<std::string, std::string> aliases = {{"DU100001", "Main"}, {"DU100002", "IRA"}};
    };

    SimulatedGateway();
    explicit SimulatedGateway(Config config);
    ~SimulatedGateway() override;

    SimulatedGateway(const SimulatedGateway&) = delete;
    SimulatedGateway& operator=(const SimulatedGateway&) = delete;

    /// Starts the delivery thread and announces the next valid order id
    void connect();
    void disconnect();

    bool is_connected() const override { return connected_.load(std::memory_order_acquire); }
    void set_event_handler(EventHandler handler) override;

    void req_market_data_type(MarketDataType type) override;
    void req_market_data(RequestId id, const Contract& contract, bool snapshot) override;
    void cancel_market_data(RequestId id) override;
    void req_contract_details(RequestId id, const Contract& contract) override;
    void req_chain_parameters(RequestId id, const std::string& symbol, SecType underlying_type,
                              ContractId underlying_con_id) override;
    void place_order(OrderId id, const Contract& contract, const Order& order) override;

    void req_managed_accounts() override;
    void req_account_summary(RequestId id, const std::string& group, const std::string& tags) override;
    void cancel_account_summary(RequestId id) override;
    void req_positions() override;
    void cancel_positions() override;
    void req_account_updates(bool subscribe, const std::string& account) override;

    void req_historical_data(RequestId id, const Contract& contract, const HistoricalQuery& query) override;
    void cancel_historical_data(RequestId id) override;

    void set_spot(const std::string& symbol, double price);
    double spot(const std::string& symbol) const;

    uint64_t events_delivered() const { return delivered_.load(std::memory_order_relaxed); }
    uint64_t orders_received() const { return orders_.load(std::memory_order_relaxed); }

private:
    using Clock = std::chrono::steady_clock;

    void delivery_loop();

    /// Queue events for one request, each after its own latency
    void enqueue(std::vector<GatewayEvent> events);
    Clock::duration next_latency();

    /// Drop queued events of one request, or of one id-less stream
    void drop_queued(RequestId id);
    void drop_queued(EventStream stream);

    std::vector<GatewayEvent> stock_snapshot(RequestId id, const Contract& contract) const;
    std::vector<GatewayEvent> option_snapshot(RequestId id, const Contract& contract) const;
    std::vector<std::string> upcoming_expirations() const;
    std::vector<GatewayEvent> daily_bars(RequestId id, const Contract& contract, const HistoricalQuery& query) const;

    static ContractId synthetic_con_id(const Contract& contract);

    Config config_;

    std::atomic<bool> connected_{false};
    std::atomic<bool> running_{false};
    std::thread delivery_thread_;

    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::multimap<Clock::time_point, GatewayEvent> queue_;
    std::mt19937 rng_;

    // Held while the handler runs so a handler swap waits for the delivery in progress
    std::mutex handler_mutex_;
    EventHandler handler_;

    mutable std::mutex spot_mutex_;
    std::map<std::string, double> spots_;

    std::atomic<uint64_t> delivered_{0};
    std::atomic<uint64_t> orders_{0};
};

}  // namespace gateway
}  // namespace rolldesk
