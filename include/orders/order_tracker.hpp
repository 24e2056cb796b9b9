#pragma once

#include "../gateway/gateway_events.hpp"
#include "../logging/async_logger.hpp"
#include "combo_order.hpp"

#include <exception>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace rolldesk {
namespace orders {

/**
 * OrderTracker - last known status of every order this desk placed
 *
 * Order status events carry only the order id, so the builders register each
 * order's account and label before sending it. Every status (including those
 * for orders placed by another session) is forwarded to the listeners on the
 * gateway's delivery thread.
 */
class OrderTracker {
public:
    using Listener = std::function<void(const OrderStatusUpdate&)>;
    using ListenerId = uint64_t;

    explicit OrderTracker(logging::AsyncLogger& logger) : logger_(logger) {}

    /// Record an order about to be sent; its status starts as PendingSubmit
    void track(OrderId order_id, const std::string& account, const std::string& symbol, double quantity) {
        OrderStatusUpdate update;
        update.order_id = order_id;
        update.account = account;
        update.status = "PendingSubmit";
        update.remaining = quantity;
        update.symbol = symbol;

        std::lock_guard<std::mutex> lock(mutex_);
        orders_[order_id] = std::move(update);
    }

    void on_status(const gateway::OrderStatusEvent& event) {
        OrderStatusUpdate update;
        std::vector<Listener> listeners;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto& entry = orders_[event.order_id];
            entry.order_id = event.order_id;
            entry.status = event.status;
            entry.filled = event.filled;
            entry.remaining = event.remaining;
            entry.avg_fill_price = event.avg_fill_price;
            update = entry;
            for (const auto& [id, listener] : listeners_) {
                listeners.push_back(listener);
            }
        }

        LOGF_INFO(logger_, Orders, "order #%lld %s: filled %.0f remaining %.0f @ %.2f",
                  static_cast<long long>(update.order_id), update.status.c_str(), update.filled, update.remaining,
                  update.avg_fill_price);

        for (const auto& listener : listeners) {
            try {
                listener(update);
            } catch (const std::exception& e) {
                LOGF_ERROR(logger_, Orders, "order status listener failed for #%lld: %s",
                           static_cast<long long>(update.order_id), e.what());
            }
        }
    }

    ListenerId add_listener(Listener listener) {
        std::lock_guard<std::mutex> lock(mutex_);
        ListenerId id = ++next_listener_;
        listeners_.emplace(id, std::move(listener));
        return id;
    }

    bool remove_listener(ListenerId id) {
        std::lock_guard<std::mutex> lock(mutex_);
        return listeners_.erase(id) > 0;
    }

    std::optional<OrderStatusUpdate> last_status(OrderId order_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = orders_.find(order_id);
        if (it == orders_.end()) return std::nullopt;
        return it->second;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return orders_.size();
    }

private:
    logging::AsyncLogger& logger_;

    mutable std::mutex mutex_;
    std::unordered_map<OrderId, OrderStatusUpdate> orders_;
    std::map<ListenerId, Listener> listeners_;
    ListenerId next_listener_ = 0;
};

}  // namespace orders
}  // namespace rolldesk
