#include "../../include/core/request_correlator.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace rolldesk::core {

bool CorrelatorConfig::ranges_disjoint() const {
    std::vector<int64_t> bases = {order_base,    quote_base,   chain_base,  contract_base,
                                   roll_base,     account_base, history_base};
    std::sort(bases.begin(), bases.end());
    for (size_t i = 1; i < bases.size(); ++i) {
        if (bases[i] - bases[i - 1] < range_width) return false;
    }
    return range_width > 0 && bases.front() > 0;
}

RequestCorrelator::RequestCorrelator(TimerService& timers, logging::AsyncLogger& logger, CorrelatorConfig config)
    : timers_(timers), logger_(logger), config_(config), timeouts_(0) {
    if (!config_.ranges_disjoint()) {
        throw ConfigError("request id ranges overlap or are empty");
    }
    for (size_t i = 0; i < REQUEST_CATEGORY_COUNT; ++i) {
        next_ids_[i] = config_.base_of(static_cast<RequestCategory>(i));
    }
}

RequestCorrelator::~RequestCorrelator() {
    std::vector<TimerService::TimerId> timers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, pending] : pending_) {
            timers.push_back(pending->timer);
        }
        pending_.clear();
        stream_owners_.fill(INVALID_REQUEST_ID);
    }
    for (auto timer : timers) {
        timers_.cancel(timer);
    }
}

RequestId RequestCorrelator::allocate_id(RequestCategory category) {
    const auto idx = static_cast<size_t>(category);
    const int64_t base = config_.base_of(category);
    const int64_t end = base + config_.range_width;

    std::lock_guard<std::mutex> lock(mutex_);
    for (int64_t attempts = 0; attempts < config_.range_width; ++attempts) {
        RequestId id = next_ids_[idx]++;
        if (next_ids_[idx] >= end) {
            next_ids_[idx] = base;
            LOGF_WARN(logger_, Correlator, "%s id range exhausted, wrapping to %lld",
                      request_category_to_string(category), static_cast<long long>(base));
        }
        if (pending_.find(id) == pending_.end()) {
            return id;
        }
    }
    throw DeskError(ErrorCode::InvalidRequest,
                    std::string("no free request id in ") + request_category_to_string(category) + " range");
}

void RequestCorrelator::register_request(RequestId id, RequestCategory category, EventHandler on_event,
                                         TimeoutHandler on_timeout, std::chrono::milliseconds timeout) {
    if (timeout.count() <= 0) {
        throw DeskError(ErrorCode::InvalidRequest, "request " + std::to_string(id) + " registered without timeout");
    }

    auto pending = std::make_shared<Pending>();
    pending->id = id;
    pending->category = category;
    pending->created_at = std::chrono::steady_clock::now();
    pending->on_event = std::move(on_event);
    pending->on_timeout = std::move(on_timeout);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!pending_.emplace(id, pending).second) {
            throw DeskError(ErrorCode::InvalidRequest, "request id " + std::to_string(id) + " already pending");
        }
    }

    auto timer = timers_.schedule_after(timeout, [this, id]() { on_timer(id); });

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(id);
    if (it != pending_.end() && it->second == pending) {
        it->second->timer = timer;
    }
    // Completed before the timer was armed: the timer finds nothing and is a no-op
}

bool RequestCorrelator::complete(RequestId id) {
    TimerService::TimerId timer = TimerService::INVALID_TIMER;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(id);
        if (it == pending_.end()) return false;
        timer = it->second->timer;
        pending_.erase(it);
        unbind_locked(id);
    }
    timers_.cancel(timer);
    return true;
}

bool RequestCorrelator::bind_stream(gateway::EventStream stream, RequestId id) {
    if (stream == gateway::EventStream::None) return false;
    const auto idx = static_cast<size_t>(stream);

    std::lock_guard<std::mutex> lock(mutex_);
    if (pending_.find(id) == pending_.end()) return false;
    RequestId owner = stream_owners_[idx];
    if (owner != INVALID_REQUEST_ID && owner != id && pending_.find(owner) != pending_.end()) {
        return false;
    }
    stream_owners_[idx] = id;
    return true;
}

void RequestCorrelator::unbind_locked(RequestId id) {
    for (auto& owner : stream_owners_) {
        if (owner == id) owner = INVALID_REQUEST_ID;
    }
}

bool RequestCorrelator::dispatch(const gateway::GatewayEvent& event) {
    std::shared_ptr<Pending> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        RequestId id = gateway::event_request_id(event);
        if (id == INVALID_REQUEST_ID) {
            auto stream = gateway::event_stream(event);
            if (stream == gateway::EventStream::None) return false;
            id = stream_owners_[static_cast<size_t>(stream)];
            if (id == INVALID_REQUEST_ID) return false;
        }
        auto it = pending_.find(id);
        if (it == pending_.end()) return false;
        pending = it->second;
    }

    if (pending->on_event) {
        pending->on_event(event);
    }
    return true;
}

void RequestCorrelator::on_timer(RequestId id) {
    std::shared_ptr<Pending> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(id);
        if (it == pending_.end()) return;
        pending = it->second;
        pending_.erase(it);
        unbind_locked(id);
    }

    timeouts_.fetch_add(1, std::memory_order_relaxed);
    auto age_ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                                        pending->created_at)
                      .count();
    LOGF_DEBUG(logger_, Correlator, "%s request %lld timed out after %lld ms",
               request_category_to_string(pending->category), static_cast<long long>(id),
               static_cast<long long>(age_ms));

    if (pending->on_timeout) {
        pending->on_timeout();
    }
}

void RequestCorrelator::advance_order_ids(OrderId next_valid_id) {
    const auto idx = static_cast<size_t>(RequestCategory::Order);
    const int64_t base = config_.order_base;
    const int64_t end = base + config_.range_width;

    if (next_valid_id < base || next_valid_id >= end) {
        LOGF_WARN(logger_, Correlator, "next valid order id %lld outside order range [%lld, %lld)",
                  static_cast<long long>(next_valid_id), static_cast<long long>(base), static_cast<long long>(end));
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (next_valid_id > next_ids_[idx]) {
        next_ids_[idx] = next_valid_id;
    }
}

bool RequestCorrelator::is_pending(RequestId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.find(id) != pending_.end();
}

size_t RequestCorrelator::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

}  // namespace rolldesk::core
