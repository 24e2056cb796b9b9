#include "../../include/core/timer_service.hpp"

#include <utility>

namespace rolldesk::core {

TimerService::TimerService() : next_id_(1), stopping_(false), fired_(0) {
    worker_ = std::thread([this]() { run(); });
}

TimerService::~TimerService() {
    shutdown();
}

TimerService::TimerId TimerService::schedule_after(std::chrono::milliseconds delay, Callback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_) return INVALID_TIMER;

    TimerId id = next_id_++;
    auto deadline = Clock::now() + delay;
    entries_.emplace(id, Entry{deadline, std::move(callback)});
    queue_.emplace(deadline, id);
    cv_.notify_one();
    return id;
}

bool TimerService::cancel(TimerId id) {
    if (id == INVALID_TIMER) return false;

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) return false;

    // Queue entry is left behind and skipped when it surfaces
    entries_.erase(it);
    return true;
}

size_t TimerService::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void TimerService::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) return;
        stopping_ = true;
        entries_.clear();
        queue_.clear();
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void TimerService::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        if (queue_.empty()) {
            cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
            continue;
        }

        auto next = queue_.begin();
        if (Clock::now() < next->first) {
            cv_.wait_until(lock, next->first);
            continue;
        }

        TimerId id = next->second;
        queue_.erase(next);

        auto it = entries_.find(id);
        if (it == entries_.end()) continue;  // cancelled

        Callback callback = std::move(it->second.callback);
        entries_.erase(it);

        lock.unlock();
        fired_.fetch_add(1, std::memory_order_relaxed);
        callback();
        lock.lock();
    }
}

}  // namespace rolldesk::core
