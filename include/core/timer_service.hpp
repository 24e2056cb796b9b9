#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace rolldesk {
namespace core {

/**
 * TimerService - one-shot deadlines on a single worker thread
 *
 * Settle timers, hard timeouts, per-request timeouts and deferred bursts all
 * run here. Callbacks execute on the timer thread with no internal lock held,
 * so a callback may schedule or cancel other timers.
 *
 * cancel() only guarantees the callback will not start later; a callback that
 * is already running is not interrupted. Owners guard their own state with a
 * "finished" flag.
 */
class TimerService {
public:
    using TimerId = uint64_t;
    using Callback = std::function<void()>;
    using Clock = std::chrono::steady_clock;

    static constexpr TimerId INVALID_TIMER = 0;

    TimerService();
    ~TimerService();

    TimerService(const TimerService&) = delete;
    TimerService& operator=(const TimerService&) = delete;

    TimerId schedule_after(std::chrono::milliseconds delay, Callback callback);

    /// Returns true if the timer was pending and will not fire
    bool cancel(TimerId id);

    size_t pending() const;
    uint64_t fired_count() const { return fired_.load(std::memory_order_relaxed); }

    /// Stops the worker; pending timers are dropped without firing
    void shutdown();

private:
    struct Entry {
        Clock::time_point deadline;
        Callback callback;
    };

    void run();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::unordered_map<TimerId, Entry> entries_;
    std::multimap<Clock::time_point, TimerId> queue_;
    TimerId next_id_;
    bool stopping_;
    std::atomic<uint64_t> fired_;
    std::thread worker_;
};

}  // namespace core
}  // namespace rolldesk
