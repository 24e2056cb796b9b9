#include "../include/core/timer_service.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

using namespace rolldesk::core;
using namespace std::chrono_literals;

#define TEST(name) void name()
#define RUN_TEST(name)                                                                                                 \
    do {                                                                                                               \
        std::cout << "  " << #name << "... ";                                                                          \
        name();                                                                                                        \
        std::cout << "PASSED\n";                                                                                       \
    } while (0)

#define ASSERT_EQ(a, b) assert((a) == (b))
#define ASSERT_TRUE(x) assert(x)
#define ASSERT_FALSE(x) assert(!(x))

// Poll until cond holds or the deadline passes
template <typename Cond>
bool wait_for(Cond cond, std::chrono::milliseconds deadline = 2000ms) {
    auto until = std::chrono::steady_clock::now() + deadline;
    while (std::chrono::steady_clock::now() < until) {
        if (cond()) return true;
        std::this_thread::sleep_for(1ms);
    }
    return cond();
}

TEST(fires_after_delay) {
    TimerService timers;
    std::atomic<bool> fired{false};
    auto start = std::chrono::steady_clock::now();
    std::atomic<int64_t> elapsed_ms{0};

    timers.schedule_after(30ms, [&]() {
        elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start)
                         .count();
        fired = true;
    });

    ASSERT_TRUE(wait_for([&]() { return fired.load(); }));
    ASSERT_TRUE(elapsed_ms.load() >= 30);
    ASSERT_EQ(timers.fired_count(), 1u);
    ASSERT_EQ(timers.pending(), 0u);
}

TEST(fires_in_deadline_order) {
    TimerService timers;
    std::mutex mutex;
    std::vector<int> order;

    timers.schedule_after(60ms, [&]() { std::lock_guard<std::mutex> l(mutex); order.push_back(3); });
    timers.schedule_after(10ms, [&]() { std::lock_guard<std::mutex> l(mutex); order.push_back(1); });
    timers.schedule_after(35ms, [&]() { std::lock_guard<std::mutex> l(mutex); order.push_back(2); });

    ASSERT_TRUE(wait_for([&]() { std::lock_guard<std::mutex> l(mutex); return order.size() == 3; }));
    ASSERT_EQ(order, (std::vector<int>{1, 2, 3}));
}

TEST(cancelled_timer_never_fires) {
    TimerService timers;
    std::atomic<int> fired{0};

    auto id = timers.schedule_after(20ms, [&]() { fired++; });
    ASSERT_TRUE(timers.cancel(id));
    ASSERT_FALSE(timers.cancel(id));

    std::this_thread::sleep_for(60ms);
    ASSERT_EQ(fired.load(), 0);
    ASSERT_EQ(timers.fired_count(), 0u);
}

TEST(cancel_invalid_timer_is_noop) {
    TimerService timers;
    ASSERT_FALSE(timers.cancel(TimerService::INVALID_TIMER));
    ASSERT_FALSE(timers.cancel(12345));
}

TEST(callback_can_schedule_followup) {
    TimerService timers;
    std::atomic<bool> second{false};

    timers.schedule_after(5ms, [&]() { timers.schedule_after(5ms, [&]() { second = true; }); });

    ASSERT_TRUE(wait_for([&]() { return second.load(); }));
    ASSERT_EQ(timers.fired_count(), 2u);
}

TEST(shutdown_drops_pending_timers) {
    TimerService timers;
    std::atomic<int> fired{0};
    timers.schedule_after(50ms, [&]() { fired++; });
    ASSERT_EQ(timers.pending(), 1u);

    timers.shutdown();
    ASSERT_EQ(timers.pending(), 0u);
    ASSERT_EQ(timers.schedule_after(1ms, [&]() { fired++; }), TimerService::INVALID_TIMER);

    std::this_thread::sleep_for(80ms);
    ASSERT_EQ(fired.load(), 0);
}

int main() {
    std::cout << "\n=== Timer Service Tests ===\n\n";

    RUN_TEST(fires_after_delay);
    RUN_TEST(fires_in_deadline_order);
    RUN_TEST(cancelled_timer_never_fires);
    RUN_TEST(cancel_invalid_timer_is_noop);
    RUN_TEST(callback_can_schedule_followup);
    RUN_TEST(shutdown_drops_pending_timers);

    std::cout << "\n=== All Timer Service Tests Passed! ===\n";
    return 0;
}
