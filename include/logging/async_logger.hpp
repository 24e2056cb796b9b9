#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <functional>
#include <thread>

namespace rolldesk {
namespace logging {

/**
 * Log Level
 */
enum class LogLevel : uint8_t { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4, Fatal = 5 };

inline const char* level_to_string(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO ";
    case LogLevel::Warn:
        return "WARN ";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Fatal:
        return "FATAL";
    default:
        return "?????";
    }
}

inline bool parse_level(const char* s, LogLevel& out) {
    if (std::strcmp(s, "trace") == 0) out = LogLevel::Trace;
    else if (std::strcmp(s, "debug") == 0) out = LogLevel::Debug;
    else if (std::strcmp(s, "info") == 0) out = LogLevel::Info;
    else if (std::strcmp(s, "warn") == 0) out = LogLevel::Warn;
    else if (std::strcmp(s, "error") == 0) out = LogLevel::Error;
    else if (std::strcmp(s, "fatal") == 0) out = LogLevel::Fatal;
    else return false;
    return true;
}

// Category constants for the desk
namespace LogCategory {
constexpr uint8_t System = 0;
constexpr uint8_t Gateway = 1;
constexpr uint8_t Correlator = 2;
constexpr uint8_t Quotes = 3;
constexpr uint8_t Chains = 4;
constexpr uint8_t Greeks = 5;
constexpr uint8_t Preloader = 6;
constexpr uint8_t Orders = 7;
constexpr uint8_t Accounts = 8;
constexpr uint8_t Rates = 9;
constexpr uint8_t History = 10;
} // namespace LogCategory

inline const char* category_to_string(uint8_t category) {
    switch (category) {
    case LogCategory::System:
        return "system";
    case LogCategory::Gateway:
        return "gateway";
    case LogCategory::Correlator:
        return "correlator";
    case LogCategory::Quotes:
        return "quotes";
    case LogCategory::Chains:
        return "chains";
    case LogCategory::Greeks:
        return "greeks";
    case LogCategory::Preloader:
        return "preloader";
    case LogCategory::Orders:
        return "orders";
    case LogCategory::Accounts:
        return "accounts";
    case LogCategory::Rates:
        return "rates";
    case LogCategory::History:
        return "history";
    default:
        return "?";
    }
}

/**
 * Log Entry - Fixed size, four cache lines
 */
struct alignas(64) LogEntry {
    uint64_t timestamp_ns; // 8 bytes
    LogLevel level;        // 1 byte
    uint8_t category;      // 1 byte
    uint16_t reserved;     // 2 bytes padding
    uint32_t thread_id;    // 4 bytes
    char message[240];     // 240 bytes (null-terminated)
    // Total: 256 bytes

    void set_message(const char* msg) {
        size_t len = std::strlen(msg);
        if (len >= sizeof(message))
            len = sizeof(message) - 1;
        std::memcpy(message, msg, len);
        message[len] = '\0';
    }
};
static_assert(sizeof(LogEntry) == 256, "LogEntry must be 256 bytes");

/**
 * Bounded Multi-Producer / Single-Consumer Ring Buffer
 *
 * Callers, the timer thread and the gateway delivery thread all log, so each
 * slot carries a sequence number: producers claim a slot with a CAS on head,
 * write it, then publish by bumping the slot sequence. The consumer only reads
 * slots whose sequence says they are published.
 */
template <size_t Capacity = 2048>
class alignas(64) LogRingBuffer {
public:
    static_assert((Capacity & (Capacity - 1)) == 0, "Capacity must be power of 2");

    LogRingBuffer() : head_(0), tail_(0) {
        for (size_t i = 0; i < Capacity; ++i) {
            cells_[i].sequence.store(i, std::memory_order_relaxed);
        }
    }

    /**
     * Try to push a log entry (any producer thread)
     * Returns false if buffer is full.
     */
    bool try_push(const LogEntry& entry) {
        size_t pos = head_.load(std::memory_order_relaxed);
        for (;;) {
            Cell& cell = cells_[pos & (Capacity - 1)];
            size_t seq = cell.sequence.load(std::memory_order_acquire);
            intptr_t diff = static_cast<intptr_t>(seq) - static_cast<intptr_t>(pos);
            if (diff == 0) {
                if (head_.compare_exchange_weak(pos, pos + 1, std::memory_order_relaxed)) {
                    cell.entry = entry;
                    cell.sequence.store(pos + 1, std::memory_order_release);
                    return true;
                }
            } else if (diff < 0) {
                return false; // Buffer full
            } else {
                pos = head_.load(std::memory_order_relaxed);
            }
        }
    }

    /**
     * Try to pop a log entry (consumer thread only)
     */
    bool try_pop(LogEntry& entry) {
        size_t pos = tail_.load(std::memory_order_relaxed);
        Cell& cell = cells_[pos & (Capacity - 1)];
        size_t seq = cell.sequence.load(std::memory_order_acquire);
        if (static_cast<intptr_t>(seq) - static_cast<intptr_t>(pos + 1) < 0) {
            return false; // Empty or not yet published
        }
        entry = cell.entry;
        cell.sequence.store(pos + Capacity, std::memory_order_release);
        tail_.store(pos + 1, std::memory_order_relaxed);
        return true;
    }

    size_t size() const {
        size_t head = head_.load(std::memory_order_acquire);
        size_t tail = tail_.load(std::memory_order_acquire);
        return head >= tail ? head - tail : 0;
    }

    bool empty() const { return size() == 0; }

private:
    struct Cell {
        std::atomic<size_t> sequence;
        LogEntry entry;
    };

    alignas(64) std::atomic<size_t> head_;
    alignas(64) std::atomic<size_t> tail_;
    alignas(64) std::array<Cell, Capacity> cells_;
};

/**
 * Async Logger
 *
 * The log call formats and enqueues without blocking; a background thread
 * handles the actual I/O. When the ring is full the entry is dropped and
 * counted.
 *
 * Usage:
 *   AsyncLogger logger;
 *   logger.start();
 *   LOGF_INFO(logger, Greeks, "batch %s %s done: %zu/%zu with data", sym, exp, n, total);
 *   logger.stop();
 */
class AsyncLogger {
public:
    using OutputCallback = std::function<void(const LogEntry&)>;

    AsyncLogger() : running_(false), min_level_(LogLevel::Info), dropped_count_(0), total_logged_(0) {}

    ~AsyncLogger() { stop(); }

    // Non-copyable
    AsyncLogger(const AsyncLogger&) = delete;
    AsyncLogger& operator=(const AsyncLogger&) = delete;

    /**
     * Start the background consumer thread
     */
    void start() {
        if (running_.exchange(true))
            return; // Already running

        consumer_thread_ = std::thread([this]() { consume_loop(); });
    }

    /**
     * Stop the logger and flush remaining entries
     */
    void stop() {
        if (!running_.exchange(false))
            return; // Already stopped

        if (consumer_thread_.joinable()) {
            consumer_thread_.join();
        }

        flush();
    }

    /**
     * Drain pending entries on the calling thread.
     * Only safe when the consumer thread is not running.
     */
    void flush() {
        if (running_.load())
            return;
        LogEntry entry;
        while (buffer_.try_pop(entry)) {
            output_entry(entry);
        }
    }

    void log(LogLevel level, uint8_t category, const char* message) {
        if (level < min_level_.load(std::memory_order_relaxed))
            return;

        LogEntry entry;
        entry.timestamp_ns = get_timestamp_ns();
        entry.level = level;
        entry.category = category;
        entry.reserved = 0;
        entry.thread_id = get_thread_id();
        entry.set_message(message);

        if (!buffer_.try_push(entry)) {
            dropped_count_.fetch_add(1, std::memory_order_relaxed);
        } else {
            total_logged_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    /**
     * Log with printf-style formatting
     */
    template <typename... Args>
    void logf(LogLevel level, uint8_t category, const char* fmt, Args... args) {
        if (level < min_level_.load(std::memory_order_relaxed))
            return;

        char buffer[sizeof(LogEntry::message)];
        std::snprintf(buffer, sizeof(buffer), fmt, args...);
        log(level, category, buffer);
    }

    void set_min_level(LogLevel level) { min_level_.store(level, std::memory_order_relaxed); }
    LogLevel min_level() const { return min_level_.load(std::memory_order_relaxed); }

    // Must be set before start()
    void set_output_callback(OutputCallback cb) { output_callback_ = std::move(cb); }

    // Statistics
    uint64_t dropped_count() const { return dropped_count_.load(); }
    uint64_t total_logged() const { return total_logged_.load(); }
    size_t pending_count() const { return buffer_.size(); }

private:
    LogRingBuffer<2048> buffer_;
    std::atomic<bool> running_;
    std::thread consumer_thread_;
    std::atomic<LogLevel> min_level_;
    OutputCallback output_callback_;

    std::atomic<uint64_t> dropped_count_;
    std::atomic<uint64_t> total_logged_;

    void consume_loop() {
        LogEntry entry;
        while (running_.load(std::memory_order_relaxed)) {
            while (buffer_.try_pop(entry)) {
                output_entry(entry);
            }
            // Sleep briefly to avoid busy spinning
            std::this_thread::sleep_for(std::chrono::microseconds(500));
        }
        while (buffer_.try_pop(entry)) {
            output_entry(entry);
        }
    }

    void output_entry(const LogEntry& entry) {
        if (output_callback_) {
            output_callback_(entry);
        } else {
            // Default: print to stderr
            auto ts_ms = entry.timestamp_ns / 1000000;
            std::fprintf(stderr, "[%lu.%03lu] [%s] [%s] %s\n", static_cast<unsigned long>(ts_ms / 1000),
                         static_cast<unsigned long>(ts_ms % 1000), level_to_string(entry.level),
                         category_to_string(entry.category), entry.message);
        }
    }

    static uint64_t get_timestamp_ns() {
        auto now = std::chrono::system_clock::now();
        return std::chrono::duration_cast<std::chrono::nanoseconds>(now.time_since_epoch()).count();
    }

    static uint32_t get_thread_id() {
        static thread_local uint32_t id = 0;
        if (id == 0) {
            std::hash<std::thread::id> hasher;
            id = static_cast<uint32_t>(hasher(std::this_thread::get_id()));
        }
        return id;
    }
};

// Convenience macros
#define LOG_DEBUG(logger, cat, msg) (logger).log(rolldesk::logging::LogLevel::Debug, rolldesk::logging::LogCategory::cat, msg)
#define LOG_INFO(logger, cat, msg) (logger).log(rolldesk::logging::LogLevel::Info, rolldesk::logging::LogCategory::cat, msg)
#define LOG_WARN(logger, cat, msg) (logger).log(rolldesk::logging::LogLevel::Warn, rolldesk::logging::LogCategory::cat, msg)
#define LOG_ERROR(logger, cat, msg) (logger).log(rolldesk::logging::LogLevel::Error, rolldesk::logging::LogCategory::cat, msg)

// Printf-style variants
#define LOGF_DEBUG(logger, cat, fmt, ...)                                                                              \
    (logger).logf(rolldesk::logging::LogLevel::Debug, rolldesk::logging::LogCategory::cat, fmt, ##__VA_ARGS__)
#define LOGF_INFO(logger, cat, fmt, ...)                                                                               \
    (logger).logf(rolldesk::logging::LogLevel::Info, rolldesk::logging::LogCategory::cat, fmt, ##__VA_ARGS__)
#define LOGF_WARN(logger, cat, fmt, ...)                                                                               \
    (logger).logf(rolldesk::logging::LogLevel::Warn, rolldesk::logging::LogCategory::cat, fmt, ##__VA_ARGS__)
#define LOGF_ERROR(logger, cat, fmt, ...)                                                                              \
    (logger).logf(rolldesk::logging::LogLevel::Error, rolldesk::logging::LogCategory::cat, fmt, ##__VA_ARGS__)

} // namespace logging
} // namespace rolldesk
