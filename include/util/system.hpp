#pragma once

/**
 * Process utilities for the rolldesk tool
 *
 * Signal-driven graceful shutdown.
 */

#include <atomic>
#include <csignal>

namespace rolldesk {
namespace util {

namespace detail {
inline std::atomic<bool>* g_running_flag = nullptr;
inline volatile std::sig_atomic_t g_last_signal = 0;
} // namespace detail

/**
 * Graceful shutdown signal handler.
 *
 * Only touches the running flag and the signal number; the main loop does
 * the logging once it notices the flag.
 */
inline void graceful_shutdown_handler(int sig) {
    detail::g_last_signal = sig;
    if (detail::g_running_flag) {
        detail::g_running_flag->store(false);
    }
}

/**
 * Install graceful shutdown handler for SIGINT and SIGTERM.
 *
 * @param running Atomic flag to set to false on signal
 */
inline void install_shutdown_handler(std::atomic<bool>& running) {
    detail::g_running_flag = &running;
    std::signal(SIGINT, graceful_shutdown_handler);
    std::signal(SIGTERM, graceful_shutdown_handler);
}

/// Signal that stopped the process, 0 if none
inline int last_shutdown_signal() {
    return static_cast<int>(detail::g_last_signal);
}

} // namespace util
} // namespace rolldesk
