#pragma once

#include "../config/defaults.hpp"
#include "../logging/async_logger.hpp"
#include "../types.hpp"

#include <chrono>
#include <cmath>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace rolldesk {
namespace rates {

// =============================================================================
// Margin interest (pure)
// =============================================================================

/**
 * All-in annual margin rate in percent: benchmark plus the broker's tiered
 * spread on the absolute loan size.
 */
inline double margin_rate(Money loan, double benchmark_pct) {
    const double abs_loan = std::fabs(loan);
    double spread = 0.25;
    if (abs_loan <= 100'000) {
        spread = 1.5;
    } else if (abs_loan <= 1'000'000) {
        spread = 1.0;
    } else if (abs_loan <= 3'000'000) {
        spread = 0.5;
    }
    return benchmark_pct + spread;
}

/// Daily interest on a negative cash balance (actual/360); 0 for a credit balance
inline Money estimate_daily_interest(Money loan, double benchmark_pct) {
    if (loan >= 0) return 0.0;
    return std::fabs(loan) * (margin_rate(loan, benchmark_pct) / 100.0) / 360.0;
}

// =============================================================================
// FRED client
// =============================================================================

struct RatesConfig {
    std::string api_key;  // empty: FRED_API_KEY from the environment
    std::string base_url = "https://api.stlouisfed.org/fred/series/observations";
    std::string series_id = "DFF";
    std::chrono::milliseconds ttl{config::ttl::RATE_MS};
    long http_timeout_s = config::rates::HTTP_TIMEOUT_S;
    double fallback_pct = config::rates::FALLBACK_FED_FUNDS_PCT;
};

/**
 * FedFundsClient - effective Fed Funds rate (FRED series DFF)
 *
 * The latest observation is cached for the TTL. On any fetch or parse failure
 * the last good value is returned, or the configured fallback when nothing
 * was ever fetched; callers never see an exception.
 *
 * The HTTP GET is injectable so tests run without network access.
 */
class FedFundsClient {
public:
    using HttpGet = std::function<std::string(const std::string& url, long timeout_s)>;

    FedFundsClient(RatesConfig config, logging::AsyncLogger& logger, HttpGet http_get = {});

    /// Rate in percent, e.g. 4.33
    double get_rate();

    /// Cached value, if any, without touching the network
    std::optional<double> cached_rate() const;

    std::string request_url() const;

    /**
     * Parse a FRED observations response. Returns nullopt when the newest
     * observation is missing or is FRED's "." placeholder. Throws on invalid
     * JSON.
     */
    static std::optional<double> parse_observation(const std::string& body);

    /// libcurl GET; throws std::runtime_error on transport errors and non-200
    static std::string curl_get(const std::string& url, long timeout_s);

private:
    RatesConfig config_;
    logging::AsyncLogger& logger_;
    HttpGet http_get_;

    mutable std::mutex mutex_;
    std::optional<double> cached_;
    std::chrono::steady_clock::time_point fetched_at_;
};

}  // namespace rates
}  // namespace rolldesk
