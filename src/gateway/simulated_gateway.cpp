#include "../../include/gateway/simulated_gateway.hpp"

#include <algorithm>
#include <cmath>
#include <ctime>
#include <functional>
#include <numbers>
#include <sstream>

namespace rolldesk::gateway {

namespace {

constexpr double DEFAULT_SPOT = 100.0;
constexpr double ANNUAL_DAYS = 365.0;

double norm_cdf(double x) {
    return 0.5 * std::erfc(-x / std::sqrt(2.0));
}

double norm_pdf(double x) {
    return std::exp(-0.5 * x * x) / std::sqrt(2.0 * std::numbers::pi);
}

/// Days from today to a YYYYMMDD expiry, at least one
double days_to_expiry(const std::string& expiry) {
    if (expiry.size() != 8) return 1.0;
    std::tm tm_exp{};
    tm_exp.tm_year = std::stoi(expiry.substr(0, 4)) - 1900;
    tm_exp.tm_mon = std::stoi(expiry.substr(4, 2)) - 1;
    tm_exp.tm_mday = std::stoi(expiry.substr(6, 2));
    tm_exp.tm_hour = 16;
    std::time_t exp_t = std::mktime(&tm_exp);
    double days = std::difftime(exp_t, std::time(nullptr)) / 86400.0;
    return std::max(days, 1.0);
}

double round_cents(double v) {
    return std::round(v * 100.0) / 100.0;
}

/// Trading days covered by a duration such as "30 D", "6 M" or "1 Y"
int trading_days(const std::string& duration) {
    std::istringstream in(duration);
    int count = 0;
    char unit = 'D';
    in >> count >> unit;
    if (count <= 0) return 0;
    switch (unit) {
    case 'W':
        return count * 5;
    case 'M':
        return count * 21;
    case 'Y':
        return count * 252;
    default:
        return count;
    }
}

std::string format_day(const std::tm& day) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d%02d%02d", day.tm_year + 1900, day.tm_mon + 1, day.tm_mday);
    return buf;
}

}  // namespace

SimulatedGateway::SimulatedGateway() : SimulatedGateway(Config{}) {}

SimulatedGateway::SimulatedGateway(Config config) : config_(config), rng_(config.seed) {
    spots_["QQQ"] = 592.40;
    spots_["TQQQ"] = 81.15;
    spots_["SPY"] = 668.90;
}

SimulatedGateway::~SimulatedGateway() {
    disconnect();
}

void SimulatedGateway::connect() {
    if (running_.exchange(true)) return;
    connected_.store(true, std::memory_order_release);
    delivery_thread_ = std::thread([this]() { delivery_loop(); });
    enqueue({NextValidIdEvent{config_.first_order_id}});
}

void SimulatedGateway::disconnect() {
    connected_.store(false, std::memory_order_release);
    if (!running_.exchange(false)) return;
    queue_cv_.notify_all();
    if (delivery_thread_.joinable()) {
        delivery_thread_.join();
    }
    std::lock_guard<std::mutex> lock(queue_mutex_);
    queue_.clear();
}

void SimulatedGateway::set_event_handler(EventHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    handler_ = std::move(handler);
}

// ============================================================================
// Requests
// ============================================================================

void SimulatedGateway::req_market_data_type(MarketDataType /*type*/) {
    // Every snapshot is synthetic, so the data type changes nothing
}

void SimulatedGateway::req_market_data(RequestId id, const Contract& contract, bool /*snapshot*/) {
    if (contract.sec_type == SecType::Option) {
        enqueue(option_snapshot(id, contract));
    } else {
        enqueue(stock_snapshot(id, contract));
    }
}

void SimulatedGateway::cancel_market_data(RequestId id) {
    drop_queued(id);
}

void SimulatedGateway::req_contract_details(RequestId id, const Contract& contract) {
    ContractDetailsEvent details{id, contract};
    details.contract.con_id = synthetic_con_id(contract);
    if (contract.sec_type == SecType::Option) {
        details.contract.multiplier = "100";
        if (details.contract.trading_class.empty()) {
            details.contract.trading_class = contract.symbol;
        }
    }
    enqueue({details, ContractDetailsEndEvent{id}});
}

void SimulatedGateway::req_chain_parameters(RequestId id, const std::string& symbol, SecType /*underlying_type*/,
                                            ContractId underlying_con_id) {
    const double s = spot(symbol);
    const double step = s >= 200.0 ? 1.0 : 0.5;
    const double lo = std::floor(s * (1.0 - config_.strike_span_pct));
    const double hi = std::ceil(s * (1.0 + config_.strike_span_pct));

    std::vector<double> strikes;
    for (double k = lo; k <= hi; k += step) {
        strikes.push_back(k);
    }

    ChainParameterEvent smart{id, "SMART", underlying_con_id, symbol, "100", upcoming_expirations(), strikes};
    ChainParameterEvent cboe = smart;
    cboe.exchange = "CBOE";
    enqueue({smart, cboe, ChainParameterEndEvent{id}});
}

void SimulatedGateway::place_order(OrderId id, const Contract& contract, const Order& order) {
    orders_.fetch_add(1, std::memory_order_relaxed);
    if (!order.transmit) return;

    double fill_price = order.limit_price;
    if (order.order_type == OrderType::Market || fill_price == 0.0) {
        fill_price = contract.sec_type == SecType::Stock ? spot(contract.symbol) : 0.0;
    }
    enqueue({
        OrderStatusEvent{id, "Submitted", 0.0, order.total_quantity, 0.0},
        OrderStatusEvent{id, "Filled", order.total_quantity, 0.0, round_cents(fill_price)},
    });
}

// ============================================================================
// Accounts
// ============================================================================

void SimulatedGateway::req_managed_accounts() {
    std::string csv;
    for (const auto& account : config_.accounts) {
        if (!csv.empty()) csv += ",";
        csv += account;
    }
    enqueue({ManagedAccountsEvent{csv}});
}

void SimulatedGateway::req_account_summary(RequestId id, const std::string& /*group*/, const std::string& tags) {
    std::vector<std::string> wanted;
    std::istringstream in(tags);
    for (std::string tag; std::getline(in, tag, ',');) {
        if (!tag.empty()) wanted.push_back(tag);
    }

    std::vector<GatewayEvent> events;
    double scale = 1.0;
    for (const auto& account : config_.accounts) {
        for (const auto& tag : wanted) {
            double value = 0.0;
            if (tag == "NetLiquidation") value = 250'000.0 * scale;
            else if (tag == "AvailableFunds") value = 180'000.0 * scale;
            else if (tag == "TotalCashValue") value = 40'000.0 * scale;
            else if (tag == "GrossPositionValue") value = 210'000.0 * scale;
            else continue;
            events.push_back(AccountSummaryEvent{id, account, tag, std::to_string(round_cents(value)), "USD"});
        }
        scale *= 0.5;
    }
    events.push_back(AccountSummaryEndEvent{id});
    enqueue(std::move(events));
}

void SimulatedGateway::cancel_account_summary(RequestId id) {
    drop_queued(id);
}

void SimulatedGateway::req_positions() {
    std::vector<GatewayEvent> events;
    double shares = 400.0;
    for (const auto& account : config_.accounts) {
        Contract stock = Contract::stock("QQQ");
        stock.con_id = synthetic_con_id(stock);
        events.push_back(PositionEvent{account, stock, shares, round_cents(spot("QQQ") * 0.9)});
        shares /= 2.0;
    }
    events.push_back(PositionEndEvent{});
    enqueue(std::move(events));
}

void SimulatedGateway::cancel_positions() {
    drop_queued(EventStream::Positions);
}

void SimulatedGateway::req_account_updates(bool subscribe, const std::string& account) {
    if (!subscribe) {
        drop_queued(EventStream::AccountUpdates);
        return;
    }
    std::vector<GatewayEvent> events;
    auto alias = config_.aliases.find(account);
    // An account without an alias reports its own id as the group
    events.push_back(AccountValueEvent{"AccountOrGroup", alias != config_.aliases.end() ? alias->second : account,
                                       "", account});
    events.push_back(AccountValueEvent{"NetLiquidation", "250000.00", "USD", account});
    events.push_back(AccountDownloadEndEvent{account});
    enqueue(std::move(events));
}

// ============================================================================
// Historical data
// ============================================================================

void SimulatedGateway::req_historical_data(RequestId id, const Contract& contract, const HistoricalQuery& query) {
    if (contract.sec_type != SecType::Stock) {
        enqueue({GatewayErrorEvent{id, error_code::NO_SECURITY_DEFINITION,
                                   "No historical data for " + contract.symbol}});
        return;
    }
    enqueue(daily_bars(id, contract, query));
}

void SimulatedGateway::cancel_historical_data(RequestId id) {
    drop_queued(id);
}

void SimulatedGateway::set_spot(const std::string& symbol, double price) {
    std::lock_guard<std::mutex> lock(spot_mutex_);
    spots_[symbol] = price;
}

double SimulatedGateway::spot(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(spot_mutex_);
    auto it = spots_.find(symbol);
    return it != spots_.end() ? it->second : DEFAULT_SPOT;
}

// ============================================================================
// Synthetic data
// ============================================================================

std::vector<GatewayEvent> SimulatedGateway::stock_snapshot(RequestId id, const Contract& contract) const {
    const double s = spot(contract.symbol);
    const double half_spread = std::max(0.01, round_cents(s * 0.0001));
    return {
        TickPriceEvent{id, tick::DELAYED_BID, round_cents(s - half_spread)},
        TickPriceEvent{id, tick::DELAYED_ASK, round_cents(s + half_spread)},
        TickPriceEvent{id, tick::DELAYED_LAST, round_cents(s)},
        TickPriceEvent{id, tick::DELAYED_CLOSE, round_cents(s * 0.995)},
        SnapshotEndEvent{id},
    };
}

std::vector<GatewayEvent> SimulatedGateway::option_snapshot(RequestId id, const Contract& contract) const {
    const double s = spot(contract.symbol);
    const double k = contract.strike;
    const double t = days_to_expiry(contract.expiry) / ANNUAL_DAYS;
    const double moneyness = std::log(k / s);
    const double iv = 0.18 + 0.6 * moneyness * moneyness - 0.1 * moneyness;

    const double sqrt_t = std::sqrt(t);
    const double d1 = (std::log(s / k) + 0.5 * iv * iv * t) / (iv * sqrt_t);
    const double d2 = d1 - iv * sqrt_t;
    const bool call = contract.right == OptionRight::Call;

    const double price = call ? s * norm_cdf(d1) - k * norm_cdf(d2) : k * norm_cdf(-d2) - s * norm_cdf(-d1);
    const double delta = call ? norm_cdf(d1) : norm_cdf(d1) - 1.0;
    const double gamma = norm_pdf(d1) / (s * iv * sqrt_t);
    const double vega = s * norm_pdf(d1) * sqrt_t / 100.0;
    const double theta = -(s * norm_pdf(d1) * iv) / (2.0 * sqrt_t) / ANNUAL_DAYS;

    std::vector<GatewayEvent> events;
    // Deep out-of-the-money strikes quote nothing, like the real chain
    if (price >= 0.01) {
        const double half_spread = std::max(0.01, round_cents(price * 0.02));
        events.push_back(TickPriceEvent{id, tick::BID, round_cents(std::max(0.01, price - half_spread))});
        events.push_back(TickPriceEvent{id, tick::ASK, round_cents(price + half_spread)});
    }

    TickOptionComputationEvent model{id, tick::MODEL_OPTION};
    model.implied_vol = iv;
    model.delta = delta;
    model.option_price = price;
    model.gamma = gamma;
    model.vega = vega;
    model.theta = theta;
    model.underlying_price = s;
    events.push_back(model);

    const double oi = std::round(5000.0 * std::exp(-40.0 * moneyness * moneyness));
    events.push_back(TickSizeEvent{id, call ? tick::OPTION_CALL_OPEN_INTEREST : tick::OPTION_PUT_OPEN_INTEREST, oi});
    return events;
}

std::vector<std::string> SimulatedGateway::upcoming_expirations() const {
    std::vector<std::string> out;
    std::time_t now = std::time(nullptr);
    std::tm day{};
    localtime_r(&now, &day);
    // Walk forward to the next Friday, then weekly
    int until_friday = (5 - day.tm_wday + 7) % 7;
    day.tm_mday += until_friday;
    day.tm_hour = 12;
    for (size_t i = 0; i < config_.num_expirations; ++i) {
        std::tm norm = day;
        std::mktime(&norm);
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%04d%02d%02d", norm.tm_year + 1900, norm.tm_mon + 1, norm.tm_mday);
        out.emplace_back(buf);
        day.tm_mday += 7;
    }
    return out;
}

std::vector<GatewayEvent> SimulatedGateway::daily_bars(RequestId id, const Contract& contract,
                                                      const HistoricalQuery& query) const {
    const int days = std::min(trading_days(query.duration), 2520);

    // Walk backwards from the current spot, then emit oldest first
    std::mt19937 walk(config_.seed ^ static_cast<uint32_t>(std::hash<std::string>{}(contract.symbol)));
    std::normal_distribution<double> step(0.0, 0.012);

    std::vector<double> closes;
    double close = spot(contract.symbol);
    for (int i = 0; i < days; ++i) {
        closes.push_back(close);
        close /= std::exp(step(walk));
    }

    std::vector<std::string> dates;
    std::time_t now = std::time(nullptr);
    std::tm day{};
    localtime_r(&now, &day);
    day.tm_hour = 12;
    while (static_cast<int>(dates.size()) < days) {
        std::tm norm = day;
        std::mktime(&norm);
        if (norm.tm_wday != 0 && norm.tm_wday != 6) {
            dates.push_back(format_day(norm));
        }
        day.tm_mday -= 1;
    }

    std::vector<GatewayEvent> events;
    for (int i = days - 1; i >= 0; --i) {
        const double c = closes[i];
        const double o = i + 1 < days ? closes[i + 1] : c;
        const double high = std::max(o, c) * 1.004;
        const double low = std::min(o, c) * 0.996;
        const double volume = std::round(1'000'000.0 + 40'000'000.0 * std::fabs(c - o) / c);
        events.push_back(HistoricalBarEvent{id, dates[i], round_cents(o), round_cents(high), round_cents(low),
                                            round_cents(c), volume});
    }
    events.push_back(HistoricalDataEndEvent{id});
    return events;
}

ContractId SimulatedGateway::synthetic_con_id(const Contract& contract) {
    std::string key = contract.symbol + ":" + sec_type_to_string(contract.sec_type);
    if (contract.sec_type == SecType::Option) {
        key += ":" + contract.expiry + ":" + std::to_string(strike_key(contract.strike)) + ":" +
               right_to_char(contract.right);
    }
    // Positive and within the gateway's int32 range
    return static_cast<ContractId>(std::hash<std::string>{}(key) % 2'000'000'000ULL) + 1;
}

// ============================================================================
// Delivery
// ============================================================================

SimulatedGateway::Clock::duration SimulatedGateway::next_latency() {
    std::uniform_int_distribution<int64_t> dist(config_.min_latency.count(), config_.max_latency.count());
    return std::chrono::milliseconds(dist(rng_));
}

void SimulatedGateway::drop_queued(RequestId id) {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    for (auto it = queue_.begin(); it != queue_.end();) {
        if (event_request_id(it->second) == id) {
            it = queue_.erase(it);
        } else {
            ++it;
        }
    }
}

void SimulatedGateway::drop_queued(EventStream stream) {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    for (auto it = queue_.begin(); it != queue_.end();) {
        if (event_stream(it->second) == stream) {
            it = queue_.erase(it);
        } else {
            ++it;
        }
    }
}

void SimulatedGateway::enqueue(std::vector<GatewayEvent> events) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        auto due = Clock::now();
        for (auto& event : events) {
            due += next_latency() / 4;
            queue_.emplace(due, std::move(event));
        }
    }
    queue_cv_.notify_one();
}

void SimulatedGateway::delivery_loop() {
    while (running_.load(std::memory_order_acquire)) {
        GatewayEvent event;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            if (queue_.empty()) {
                queue_cv_.wait(lock, [this]() { return !queue_.empty() || !running_.load(); });
                continue;
            }
            auto due = queue_.begin()->first;
            if (Clock::now() < due) {
                queue_cv_.wait_until(lock, due);
                continue;
            }
            event = std::move(queue_.begin()->second);
            queue_.erase(queue_.begin());
        }

        std::lock_guard<std::mutex> lock(handler_mutex_);
        if (handler_) {
            handler_(event);
            delivered_.fetch_add(1, std::memory_order_relaxed);
        }
    }
}

}  // namespace rolldesk::gateway
