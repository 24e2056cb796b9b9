/**
 * rolldesk - options desk against a simulated gateway
 *
 * Loads the desk config, connects a SimulatedGateway, prints the managed
 * accounts with their balances and positions, each watched symbol's chain, a
 * greeks window around spot, recent daily bars, a sample roll and a stock
 * batch order, then keeps the background preloader running until the
 * duration elapses or SIGINT/SIGTERM.
 *
 * Usage:
 *   ./rolldesk                         # Built-in defaults, QQQ and TQQQ
 *   ./rolldesk -s qqq -d 60            # One symbol for a minute
 *   ./rolldesk -c desk.json -v         # Config file, debug logging
 */

#include "../include/config/desk_config.hpp"
#include "../include/core/errors.hpp"
#include "../include/gateway/simulated_gateway.hpp"
#include "../include/market/market_data_caches.hpp"
#include "../include/trading_desk.hpp"
#include "../include/util/cli.hpp"
#include "../include/util/system.hpp"
#include "../include/util/time_utils.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <iostream>
#include <map>
#include <thread>

using namespace rolldesk;

namespace {

std::FILE* g_log_file = nullptr;

void write_log_line(const logging::LogEntry& entry) {
    auto ts_ms = entry.timestamp_ns / 1000000;
    std::fprintf(g_log_file, "[%lu.%03lu] [%s] [%s] %s\n", static_cast<unsigned long>(ts_ms / 1000),
                 static_cast<unsigned long>(ts_ms % 1000), logging::level_to_string(entry.level),
                 logging::category_to_string(entry.category), entry.message);
    std::fflush(g_log_file);
}

void print_chain(const std::string& symbol, const std::vector<market::ChainParams>& chain) {
    auto expirations = market::ChainCache::all_expirations(chain);
    std::printf("\n%s chain: %zu listing(s), %zu expirations\n", symbol.c_str(), chain.size(), expirations.size());
    for (const auto& p : chain) {
        std::printf("  %-6s class %-5s x%s  %zu expirations, %zu strikes",
                    p.exchange.c_str(), p.trading_class.c_str(), p.multiplier.c_str(), p.expirations.size(),
                    p.strikes.size());
        if (!p.strikes.empty()) {
            std::printf(" [%s .. %s]", format_strike(p.strikes.front()).c_str(),
                        format_strike(p.strikes.back()).c_str());
        }
        std::printf("\n");
    }
}

void print_greeks(const std::string& expiry, const std::vector<market::OptionGreek>& greeks) {
    std::printf("\n  %-8s %8s %1s %8s %8s %8s %7s %7s %8s %7s %6s\n", "expiry", "strike", "R", "bid", "ask", "mark",
                "delta", "gamma", "theta", "vega", "iv");
    for (const auto& g : greeks) {
        std::printf("  %-8s %8s %c %8.2f %8.2f %8.2f %7.3f %7.4f %8.3f %7.3f %5.1f%%\n", expiry.c_str(),
                    format_strike(g.strike).c_str(), right_to_char(g.right), g.bid, g.ask, g.mark(), g.delta,
                    g.gamma, g.theta, g.vega, g.implied_vol * 100.0);
    }
}

/// Window of `half_width` strikes each side of spot
std::vector<double> strikes_around(const std::vector<double>& strikes, double spot, size_t half_width) {
    if (strikes.empty()) return {};
    auto it = std::lower_bound(strikes.begin(), strikes.end(), spot);
    size_t center = it == strikes.end() ? strikes.size() - 1 : static_cast<size_t>(it - strikes.begin());
    size_t lo = center >= half_width ? center - half_width : 0;
    size_t hi = std::min(strikes.size() - 1, center + half_width);
    return std::vector<double>(strikes.begin() + lo, strikes.begin() + hi + 1);
}

void show_symbol(TradingDesk& desk, const std::string& symbol) {
    auto chain = desk.get_option_chain(symbol);
    print_chain(symbol, chain);

    auto quote = desk.get_stock_quote(symbol);
    std::printf("  spot %.2f (bid %.2f ask %.2f last %.2f)\n", quote.price(), quote.bid, quote.ask, quote.last);

    auto expirations = market::ChainCache::all_expirations(chain);
    if (expirations.empty()) return;

    const std::string& expiry = expirations.front();
    auto window = strikes_around(market::ChainCache::strikes_for(chain, expiry), quote.price(), 3);

    auto start = util::SteadyClock::now();
    auto greeks = desk.get_option_greeks(symbol, expiry, window);
    print_greeks(expiry, greeks);
    std::printf("  %zu entries in %lldms\n", greeks.size(), static_cast<long long>(util::elapsed_ms(start)));

    // Second read is served from the cache
    start = util::SteadyClock::now();
    greeks = desk.get_option_greeks(symbol, expiry, window);
    std::printf("  cached read: %zu entries in %lldms\n", greeks.size(),
                static_cast<long long>(util::elapsed_ms(start)));
}

void show_sample_roll(TradingDesk& desk, const std::string& symbol, const std::vector<std::string>& accounts) {
    auto chain = desk.get_option_chain(symbol);
    auto expirations = market::ChainCache::all_expirations(chain);
    if (expirations.size() < 2) return;

    double spot = desk.get_stock_quote(symbol).price();
    auto near = strikes_around(market::ChainCache::strikes_for(chain, expirations[0]), spot, 0);
    auto far = strikes_around(market::ChainCache::strikes_for(chain, expirations[1]), spot - 5.0, 0);
    if (near.empty() || far.empty()) return;

    orders::RollOrderRequest request;
    request.symbol = symbol;
    request.close_leg = {expirations[0], near.front(), OptionRight::Put};
    request.open_leg = {expirations[1], far.front(), OptionRight::Put};
    request.direction = PositionDirection::Short;
    request.limit_price = 0.85;

    orders::AccountQuantities quantities;
    for (size_t i = 0; i < accounts.size(); ++i) {
        quantities[accounts[i]] = i == 0 ? 2 : (i == 1 ? 1 : 0);
    }
    auto updates = desk.place_roll_order(request, quantities);

    std::printf("\nSample roll %s\n", orders::describe_roll(request).c_str());
    for (const auto& u : updates) {
        auto description = desk.combo_description(u.order_id);
        std::printf("  order #%lld %-10s %-13s qty %.0f  %s\n", static_cast<long long>(u.order_id),
                    u.account.c_str(), u.status.c_str(), u.remaining,
                    description ? description->c_str() : "?");
    }
}

void show_accounts(TradingDesk& desk) {
    auto accounts = desk.request_managed_accounts();
    auto aliases = desk.request_account_aliases(accounts);

    std::printf("\nManaged accounts\n");
    for (const auto& summary : desk.request_account_summary()) {
        auto alias = aliases.find(summary.account);
        std::printf("  %-10s %-6s net liq %12.2f  available %12.2f %s\n", summary.account.c_str(),
                    alias == aliases.end() ? "" : alias->second.c_str(), summary.net_liquidation,
                    summary.available_funds, summary.currency.c_str());
    }
    for (const auto& p : desk.request_positions()) {
        std::printf("  %-10s %-6s %8.0f @ %.2f\n", p.account.c_str(), p.contract.symbol.c_str(), p.quantity,
                    p.avg_cost);
    }
}

void show_history(TradingDesk& desk, const std::string& symbol) {
    market::HistoricalRequest request;
    request.symbol = symbol;
    request.duration = "5 D";
    auto bars = desk.get_historical_data(request);

    std::printf("\n%s daily bars\n", symbol.c_str());
    for (const auto& b : bars) {
        std::printf("  %s  o %8.2f h %8.2f l %8.2f c %8.2f  v %.0f\n", b.time.c_str(), b.open, b.high, b.low,
                    b.close, b.volume);
    }
}

void show_sample_batch(TradingDesk& desk, const std::string& symbol, const std::vector<std::string>& accounts) {
    if (accounts.empty()) return;

    auto listener = desk.add_order_status_listener([](const orders::OrderStatusUpdate& u) {
        std::printf("  status #%lld %-10s %-9s filled %.0f remaining %.0f @ %.2f\n",
                    static_cast<long long>(u.order_id), u.account.c_str(), u.status.c_str(), u.filled, u.remaining,
                    u.avg_fill_price);
    });

    orders::BatchOrderRequest request;
    request.symbol = symbol;
    request.action = OrderAction::Buy;

    orders::AccountQuantities quantities;
    for (const auto& account : accounts) {
        quantities[account] = 10;
    }
    std::printf("\nSample batch: buy 10 %s per account\n", symbol.c_str());
    auto updates = desk.place_batch_orders(request, quantities);

    // Statuses arrive on the gateway thread
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    desk.remove_order_status_listener(listener);
    for (const auto& u : updates) {
        auto last = desk.last_order_status(u.order_id);
        std::printf("  order #%lld %-10s %s\n", static_cast<long long>(u.order_id), u.account.c_str(),
                    last ? last->status.c_str() : u.status.c_str());
    }
}

void show_rates(TradingDesk& desk) {
    double rate = desk.fed_funds_rate();
    std::printf("\nFed Funds %.2f%%\n", rate);
    for (Money loan : {-50'000.0, -500'000.0, -2'000'000.0}) {
        std::printf("  loan %12.0f: margin rate %.2f%%, daily interest %.2f\n", loan, desk.margin_rate(loan),
                    desk.estimate_daily_interest(loan));
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    util::CLIArgs args;
    if (!util::parse_args(argc, argv, args)) {
        return 1;
    }
    if (args.help) {
        util::print_help();
        return 0;
    }

    config::DeskConfig cfg;
    try {
        if (!args.config_path.empty()) {
            cfg = config::load_config(args.config_path);
        }
    } catch (const ConfigError& e) {
        std::cerr << "Config error: " << e.what() << "\n";
        return 1;
    }
    if (!args.symbols.empty()) {
        cfg.preloader.symbols = args.symbols;
    }

    logging::AsyncLogger logger;
    logger.set_min_level(args.verbose ? logging::LogLevel::Debug : cfg.logging.level);
    if (!cfg.logging.file.empty()) {
        g_log_file = std::fopen(cfg.logging.file.c_str(), "a");
        if (!g_log_file) {
            std::cerr << "Cannot open log file: " << cfg.logging.file << "\n";
            return 1;
        }
        logger.set_output_callback(write_log_line);
    }
    logger.start();

    std::atomic<bool> running{true};
    util::install_shutdown_handler(running);

    std::cout << "═══════════════════════════════════════════════════════════\n";
    std::cout << "  rolldesk (simulated gateway)\n";
    std::cout << "═══════════════════════════════════════════════════════════\n";

    int exit_code = 0;
    {
        market::MarketDataCaches caches(cfg.ttls.greeks, cfg.ttls.chain);
        gateway::SimulatedGateway gateway;
        TradingDesk desk(gateway, caches, logger, cfg);
        gateway.connect();

        try {
            show_accounts(desk);
            auto accounts = desk.request_managed_accounts();
            for (const auto& symbol : cfg.preloader.symbols) {
                show_symbol(desk, symbol);
            }
            if (!cfg.preloader.symbols.empty()) {
                const auto& first = cfg.preloader.symbols.front();
                show_history(desk, first);
                show_sample_roll(desk, first, accounts);
                show_sample_batch(desk, first, accounts);
            }
            show_rates(desk);
        } catch (const DeskError& e) {
            std::cerr << "Desk error [" << error_code_to_string(e.code()) << "]: " << e.what() << "\n";
            exit_code = 1;
        }

        if (exit_code == 0) {
            desk.start_preloader();
            std::printf("\nPreloading %zu symbol(s) every %llds%s\n", cfg.preloader.symbols.size(),
                        static_cast<long long>(cfg.preloader.interval.count() / 1000),
                        args.duration > 0 ? "" : " (Ctrl+C to stop)");

            auto started = util::SteadyClock::now();
            auto last_report = started;
            while (running.load()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
                if (args.duration > 0 && util::elapsed_ms(started) >= args.duration * 1000LL) {
                    break;
                }
                if (util::elapsed_ms(last_report) >= 5000) {
                    last_report = util::SteadyClock::now();
                    auto& preloader = desk.preloader();
                    std::printf("  cycles %llu (skipped %llu), batches %llu/%llu, pending requests %zu\n",
                                static_cast<unsigned long long>(preloader.cycles_completed()),
                                static_cast<unsigned long long>(preloader.cycles_skipped()),
                                static_cast<unsigned long long>(desk.collector().batches_finished()),
                                static_cast<unsigned long long>(desk.collector().batches_started()),
                                desk.correlator().pending_count());
                }
            }
            if (int sig = util::last_shutdown_signal()) {
                std::printf("\n[SHUTDOWN] Received signal %d, stopping gracefully...\n", sig);
            }
            desk.stop_preloader();
        }

        desk.on_gateway_disconnected();
        gateway.disconnect();
    }

    logger.stop();
    if (g_log_file) {
        std::fclose(g_log_file);
    }
    return exit_code;
}
