#include "../../include/config/desk_config.hpp"

#include "../../include/core/errors.hpp"
#include "../../include/util/string_utils.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

namespace rolldesk::config {

using json = nlohmann::json;

namespace {

const json* section(const json& root, const char* name) {
    auto it = root.find(name);
    if (it == root.end()) return nullptr;
    if (!it->is_object()) {
        throw ConfigError(std::string("\"") + name + "\" must be an object");
    }
    return &*it;
}

template <typename T>
void read_value(const json* sec, const char* key, T& out) {
    if (!sec) return;
    auto it = sec->find(key);
    if (it == sec->end()) return;
    try {
        out = it->get<T>();
    } catch (const json::exception& e) {
        throw ConfigError(std::string("invalid value for \"") + key + "\": " + e.what());
    }
}

void read_ms(const json* sec, const char* key, std::chrono::milliseconds& out) {
    int64_t ms = out.count();
    read_value(sec, key, ms);
    if (ms <= 0) {
        throw ConfigError(std::string("\"") + key + "\" must be positive");
    }
    out = std::chrono::milliseconds(ms);
}

void read_ranges(const json& root, core::CorrelatorConfig& cfg) {
    const json* sec = section(root, "ranges");
    read_value(sec, "width", cfg.range_width);
    read_value(sec, "order_base", cfg.order_base);
    read_value(sec, "quote_base", cfg.quote_base);
    read_value(sec, "chain_base", cfg.chain_base);
    read_value(sec, "contract_base", cfg.contract_base);
    read_value(sec, "roll_base", cfg.roll_base);
    read_value(sec, "account_base", cfg.account_base);
    read_value(sec, "history_base", cfg.history_base);
    if (cfg.range_width <= 0) {
        throw ConfigError("\"width\" must be positive");
    }
    if (!cfg.ranges_disjoint()) {
        throw ConfigError("request id ranges overlap");
    }
}

void read_snapshot(const json& root, market::SnapshotConfig& cfg) {
    const json* sec = section(root, "snapshot");
    read_value(sec, "burst_size", cfg.burst_size);
    read_ms(sec, "burst_delay_ms", cfg.burst_delay);
    read_ms(sec, "settle_ms", cfg.settle);
    read_ms(sec, "hard_timeout_ms", cfg.hard_timeout);
    read_value(sec, "exchange", cfg.exchange);
    if (cfg.burst_size == 0) {
        throw ConfigError("\"burst_size\" must be at least 1");
    }
}

void read_preloader(const json& root, market::PreloaderConfig& cfg) {
    const json* sec = section(root, "preloader");
    std::vector<std::string> symbols = cfg.symbols;
    read_value(sec, "symbols", symbols);
    cfg.symbols.clear();
    for (const auto& s : symbols) {
        std::string sym = util::to_upper(util::trim(s));
        if (!sym.empty() && std::find(cfg.symbols.begin(), cfg.symbols.end(), sym) == cfg.symbols.end()) {
            cfg.symbols.push_back(sym);
        }
    }
    read_ms(sec, "interval_ms", cfg.interval);
    read_value(sec, "num_expirations", cfg.num_expirations);
    read_value(sec, "strike_radius", cfg.strike_radius);
    read_value(sec, "fallback_half_width", cfg.fallback_half_width);
}

void read_logging(const json& root, LoggingConfig& cfg) {
    const json* sec = section(root, "logging");
    std::string level;
    read_value(sec, "level", level);
    if (!level.empty() && !logging::parse_level(level.c_str(), cfg.level)) {
        throw ConfigError("unknown log level \"" + level + "\"");
    }
    read_value(sec, "file", cfg.file);
}

}  // namespace

DeskConfig parse_config(const std::string& json_text) {
    json root;
    try {
        root = json::parse(json_text);
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("malformed config: ") + e.what());
    }
    if (!root.is_object()) {
        throw ConfigError("config root must be an object");
    }

    DeskConfig cfg;
    read_ranges(root, cfg.correlator);
    read_snapshot(root, cfg.snapshot);

    const json* ttl_sec = section(root, "ttl");
    read_ms(ttl_sec, "greeks_ms", cfg.ttls.greeks);
    read_ms(ttl_sec, "chain_ms", cfg.ttls.chain);

    const json* timeouts_sec = section(root, "timeouts");
    read_ms(timeouts_sec, "quote_ms", cfg.quotes.timeout);
    read_ms(timeouts_sec, "resolution_ms", cfg.resolver.timeout);
    read_ms(timeouts_sec, "chain_ms", cfg.chains.timeout);
    read_ms(timeouts_sec, "managed_accounts_ms", cfg.accounts.managed_accounts_timeout);
    read_ms(timeouts_sec, "account_summary_ms", cfg.accounts.summary_timeout);
    read_ms(timeouts_sec, "positions_ms", cfg.accounts.positions_timeout);
    read_ms(timeouts_sec, "account_alias_ms", cfg.accounts.alias_timeout);
    read_ms(timeouts_sec, "historical_ms", cfg.historical.timeout);

    // One exchange for every request the desk routes
    cfg.resolver.exchange = cfg.snapshot.exchange;
    cfg.quotes.exchange = cfg.snapshot.exchange;
    cfg.historical.exchange = cfg.snapshot.exchange;

    read_preloader(root, cfg.preloader);
    read_logging(root, cfg.logging);

    const json* accounts_sec = section(root, "accounts");
    read_value(accounts_sec, "alias_store", cfg.alias_store_path);
    read_value(accounts_sec, "summary_group", cfg.accounts.summary_group);
    read_value(accounts_sec, "summary_tags", cfg.accounts.summary_tags);
    if (cfg.accounts.summary_tags.empty()) {
        throw ConfigError("\"summary_tags\" must name at least one tag");
    }

    const json* rates_sec = section(root, "rates");
    read_value(rates_sec, "fred_api_key", cfg.rates.api_key);
    read_ms(rates_sec, "ttl_ms", cfg.rates.ttl);

    return cfg;
}

DeskConfig load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_config(buffer.str());
}

}  // namespace rolldesk::config
