#pragma once

#include "../gateway/gateway_events.hpp"
#include "../types.hpp"

#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

namespace rolldesk {
namespace market {

/**
 * OptionGreek - quote and risk sensitivities of one option contract
 *
 * Every numeric field uses 0 as "unknown". Fields are only ever overwritten by
 * merge_from() or the tick appliers below, which never replace a known value
 * with an unknown one.
 */
struct OptionGreek {
    // Bits of model_fields: which greeks came from a model computation
    static constexpr uint8_t MODEL_IV = 1 << 0;
    static constexpr uint8_t MODEL_DELTA = 1 << 1;
    static constexpr uint8_t MODEL_GAMMA = 1 << 2;
    static constexpr uint8_t MODEL_THETA = 1 << 3;
    static constexpr uint8_t MODEL_VEGA = 1 << 4;

    double strike = 0.0;
    OptionRight right = OptionRight::Call;
    std::string expiry;  // YYYYMMDD

    Money bid = 0.0;
    Money ask = 0.0;
    Money last = 0.0;

    double delta = 0.0;
    double gamma = 0.0;
    double theta = 0.0;
    double vega = 0.0;
    double implied_vol = 0.0;
    int64_t open_interest = 0;
    uint8_t model_fields = 0;

    bool has_price() const { return bid > 0 || ask > 0 || last > 0; }
    bool has_greeks() const { return delta != 0 || gamma != 0 || theta != 0 || vega != 0 || implied_vol > 0; }
    bool has_data() const { return has_price() || has_greeks() || open_interest > 0; }

    /// Bid/ask midpoint when both sides are known, else last
    Money mark() const {
        if (bid > 0 && ask > 0) return (bid + ask) / 2.0;
        return last;
    }

    StrikeKey key() const { return strike_key(strike); }

    /**
     * Non-destructive merge: a field of `other` replaces ours only if it is
     * meaningfully present (price > 0, greek != 0, IV > 0, OI > 0).
     * A greek taken from a bid/ask/last computation never replaces one that
     * came from the model. Merging a record into itself leaves it unchanged.
     */
    void merge_from(const OptionGreek& other) {
        if (other.bid > 0) bid = other.bid;
        if (other.ask > 0) ask = other.ask;
        if (other.last > 0) last = other.last;
        merge_greek(delta, other.delta, other, MODEL_DELTA, false);
        merge_greek(gamma, other.gamma, other, MODEL_GAMMA, false);
        merge_greek(theta, other.theta, other, MODEL_THETA, false);
        merge_greek(vega, other.vega, other, MODEL_VEGA, false);
        merge_greek(implied_vol, other.implied_vol, other, MODEL_IV, true);
        if (other.open_interest > 0) open_interest = other.open_interest;
    }

    bool is_model(uint8_t bit) const { return (model_fields & bit) != 0; }

    bool operator==(const OptionGreek& o) const {
        return strike_key(strike) == strike_key(o.strike) && right == o.right && expiry == o.expiry &&
               bid == o.bid && ask == o.ask && last == o.last && delta == o.delta && gamma == o.gamma &&
               theta == o.theta && vega == o.vega && implied_vol == o.implied_vol &&
               open_interest == o.open_interest;
    }
    bool operator!=(const OptionGreek& o) const { return !(*this == o); }

private:
    void merge_greek(double& field, double in, const OptionGreek& other, uint8_t bit, bool positive_only) {
        if (!std::isfinite(in) || (positive_only ? in <= 0 : in == 0)) return;
        if (other.is_model(bit)) {
            field = in;
            model_fields |= bit;
        } else if (!is_model(bit)) {
            field = in;
        }
    }
};

/// Strike ascending, call before put at equal strike
inline bool greek_order(const OptionGreek& a, const OptionGreek& b) {
    StrikeKey ka = a.key();
    StrikeKey kb = b.key();
    if (ka != kb) return ka < kb;
    return a.right == OptionRight::Call && b.right == OptionRight::Put;
}

// (strike, right) identity inside one (symbol, expiry) key
struct PairKey {
    StrikeKey strike;
    OptionRight right;

    bool operator<(const PairKey& o) const {
        if (strike != o.strike) return strike < o.strike;
        return static_cast<uint8_t>(right) < static_cast<uint8_t>(o.right);
    }
    bool operator==(const PairKey& o) const { return strike == o.strike && right == o.right; }
};

inline PairKey pair_key(const OptionGreek& g) {
    return PairKey{g.key(), g.right};
}

// =============================================================================
// Tick appliers
// =============================================================================

/**
 * Apply a tick_price event to any record with bid/ask/last fields. The gateway
 * sends -1 for "no data"; those and unset sentinels are ignored. Close only
 * fills last while last is unknown.
 *
 * Returns true if the tick type is one we track.
 */
template <typename Quote>
bool apply_tick_price(Quote& g, int tick_type, double value) {
    namespace tick = gateway::tick;
    bool known = true;
    bool usable = is_gateway_value(value) && value > 0;

    switch (tick_type) {
    case tick::BID:
    case tick::DELAYED_BID:
        if (usable) g.bid = value;
        break;
    case tick::ASK:
    case tick::DELAYED_ASK:
        if (usable) g.ask = value;
        break;
    case tick::LAST:
    case tick::DELAYED_LAST:
        if (usable) g.last = value;
        break;
    case tick::CLOSE:
    case tick::DELAYED_CLOSE:
        if (usable && g.last == 0) g.last = value;
        break;
    default:
        known = false;
        break;
    }
    return known;
}

inline bool apply_tick_size(OptionGreek& g, int tick_type, double size) {
    namespace tick = gateway::tick;
    if (tick_type != tick::OPTION_CALL_OPEN_INTEREST && tick_type != tick::OPTION_PUT_OPEN_INTEREST &&
        tick_type != tick::FUTURES_OPEN_INTEREST) {
        return false;
    }
    if (is_gateway_value(size) && size > 0) {
        g.open_interest = static_cast<int64_t>(std::llround(size));
    }
    return true;
}

inline bool is_model_field(int field) {
    return field == gateway::tick::MODEL_OPTION || field == gateway::tick::DELAYED_MODEL_OPTION;
}

inline bool is_computation_field(int field) {
    namespace tick = gateway::tick;
    return (field >= tick::BID_OPTION && field <= tick::MODEL_OPTION) ||
           (field >= tick::DELAYED_BID_OPTION && field <= tick::DELAYED_MODEL_OPTION);
}

/**
 * Apply a tick_option_computation event.
 *
 * Model computations overwrite; bid/ask/last computations only fill fields
 * that are still unknown, so a model value is never displaced by a fallback
 * regardless of arrival order.
 */
inline bool apply_option_computation(OptionGreek& g, const gateway::TickOptionComputationEvent& e) {
    if (!is_computation_field(e.field)) return false;

    const bool model = is_model_field(e.field);
    auto take = [&g, model](double& field, const std::optional<double>& in, uint8_t bit, bool positive_only) {
        if (!in || !is_gateway_value(*in)) return;
        double v = *in;
        if (positive_only ? v <= 0 : v == 0) return;
        if (model) {
            field = v;
            g.model_fields |= bit;
        } else if (field == 0) {
            field = v;
        }
    };

    take(g.implied_vol, e.implied_vol, OptionGreek::MODEL_IV, true);
    take(g.delta, e.delta, OptionGreek::MODEL_DELTA, false);
    take(g.gamma, e.gamma, OptionGreek::MODEL_GAMMA, false);
    take(g.vega, e.vega, OptionGreek::MODEL_VEGA, false);
    take(g.theta, e.theta, OptionGreek::MODEL_THETA, false);
    return true;
}

}  // namespace market
}  // namespace rolldesk
