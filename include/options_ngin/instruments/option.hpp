// include/options_ngin/instruments/option.hpp
#pragma once

#include <optional>
#include <string>
#include <vector>
#include "options_ngin/core/types.hpp"

namespace options_ngin {

enum class OptionType { CALL, PUT };

enum class LegSide { LONG, SHORT };

std::string option_type_to_string(OptionType type);
std::optional<OptionType> option_type_from_string(const std::string& text);
std::string leg_side_to_string(LegSide side);

/**
 * @brief +1 for long legs, -1 for short legs
 */
inline double side_sign(LegSide side) {
    return side == LegSide::LONG ? 1.0 : -1.0;
}

struct Greeks {
    double delta{0.0};
    double gamma{0.0};
    double theta{0.0};  // Per calendar day
    double vega{0.0};   // Per 1 vol point
    double rho{0.0};    // Per 1 rate point
};

/**
 * @brief Identity of a listed option: type, strike and expiration
 */
struct OptionContract {
    OptionType type{OptionType::CALL};
    double strike{0.0};
    Timestamp expiration;

    OptionContract() = default;
    OptionContract(OptionType t, double k, Timestamp exp) : type(t), strike(k), expiration(exp) {}

    /**
     * @brief True if other has the same type and strike and an expiration
     *        within tolerance_days of this one
     */
    bool matches(const OptionContract& other, double tolerance_days) const;

    std::string to_string() const;

    bool operator==(const OptionContract& other) const {
        return type == other.type && strike == other.strike && expiration == other.expiration;
    }
    bool operator<(const OptionContract& other) const;
};

/**
 * @brief Immutable quote snapshot for one contract at one timestamp
 */
struct OptionQuote {
    OptionType type{OptionType::CALL};
    double strike{0.0};
    Timestamp expiration;
    double bid{0.0};
    double ask{0.0};
    double last{0.0};
    double volume{0.0};
    double open_interest{0.0};
    double implied_volatility{0.0};  // 0 when the source did not supply one

    OptionContract contract() const {
        return OptionContract(type, strike, expiration);
    }

    double mid() const {
        return (bid + ask) / 2.0;
    }

    /**
     * @brief Last trade price if positive, otherwise the bid/ask midpoint
     */
    double mark_price() const {
        return last > 0.0 ? last : mid();
    }
};

/**
 * @brief Find the quote for a contract
 *
 * Type and strike must match exactly; expiration may differ by up to
 * tolerance_days. When several quotes qualify the closest expiration wins.
 *
 * @return Pointer into quotes, or nullptr when no quote qualifies
 */
const OptionQuote* find_quote(const std::vector<OptionQuote>& quotes,
                              const OptionContract& contract, double tolerance_days);

}  // namespace options_ngin
