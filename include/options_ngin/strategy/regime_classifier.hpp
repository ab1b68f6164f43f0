// include/options_ngin/strategy/regime_classifier.hpp
#pragma once

#include <optional>
#include <string>
#include "options_ngin/strategy/types.hpp"

namespace options_ngin {

/**
 * @brief Volatility-index level buckets used to segment trade results
 */
enum class VolatilityRegime {
    EXTREMELY_LOW,   // < 12
    LOW,             // 12 to < 15
    OPTIMAL_LOW,     // 15 to 20
    OPTIMAL_MEDIUM,  // > 20 to 25
    OPTIMAL_HIGH,    // > 25 to 30
    HIGH,            // > 30 to 40
    EXTREMELY_HIGH,  // > 40
    UNKNOWN
};

std::string regime_to_string(VolatilityRegime regime);

/**
 * @brief Bucket a volatility-index level; missing or non-finite gives UNKNOWN
 */
VolatilityRegime classify_regime(std::optional<double> volatility_index);

/**
 * @brief Regime label for a signal: the explicit label if it carries one,
 *        otherwise the bucket of its volatility-index level
 */
std::string regime_label_for(const Signal& signal);

}  // namespace options_ngin
