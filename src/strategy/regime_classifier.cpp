// src/strategy/regime_classifier.cpp
#include "options_ngin/strategy/regime_classifier.hpp"
#include <cmath>

namespace options_ngin {

std::string regime_to_string(VolatilityRegime regime) {
    switch (regime) {
        case VolatilityRegime::EXTREMELY_LOW:
            return "EXTREMELY_LOW";
        case VolatilityRegime::LOW:
            return "LOW";
        case VolatilityRegime::OPTIMAL_LOW:
            return "OPTIMAL_LOW";
        case VolatilityRegime::OPTIMAL_MEDIUM:
            return "OPTIMAL_MEDIUM";
        case VolatilityRegime::OPTIMAL_HIGH:
            return "OPTIMAL_HIGH";
        case VolatilityRegime::HIGH:
            return "HIGH";
        case VolatilityRegime::EXTREMELY_HIGH:
            return "EXTREMELY_HIGH";
        default:
            return "UNKNOWN";
    }
}

VolatilityRegime classify_regime(std::optional<double> volatility_index) {
    if (!volatility_index || !std::isfinite(*volatility_index)) {
        return VolatilityRegime::UNKNOWN;
    }

    double level = *volatility_index;
    if (level < 12.0)
        return VolatilityRegime::EXTREMELY_LOW;
    if (level < 15.0)
        return VolatilityRegime::LOW;
    if (level <= 20.0)
        return VolatilityRegime::OPTIMAL_LOW;
    if (level <= 25.0)
        return VolatilityRegime::OPTIMAL_MEDIUM;
    if (level <= 30.0)
        return VolatilityRegime::OPTIMAL_HIGH;
    if (level <= 40.0)
        return VolatilityRegime::HIGH;
    return VolatilityRegime::EXTREMELY_HIGH;
}

std::string regime_label_for(const Signal& signal) {
    if (signal.indicators.regime && !signal.indicators.regime->empty()) {
        return *signal.indicators.regime;
    }
    return regime_to_string(classify_regime(signal.indicators.volatility_index));
}

}  // namespace options_ngin
