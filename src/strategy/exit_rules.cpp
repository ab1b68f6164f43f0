// src/strategy/exit_rules.cpp
#include "options_ngin/strategy/exit_rules.hpp"
#include <cmath>

namespace options_ngin {

Result<void> ExitThresholds::validate() const {
    if (!std::isfinite(profit_target) || profit_target <= 0.0) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                "profit_target must be positive, got " +
                                    std::to_string(profit_target),
                                "ExitThresholds");
    }
    if (!std::isfinite(max_loss) || max_loss <= 0.0) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                "max_loss must be positive, got " + std::to_string(max_loss),
                                "ExitThresholds");
    }
    if (!std::isfinite(max_hold_minutes) || max_hold_minutes <= 0.0) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                "max_hold_minutes must be positive", "ExitThresholds");
    }
    if (target_hold_minutes) {
        double target = *target_hold_minutes;
        if (!std::isfinite(target) || target <= 0.0 || target > max_hold_minutes) {
            return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                    "target_hold_minutes must be in (0, max_hold_minutes]",
                                    "ExitThresholds");
        }
    }
    return Result<void>();
}

nlohmann::json ExitThresholds::to_json() const {
    nlohmann::json j;
    j["profit_target"] = profit_target;
    j["max_loss"] = max_loss;
    if (target_hold_minutes) {
        j["target_hold_minutes"] = *target_hold_minutes;
    } else {
        j["target_hold_minutes"] = nullptr;
    }
    j["max_hold_minutes"] = max_hold_minutes;
    return j;
}

void ExitThresholds::from_json(const nlohmann::json& j) {
    if (j.contains("profit_target"))
        profit_target = j.at("profit_target").get<double>();
    if (j.contains("max_loss"))
        max_loss = j.at("max_loss").get<double>();
    if (j.contains("target_hold_minutes")) {
        if (j.at("target_hold_minutes").is_null())
            target_hold_minutes.reset();
        else
            target_hold_minutes = j.at("target_hold_minutes").get<double>();
    }
    if (j.contains("max_hold_minutes"))
        max_hold_minutes = j.at("max_hold_minutes").get<double>();
}

std::optional<ExitReason> evaluate_exit(const ExitThresholds& thresholds, double unrealized_pnl,
                                        double holding_minutes) {
    if (unrealized_pnl >= thresholds.profit_target) {
        return ExitReason::PROFIT_TARGET;
    }
    if (unrealized_pnl <= -thresholds.max_loss) {
        return ExitReason::STOP_LOSS;
    }
    if (thresholds.target_hold_minutes && holding_minutes >= *thresholds.target_hold_minutes) {
        return ExitReason::TARGET_HOLD_REACHED;
    }
    if (holding_minutes >= thresholds.max_hold_minutes) {
        return ExitReason::MAX_HOLD_REACHED;
    }
    return std::nullopt;
}

}  // namespace options_ngin
