// src/strategy/types.cpp
#include "options_ngin/strategy/types.hpp"

namespace options_ngin {

std::string exit_reason_to_string(ExitReason reason) {
    switch (reason) {
        case ExitReason::PROFIT_TARGET:
            return "PROFIT_TARGET";
        case ExitReason::STOP_LOSS:
            return "STOP_LOSS";
        case ExitReason::TARGET_HOLD_REACHED:
            return "TARGET_HOLD_REACHED";
        case ExitReason::MAX_HOLD_REACHED:
            return "MAX_HOLD_REACHED";
        case ExitReason::END_OF_PERIOD:
            return "END_OF_PERIOD";
        default:
            return "UNKNOWN";
    }
}

}  // namespace options_ngin
