// src/data/signal_generator.cpp
#include "options_ngin/data/signal_generator.hpp"

namespace options_ngin {

ScheduledSignalGenerator::ScheduledSignalGenerator(const std::vector<Signal>& signals) {
    for (const auto& signal : signals) {
        add_signal(signal);
    }
}

void ScheduledSignalGenerator::add_signal(const Signal& signal) {
    schedule_[signal.timestamp] = signal;
}

std::optional<Signal> ScheduledSignalGenerator::next_signal(
    const std::vector<Bar>& history, const std::vector<OptionQuote>& /*quotes*/) {
    if (history.empty()) {
        return std::nullopt;
    }
    auto it = schedule_.find(history.back().timestamp);
    if (it == schedule_.end()) {
        return std::nullopt;
    }
    return it->second;
}

}  // namespace options_ngin
