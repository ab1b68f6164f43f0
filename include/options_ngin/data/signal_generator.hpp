// include/options_ngin/data/signal_generator.hpp
#pragma once

#include <functional>
#include <map>
#include <optional>
#include <vector>
#include "options_ngin/core/types.hpp"
#include "options_ngin/instruments/option.hpp"
#include "options_ngin/strategy/types.hpp"

namespace options_ngin {

/**
 * @brief Upstream producer of entry signals
 */
class SignalGenerator {
public:
    virtual ~SignalGenerator() = default;

    /**
     * @brief Signal for the latest bar, if any
     * @param history Bars seen so far, the current bar last
     * @param quotes Quote snapshot at the current bar
     */
    virtual std::optional<Signal> next_signal(const std::vector<Bar>& history,
                                              const std::vector<OptionQuote>& quotes) = 0;
};

/**
 * @brief Emits prepared signals at the bars carrying their timestamps
 */
class ScheduledSignalGenerator : public SignalGenerator {
public:
    ScheduledSignalGenerator() = default;
    explicit ScheduledSignalGenerator(const std::vector<Signal>& signals);

    void add_signal(const Signal& signal);

    std::optional<Signal> next_signal(const std::vector<Bar>& history,
                                      const std::vector<OptionQuote>& quotes) override;

private:
    std::map<Timestamp, Signal> schedule_;
};

/**
 * @brief Adapts a callable into a SignalGenerator
 */
class CallbackSignalGenerator : public SignalGenerator {
public:
    using Callback = std::function<std::optional<Signal>(const std::vector<Bar>&,
                                                         const std::vector<OptionQuote>&)>;

    explicit CallbackSignalGenerator(Callback callback) : callback_(std::move(callback)) {}

    std::optional<Signal> next_signal(const std::vector<Bar>& history,
                                      const std::vector<OptionQuote>& quotes) override {
        if (!callback_) {
            return std::nullopt;
        }
        return callback_(history, quotes);
    }

private:
    Callback callback_;
};

}  // namespace options_ngin
