#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "backtest.hpp"

namespace cli {

    // The "strategy" object of a runner config
    struct StrategySettings {
        std::string type = "buy_and_hold";
        std::size_t lookback = 20;
        std::optional<double> sl_pct;
        std::optional<double> tp_pct;
        double size = backtester::kAllAvailable;
    };

    // Null yields the defaults. Throws core::ConfigException on an unknown
    // type or an out-of-range field.
    StrategySettings parseStrategy(const nlohmann::json& j);

    // True while `code` has an open trade or a queued entry order
    bool holdsOrEntering(const backtester::Backtest& bt, const std::string& code);

    // Enters every instrument once, on its first bar, and holds
    backtester::Backtest::Strategy makeBuyAndHold(const StrategySettings& settings);

    // Goes long when the close exceeds the highest high of the previous
    // `lookback` bars, with optional percentage stop-loss and take-profit.
    backtester::Backtest::Strategy makeBreakout(const StrategySettings& settings);

    backtester::Backtest::Strategy makeStrategy(const StrategySettings& settings);

} // namespace cli
