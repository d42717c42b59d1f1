#pragma once

#include <nlohmann/json.hpp>

#include "broker.hpp"

namespace backtester {

    using json = nlohmann::json;

    struct BacktestConfig : BrokerConfig {
        // Close whatever is still open at the last close when the run is finalized
        bool finalize_trades = false;

        // Reads cash, spread, commission (rate or [fixed, relative]), margin,
        // trade_on_close, exclusive_orders, finalize_trades. Missing keys keep
        // their defaults. Throws core::ConfigException on wrong types or
        // out-of-range values.
        static BacktestConfig fromJson(const json& j);

        json toJson() const;
    };

} // namespace backtester
