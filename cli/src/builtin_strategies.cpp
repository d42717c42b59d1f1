#include "builtin_strategies.hpp"
#include "exceptions.hpp"
#include "series_view.hpp"

#include <algorithm>

using json = nlohmann::json;

namespace cli {

    namespace {

        std::optional<double> readPct(const json& j, const char* key) {
            if (!j.contains(key) || j.at(key).is_null()) {
                return std::nullopt;
            }
            if (!j.at(key).is_number() || j.at(key).get<double>() <= 0.0 || j.at(key).get<double>() >= 1.0) {
                throw core::ConfigException(std::string("strategy.") + key + " must be a fraction in (0, 1)");
            }
            return j.at(key).get<double>();
        }

    } // namespace

    StrategySettings parseStrategy(const json& j) {
        StrategySettings settings;
        if (j.is_null()) {
            return settings;
        }
        if (!j.is_object()) {
            throw core::ConfigException("'strategy' must be a JSON object");
        }
        settings.type = j.value("type", settings.type);
        if (settings.type != "buy_and_hold" && settings.type != "breakout") {
            throw core::ConfigException("Unknown strategy type '" + settings.type + "' (expected buy_and_hold or breakout)");
        }
        if (j.contains("lookback")) {
            if (!j.at("lookback").is_number_integer() || j.at("lookback").get<long long>() < 1) {
                throw core::ConfigException("strategy.lookback must be a positive integer");
            }
            settings.lookback = j.at("lookback").get<std::size_t>();
        }
        settings.sl_pct = readPct(j, "sl_pct");
        settings.tp_pct = readPct(j, "tp_pct");
        if (j.contains("size")) {
            if (!j.at("size").is_number() || j.at("size").get<double>() <= 0.0) {
                throw core::ConfigException("strategy.size must be a positive number");
            }
            settings.size = j.at("size").get<double>();
        }
        return settings;
    }

    bool holdsOrEntering(const backtester::Backtest& bt, const std::string& code) {
        if (bt.getPositionOf(code) != 0) {
            return true;
        }
        // Orders placed on this step fill on the next one
        for (const auto& order : bt.getOrders()) {
            if (order.code == code && !order.isContingent()) {
                return true;
            }
        }
        return false;
    }

    backtester::Backtest::Strategy makeBuyAndHold(const StrategySettings& settings) {
        return [settings](backtester::Backtest& bt) {
            for (const auto& entry : bt.getData()) {
                if (entry.second.empty() || holdsOrEntering(bt, entry.first)) {
                    continue;
                }
                bool exited = false;
                for (const auto& trade : bt.getClosedTrades()) {
                    exited = exited || trade.code == entry.first;
                }
                if (!exited) {
                    bt.buy(entry.first, settings.size);
                }
            }
        };
    }

    backtester::Backtest::Strategy makeBreakout(const StrategySettings& settings) {
        return [settings](backtester::Backtest& bt) {
            for (const auto& entry : bt.getData()) {
                const core::SeriesView& bars = entry.second;
                if (bars.size() <= settings.lookback || holdsOrEntering(bt, entry.first)) {
                    continue;
                }
                double highest = 0.0;
                for (std::size_t i = bars.size() - 1 - settings.lookback; i < bars.size() - 1; ++i) {
                    highest = std::max(highest, bars[i].high);
                }
                double close = bars.back().close;
                if (close <= highest) {
                    continue;
                }
                backtester::OrderRequest request;
                request.code = entry.first;
                request.size = settings.size;
                if (settings.sl_pct) {
                    request.sl = close * (1.0 - *settings.sl_pct);
                }
                if (settings.tp_pct) {
                    request.tp = close * (1.0 + *settings.tp_pct);
                }
                bt.buy(request);
            }
        };
    }

    backtester::Backtest::Strategy makeStrategy(const StrategySettings& settings) {
        return settings.type == "breakout" ? makeBreakout(settings) : makeBuyAndHold(settings);
    }

} // namespace cli
