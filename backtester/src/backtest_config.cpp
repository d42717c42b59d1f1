#include "backtest_config.hpp"
#include "exceptions.hpp"

#include <string>

namespace backtester {

    namespace {
        double readNumber(const json& j, const char* key, double fallback) {
            if (!j.contains(key)) {
                return fallback;
            }
            const json& value = j.at(key);
            if (!value.is_number()) {
                throw core::ConfigException(std::string("Config key '") + key + "' must be a number, got " + value.dump());
            }
            return value.get<double>();
        }

        bool readBool(const json& j, const char* key, bool fallback) {
            if (!j.contains(key)) {
                return fallback;
            }
            const json& value = j.at(key);
            if (!value.is_boolean()) {
                throw core::ConfigException(std::string("Config key '") + key + "' must be true or false, got " + value.dump());
            }
            return value.get<bool>();
        }
    }

    BacktestConfig BacktestConfig::fromJson(const json& j) {
        if (!j.is_object()) {
            throw core::ConfigException("Backtest config must be a JSON object, got " + j.dump());
        }

        BacktestConfig config;
        config.cash = readNumber(j, "cash", config.cash);
        config.spread = readNumber(j, "spread", config.spread);
        config.margin = readNumber(j, "margin", config.margin);
        config.trade_on_close = readBool(j, "trade_on_close", config.trade_on_close);
        config.exclusive_orders = readBool(j, "exclusive_orders", config.exclusive_orders);
        config.finalize_trades = readBool(j, "finalize_trades", config.finalize_trades);

        if (j.contains("commission")) {
            const json& commission = j.at("commission");
            if (commission.is_number()) {
                config.commission = CommissionModel(commission.get<double>());
            } else if (commission.is_array() && commission.size() == 2 &&
                       commission[0].is_number() && commission[1].is_number()) {
                config.commission = CommissionModel(commission[0].get<double>(), commission[1].get<double>());
            } else {
                throw core::ConfigException("Config key 'commission' must be a rate or [fixed, relative], got " +
                                            commission.dump());
            }
        }

        config.validate();
        return config;
    }

    json BacktestConfig::toJson() const {
        json commission_json;
        if (commission.isCustom()) {
            commission_json = "custom";
        } else if (commission.getFixed() != 0.0) {
            commission_json = json::array({commission.getFixed(), commission.getRelative()});
        } else {
            commission_json = commission.getRelative();
        }

        return {
            {"cash", cash},
            {"spread", spread},
            {"commission", commission_json},
            {"margin", margin},
            {"trade_on_close", trade_on_close},
            {"exclusive_orders", exclusive_orders},
            {"finalize_trades", finalize_trades}
        };
    }

} // namespace backtester
