// cli/src/main.cpp

// Standard includes
#include <exception>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Third-party
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/logger.h>

// Project includes
#include "logging.hpp"
#include "exceptions.hpp"
#include "datatypes.hpp"
#include "utils.hpp"
#include "database_manager.hpp"
#include "bar_data_provider.hpp"
#include "backtest.hpp"
#include "builtin_strategies.hpp"

using json = nlohmann::json;

namespace {

    json loadJsonFile(const std::string& path) {
        std::ifstream ifs(path);
        if (!ifs.is_open()) {
            throw core::ConfigException("Failed to open config file: " + path);
        }
        try {
            return json::parse(ifs);
        } catch (const json::parse_error& e) {
            throw core::ConfigException("Failed to parse config file '" + path + "': " + e.what());
        }
    }

    std::optional<core::Timestamp> readDate(const json& config, const char* key) {
        if (!config.contains(key) || config.at(key).is_null()) {
            return std::nullopt;
        }
        try {
            return core::utils::stringToTimestamp(config.at(key).get<std::string>());
        } catch (const std::exception& e) {
            throw core::ConfigException(std::string("Invalid '") + key + "' date: " + e.what());
        }
    }

} // namespace

int main(int argc, char* argv[]) {
    // Define logger pointer early in the main scope
    std::shared_ptr<spdlog::logger> logger = nullptr;

    if (argc != 2) {
        std::cerr << "Usage: " << argv[0] << " <config.json>" << std::endl;
        return 1;
    }

    // Main try block for exception handling
    try {
        // --- Load Config ---
        json config = loadJsonFile(argv[1]);
        if (!config.is_object()) {
            throw core::ConfigException("Config root must be a JSON object");
        }

        // --- Initialize Logging ---
        spdlog::level::level_enum console_level = spdlog::level::info;
        if (config.contains("log_level")) {
            console_level = core::logging::level_from_string(config.at("log_level").get<std::string>());
        }
        core::logging::initialize("backcast_cli", console_level, spdlog::level::debug);
        logger = core::logging::getLogger();
        logger->info("backcast CLI starting with config {}", argv[1]);

        // --- Read Parameters ---
        std::string db_path = config.value("database", std::string());
        if (db_path.empty()) {
            throw core::ConfigException("Config key 'database' (SQLite path) is required");
        }
        if (!config.contains("codes") || !config.at("codes").is_array() || config.at("codes").empty()) {
            throw core::ConfigException("Config key 'codes' must be a non-empty array of instrument codes");
        }
        auto codes = config.at("codes").get<std::vector<std::string>>();
        auto from = readDate(config, "from");
        auto to = readDate(config, "to");
        auto backtest_config = backtester::BacktestConfig::fromJson(config.value("backtest", json::object()));
        cli::StrategySettings strategy = cli::parseStrategy(config.value("strategy", json()));
        logger->info("Backtest parameters: {}", backtest_config.toJson().dump());

        // --- Load Data ---
        data::DatabaseManager db_manager(db_path);
        if (!db_manager.connect()) {
            throw core::DataLoadException("Could not open database: " + db_path);
        }
        if (!db_manager.initializeSchema()) {
            throw core::DataLoadException("Schema check failed for database: " + db_path);
        }
        auto universe = data::loadUniverse(db_manager, codes, from, to);
        db_manager.disconnect();

        // --- Run Backtest ---
        logger->info("---=== Starting Backtest Run ({}) ===---", strategy.type);
        backtester::Backtest bt(std::move(universe), backtest_config);
        bt.setStrategy(cli::makeStrategy(strategy));
        bt.addTradeCallback([&logger](const std::string& event, const backtester::Trade& trade) {
            logger->info("{} {} x{} @ {:.4f} on {}", event, trade.code, trade.size, trade.entry_price,
                         core::utils::timestampToString(trade.entry_time));
        });

        const backtester::StatsReport& report = bt.run();
        if (bt.getLastError()) {
            logger->error("Run stopped early at step {}: {}", bt.getLastError()->step_index, bt.getLastError()->message);
        }
        report.logMetrics();

        // --- Write Report ---
        if (config.contains("report")) {
            std::string report_path = config.at("report").get<std::string>();
            std::ofstream out(report_path);
            if (!out.is_open()) {
                throw core::ConfigException("Failed to open report file for writing: " + report_path);
            }
            json output = report.toJson();
            output["_config"] = backtest_config.toJson();
            out << output.dump(2) << std::endl;
            logger->info("Report written to {}", report_path);
        }

        logger->info("---=== Backtest Run Finished ===---");
        if (bt.getLastError()) {
            return 1;
        }

    // --- Exception Handling ---
    } catch (const core::BackcastException& ex) {
        std::cerr << "backcast error: " << ex.what() << std::endl;
        if (logger) logger->critical("backcast error: {}", ex.what());
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Standard error: " << ex.what() << std::endl;
        if (logger) logger->critical("Standard error: {}", ex.what());
        return 1;
    }

    // Success
    return 0;
}
