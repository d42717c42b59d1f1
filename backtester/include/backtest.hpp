#pragma once

#include <cstddef>
#include <functional>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "datatypes.hpp"
#include "series_view.hpp"
#include "backtest_config.hpp"
#include "broker.hpp"
#include "stats.hpp"

namespace backtester {

    // Size meaning "all available buying power"
    inline constexpr double kAllAvailable = 1.0 - std::numeric_limits<double>::epsilon();

    struct OrderRequest {
        std::optional<std::string> code;  // May be omitted with a single instrument
        double size = kAllAvailable;      // Unsigned; sell() negates it
        std::optional<double> limit;
        std::optional<double> stop;
        std::optional<double> sl;
        std::optional<double> tp;
        std::optional<std::string> tag;
    };

    enum class StepOutcome {
        Advanced,   // Bar processed, more bars remain
        Completed,  // Last bar processed, or the run had already finished
        Failed      // Bar processing threw; the run is over
    };

    struct StepError {
        std::size_t step_index = 0;
        core::Timestamp time;
        std::string message;
    };

    struct StepResult {
        StepOutcome outcome = StepOutcome::Completed;
        std::optional<StepError> error;
    };

    // Drives one Broker over the union of all instruments' timestamps, one bar
    // per step. A strategy callback at step t sees bars up to t; its orders are
    // matched from bar t+1 (or at bar t's close with trade_on_close).
    class Backtest {
    public:
        using Strategy = std::function<void(Backtest&)>;
        using TradeCallback = std::function<void(const std::string& event, const Trade& trade)>;

        // Validates and, where needed, sorts the data, then start()s.
        // Throws core::DataValidationException or core::ConfigException.
        explicit Backtest(std::map<std::string, core::BarSeries> data, BacktestConfig config = {});

        Backtest(const Backtest&) = delete;
        Backtest& operator=(const Backtest&) = delete;

        // --- Lifecycle ---
        Backtest& start();
        Backtest& reset();
        StepResult advance();
        bool step();
        Backtest& goTo(std::size_t target_step, Strategy strategy = nullptr);
        const StatsReport& run();
        const StatsReport& finalize();

        Backtest& setStrategy(Strategy strategy);
        void addTradeCallback(TradeCallback callback);
        // Starting cash for the next start()/reset()
        void setCash(double cash);

        // --- Trading ---
        Order buy(const OrderRequest& request = {});
        Order sell(const OrderRequest& request = {});
        Order buy(const std::string& code, double size);
        Order sell(const std::string& code, double size);

        // --- Introspection ---
        std::map<std::string, core::SeriesView> getData() const;
        const std::vector<core::Timestamp>& getIndex() const { return index_; }
        std::vector<std::string> getCodes() const;
        Position getPosition() const;
        Position getPosition(const std::string& code) const;
        long long getPositionOf(const std::string& code) const;
        double getEquity() const;
        double getCash() const;
        std::vector<Trade> getTrades() const;
        std::vector<ClosedTrade> getClosedTrades() const;
        std::vector<Order> getOrders() const;
        std::optional<core::Timestamp> getCurrentTime() const;
        double getProgress() const;
        std::size_t getStepIndex() const { return step_index_; }
        std::size_t getTotalSteps() const { return index_.size(); }
        bool isStarted() const { return started_; }
        bool isFinished() const { return finished_; }
        const std::optional<StepError>& getLastError() const { return last_error_; }
        const BacktestConfig& getConfig() const { return config_; }
        const Broker* getBroker() const { return broker_.get(); }

        nlohmann::json getStateSnapshot() const;

    private:
        std::map<std::string, core::BarSeries> data_;
        BacktestConfig config_;
        std::vector<core::Timestamp> index_;
        // Per code: timestamp (clock ticks) -> row
        std::map<std::string, std::unordered_map<core::Duration::rep, std::size_t>> row_of_;
        // Per code: rows visible to the strategy
        std::map<std::string, std::size_t> visible_rows_;

        std::unique_ptr<Broker> broker_;
        Strategy strategy_;
        std::vector<TradeCallback> trade_callbacks_;
        std::unique_ptr<StatsReport> results_;
        std::optional<StepError> last_error_;

        std::size_t step_index_ = 0;
        bool started_ = false;
        bool finished_ = false;
        bool in_step_ = false;

        // --- Private Helper Methods ---
        void validateData();
        void requireStarted(const char* operation) const;
        std::string resolveCode(const std::optional<std::string>& code) const;
        Order submit(const OrderRequest& request, double sign);
        void attachTradeCallbacks();
    };

} // namespace backtester
