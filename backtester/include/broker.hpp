#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "datatypes.hpp"
#include "commission.hpp"
#include "order.hpp"
#include "trade.hpp"
#include "position.hpp"

namespace backtester {

    struct BrokerConfig {
        double cash = 10000.0;
        double spread = 0.0;          // Fraction of price, charged against the trader on entry
        CommissionModel commission;
        double margin = 1.0;          // Leverage is 1 / margin
        bool trade_on_close = false;  // Market orders fill at the submitting bar's close
        bool exclusive_orders = false;

        // Throws core::ConfigException on out-of-range values
        void validate() const;
    };

    // Owns cash, pending orders, open trades and the closed-trade ledger of one
    // run, and applies one bar's worth of fills at a time.
    //
    // Per bar the controller calls beginBar() (new marks become visible), then
    // the strategy may place orders, then next() matches orders against the bar
    // and records equity.
    class Broker {
    public:
        using TradeEventHandler = std::function<void(const std::string& event, const Trade& trade)>;
        using RejectionHandler = std::function<void(const Order& order, const std::string& reason)>;

        Broker(const BrokerConfig& config, std::size_t total_bars);

        Broker(const Broker&) = delete;
        Broker& operator=(const Broker&) = delete;

        // Queues a plain order. Throws core::InvalidOrderException for a zero,
        // non-finite or fractional (|size| >= 1) size, or a non-positive price.
        Order newOrder(const std::string& code,
                       double size,
                       std::optional<double> limit = std::nullopt,
                       std::optional<double> stop = std::nullopt,
                       std::optional<double> sl = std::nullopt,
                       std::optional<double> tp = std::nullopt,
                       std::optional<std::string> tag = std::nullopt);

        // Saves a checkpoint, then makes `bars` the current marks
        void beginBar(std::size_t bar_index, core::Timestamp time, const std::map<std::string, core::Bar>& bars);
        // On an exception the broker is rolled back to the last completed bar
        // before the exception propagates.
        void next();
        // Restores the checkpoint taken by the last beginBar(): the previous
        // bar's marks, cash, orders, trades and ledger. Orders placed since
        // are dropped. No-op once next() completed.
        void rollbackBar();

        bool cancelOrder(long long order_id);
        void closeTrade(long long trade_id, double portion = 1.0);
        void closePosition(const std::optional<std::string>& code, double portion = 1.0);

        // Closes every open trade at its code's last close on the current bar
        // and re-records that bar's equity.
        void settleOpenTrades();

        // --- Getters ---
        double getCash() const { return cash_; }
        double getEquity() const;
        double getMarginAvailable() const;
        double getLeverage() const { return 1.0 / config_.margin; }
        const BrokerConfig& getConfig() const { return config_; }

        // Last close seen for `code`; NaN before its first bar
        double getLastPrice(const std::string& code) const;
        long long getPositionSize(const std::optional<std::string>& code = std::nullopt) const;

        const std::vector<Order>& getOrders() const { return orders_; }
        const std::vector<Trade>& getTrades() const { return trades_; }
        const std::vector<ClosedTrade>& getClosedTrades() const { return closed_trades_; }
        const std::vector<double>& getEquityHistory() const { return equity_; }

        long long getCurrentBar() const { return bar_index_; }
        std::optional<core::Timestamp> getCurrentTime() const;

        const Order* findOrder(long long order_id) const;
        const Trade* findTrade(long long trade_id) const;

        void setTradeEventHandler(TradeEventHandler handler) { trade_event_handler_ = std::move(handler); }
        void setRejectionHandler(RejectionHandler handler) { rejection_handler_ = std::move(handler); }

    private:
        BrokerConfig config_;
        double cash_;
        std::vector<double> equity_;          // NaN until the bar is processed
        std::vector<core::Timestamp> bar_times_;
        std::vector<Order> orders_;
        std::vector<Trade> trades_;
        std::vector<ClosedTrade> closed_trades_;

        std::map<std::string, core::Bar> last_bars_;   // Most recent bar per code
        std::map<std::string, core::Bar> active_bars_; // Codes with a bar on the current step
        long long bar_index_ = -1;

        long long next_order_id_ = 1;
        long long next_trade_id_ = 1;

        TradeEventHandler trade_event_handler_;
        RejectionHandler rejection_handler_;

        // State as of the end of the last completed bar
        struct Checkpoint {
            long long bar_index = -1;
            std::map<std::string, core::Bar> last_bars;
            std::map<std::string, core::Bar> active_bars;
            double cash = 0.0;
            std::vector<Order> orders;
            std::vector<Trade> trades;
            std::size_t closed_count = 0;
            long long next_order_id = 1;
            long long next_trade_id = 1;
        };
        std::optional<Checkpoint> checkpoint_;

        // --- Private Helper Methods ---
        std::vector<Order>::iterator findOrderIt(long long order_id);
        std::vector<Trade>::iterator findTradeIt(long long trade_id);
        void removeOrder(long long order_id);

        Order makeContingentOrder(const Trade& trade, BracketLeg leg, double price);
        double adjustedPrice(double size, double price) const;

        void processBar();
        // Bracket pass. Returns true when the trade was closed.
        bool processBrackets(long long trade_id, const core::Bar& bar);
        void processPendingOrders(std::vector<long long>& reprocess_trade_ids);
        void recordEquity();

        long long openTrade(const Order& order, double price, long long size, std::size_t bar);
        void reduceTrade(long long trade_id, double price, long long size, std::size_t bar);
        void closeTradeFully(long long trade_id, double price, std::size_t bar);
        void finishClose(Trade closed, double price, std::size_t bar);
        void reject(const Order& order, const std::string& reason);
    };

} // namespace backtester
