#include "broker.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <string>
#include <utility>

namespace backtester {

    namespace {
        const double kNaN = std::numeric_limits<double>::quiet_NaN();

        void requireFinite(double value, const char* what, long long order_or_trade_id) {
            if (!std::isfinite(value)) {
                throw core::BacktestException(std::string("Non-finite ") + what + " for #" +
                                              std::to_string(order_or_trade_id));
            }
        }
    }

    void BrokerConfig::validate() const {
        if (!std::isfinite(cash) || cash <= 0.0) {
            throw core::ConfigException("Starting cash must be > 0, got " + std::to_string(cash));
        }
        if (!(margin > 0.0 && margin <= 1.0)) {
            throw core::ConfigException("Margin must be in (0, 1], got " + std::to_string(margin));
        }
        if (!(spread >= 0.0 && spread < 0.1)) {
            throw core::ConfigException("Spread must be in [0, 0.1), got " + std::to_string(spread));
        }
        commission.validate();
    }

    Broker::Broker(const BrokerConfig& config, std::size_t total_bars)
        : config_(config), cash_(config.cash), equity_(total_bars, kNaN), bar_times_(total_bars)
    {
        config_.validate();
        core::logging::getLogger()->debug("Broker created: cash {:.2f}, margin {}, spread {}, {} bars",
                                          cash_, config_.margin, config_.spread, total_bars);
    }

    // --- Order entry ---

    Order Broker::newOrder(const std::string& code,
                           double size,
                           std::optional<double> limit,
                           std::optional<double> stop,
                           std::optional<double> sl,
                           std::optional<double> tp,
                           std::optional<std::string> tag)
    {
        if (code.empty()) {
            throw core::InvalidOrderException("Order needs an instrument code.");
        }
        if (!std::isfinite(size) || size == 0.0) {
            throw core::InvalidOrderException("Order size must be a non-zero finite number, got " + std::to_string(size));
        }
        if (std::abs(size) >= 1.0 && std::round(size) != size) {
            throw core::InvalidOrderException("Order size must be a fraction in (0, 1) or a whole number of units, got " +
                                              std::to_string(size));
        }
        auto checkPrice = [](const std::optional<double>& price, const char* name) {
            if (price && !(std::isfinite(*price) && *price > 0.0)) {
                throw core::InvalidOrderException(std::string("Order ") + name + " price must be positive, got " +
                                                  std::to_string(*price));
            }
        };
        checkPrice(limit, "limit");
        checkPrice(stop, "stop");
        checkPrice(sl, "sl");
        checkPrice(tp, "tp");

        Order order;
        order.id = next_order_id_++;
        order.code = code;
        order.size = size;
        order.limit = limit;
        order.stop = stop;
        order.sl = sl;
        order.tp = tp;
        order.tag = std::move(tag);
        order.submitted_bar = bar_index_;
        auto last = last_bars_.find(code);
        if (last != last_bars_.end()) {
            order.submitted_close = last->second.close;
        }
        order.broker = this;

        if (config_.exclusive_orders) {
            // One active position per code: drop its pending orders and close its trades first
            orders_.erase(std::remove_if(orders_.begin(), orders_.end(),
                                         [&code](const Order& o) { return !o.isContingent() && o.code == code; }),
                          orders_.end());
            std::vector<long long> trade_ids;
            for (const auto& trade : trades_) {
                if (trade.code == code) {
                    trade_ids.push_back(trade.id);
                }
            }
            for (long long trade_id : trade_ids) {
                closeTrade(trade_id, 1.0);
            }
        }

        orders_.push_back(order);
        core::logging::getLogger()->debug("Order #{} queued: {} {} (limit {}, stop {}, sl {}, tp {})",
                                          order.id, order.code, order.size,
                                          limit.value_or(kNaN), stop.value_or(kNaN),
                                          sl.value_or(kNaN), tp.value_or(kNaN));
        return order;
    }

    bool Broker::cancelOrder(long long order_id) {
        auto it = findOrderIt(order_id);
        if (it == orders_.end()) {
            return false;
        }
        if (const auto* contingent = std::get_if<ContingentOf>(&it->kind)) {
            auto trade = findTradeIt(contingent->trade_id);
            if (trade != trades_.end()) {
                if (contingent->leg == BracketLeg::StopLoss) {
                    trade->sl.reset();
                    trade->sl_order_id.reset();
                } else {
                    trade->tp.reset();
                    trade->tp_order_id.reset();
                }
            }
        }
        orders_.erase(it);
        core::logging::getLogger()->debug("Order #{} cancelled.", order_id);
        return true;
    }

    void Broker::closeTrade(long long trade_id, double portion) {
        if (!(portion > 0.0 && portion <= 1.0)) {
            throw core::PreconditionException("Close portion must be in (0, 1], got " + std::to_string(portion));
        }
        auto it = findTradeIt(trade_id);
        if (it == trades_.end()) {
            core::logging::getLogger()->debug("Close requested for trade #{} which is no longer open.", trade_id);
            return;
        }

        double units = std::max(1.0, std::round(static_cast<double>(std::llabs(it->size)) * portion));

        Order order;
        order.id = next_order_id_++;
        order.code = it->code;
        order.size = std::copysign(units, static_cast<double>(-it->size));
        order.tag = it->tag;
        order.intent = ReducesTrade{trade_id};
        order.submitted_bar = bar_index_;
        order.submitted_close = getLastPrice(it->code);
        order.broker = this;

        // Closing orders go ahead of everything else queued
        orders_.insert(orders_.begin(), order);
    }

    void Broker::closePosition(const std::optional<std::string>& code, double portion) {
        std::vector<long long> trade_ids;
        for (const auto& trade : trades_) {
            if (!code || trade.code == *code) {
                trade_ids.push_back(trade.id);
            }
        }
        for (long long trade_id : trade_ids) {
            closeTrade(trade_id, portion);
        }
    }

    // --- Bar processing ---

    void Broker::beginBar(std::size_t bar_index, core::Timestamp time, const std::map<std::string, core::Bar>& bars) {
        if (bar_index >= equity_.size()) {
            throw core::BacktestException("Bar index " + std::to_string(bar_index) + " beyond the " +
                                          std::to_string(equity_.size()) + " bars this broker was sized for");
        }
        // The ledger only grows during a bar, so its length is enough to undo it
        checkpoint_ = Checkpoint{bar_index_, last_bars_, active_bars_, cash_, orders_, trades_,
                                 closed_trades_.size(), next_order_id_, next_trade_id_};

        bar_index_ = static_cast<long long>(bar_index);
        bar_times_[bar_index] = time;
        active_bars_ = bars;
        for (const auto& entry : bars) {
            last_bars_[entry.first] = entry.second;
        }
    }

    void Broker::next() {
        if (bar_index_ < 0) {
            throw core::BacktestException("Broker::next() called before the first bar was set.");
        }
        try {
            processBar();
        } catch (...) {
            rollbackBar();
            throw;
        }
        checkpoint_.reset();
    }

    void Broker::rollbackBar() {
        if (!checkpoint_) {
            return;
        }
        Checkpoint& saved = *checkpoint_;
        if (bar_index_ >= 0) {
            equity_[static_cast<std::size_t>(bar_index_)] = kNaN;
        }
        core::logging::getLogger()->debug("Rolling back bar {} to bar {}.", bar_index_, saved.bar_index);
        bar_index_ = saved.bar_index;
        last_bars_ = std::move(saved.last_bars);
        active_bars_ = std::move(saved.active_bars);
        cash_ = saved.cash;
        orders_ = std::move(saved.orders);
        trades_ = std::move(saved.trades);
        closed_trades_.resize(saved.closed_count);
        next_order_id_ = saved.next_order_id;
        next_trade_id_ = saved.next_trade_id;
        checkpoint_.reset();
    }

    void Broker::processBar() {
        auto logger = core::logging::getLogger();
        logger->trace("Broker processing bar {} ({}), {} pending orders, {} open trades",
                      bar_index_, core::utils::timestampToString(bar_times_[bar_index_]),
                      orders_.size(), trades_.size());

        // 1. Brackets of trades carried over from earlier bars
        std::vector<long long> carried;
        for (const auto& trade : trades_) {
            if (static_cast<long long>(trade.entry_bar) < bar_index_ && active_bars_.count(trade.code)) {
                carried.push_back(trade.id);
            }
        }
        for (long long trade_id : carried) {
            const Trade* trade = findTrade(trade_id);
            if (trade) {
                processBrackets(trade_id, active_bars_.at(trade->code));
            }
        }

        // 2. Pending plain orders
        std::vector<long long> reprocess;
        processPendingOrders(reprocess);

        // 3. Brackets of trades just opened at this bar's open
        for (long long trade_id : reprocess) {
            const Trade* trade = findTrade(trade_id);
            if (trade) {
                processBrackets(trade_id, active_bars_.at(trade->code));
            }
        }

        // 4. Mark to market
        recordEquity();
    }

    bool Broker::processBrackets(long long trade_id, const core::Bar& bar) {
        auto it = findTradeIt(trade_id);
        if (it == trades_.end()) {
            return false;
        }
        const Trade& trade = *it;

        // Stop-loss is checked first: when both levels sit inside the bar the
        // worse outcome for the holder is assumed.
        std::optional<double> fill;
        const char* leg = nullptr;
        if (trade.sl) {
            bool hit = trade.isLong() ? bar.low <= *trade.sl : bar.high >= *trade.sl;
            if (hit) {
                fill = trade.isLong() ? std::min(bar.open, *trade.sl) : std::max(bar.open, *trade.sl);
                leg = "SL";
            }
        }
        if (!fill && trade.tp) {
            bool hit = trade.isLong() ? bar.high >= *trade.tp : bar.low <= *trade.tp;
            if (hit) {
                fill = trade.isLong() ? std::max(bar.open, *trade.tp) : std::min(bar.open, *trade.tp);
                leg = "TP";
            }
        }
        if (!fill) {
            return false;
        }

        core::logging::getLogger()->debug("{} hit for trade #{} ({}) at {:.4f}", leg, trade.id, trade.code, *fill);
        closeTradeFully(trade_id, *fill, static_cast<std::size_t>(bar_index_));
        return true;
    }

    void Broker::processPendingOrders(std::vector<long long>& reprocess_trade_ids) {
        auto logger = core::logging::getLogger();
        const std::size_t bar = static_cast<std::size_t>(bar_index_);

        std::vector<long long> order_ids;
        for (const auto& order : orders_) {
            if (!order.isContingent()) {
                order_ids.push_back(order.id);
            }
        }

        for (long long order_id : order_ids) {
            auto it = findOrderIt(order_id);
            if (it == orders_.end()) {
                continue; // Removed by an earlier fill this bar
            }
            // With trade_on_close a market order fills on the step it was placed,
            // at the code's last close, even when the code has no bar on this step
            bool fills_on_submit_close = config_.trade_on_close && it->isMarket() &&
                                         it->submitted_bar == bar_index_ && std::isfinite(it->submitted_close);
            auto active = active_bars_.find(it->code);
            if (active == active_bars_.end() && !fills_on_submit_close) {
                continue; // No bar for this code on this step
            }
            if (it->submitted_bar >= bar_index_ && !fills_on_submit_close) {
                continue; // Placed during this bar; matched from the next one
            }
            const core::Bar& b = active != active_bars_.end() ? active->second : last_bars_.at(it->code);

            // A triggered stop turns into a market or limit order
            std::optional<double> stop_price = it->stop;
            if (stop_price) {
                bool stop_hit = it->isLong() ? b.high >= *stop_price : b.low <= *stop_price;
                if (!stop_hit) {
                    continue;
                }
                it->stop.reset();
            }

            Order order = *it;
            double price = 0.0;
            if (order.limit) {
                bool limit_hit = order.isLong() ? b.low <= *order.limit : b.high >= *order.limit;
                // Limit on the far side of the stop: assume it traded before the stop armed
                bool limit_before_stop = limit_hit && stop_price &&
                    (order.isLong() ? *order.limit < *stop_price : *order.limit > *stop_price);
                if (!limit_hit || limit_before_stop) {
                    continue;
                }
                price = order.isLong() ? std::min(stop_price.value_or(b.open), *order.limit)
                                       : std::max(stop_price.value_or(b.open), *order.limit);
            } else {
                price = b.open;
                if (stop_price) {
                    price = order.isLong() ? std::max(price, *stop_price) : std::min(price, *stop_price);
                }
            }

            bool market_fill = !order.limit && !stop_price;
            bool close_fill = market_fill && fills_on_submit_close;
            if (close_fill) {
                price = order.submitted_close;
            }
            requireFinite(price, "fill price for order", order.id);

            // Reducing orders shrink exactly one trade
            if (const auto* reduce = std::get_if<ReducesTrade>(&order.intent)) {
                removeOrder(order.id);
                auto trade = findTradeIt(reduce->trade_id);
                if (trade != trades_.end()) {
                    double units = std::min(static_cast<double>(std::llabs(trade->size)), std::abs(order.size));
                    long long size = static_cast<long long>(std::copysign(units, order.size));
                    reduceTrade(reduce->trade_id, price, size, bar);
                }
                continue;
            }

            double adjusted = adjustedPrice(order.size, price);
            double commission = config_.commission(order.size, price);
            requireFinite(commission, "commission for order", order.id);
            double adjusted_plus_commission = adjusted + commission / std::abs(order.size);

            // Fractional sizes become whole units of the available buying power
            double size = order.size;
            if (std::abs(size) < 1.0) {
                double units = std::floor(getMarginAvailable() * getLeverage() * std::abs(size) / adjusted_plus_commission);
                if (!(units >= 1.0)) {
                    logger->warn("Order #{} for {} cancelled: {:.2f}% of available liquidity does not buy a single unit at {:.4f}",
                                 order.id, order.code, std::abs(order.size) * 100.0, adjusted_plus_commission);
                    removeOrder(order.id);
                    continue;
                }
                size = std::copysign(units, size);
            }
            long long need = static_cast<long long>(size);

            // Net against opposite trades of the same code, oldest first.
            // Those close at the unadjusted price; spread was paid on their entry.
            std::vector<long long> opposite;
            for (const auto& trade : trades_) {
                if (trade.code == order.code && trade.isLong() != order.isLong()) {
                    opposite.push_back(trade.id);
                }
            }
            for (long long trade_id : opposite) {
                auto trade = findTradeIt(trade_id);
                if (trade == trades_.end()) {
                    continue;
                }
                if (std::llabs(need) >= std::llabs(trade->size)) {
                    need += trade->size;
                    closeTradeFully(trade_id, price, bar);
                } else {
                    reduceTrade(trade_id, price, need, bar);
                    need = 0;
                }
                if (need == 0) {
                    break;
                }
            }

            if (static_cast<double>(std::llabs(need)) * adjusted_plus_commission > getMarginAvailable() * getLeverage()) {
                removeOrder(order.id);
                reject(order, "insufficient margin");
                continue;
            }

            removeOrder(order.id);
            if (need != 0) {
                long long trade_id = openTrade(order, adjusted, need, bar);
                if ((order.sl || order.tp) && market_fill && !close_fill) {
                    reprocess_trade_ids.push_back(trade_id);
                }
            }
        }
    }

    void Broker::recordEquity() {
        equity_[static_cast<std::size_t>(bar_index_)] = getEquity();
    }

    // --- Fills ---

    long long Broker::openTrade(const Order& order, double price, long long size, std::size_t bar) {
        double commission = config_.commission(static_cast<double>(size), price);
        requireFinite(commission, "commission for order", order.id);

        Trade trade;
        trade.id = next_trade_id_++;
        trade.code = order.code;
        trade.size = size;
        trade.entry_price = price;
        trade.entry_time = bar_times_[bar];
        trade.entry_bar = bar;
        trade.tag = order.tag;
        trade.commissions = commission;
        trade.broker = this;

        cash_ -= static_cast<double>(size) * price + commission;
        trades_.push_back(trade);

        // SL ends up ahead of TP in the queue
        if (order.tp) {
            Order tp_order = makeContingentOrder(trade, BracketLeg::TakeProfit, *order.tp);
            trades_.back().tp = order.tp;
            trades_.back().tp_order_id = tp_order.id;
            orders_.insert(orders_.begin(), tp_order);
        }
        if (order.sl) {
            Order sl_order = makeContingentOrder(trade, BracketLeg::StopLoss, *order.sl);
            trades_.back().sl = order.sl;
            trades_.back().sl_order_id = sl_order.id;
            orders_.insert(orders_.begin(), sl_order);
        }

        core::logging::getLogger()->debug("Opened trade #{}: {} {} @ {:.4f} (commission {:.4f}, cash {:.2f})",
                                          trade.id, trade.code, size, price, commission, cash_);

        if (trade_event_handler_) {
            Trade snapshot = trades_.back();
            trade_event_handler_(size > 0 ? "BUY" : "SELL", snapshot);
        }
        return trade.id;
    }

    void Broker::reduceTrade(long long trade_id, double price, long long size, std::size_t bar) {
        auto it = findTradeIt(trade_id);
        if (it == trades_.end()) {
            return;
        }
        long long size_left = it->size + size;
        if (size_left == 0) {
            closeTradeFully(trade_id, price, bar);
            return;
        }

        // Keep the remainder open and close a slice carrying its share of entry commission
        long long old_size = it->size;
        Trade slice = *it;
        slice.size = -size;
        slice.commissions = it->commissions * static_cast<double>(std::llabs(size)) / static_cast<double>(std::llabs(old_size));
        slice.sl_order_id.reset();
        slice.tp_order_id.reset();

        it->size = size_left;
        it->commissions -= slice.commissions;
        for (const auto& contingent_id : {it->sl_order_id, it->tp_order_id}) {
            if (contingent_id) {
                auto order = findOrderIt(*contingent_id);
                if (order != orders_.end()) {
                    order->size = static_cast<double>(-size_left);
                }
            }
        }

        finishClose(std::move(slice), price, bar);
    }

    void Broker::closeTradeFully(long long trade_id, double price, std::size_t bar) {
        auto it = findTradeIt(trade_id);
        if (it == trades_.end()) {
            return;
        }
        Trade closed = *it;
        trades_.erase(it);
        if (closed.sl_order_id) {
            removeOrder(*closed.sl_order_id);
        }
        if (closed.tp_order_id) {
            removeOrder(*closed.tp_order_id);
        }
        finishClose(std::move(closed), price, bar);
    }

    void Broker::finishClose(Trade closed, double price, std::size_t bar) {
        double commission = config_.commission(static_cast<double>(-closed.size), price);
        requireFinite(commission, "commission for trade", closed.id);

        cash_ += static_cast<double>(closed.size) * price - commission;
        closed.commissions += commission;
        closed.exit_price = price;
        closed.exit_bar = bar;
        closed.exit_time = bar_times_[bar];
        closed.sl_order_id.reset();
        closed.tp_order_id.reset();

        core::logging::getLogger()->debug("Closed trade #{}: {} {} @ {:.4f} -> {:.4f}, PnL {:.2f}, cash {:.2f}",
                                          closed.id, closed.code, closed.size, closed.entry_price, price,
                                          closed.pl(), cash_);
        closed_trades_.push_back(std::move(closed));
    }

    void Broker::settleOpenTrades() {
        if (bar_index_ < 0) {
            return;
        }
        const std::size_t bar = static_cast<std::size_t>(bar_index_);

        std::vector<long long> trade_ids;
        for (auto it = trades_.rbegin(); it != trades_.rend(); ++it) {
            trade_ids.push_back(it->id);
        }
        for (long long trade_id : trade_ids) {
            const Trade* trade = findTrade(trade_id);
            if (trade) {
                double price = getLastPrice(trade->code);
                requireFinite(price, "settlement price for trade", trade_id);
                closeTradeFully(trade_id, price, bar);
            }
        }

        // Close orders for trades that no longer exist
        orders_.erase(std::remove_if(orders_.begin(), orders_.end(),
                                     [](const Order& o) { return o.isReducing(); }),
                      orders_.end());

        if (!trade_ids.empty()) {
            core::logging::getLogger()->info("Settled {} open trade(s) at the last close.", trade_ids.size());
        }
        recordEquity();
    }

    void Broker::reject(const Order& order, const std::string& reason) {
        core::logging::getLogger()->debug("Order #{} for {} ({}) not filled: {}", order.id, order.code, order.size, reason);
        if (rejection_handler_) {
            rejection_handler_(order, reason);
        }
    }

    // --- Getters ---

    double Broker::getEquity() const {
        double equity = cash_;
        for (const auto& trade : trades_) {
            equity += static_cast<double>(trade.size) * getLastPrice(trade.code);
        }
        return equity;
    }

    double Broker::getMarginAvailable() const {
        double margin_used = 0.0;
        for (const auto& trade : trades_) {
            margin_used += static_cast<double>(std::llabs(trade.size)) * getLastPrice(trade.code) * config_.margin;
        }
        return std::max(0.0, getEquity() - margin_used);
    }

    double Broker::getLastPrice(const std::string& code) const {
        auto it = last_bars_.find(code);
        return it != last_bars_.end() ? it->second.close : kNaN;
    }

    long long Broker::getPositionSize(const std::optional<std::string>& code) const {
        long long total = 0;
        for (const auto& trade : trades_) {
            if (!code || trade.code == *code) {
                total += trade.size;
            }
        }
        return total;
    }

    std::optional<core::Timestamp> Broker::getCurrentTime() const {
        if (bar_index_ < 0) {
            return std::nullopt;
        }
        return bar_times_[static_cast<std::size_t>(bar_index_)];
    }

    const Order* Broker::findOrder(long long order_id) const {
        auto it = std::find_if(orders_.begin(), orders_.end(), [order_id](const Order& o) { return o.id == order_id; });
        return it != orders_.end() ? &*it : nullptr;
    }

    const Trade* Broker::findTrade(long long trade_id) const {
        auto it = std::find_if(trades_.begin(), trades_.end(), [trade_id](const Trade& t) { return t.id == trade_id; });
        return it != trades_.end() ? &*it : nullptr;
    }

    // --- Private helpers ---

    std::vector<Order>::iterator Broker::findOrderIt(long long order_id) {
        return std::find_if(orders_.begin(), orders_.end(), [order_id](const Order& o) { return o.id == order_id; });
    }

    std::vector<Trade>::iterator Broker::findTradeIt(long long trade_id) {
        return std::find_if(trades_.begin(), trades_.end(), [trade_id](const Trade& t) { return t.id == trade_id; });
    }

    void Broker::removeOrder(long long order_id) {
        auto it = findOrderIt(order_id);
        if (it != orders_.end()) {
            orders_.erase(it);
        }
    }

    Order Broker::makeContingentOrder(const Trade& trade, BracketLeg leg, double price) {
        Order order;
        order.id = next_order_id_++;
        order.code = trade.code;
        order.size = static_cast<double>(-trade.size);
        if (leg == BracketLeg::StopLoss) {
            order.stop = price;
        } else {
            order.limit = price;
        }
        order.tag = trade.tag;
        order.kind = ContingentOf{trade.id, leg};
        order.intent = ReducesTrade{trade.id};
        order.submitted_bar = bar_index_;
        order.broker = this;
        return order;
    }

    double Broker::adjustedPrice(double size, double price) const {
        return price * (1.0 + std::copysign(config_.spread, size));
    }

} // namespace backtester
