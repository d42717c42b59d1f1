#include "backtest.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace backtester {

    namespace {
        // Marks the controller as inside step() for the lifetime of one bar
        class StepGuard {
        public:
            explicit StepGuard(bool& flag) : flag_(flag) { flag_ = true; }
            ~StepGuard() { flag_ = false; }
            StepGuard(const StepGuard&) = delete;
            StepGuard& operator=(const StepGuard&) = delete;
        private:
            bool& flag_;
        };
    }

    Backtest::Backtest(std::map<std::string, core::BarSeries> data, BacktestConfig config)
        : data_(std::move(data)), config_(std::move(config))
    {
        config_.validate();
        validateData();
        start();
    }

    void Backtest::validateData() {
        auto logger = core::logging::getLogger();
        if (data_.empty()) {
            throw core::DataValidationException("Backtest needs at least one instrument.");
        }

        for (auto& pair : data_) {
            const std::string& code = pair.first;
            core::BarSeries& series = pair.second;
            if (code.empty()) {
                throw core::DataValidationException("Instrument code must not be empty.");
            }
            if (series.empty()) {
                throw core::DataValidationException("No bars for " + code + ".");
            }
            for (const auto& bar : series) {
                if (!std::isfinite(bar.open) || !std::isfinite(bar.high) ||
                    !std::isfinite(bar.low) || !std::isfinite(bar.close)) {
                    throw core::DataValidationException("Missing or non-finite OHLC value for " + code + " at " +
                                                        core::utils::timestampToString(bar.timestamp));
                }
            }
            if (!std::is_sorted(series.begin(), series.end())) {
                logger->warn("Bars for {} are not in time order; sorting them.", code);
                std::stable_sort(series.begin(), series.end());
            }
            auto dup = std::adjacent_find(series.begin(), series.end(),
                                          [](const core::Bar& a, const core::Bar& b) { return a.timestamp == b.timestamp; });
            if (dup != series.end()) {
                throw core::DataValidationException("Duplicate timestamp for " + code + " at " +
                                                    core::utils::timestampToString(dup->timestamp));
            }
        }
    }

    // --- Lifecycle ---

    Backtest& Backtest::start() {
        if (in_step_) {
            throw core::BacktestException("start()/reset() called from inside the strategy callback.");
        }
        auto logger = core::logging::getLogger();

        // Time axis: sorted union of every instrument's timestamps
        std::vector<core::Timestamp> axis;
        for (const auto& pair : data_) {
            for (const auto& bar : pair.second) {
                axis.push_back(bar.timestamp);
            }
        }
        std::sort(axis.begin(), axis.end());
        axis.erase(std::unique(axis.begin(), axis.end()), axis.end());
        index_ = std::move(axis);

        row_of_.clear();
        for (const auto& pair : data_) {
            auto& rows = row_of_[pair.first];
            rows.reserve(pair.second.size());
            for (std::size_t i = 0; i < pair.second.size(); ++i) {
                rows.emplace(pair.second[i].timestamp.time_since_epoch().count(), i);
            }
        }
        visible_rows_.clear();

        broker_ = std::make_unique<Broker>(config_, index_.size());
        attachTradeCallbacks();
        results_.reset();
        last_error_.reset();
        step_index_ = 0;
        started_ = true;
        finished_ = index_.empty();

        logger->info("Backtest started: {} instrument(s), {} bars, {} to {}, cash {:.2f}",
                     data_.size(), index_.size(),
                     core::utils::timestampToString(index_.front()),
                     core::utils::timestampToString(index_.back()),
                     config_.cash);
        return *this;
    }

    Backtest& Backtest::reset() {
        return start();
    }

    StepResult Backtest::advance() {
        requireStarted("step");
        if (in_step_) {
            throw core::BacktestException("step()/goTo()/run() called from inside the strategy callback.");
        }
        if (finished_) {
            return StepResult{StepOutcome::Completed, std::nullopt};
        }
        if (step_index_ >= index_.size()) {
            finished_ = true;
            return StepResult{StepOutcome::Completed, std::nullopt};
        }

        StepGuard guard(in_step_);
        const core::Timestamp now = index_[step_index_];

        // Reveal this bar for every code that has one; others keep their window
        const std::map<std::string, std::size_t> visible_before = visible_rows_;
        std::map<std::string, core::Bar> bars_now;
        for (const auto& pair : data_) {
            const auto& rows = row_of_.at(pair.first);
            auto row = rows.find(now.time_since_epoch().count());
            if (row != rows.end()) {
                visible_rows_[pair.first] = row->second + 1;
                bars_now.emplace(pair.first, pair.second[row->second]);
            }
        }
        broker_->beginBar(step_index_, now, bars_now);

        if (strategy_) {
            try {
                strategy_(*this);
            } catch (...) {
                broker_->rollbackBar();
                visible_rows_ = visible_before;
                throw;
            }
        }

        // A failed bar leaves broker and visibility on the last completed bar
        try {
            broker_->next();
        } catch (const std::exception& e) {
            visible_rows_ = visible_before;
            finished_ = true;
            last_error_ = StepError{step_index_, now, e.what()};
            core::logging::getLogger()->error("Bar {} ({}) failed, run stopped: {}",
                                              step_index_, core::utils::timestampToString(now), e.what());
            return StepResult{StepOutcome::Failed, last_error_};
        }

        ++step_index_;
        if (step_index_ >= index_.size()) {
            finished_ = true;
            core::logging::getLogger()->info("Backtest reached the last bar after {} steps.", step_index_);
            return StepResult{StepOutcome::Completed, std::nullopt};
        }
        return StepResult{StepOutcome::Advanced, std::nullopt};
    }

    bool Backtest::step() {
        return advance().outcome == StepOutcome::Advanced;
    }

    Backtest& Backtest::goTo(std::size_t target_step, Strategy strategy) {
        requireStarted("goTo");
        if (in_step_) {
            throw core::BacktestException("step()/goTo()/run() called from inside the strategy callback.");
        }
        if (index_.empty()) {
            return *this;
        }
        target_step = std::max<std::size_t>(1, std::min(target_step, index_.size()));

        // The cursor only moves forward; going back replays from the start
        if (target_step < step_index_) {
            reset();
        }

        Strategy original = strategy_;
        if (strategy) {
            strategy_ = std::move(strategy);
        }
        try {
            while (step_index_ < target_step && !finished_) {
                advance();
            }
        } catch (...) {
            strategy_ = std::move(original);
            throw;
        }
        strategy_ = std::move(original);
        return *this;
    }

    const StatsReport& Backtest::run() {
        if (!started_) {
            start();
        }
        if (in_step_) {
            throw core::BacktestException("step()/goTo()/run() called from inside the strategy callback.");
        }
        while (!finished_) {
            advance();
        }
        return finalize();
    }

    const StatsReport& Backtest::finalize() {
        if (results_) {
            return *results_;
        }
        requireStarted("finalize");
        auto logger = core::logging::getLogger();

        if (config_.finalize_trades) {
            broker_->settleOpenTrades();
        } else if (!broker_->getTrades().empty()) {
            logger->warn("{} trade(s) still open at the end of the run and left out of the statistics. "
                         "Set finalize_trades to close them at the last price.",
                         broker_->getTrades().size());
        }

        // Only the stepped bars count; a run that never stepped reports its starting point
        std::size_t bars = std::max<std::size_t>(step_index_, 1);
        std::vector<core::Timestamp> index(index_.begin(), index_.begin() + static_cast<std::ptrdiff_t>(bars));
        const auto& history = broker_->getEquityHistory();
        std::vector<double> equity(history.begin(), history.begin() + static_cast<std::ptrdiff_t>(bars));

        // Back-fill gaps, then fall back to cash
        double next_valid = std::numeric_limits<double>::quiet_NaN();
        for (auto it = equity.rbegin(); it != equity.rend(); ++it) {
            if (std::isnan(*it)) {
                *it = next_valid;
            } else {
                next_valid = *it;
            }
        }
        for (auto& value : equity) {
            if (std::isnan(value)) {
                value = broker_->getCash();
            }
        }

        results_ = std::make_unique<StatsReport>(computeStats(broker_->getClosedTrades(), equity, index));
        logger->info("Backtest finalized: {} closed trade(s), final equity {:.2f}, return {:.2f}%",
                     results_->num_trades, results_->equity_final, results_->return_pct);
        return *results_;
    }

    Backtest& Backtest::setStrategy(Strategy strategy) {
        strategy_ = std::move(strategy);
        return *this;
    }

    void Backtest::addTradeCallback(TradeCallback callback) {
        trade_callbacks_.push_back(std::move(callback));
    }

    void Backtest::setCash(double cash) {
        if (!std::isfinite(cash) || cash <= 0.0) {
            throw core::ConfigException("Starting cash must be > 0, got " + std::to_string(cash));
        }
        config_.cash = cash;
    }

    void Backtest::attachTradeCallbacks() {
        broker_->setTradeEventHandler([this](const std::string& event, const Trade& trade) {
            for (const auto& callback : trade_callbacks_) {
                callback(event, trade);
            }
        });
    }

    // --- Trading ---

    Order Backtest::buy(const OrderRequest& request) {
        return submit(request, 1.0);
    }

    Order Backtest::sell(const OrderRequest& request) {
        return submit(request, -1.0);
    }

    Order Backtest::buy(const std::string& code, double size) {
        OrderRequest request;
        request.code = code;
        request.size = size;
        return submit(request, 1.0);
    }

    Order Backtest::sell(const std::string& code, double size) {
        OrderRequest request;
        request.code = code;
        request.size = size;
        return submit(request, -1.0);
    }

    Order Backtest::submit(const OrderRequest& request, double sign) {
        requireStarted("buy/sell");
        std::string code = resolveCode(request.code);
        if (!std::isfinite(request.size) || request.size <= 0.0) {
            throw core::InvalidOrderException("Order size must be positive (sell() sets the direction), got " +
                                              std::to_string(request.size));
        }
        return broker_->newOrder(code, sign * request.size, request.limit, request.stop,
                                 request.sl, request.tp, request.tag);
    }

    std::string Backtest::resolveCode(const std::optional<std::string>& code) const {
        if (code) {
            if (!data_.count(*code)) {
                throw core::InvalidOrderException("Unknown instrument code: " + *code);
            }
            return *code;
        }
        if (data_.size() == 1) {
            return data_.begin()->first;
        }
        throw core::InvalidOrderException("A code is required when more than one instrument is loaded.");
    }

    void Backtest::requireStarted(const char* operation) const {
        if (!started_ || !broker_) {
            throw core::BacktestException(std::string(operation) + " requires a started backtest; call start() first.");
        }
    }

    // --- Introspection ---

    std::map<std::string, core::SeriesView> Backtest::getData() const {
        std::map<std::string, core::SeriesView> views;
        for (const auto& pair : data_) {
            if (visible_rows_.empty()) {
                views.emplace(pair.first, core::SeriesView(pair.second, pair.second.size()));
                continue;
            }
            auto visible = visible_rows_.find(pair.first);
            if (visible != visible_rows_.end()) {
                views.emplace(pair.first, core::SeriesView(pair.second, visible->second));
            }
        }
        return views;
    }

    std::vector<std::string> Backtest::getCodes() const {
        std::vector<std::string> codes;
        for (const auto& pair : data_) {
            codes.push_back(pair.first);
        }
        return codes;
    }

    Position Backtest::getPosition() const {
        return Position(broker_.get(), std::nullopt);
    }

    Position Backtest::getPosition(const std::string& code) const {
        return Position(broker_.get(), code);
    }

    long long Backtest::getPositionOf(const std::string& code) const {
        return broker_ ? broker_->getPositionSize(code) : 0;
    }

    double Backtest::getEquity() const {
        return broker_ ? broker_->getEquity() : config_.cash;
    }

    double Backtest::getCash() const {
        return broker_ ? broker_->getCash() : config_.cash;
    }

    std::vector<Trade> Backtest::getTrades() const {
        return broker_ ? broker_->getTrades() : std::vector<Trade>{};
    }

    std::vector<ClosedTrade> Backtest::getClosedTrades() const {
        return broker_ ? broker_->getClosedTrades() : std::vector<ClosedTrade>{};
    }

    std::vector<Order> Backtest::getOrders() const {
        return broker_ ? broker_->getOrders() : std::vector<Order>{};
    }

    std::optional<core::Timestamp> Backtest::getCurrentTime() const {
        if (step_index_ == 0 || index_.empty()) {
            return std::nullopt;
        }
        return index_[step_index_ - 1];
    }

    double Backtest::getProgress() const {
        if (index_.empty()) {
            return 0.0;
        }
        return static_cast<double>(step_index_) / static_cast<double>(index_.size());
    }

    nlohmann::json Backtest::getStateSnapshot() const {
        nlohmann::json positions = nlohmann::json::object();
        for (const auto& trade : getTrades()) {
            long long held = positions.contains(trade.code) ? positions[trade.code].get<long long>() : 0;
            positions[trade.code] = held + trade.size;
        }

        auto current = getCurrentTime();
        return {
            {"current_time", current ? core::utils::timestampToString(*current) : std::string("-")},
            {"progress", getProgress()},
            {"equity", getEquity()},
            {"cash", getCash()},
            {"position", getPosition().size()},
            {"positions", positions},
            {"closed_trades", getClosedTrades().size()},
            {"step_index", step_index_},
            {"total_steps", index_.size()},
            {"is_finished", finished_}
        };
    }

} // namespace backtester
