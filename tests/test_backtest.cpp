#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/sinks/ringbuffer_sink.h>

#include "backtest.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "test_helpers.hpp"

using backtester::Backtest;
using backtester::BacktestConfig;
using backcast_test::flatSeries;
using backcast_test::seriesFromPrices;
using backcast_test::waveSeries;

namespace {

    using Universe = std::map<std::string, core::BarSeries>;

    BacktestConfig configWithCash(double cash) {
        BacktestConfig config;
        config.cash = cash;
        return config;
    }

    // Buys 10 units on the first bar, sells them on bar `sell_step`
    Backtest::Strategy roundTrip(std::size_t sell_step) {
        return [sell_step](Backtest& bt) {
            if (bt.getStepIndex() == 0) {
                bt.buy("AAA", 10);
            } else if (bt.getStepIndex() == sell_step) {
                bt.sell("AAA", 10);
            }
        };
    }

    // Long on a rising close, flat on a falling one
    void followTrend(Backtest& bt) {
        for (const auto& entry : bt.getData()) {
            const core::SeriesView& bars = entry.second;
            if (bars.size() < 2) {
                continue;
            }
            bool rising = bars[bars.size() - 1].close > bars[bars.size() - 2].close;
            long long held = bt.getPositionOf(entry.first);
            if (rising && held == 0) {
                backtester::OrderRequest request;
                request.code = entry.first;
                request.size = 0.3;
                request.sl = bars.back().close * 0.9;
                bt.buy(request);
            } else if (!rising && held > 0) {
                bt.getPosition(entry.first).close();
            }
        }
    }

    // Captures warnings written through the shared logger
    class WarningCapture {
    public:
        WarningCapture() : sink_(std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(64)) {
            sink_->set_level(spdlog::level::warn);
            core::logging::getLogger()->sinks().push_back(sink_);
        }
        ~WarningCapture() {
            auto& sinks = core::logging::getLogger()->sinks();
            sinks.erase(std::remove(sinks.begin(), sinks.end(), sink_), sinks.end());
        }
        bool contains(const std::string& text) const {
            for (const auto& line : sink_->last_formatted()) {
                if (line.find(text) != std::string::npos) {
                    return true;
                }
            }
            return false;
        }
    private:
        std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> sink_;
    };

}  // namespace

TEST(BacktestTest, BuyFillsOnNextBar) {
    Backtest bt(Universe{{"AAA", flatSeries(10, 100.0)}}, configWithCash(10000.0));
    bt.setStrategy([](Backtest& b) {
        if (b.getStepIndex() == 0) {
            b.buy("AAA", 10);
        }
    });

    EXPECT_TRUE(bt.step());
    EXPECT_EQ(bt.getPositionOf("AAA"), 0);
    EXPECT_TRUE(bt.step());
    EXPECT_DOUBLE_EQ(bt.getCash(), 9000.0);
    EXPECT_EQ(bt.getPositionOf("AAA"), 10);
    EXPECT_EQ(bt.getPosition().size(), 10);
}

TEST(BacktestTest, RelativeCommissionIsDeductedOnFill) {
    BacktestConfig config = configWithCash(10000.0);
    config.commission = backtester::CommissionModel(0.01);
    Backtest bt(Universe{{"AAA", flatSeries(10, 100.0)}}, config);
    bt.setStrategy([](Backtest& b) {
        if (b.getStepIndex() == 0) {
            b.buy("AAA", 10);
        }
    });

    bt.goTo(2);
    EXPECT_DOUBLE_EQ(bt.getCash(), 8990.0);
}

TEST(BacktestTest, RoundTripRealisesProfit) {
    Backtest bt(Universe{{"AAA", seriesFromPrices({100, 100, 100, 110, 110, 110})}}, configWithCash(10000.0));
    bt.setStrategy(roundTrip(2));
    bt.goTo(4);

    ASSERT_EQ(bt.getClosedTrades().size(), 1u);
    EXPECT_TRUE(bt.getTrades().empty());
    const auto& trade = bt.getClosedTrades().front();
    EXPECT_DOUBLE_EQ(trade.pl(), 100.0);
    EXPECT_EQ(trade.size, 10);
    EXPECT_EQ(bt.getPositionOf("AAA"), 0);
    EXPECT_DOUBLE_EQ(bt.getCash(), 10100.0);
}

TEST(BacktestTest, TradeClosedByPortionOneLeavesNoPosition) {
    Backtest bt(Universe{{"AAA", flatSeries(6, 100.0)}}, configWithCash(10000.0));
    bt.setStrategy([](Backtest& b) {
        if (b.getStepIndex() == 0) {
            b.buy("AAA", 7);
        } else if (b.getStepIndex() == 2) {
            ASSERT_EQ(b.getTrades().size(), 1u);
            b.getTrades().front().close(1.0);
        }
    });
    bt.goTo(4);

    EXPECT_EQ(bt.getPositionOf("AAA"), 0);
    EXPECT_TRUE(bt.getTrades().empty());
    ASSERT_EQ(bt.getClosedTrades().size(), 1u);
    EXPECT_EQ(bt.getClosedTrades().front().size, 7);
    EXPECT_EQ(bt.getClosedTrades().front().exit_bar, std::optional<std::size_t>(3));
}

TEST(BacktestTest, OpenTradesAreLeftOutOfStatsUnlessFinalized) {
    WarningCapture warnings;
    Backtest bt(Universe{{"AAA", seriesFromPrices({100, 100, 105, 110})}}, configWithCash(10000.0));
    bt.setStrategy([](Backtest& b) {
        if (b.getStepIndex() == 0) {
            b.buy("AAA", 10);
        }
    });

    const auto& stats = bt.run();
    EXPECT_TRUE(bt.isFinished());
    EXPECT_EQ(stats.num_trades, 0u);
    EXPECT_EQ(bt.getTrades().size(), 1u);
    EXPECT_TRUE(std::isnan(stats.win_rate_pct));
    EXPECT_DOUBLE_EQ(stats.equity_final, 10000.0 - 1000.0 + 1100.0);
    EXPECT_TRUE(warnings.contains("still open"));
}

TEST(BacktestTest, FinalizeTradesClosesAtLastClose) {
    BacktestConfig config = configWithCash(10000.0);
    config.finalize_trades = true;
    Backtest bt(Universe{{"AAA", seriesFromPrices({100, 100, 105, 110})}}, config);
    bt.setStrategy([](Backtest& b) {
        if (b.getStepIndex() == 0) {
            b.buy("AAA", 10);
        }
    });

    const auto& stats = bt.run();
    EXPECT_EQ(stats.num_trades, 1u);
    EXPECT_TRUE(bt.getTrades().empty());
    ASSERT_EQ(stats.trades.size(), 1u);
    EXPECT_DOUBLE_EQ(*stats.trades.front().exit_price, 110.0);
    EXPECT_DOUBLE_EQ(stats.equity_final, 10100.0);
}

TEST(BacktestTest, GoToBackwardsReplaysFromStart) {
    Backtest bt(Universe{{"AAA", waveSeries(30)}}, configWithCash(10000.0));
    bt.setStrategy(followTrend);
    bt.goTo(5);
    EXPECT_EQ(bt.getStepIndex(), 5u);
    bt.goTo(2);
    EXPECT_EQ(bt.getStepIndex(), 2u);

    Backtest fresh(Universe{{"AAA", waveSeries(30)}}, configWithCash(10000.0));
    fresh.setStrategy(followTrend);
    fresh.goTo(2);

    EXPECT_EQ(bt.getCash(), fresh.getCash());
    EXPECT_EQ(bt.getEquity(), fresh.getEquity());
    EXPECT_EQ(bt.getTrades().size(), fresh.getTrades().size());
    EXPECT_EQ(bt.getClosedTrades().size(), fresh.getClosedTrades().size());
    EXPECT_EQ(bt.getOrders().size(), fresh.getOrders().size());
    EXPECT_EQ(bt.getStateSnapshot(), fresh.getStateSnapshot());
}

TEST(BacktestTest, GoToClampsTargetAndRestoresStrategy) {
    Backtest bt(Universe{{"AAA", flatSeries(5, 100.0)}}, configWithCash(10000.0));
    int default_calls = 0;
    int override_calls = 0;
    bt.setStrategy([&default_calls](Backtest&) { ++default_calls; });

    bt.goTo(0, [&override_calls](Backtest&) { ++override_calls; });
    EXPECT_EQ(bt.getStepIndex(), 1u);
    EXPECT_EQ(override_calls, 1);

    bt.goTo(100);
    EXPECT_EQ(bt.getStepIndex(), 5u);
    EXPECT_TRUE(bt.isFinished());
    EXPECT_EQ(default_calls, 4);
}

TEST(BacktestTest, RunsAreDeterministic) {
    auto runOnce = []() {
        BacktestConfig config = configWithCash(10000.0);
        config.commission = backtester::CommissionModel(1.0, 0.002);
        config.finalize_trades = true;
        auto bt = std::make_unique<Backtest>(Universe{{"AAA", waveSeries(120)}, {"BBB", waveSeries(90, 50.0, 4.0)}},
                                             config);
        bt->setStrategy(followTrend);
        bt->run();
        return bt;
    };

    auto first = runOnce();
    auto second = runOnce();
    const auto& a = first->finalize();
    const auto& b = second->finalize();

    ASSERT_GT(a.trades.size(), 0u);
    ASSERT_EQ(a.trades.size(), b.trades.size());
    for (std::size_t i = 0; i < a.trades.size(); ++i) {
        EXPECT_EQ(a.trades[i].code, b.trades[i].code);
        EXPECT_EQ(a.trades[i].size, b.trades[i].size);
        EXPECT_EQ(a.trades[i].entry_bar, b.trades[i].entry_bar);
        EXPECT_EQ(a.trades[i].exit_bar, b.trades[i].exit_bar);
        EXPECT_EQ(a.trades[i].entry_price, b.trades[i].entry_price);
        EXPECT_EQ(a.trades[i].exit_price, b.trades[i].exit_price);
        EXPECT_EQ(a.trades[i].commissions, b.trades[i].commissions);
    }
    ASSERT_EQ(a.equity_curve.size(), b.equity_curve.size());
    for (std::size_t i = 0; i < a.equity_curve.size(); ++i) {
        EXPECT_EQ(a.equity_curve[i].equity, b.equity_curve[i].equity);
    }
}

TEST(BacktestTest, StrategyNeverSeesFutureBars) {
    core::BarSeries aaa = waveSeries(20);
    // BBB trades every other day only
    core::BarSeries bbb;
    for (int i = 0; i < 20; i += 2) {
        bbb.push_back(backcast_test::flatBar(i, 50.0 + i));
    }
    Backtest bt(Universe{{"AAA", aaa}, {"BBB", bbb}}, configWithCash(10000.0));

    std::size_t checked = 0;
    bt.setStrategy([&checked](Backtest& b) {
        core::Timestamp now = b.getIndex()[b.getStepIndex()];
        for (const auto& entry : b.getData()) {
            ASSERT_FALSE(entry.second.empty());
            EXPECT_LE(entry.second.back().timestamp, now);
            for (const auto& bar : entry.second) {
                EXPECT_LE(bar.timestamp, now);
            }
            EXPECT_THROW(entry.second.at(entry.second.size()), std::out_of_range);
        }
        EXPECT_EQ(b.getData().at("AAA").back().timestamp, now);
        ++checked;
    });
    bt.run();
    EXPECT_EQ(checked, 20u);
}

TEST(BacktestTest, PositionEqualsSumOfOpenTradesThroughoutRun) {
    Backtest bt(Universe{{"AAA", waveSeries(60)}, {"BBB", waveSeries(60, 80.0, 6.0)}}, configWithCash(50000.0));
    bt.setStrategy([](Backtest& b) {
        followTrend(b);
        for (const auto& code : b.getCodes()) {
            long long sum = 0;
            for (const auto& trade : b.getTrades()) {
                if (trade.code == code) {
                    sum += trade.size;
                }
            }
            EXPECT_EQ(b.getPositionOf(code), sum);
            EXPECT_EQ(b.getPosition(code).size(), sum);
        }
    });
    bt.run();
}

TEST(BacktestTest, FinalizeReturnsSameReport) {
    Backtest bt(Universe{{"AAA", flatSeries(5, 100.0)}}, configWithCash(10000.0));
    const auto& first = bt.run();
    const auto& second = bt.finalize();
    EXPECT_EQ(&first, &second);
    EXPECT_EQ(&bt.run(), &first);
}

TEST(BacktestTest, FinalizeBeforeAnyStepUsesFirstBar) {
    Backtest bt(Universe{{"AAA", flatSeries(5, 100.0)}}, configWithCash(10000.0));
    const auto& stats = bt.finalize();
    EXPECT_EQ(stats.equity_curve.size(), 1u);
    EXPECT_DOUBLE_EQ(stats.equity_final, 10000.0);
    EXPECT_EQ(stats.num_trades, 0u);
}

TEST(BacktestTest, StepReportsFinishOnLastBar) {
    Backtest bt(Universe{{"AAA", flatSeries(3, 100.0)}}, configWithCash(10000.0));
    EXPECT_TRUE(bt.step());
    EXPECT_TRUE(bt.step());
    EXPECT_FALSE(bt.step());
    EXPECT_TRUE(bt.isFinished());
    EXPECT_FALSE(bt.step());
    EXPECT_EQ(bt.advance().outcome, backtester::StepOutcome::Completed);
    EXPECT_DOUBLE_EQ(bt.getProgress(), 1.0);
}

TEST(BacktestTest, FailingBarEndsRunWithError) {
    BacktestConfig config = configWithCash(10000.0);
    config.commission = backtester::CommissionModel(backtester::CommissionModel::Function(
        [](double, double price) { return price > 105.0 ? std::nan("") : 0.0; }));
    Backtest bt(Universe{{"AAA", seriesFromPrices({100, 100, 110, 110, 110})}}, config);
    bt.setStrategy([](Backtest& b) {
        if (b.getStepIndex() == 1) {
            b.buy("AAA", 1);
        }
    });

    EXPECT_EQ(bt.advance().outcome, backtester::StepOutcome::Advanced);
    EXPECT_EQ(bt.advance().outcome, backtester::StepOutcome::Advanced);
    backtester::StepResult result = bt.advance();
    EXPECT_EQ(result.outcome, backtester::StepOutcome::Failed);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->step_index, 2u);
    EXPECT_TRUE(bt.isFinished());
    ASSERT_TRUE(bt.getLastError().has_value());
    EXPECT_EQ(bt.getStepIndex(), 2u);

    const auto& stats = bt.finalize();
    EXPECT_EQ(stats.equity_curve.size(), 2u);
}

TEST(BacktestTest, SettlementAfterFailedBarUsesLastCompletedBar) {
    BacktestConfig config = configWithCash(10000.0);
    config.finalize_trades = true;
    config.commission = backtester::CommissionModel(backtester::CommissionModel::Function(
        [](double size, double) { return std::abs(size) == 1.0 ? std::nan("") : 0.0; }));
    Backtest bt(Universe{{"AAA", seriesFromPrices({100, 100, 100, 200, 200})}}, config);
    bt.setStrategy([](Backtest& b) {
        if (b.getStepIndex() == 0) {
            b.buy("AAA", 10);
        } else if (b.getStepIndex() == 2) {
            b.buy("AAA", 1);
        }
    });

    const auto& stats = bt.run();
    ASSERT_TRUE(bt.getLastError().has_value());
    EXPECT_EQ(bt.getLastError()->step_index, 3u);
    EXPECT_EQ(bt.getStepIndex(), 3u);
    EXPECT_EQ(bt.getData().at("AAA").size(), 3u);
    EXPECT_EQ(bt.getCurrentTime(), std::optional<core::Timestamp>(backcast_test::dayAt(2)));

    ASSERT_EQ(stats.trades.size(), 1u);
    const backtester::ClosedTrade& trade = stats.trades.front();
    EXPECT_EQ(trade.exit_bar, std::optional<std::size_t>(2));
    EXPECT_EQ(trade.exit_time, std::optional<core::Timestamp>(stats.end));
    EXPECT_DOUBLE_EQ(*trade.exit_price, 100.0);
    EXPECT_DOUBLE_EQ(trade.pl(), 0.0);
    EXPECT_EQ(stats.end, backcast_test::dayAt(2));
    EXPECT_DOUBLE_EQ(stats.equity_final, bt.getCash());
    EXPECT_DOUBLE_EQ(stats.equity_final, 10000.0);
}

TEST(BacktestTest, StrategyExceptionLeavesBarUnprocessed) {
    Backtest bt(Universe{{"AAA", flatSeries(4, 100.0)}}, configWithCash(10000.0));
    bt.setStrategy([](Backtest& b) {
        if (b.getStepIndex() == 1) {
            b.buy("AAA", 5);
            throw std::runtime_error("signal source unavailable");
        }
    });
    EXPECT_TRUE(bt.step());
    EXPECT_THROW(bt.step(), std::runtime_error);

    EXPECT_EQ(bt.getStepIndex(), 1u);
    EXPECT_FALSE(bt.isFinished());
    EXPECT_TRUE(bt.getOrders().empty());
    EXPECT_EQ(bt.getData().at("AAA").size(), 1u);

    bt.setStrategy(nullptr);
    EXPECT_TRUE(bt.step());
    EXPECT_EQ(bt.getStepIndex(), 2u);
}

TEST(BacktestTest, SteppingFromInsideStrategyIsRejected) {
    Backtest bt(Universe{{"AAA", flatSeries(3, 100.0)}}, configWithCash(10000.0));
    bt.setStrategy([](Backtest& b) { b.step(); });
    EXPECT_THROW(bt.step(), core::BacktestException);

    bt.setStrategy(nullptr);
    bt.reset();
    EXPECT_TRUE(bt.step());
}

TEST(BacktestTest, TradeCallbacksSurviveReset) {
    Backtest bt(Universe{{"AAA", flatSeries(6, 100.0)}}, configWithCash(10000.0));
    std::vector<std::string> events;
    bt.addTradeCallback([&events](const std::string& event, const backtester::Trade& trade) {
        events.push_back(event + ":" + trade.code);
    });
    bt.setStrategy([](Backtest& b) {
        if (b.getStepIndex() == 0) {
            b.sell("AAA", 5);
        }
    });

    bt.goTo(3);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events.front(), "SELL:AAA");

    bt.reset();
    bt.goTo(3);
    EXPECT_EQ(events.size(), 2u);
}

TEST(BacktestTest, OrdersNeedKnownCodeWhenSeveralInstruments) {
    Backtest bt(Universe{{"AAA", flatSeries(3, 100.0)}, {"BBB", flatSeries(3, 50.0)}}, configWithCash(10000.0));
    EXPECT_THROW(bt.buy(), core::InvalidOrderException);
    EXPECT_THROW(bt.buy("ZZZ", 1), core::InvalidOrderException);
    EXPECT_THROW(bt.buy("AAA", -1), core::InvalidOrderException);

    Backtest single(Universe{{"AAA", flatSeries(3, 100.0)}}, configWithCash(10000.0));
    backtester::Order order = single.buy();
    EXPECT_EQ(order.code, "AAA");
    EXPECT_DOUBLE_EQ(order.size, backtester::kAllAvailable);
    backtester::Order short_order = single.sell(backtester::OrderRequest{});
    EXPECT_DOUBLE_EQ(short_order.size, -backtester::kAllAvailable);
}

TEST(BacktestTest, RejectsInvalidData) {
    EXPECT_THROW(Backtest(Universe{}), core::DataValidationException);
    EXPECT_THROW(Backtest(Universe{{"AAA", core::BarSeries{}}}), core::DataValidationException);

    core::BarSeries with_nan = flatSeries(3, 100.0);
    with_nan[1].close = std::nan("");
    EXPECT_THROW(Backtest(Universe{{"AAA", with_nan}}), core::DataValidationException);

    core::BarSeries duplicated = flatSeries(3, 100.0);
    duplicated[2].timestamp = duplicated[1].timestamp;
    EXPECT_THROW(Backtest(Universe{{"AAA", duplicated}}), core::DataValidationException);

    BacktestConfig bad = configWithCash(-5.0);
    EXPECT_THROW(Backtest(Universe{{"AAA", flatSeries(3, 100.0)}}, bad), core::ConfigException);
}

TEST(BacktestTest, UnsortedDataIsSorted) {
    core::BarSeries series = seriesFromPrices({100, 101, 102});
    std::swap(series[0], series[2]);
    Backtest bt(Universe{{"AAA", series}});
    const auto data = bt.getData();
    ASSERT_EQ(data.at("AAA").size(), 3u);
    EXPECT_DOUBLE_EQ(data.at("AAA")[0].close, 100.0);
    EXPECT_DOUBLE_EQ(data.at("AAA")[2].close, 102.0);
}

TEST(BacktestTest, IndexIsUnionOfInstrumentTimestamps) {
    core::BarSeries aaa = seriesFromPrices({100, 101, 102});
    core::BarSeries bbb = seriesFromPrices({50, 51, 52}, 2);
    Backtest bt(Universe{{"AAA", aaa}, {"BBB", bbb}});
    EXPECT_EQ(bt.getTotalSteps(), 5u);

    bt.goTo(1);
    auto data = bt.getData();
    EXPECT_EQ(data.count("BBB"), 0u);
    bt.goTo(4);
    data = bt.getData();
    EXPECT_EQ(data.at("AAA").size(), 3u);
    EXPECT_EQ(data.at("BBB").size(), 2u);
}

TEST(BacktestTest, StateSnapshotDescribesProgress) {
    Backtest bt(Universe{{"AAA", flatSeries(4, 100.0)}}, configWithCash(10000.0));
    auto before = bt.getStateSnapshot();
    EXPECT_EQ(before["current_time"], "-");
    EXPECT_EQ(before["step_index"], 0);
    EXPECT_EQ(before["total_steps"], 4);
    EXPECT_EQ(before["is_finished"], false);

    bt.setStrategy([](Backtest& b) {
        if (b.getStepIndex() == 0) {
            b.buy("AAA", 3);
        }
    });
    bt.goTo(2);
    auto after = bt.getStateSnapshot();
    EXPECT_EQ(after["current_time"], core::utils::timestampToString(backcast_test::dayAt(1)));
    EXPECT_DOUBLE_EQ(after["progress"].get<double>(), 0.5);
    EXPECT_EQ(after["position"], 3);
    EXPECT_EQ(after["positions"]["AAA"], 3);
    EXPECT_EQ(after["closed_trades"], 0);
    EXPECT_DOUBLE_EQ(after["cash"].get<double>(), 9700.0);
    EXPECT_DOUBLE_EQ(after["equity"].get<double>(), 10000.0);
}

TEST(BacktestTest, SetCashAppliesOnReset) {
    Backtest bt(Universe{{"AAA", flatSeries(3, 100.0)}}, configWithCash(10000.0));
    bt.setCash(2500.0);
    EXPECT_DOUBLE_EQ(bt.getCash(), 10000.0);
    bt.reset();
    EXPECT_DOUBLE_EQ(bt.getCash(), 2500.0);
    EXPECT_THROW(bt.setCash(0.0), core::ConfigException);
}
