#pragma once

#include <algorithm>
#include <chrono>
#include <cmath>
#include <map>
#include <string>
#include <vector>

#include "datatypes.hpp"
#include "utils.hpp"
#include "broker.hpp"

namespace backcast_test {

    // Day n after Monday 2024-01-01, midnight UTC
    inline core::Timestamp dayAt(int n) {
        return core::utils::stringToTimestamp("2024-01-01") + std::chrono::hours(24 * n);
    }

    inline core::Bar makeBar(int n, double open, double high, double low, double close, double volume = 1000.0) {
        core::Bar bar;
        bar.timestamp = dayAt(n);
        bar.open = open;
        bar.high = high;
        bar.low = low;
        bar.close = close;
        bar.volume = volume;
        return bar;
    }

    inline core::Bar flatBar(int n, double price) {
        return makeBar(n, price, price, price, price);
    }

    // One flat bar per day, starting at `first_day`
    inline core::BarSeries seriesFromPrices(const std::vector<double>& prices, int first_day = 0) {
        core::BarSeries series;
        for (std::size_t i = 0; i < prices.size(); ++i) {
            series.push_back(flatBar(first_day + static_cast<int>(i), prices[i]));
        }
        return series;
    }

    inline core::BarSeries flatSeries(int count, double price, int first_day = 0) {
        return seriesFromPrices(std::vector<double>(static_cast<std::size_t>(count), price), first_day);
    }

    // Oscillating series with real ranges, for strategies that need signals
    inline core::BarSeries waveSeries(int count, double base = 100.0, double amplitude = 10.0) {
        core::BarSeries series;
        double prev_close = base;
        for (int i = 0; i < count; ++i) {
            double close = base + amplitude * std::sin(i / 4.0) + 0.1 * i;
            double open = prev_close;
            series.push_back(makeBar(i, open, std::max(open, close) + 1.0, std::min(open, close) - 1.0, close));
            prev_close = close;
        }
        return series;
    }

    // Makes `bar` the current bar for `code` on the broker
    inline void beginBar(backtester::Broker& broker, std::size_t index, const core::Bar& bar,
                         const std::string& code = "AAA") {
        broker.beginBar(index, bar.timestamp, {{code, bar}});
    }

} // namespace backcast_test
