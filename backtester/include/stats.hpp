#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include <nlohmann/json.hpp>

#include "datatypes.hpp"
#include "trade.hpp"

namespace backtester {

    // --- Equity curve point ---
    struct EquityPoint {
        core::Timestamp timestamp;
        double equity = 0.0;
        double drawdown = 0.0;  // Fraction below the running peak
        // Set only on the bar that ends a drawdown episode
        std::optional<core::Duration> drawdown_duration;
    };

    // --- Backtest statistics ---
    // Percent fields are in percent (12.5 == 12.5%). NaN marks a ratio that is
    // undefined for the run (no trades, no volatility, no drawdown).
    struct StatsReport {
        core::Timestamp start;
        core::Timestamp end;
        core::Duration duration{};
        double exposure_time_pct = 0.0;
        double equity_final = 0.0;
        double equity_peak = 0.0;
        double commissions = 0.0;
        double return_pct = 0.0;
        double return_ann_pct = 0.0;
        double volatility_ann_pct = 0.0;
        double cagr_pct = 0.0;
        double sharpe_ratio = 0.0;
        double sortino_ratio = 0.0;
        double calmar_ratio = 0.0;
        double max_drawdown_pct = 0.0;   // <= 0
        double avg_drawdown_pct = 0.0;   // <= 0, NaN without a completed drawdown
        std::optional<core::Duration> max_drawdown_duration;
        std::optional<core::Duration> avg_drawdown_duration;
        std::size_t num_trades = 0;
        double win_rate_pct = 0.0;
        double best_trade_pct = 0.0;
        double worst_trade_pct = 0.0;
        double avg_trade_pct = 0.0;
        std::optional<core::Duration> max_trade_duration;
        std::optional<core::Duration> avg_trade_duration;
        double profit_factor = 0.0;
        double expectancy_pct = 0.0;
        double sqn = 0.0;
        double kelly_criterion = 0.0;

        std::vector<EquityPoint> equity_curve;
        std::vector<ClosedTrade> trades;

        void logMetrics() const;
        nlohmann::json toJson() const;
    };

    struct DrawdownPeaks {
        std::vector<std::optional<core::Duration>> durations;
        std::vector<double> peaks;  // NaN except where an episode ends
    };

    // Compound mean of simple returns. NaN entries count as 0; any return at or
    // below -100% gives 0; empty or all-NaN input gives NaN.
    double geometricMean(const std::vector<double>& returns);

    // For every drawdown episode (a run of non-zero drawdown between two
    // zero-drawdown bars, or ending at the last bar), the episode length and its
    // deepest drawdown, stored at the bar that ends it.
    DrawdownPeaks computeDrawdownDurationPeaks(const std::vector<double>& drawdown,
                                               const std::vector<core::Timestamp>& index);

    // Pure. Equity and index are truncated to the shorter of the two; the result
    // must not be empty. Throws core::PreconditionException unless
    // 0 <= risk_free_rate < 1.
    StatsReport computeStats(const std::vector<ClosedTrade>& closed_trades,
                             const std::vector<double>& equity,
                             const std::vector<core::Timestamp>& index,
                             double risk_free_rate = 0.0);

} // namespace backtester
