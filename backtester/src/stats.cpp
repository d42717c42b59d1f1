#include "stats.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <ctime>
#include <limits>
#include <numeric>
#include <string>

namespace backtester {

    namespace {
        const double kNaN = std::numeric_limits<double>::quiet_NaN();

        using Days = std::chrono::duration<long long, std::ratio<86400>>;

        long long floorDiv(long long a, long long b) {
            long long q = a / b;
            return (a % b != 0 && ((a < 0) != (b < 0))) ? q - 1 : q;
        }

        double mean(const std::vector<double>& values) {
            double sum = 0.0;
            std::size_t n = 0;
            for (double v : values) {
                if (!std::isnan(v)) {
                    sum += v;
                    ++n;
                }
            }
            return n ? sum / static_cast<double>(n) : kNaN;
        }

        // Sample variance (ddof = 1), NaN-skipping
        double variance(const std::vector<double>& values) {
            double m = mean(values);
            double sq = 0.0;
            std::size_t n = 0;
            for (double v : values) {
                if (!std::isnan(v)) {
                    sq += (v - m) * (v - m);
                    ++n;
                }
            }
            return n > 1 ? sq / static_cast<double>(n - 1) : kNaN;
        }

        double orNaN(double v) {
            return v == 0.0 ? kNaN : v;
        }

        // Median spacing of the last 100 timestamps
        std::optional<core::Duration> dataPeriod(const std::vector<core::Timestamp>& index) {
            std::size_t first = index.size() > 100 ? index.size() - 100 : 0;
            std::vector<core::Duration::rep> diffs;
            for (std::size_t i = first + 1; i < index.size(); ++i) {
                diffs.push_back((index[i] - index[i - 1]).count());
            }
            if (diffs.empty()) {
                return std::nullopt;
            }
            std::sort(diffs.begin(), diffs.end());
            std::size_t mid = diffs.size() / 2;
            core::Duration::rep median = diffs.size() % 2
                ? diffs[mid]
                : static_cast<core::Duration::rep>((static_cast<long double>(diffs[mid - 1]) + diffs[mid]) / 2);
            return core::Duration(median);
        }

        // Smallest non-zero calendar component of the data period
        core::Duration resolutionOf(core::Duration period) {
            using namespace std::chrono;
            const core::Duration units[] = {
                duration_cast<core::Duration>(hours(24)),
                duration_cast<core::Duration>(hours(1)),
                duration_cast<core::Duration>(minutes(1)),
                duration_cast<core::Duration>(seconds(1)),
                duration_cast<core::Duration>(milliseconds(1)),
            };
            for (const auto& unit : units) {
                if (period.count() % unit.count() == 0) {
                    return unit;
                }
            }
            return core::Duration(1);
        }

        std::optional<core::Duration> ceilTo(std::optional<core::Duration> value,
                                             std::optional<core::Duration> resolution) {
            if (!value || !resolution || resolution->count() <= 0) {
                return value;
            }
            auto rep = value->count();
            auto unit = resolution->count();
            auto q = floorDiv(rep, unit);
            if (q * unit != rep) {
                ++q;
            }
            return core::Duration(q * unit);
        }

        std::optional<core::Duration> maxDuration(const std::vector<std::optional<core::Duration>>& values) {
            std::optional<core::Duration> best;
            for (const auto& v : values) {
                if (v && (!best || *v > *best)) {
                    best = v;
                }
            }
            return best;
        }

        std::optional<core::Duration> meanDuration(const std::vector<std::optional<core::Duration>>& values) {
            long double sum = 0;
            std::size_t n = 0;
            for (const auto& v : values) {
                if (v) {
                    sum += v->count();
                    ++n;
                }
            }
            if (!n) {
                return std::nullopt;
            }
            return core::Duration(static_cast<core::Duration::rep>(sum / n));
        }

        int weekdayMondayZero(const core::Timestamp& ts) {
            long long day = core::utils::utcDayNumber(ts);
            return static_cast<int>(((day + 3) % 7 + 7) % 7); // 1970-01-01 was a Thursday
        }

        enum class ResampleRule { Day, Week, Month, Year };

        long long bucketOf(const core::Timestamp& ts, ResampleRule rule) {
            long long day = core::utils::utcDayNumber(ts);
            switch (rule) {
                case ResampleRule::Day:
                    return day;
                case ResampleRule::Week:
                    return floorDiv(day + 3, 7); // Monday-to-Sunday weeks
                case ResampleRule::Month:
                case ResampleRule::Year: {
                    std::time_t tt = std::chrono::system_clock::to_time_t(ts);
                    std::tm utc_tm;
                    #ifdef _WIN32
                        gmtime_s(&utc_tm, &tt);
                    #else
                        gmtime_r(&tt, &utc_tm);
                    #endif
                    long long year = utc_tm.tm_year + 1900;
                    return rule == ResampleRule::Year ? year : year * 12 + utc_tm.tm_mon;
                }
            }
            return day;
        }

        // Last equity value per period, then simple returns; the first entry is NaN
        std::vector<double> periodReturns(const std::vector<double>& equity,
                                          const std::vector<core::Timestamp>& index,
                                          ResampleRule rule) {
            std::vector<double> last_values;
            long long current_bucket = 0;
            for (std::size_t i = 0; i < equity.size(); ++i) {
                long long bucket = bucketOf(index[i], rule);
                if (last_values.empty() || bucket != current_bucket) {
                    last_values.push_back(equity[i]);
                    current_bucket = bucket;
                } else {
                    last_values.back() = equity[i];
                }
            }

            std::vector<double> returns;
            returns.reserve(last_values.size());
            for (std::size_t i = 0; i < last_values.size(); ++i) {
                returns.push_back(i == 0 ? kNaN : last_values[i] / last_values[i - 1] - 1.0);
            }
            return returns;
        }

        double percentOrNaN(double fraction) {
            return std::isnan(fraction) ? kNaN : fraction * 100.0;
        }

        nlohmann::json numberOrNull(double v) {
            return std::isfinite(v) ? nlohmann::json(v) : nlohmann::json(nullptr);
        }

        nlohmann::json durationOrNull(const std::optional<core::Duration>& d) {
            return d ? nlohmann::json(core::utils::durationToString(*d)) : nlohmann::json(nullptr);
        }

        std::string durationOrDash(const std::optional<core::Duration>& d) {
            return d ? core::utils::durationToString(*d) : std::string("-");
        }
    }

    double geometricMean(const std::vector<double>& returns) {
        if (returns.empty() || std::all_of(returns.begin(), returns.end(), [](double r) { return std::isnan(r); })) {
            return kNaN;
        }
        double log_sum = 0.0;
        for (double r : returns) {
            double growth = std::isnan(r) ? 1.0 : 1.0 + r;
            if (growth <= 0.0) {
                return 0.0;
            }
            log_sum += std::log(growth);
        }
        return std::exp(log_sum / static_cast<double>(returns.size())) - 1.0;
    }

    DrawdownPeaks computeDrawdownDurationPeaks(const std::vector<double>& drawdown,
                                               const std::vector<core::Timestamp>& index) {
        const std::size_t n = std::min(drawdown.size(), index.size());
        DrawdownPeaks result;
        result.durations.assign(n, std::nullopt);
        result.peaks.assign(n, kNaN);
        if (n == 0) {
            return result;
        }

        // Zero-drawdown bars plus the last bar bound the episodes
        std::vector<std::size_t> bounds;
        for (std::size_t i = 0; i < n; ++i) {
            if (drawdown[i] == 0.0) {
                bounds.push_back(i);
            }
        }
        if (bounds.empty() || bounds.back() != n - 1) {
            bounds.push_back(n - 1);
        }

        bool any_episode = false;
        for (std::size_t k = 1; k < bounds.size(); ++k) {
            std::size_t prev = bounds[k - 1];
            std::size_t cur = bounds[k];
            if (cur <= prev + 1) {
                continue;
            }
            double peak = kNaN;
            for (std::size_t i = prev; i <= cur; ++i) {
                if (!std::isnan(drawdown[i]) && (std::isnan(peak) || drawdown[i] > peak)) {
                    peak = drawdown[i];
                }
            }
            result.durations[cur] = index[cur] - index[prev];
            result.peaks[cur] = peak;
            any_episode = true;
        }

        if (!any_episode) {
            // No bounded episode: report raw drawdowns, with zero meaning none
            for (std::size_t i = 0; i < n; ++i) {
                result.peaks[i] = drawdown[i] == 0.0 ? kNaN : drawdown[i];
            }
        }
        return result;
    }

    StatsReport computeStats(const std::vector<ClosedTrade>& closed_trades,
                             const std::vector<double>& equity_in,
                             const std::vector<core::Timestamp>& index_in,
                             double risk_free_rate) {
        if (!(risk_free_rate >= 0.0 && risk_free_rate < 1.0)) {
            throw core::PreconditionException("risk_free_rate must be in [0, 1), got " + std::to_string(risk_free_rate));
        }
        const std::size_t n = std::min(equity_in.size(), index_in.size());
        if (n == 0) {
            throw core::PreconditionException("Statistics need at least one equity point with a timestamp.");
        }
        std::vector<double> equity(equity_in.begin(), equity_in.begin() + static_cast<std::ptrdiff_t>(n));
        std::vector<core::Timestamp> index(index_in.begin(), index_in.begin() + static_cast<std::ptrdiff_t>(n));

        StatsReport s;

        // --- Drawdown ---
        std::vector<double> drawdown(n);
        double running_peak = equity[0];
        for (std::size_t i = 0; i < n; ++i) {
            running_peak = std::max(running_peak, equity[i]);
            drawdown[i] = 1.0 - equity[i] / running_peak;
        }
        DrawdownPeaks dd = computeDrawdownDurationPeaks(drawdown, index);

        s.equity_curve.reserve(n);
        for (std::size_t i = 0; i < n; ++i) {
            s.equity_curve.push_back(EquityPoint{index[i], equity[i], drawdown[i], dd.durations[i]});
        }
        s.trades = closed_trades;

        const std::optional<core::Duration> period = dataPeriod(index);
        const std::optional<core::Duration> resolution =
            period ? std::optional<core::Duration>(resolutionOf(*period)) : std::nullopt;

        // --- Equity summary ---
        s.start = index.front();
        s.end = index.back();
        s.duration = s.end - s.start;

        std::vector<int> have_position(n, 0);
        for (const auto& trade : closed_trades) {
            std::size_t last = std::min(trade.exit_bar.value_or(n - 1), n - 1);
            for (std::size_t i = trade.entry_bar; i <= last && i < n; ++i) {
                have_position[i] = 1;
            }
        }
        s.exposure_time_pct = 100.0 * std::accumulate(have_position.begin(), have_position.end(), 0.0) / static_cast<double>(n);

        s.equity_final = equity.back();
        s.equity_peak = *std::max_element(equity.begin(), equity.end());
        s.commissions = 0.0;
        for (const auto& trade : closed_trades) {
            s.commissions += trade.commissions;
        }
        s.return_pct = (equity.back() - equity.front()) / equity.front() * 100.0;

        // --- Annualised figures ---
        long long freq_days = period ? std::chrono::floor<Days>(*period).count() : -1;
        std::size_t weekend_bars = 0;
        for (const auto& ts : index) {
            if (weekdayMondayZero(ts) >= 5) {
                ++weekend_bars;
            }
        }
        bool have_weekends = static_cast<double>(weekend_bars) / static_cast<double>(n) > 2.0 / 7.0 * 0.6;
        double annual_trading_days = freq_days == 7 ? 52.0
                                   : freq_days == 31 ? 12.0
                                   : freq_days == 365 ? 1.0
                                   : (have_weekends ? 365.0 : 252.0);
        ResampleRule rule = freq_days == 7 ? ResampleRule::Week
                          : freq_days == 31 ? ResampleRule::Month
                          : freq_days == 365 ? ResampleRule::Year
                          : ResampleRule::Day;

        std::vector<double> day_returns = periodReturns(equity, index, rule);
        double gmean_day_return = geometricMean(day_returns);
        if (std::isnan(gmean_day_return)) {
            gmean_day_return = 0.0;
        }

        double annualized_return = std::pow(1.0 + gmean_day_return, annual_trading_days) - 1.0;
        s.return_ann_pct = annualized_return * 100.0;
        s.volatility_ann_pct = std::sqrt(
            std::pow(variance(day_returns) + std::pow(1.0 + gmean_day_return, 2.0), annual_trading_days) -
            std::pow(1.0 + gmean_day_return, 2.0 * annual_trading_days)) * 100.0;

        double duration_days = std::chrono::duration<double, std::ratio<86400>>(s.duration).count();
        double time_in_years = duration_days / annual_trading_days;
        s.cagr_pct = time_in_years != 0.0
            ? (std::pow(s.equity_final / equity.front(), 1.0 / time_in_years) - 1.0) * 100.0
            : kNaN;

        s.sharpe_ratio = (s.return_ann_pct - risk_free_rate * 100.0) / orNaN(s.volatility_ann_pct);

        std::vector<double> downside;
        for (double r : day_returns) {
            if (!std::isnan(r)) {
                double clipped = std::min(r, 0.0);
                downside.push_back(clipped * clipped);
            }
        }
        s.sortino_ratio = (annualized_return - risk_free_rate) /
                          (std::sqrt(mean(downside)) * std::sqrt(annual_trading_days));

        double max_dd = 0.0;
        for (double d : drawdown) {
            if (!std::isnan(d)) {
                max_dd = std::max(max_dd, d);
            }
        }
        s.calmar_ratio = annualized_return / orNaN(max_dd);
        s.max_drawdown_pct = -max_dd * 100.0;
        double avg_peak = mean(dd.peaks);
        s.avg_drawdown_pct = std::isnan(avg_peak) ? kNaN : -avg_peak * 100.0;
        s.max_drawdown_duration = ceilTo(maxDuration(dd.durations), resolution);
        s.avg_drawdown_duration = ceilTo(meanDuration(dd.durations), resolution);

        // --- Trade-level figures ---
        std::vector<double> pl;
        std::vector<double> returns;
        std::vector<std::optional<core::Duration>> durations;
        for (const auto& trade : closed_trades) {
            pl.push_back(trade.pl());
            returns.push_back(trade.plPct());
            durations.push_back(trade.duration());
        }
        s.num_trades = closed_trades.size();

        double win_rate = kNaN;
        if (s.num_trades) {
            auto wins = std::count_if(pl.begin(), pl.end(), [](double v) { return v > 0.0; });
            win_rate = static_cast<double>(wins) / static_cast<double>(s.num_trades);
        }
        s.win_rate_pct = percentOrNaN(win_rate);
        s.best_trade_pct = returns.empty() ? kNaN : *std::max_element(returns.begin(), returns.end()) * 100.0;
        s.worst_trade_pct = returns.empty() ? kNaN : *std::min_element(returns.begin(), returns.end()) * 100.0;
        s.avg_trade_pct = percentOrNaN(geometricMean(returns));
        s.max_trade_duration = ceilTo(maxDuration(durations), resolution);
        s.avg_trade_duration = ceilTo(meanDuration(durations), resolution);

        double gross_win = 0.0;
        double gross_loss = 0.0;
        std::vector<double> winning_pl;
        std::vector<double> losing_pl;
        for (std::size_t i = 0; i < returns.size(); ++i) {
            if (returns[i] > 0.0) gross_win += returns[i];
            if (returns[i] < 0.0) gross_loss += returns[i];
            if (pl[i] > 0.0) winning_pl.push_back(pl[i]);
            if (pl[i] < 0.0) losing_pl.push_back(pl[i]);
        }
        s.profit_factor = s.num_trades ? gross_win / orNaN(std::abs(gross_loss)) : kNaN;
        s.expectancy_pct = percentOrNaN(mean(returns));
        s.sqn = std::sqrt(static_cast<double>(s.num_trades)) * mean(pl) / orNaN(std::sqrt(variance(pl)));
        s.kelly_criterion = win_rate - (1.0 - win_rate) / (mean(winning_pl) / -mean(losing_pl));

        return s;
    }

    void StatsReport::logMetrics() const {
        auto logger = core::logging::getLogger();
        logger->info("--- Backtest Metrics ---");
        logger->info("Start: {}", core::utils::timestampToString(start));
        logger->info("End: {}", core::utils::timestampToString(end));
        logger->info("Duration: {}", core::utils::durationToString(duration));
        logger->info("Exposure Time: {:.2f}%", exposure_time_pct);
        logger->info("Equity Final: {:.2f}", equity_final);
        logger->info("Equity Peak: {:.2f}", equity_peak);
        logger->info("Commissions: {:.2f}", commissions);
        logger->info("Return: {:.2f}%", return_pct);
        logger->info("Return (Ann.): {:.2f}%", return_ann_pct);
        logger->info("Volatility (Ann.): {:.2f}%", volatility_ann_pct);
        logger->info("CAGR: {:.2f}%", cagr_pct);
        logger->info("Sharpe Ratio: {:.2f}", sharpe_ratio);
        logger->info("Sortino Ratio: {:.2f}", sortino_ratio);
        logger->info("Calmar Ratio: {:.2f}", calmar_ratio);
        logger->info("Max. Drawdown: {:.2f}%", max_drawdown_pct);
        logger->info("Avg. Drawdown: {:.2f}%", avg_drawdown_pct);
        logger->info("Max. Drawdown Duration: {}", durationOrDash(max_drawdown_duration));
        logger->info("Avg. Drawdown Duration: {}", durationOrDash(avg_drawdown_duration));
        logger->info("# Trades: {}", num_trades);
        logger->info("Win Rate: {:.2f}%", win_rate_pct);
        logger->info("Best Trade: {:.2f}%", best_trade_pct);
        logger->info("Worst Trade: {:.2f}%", worst_trade_pct);
        logger->info("Avg. Trade: {:.2f}%", avg_trade_pct);
        logger->info("Max. Trade Duration: {}", durationOrDash(max_trade_duration));
        logger->info("Avg. Trade Duration: {}", durationOrDash(avg_trade_duration));
        logger->info("Profit Factor: {:.2f}", profit_factor);
        logger->info("Expectancy: {:.2f}%", expectancy_pct);
        logger->info("SQN: {:.2f}", sqn);
        logger->info("Kelly Criterion: {:.4f}", kelly_criterion);
        logger->info("------------------------");
    }

    nlohmann::json StatsReport::toJson() const {
        nlohmann::json j;
        j["Start"] = core::utils::timestampToString(start);
        j["End"] = core::utils::timestampToString(end);
        j["Duration"] = core::utils::durationToString(duration);
        j["Exposure Time [%]"] = numberOrNull(exposure_time_pct);
        j["Equity Final [$]"] = numberOrNull(equity_final);
        j["Equity Peak [$]"] = numberOrNull(equity_peak);
        j["Commissions [$]"] = numberOrNull(commissions);
        j["Return [%]"] = numberOrNull(return_pct);
        j["Return (Ann.) [%]"] = numberOrNull(return_ann_pct);
        j["Volatility (Ann.) [%]"] = numberOrNull(volatility_ann_pct);
        j["CAGR [%]"] = numberOrNull(cagr_pct);
        j["Sharpe Ratio"] = numberOrNull(sharpe_ratio);
        j["Sortino Ratio"] = numberOrNull(sortino_ratio);
        j["Calmar Ratio"] = numberOrNull(calmar_ratio);
        j["Max. Drawdown [%]"] = numberOrNull(max_drawdown_pct);
        j["Avg. Drawdown [%]"] = numberOrNull(avg_drawdown_pct);
        j["Max. Drawdown Duration"] = durationOrNull(max_drawdown_duration);
        j["Avg. Drawdown Duration"] = durationOrNull(avg_drawdown_duration);
        j["# Trades"] = num_trades;
        j["Win Rate [%]"] = numberOrNull(win_rate_pct);
        j["Best Trade [%]"] = numberOrNull(best_trade_pct);
        j["Worst Trade [%]"] = numberOrNull(worst_trade_pct);
        j["Avg. Trade [%]"] = numberOrNull(avg_trade_pct);
        j["Max. Trade Duration"] = durationOrNull(max_trade_duration);
        j["Avg. Trade Duration"] = durationOrNull(avg_trade_duration);
        j["Profit Factor"] = numberOrNull(profit_factor);
        j["Expectancy [%]"] = numberOrNull(expectancy_pct);
        j["SQN"] = numberOrNull(sqn);
        j["Kelly Criterion"] = numberOrNull(kelly_criterion);

        nlohmann::json curve = nlohmann::json::array();
        for (const auto& point : equity_curve) {
            curve.push_back({
                {"timestamp", core::utils::timestampToString(point.timestamp)},
                {"equity", numberOrNull(point.equity)},
                {"drawdown_pct", numberOrNull(point.drawdown * 100.0)},
                {"drawdown_duration", durationOrNull(point.drawdown_duration)}
            });
        }
        j["_equity_curve"] = curve;

        nlohmann::json trade_rows = nlohmann::json::array();
        for (const auto& trade : trades) {
            trade_rows.push_back({
                {"code", trade.code},
                {"size", trade.size},
                {"entry_bar", trade.entry_bar},
                {"exit_bar", trade.exit_bar ? nlohmann::json(*trade.exit_bar) : nlohmann::json(nullptr)},
                {"entry_price", trade.entry_price},
                {"exit_price", trade.exit_price ? numberOrNull(*trade.exit_price) : nlohmann::json(nullptr)},
                {"sl", trade.sl ? nlohmann::json(*trade.sl) : nlohmann::json(nullptr)},
                {"tp", trade.tp ? nlohmann::json(*trade.tp) : nlohmann::json(nullptr)},
                {"pnl", numberOrNull(trade.pl())},
                {"commission", numberOrNull(trade.commissions)},
                {"return_pct", numberOrNull(trade.plPct() * 100.0)},
                {"entry_time", core::utils::timestampToString(trade.entry_time)},
                {"exit_time", trade.exit_time ? nlohmann::json(core::utils::timestampToString(*trade.exit_time))
                                              : nlohmann::json(nullptr)},
                {"duration", durationOrNull(trade.duration())},
                {"tag", trade.tag ? nlohmann::json(*trade.tag) : nlohmann::json(nullptr)}
            });
        }
        j["_trades"] = trade_rows;
        return j;
    }

} // namespace backtester
