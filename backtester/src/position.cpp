#include "position.hpp"
#include "broker.hpp"

#include <cstdlib>
#include <utility>

namespace backtester {

    Position::Position(Broker* broker, std::optional<std::string> code)
        : broker_(broker), code_(std::move(code)) {}

    long long Position::size() const {
        return broker_ ? broker_->getPositionSize(code_) : 0;
    }

    double Position::pl() const {
        if (!broker_) {
            return 0.0;
        }
        double total = 0.0;
        for (const auto& trade : broker_->getTrades()) {
            if (!code_ || trade.code == *code_) {
                total += trade.pl();
            }
        }
        return total;
    }

    double Position::plPct() const {
        if (!broker_) {
            return 0.0;
        }
        double weighted = 0.0;
        double weight_sum = 0.0;
        for (const auto& trade : broker_->getTrades()) {
            if (code_ && trade.code != *code_) {
                continue;
            }
            double weight = static_cast<double>(std::llabs(trade.size)) * trade.entry_price;
            weighted += trade.plPct() * weight;
            weight_sum += weight;
        }
        return weight_sum > 0.0 ? 100.0 * weighted / weight_sum : 0.0;
    }

    void Position::close(double portion) const {
        if (broker_) {
            broker_->closePosition(code_, portion);
        }
    }

    nlohmann::json Position::toJson() const {
        return {
            {"size", size()},
            {"pl", pl()},
            {"pl_pct", plPct()},
            {"is_long", isLong()},
            {"is_short", isShort()}
        };
    }

} // namespace backtester
