#include "trade.hpp"
#include "broker.hpp"
#include "exceptions.hpp"

#include <cmath>
#include <cstdlib>
#include <string>

namespace backtester {

    double Trade::currentPrice() const {
        if (exit_price) {
            return *exit_price;
        }
        if (broker) {
            double mark = broker->getLastPrice(code);
            if (!std::isnan(mark)) {
                return mark;
            }
        }
        return entry_price;
    }

    double Trade::pl() const {
        return static_cast<double>(size) * (currentPrice() - entry_price) - commissions;
    }

    double Trade::plPct() const {
        if (size == 0 || entry_price == 0.0) {
            return 0.0;
        }
        double gross = std::copysign(1.0, static_cast<double>(size)) * (currentPrice() / entry_price - 1.0);
        double commission_pct = commissions / (static_cast<double>(std::llabs(size)) * entry_price);
        return gross - commission_pct;
    }

    double Trade::value() const {
        return static_cast<double>(std::llabs(size)) * currentPrice();
    }

    std::optional<core::Duration> Trade::duration() const {
        if (!exit_time) {
            return std::nullopt;
        }
        return *exit_time - entry_time;
    }

    void Trade::close(double portion) const {
        if (!(portion > 0.0 && portion <= 1.0)) {
            throw core::PreconditionException("Trade close portion must be in (0, 1], got " + std::to_string(portion));
        }
        if (isClosed() || !broker) {
            return;
        }
        broker->closeTrade(id, portion);
    }

} // namespace backtester
