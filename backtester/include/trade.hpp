#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "datatypes.hpp"

namespace backtester {

    class Broker;

    struct Trade {
        long long id = 0;
        std::string code;
        long long size = 0;          // Signed whole units
        double entry_price = 0.0;
        core::Timestamp entry_time;
        std::size_t entry_bar = 0;

        std::optional<double> exit_price;
        std::optional<core::Timestamp> exit_time;
        std::optional<std::size_t> exit_bar;

        std::optional<double> sl;
        std::optional<double> tp;
        std::optional<std::string> tag;
        double commissions = 0.0;    // Entry plus, once closed, exit commission

        std::optional<long long> sl_order_id;
        std::optional<long long> tp_order_id;

        // Non-owning; valid until the owning run is reset
        Broker* broker = nullptr;

        bool isLong() const { return size > 0; }
        bool isShort() const { return size < 0; }
        bool isClosed() const { return exit_price.has_value(); }

        // Exit price once closed, otherwise the broker's mark for the code
        double currentPrice() const;

        // Net of commissions, in cash
        double pl() const;
        // Signed price return minus commissions over entry notional (0.05 == 5%)
        double plPct() const;
        double value() const;
        std::optional<core::Duration> duration() const;

        // Queues a reducing order for max(1, round(|size| * portion)) units.
        // Throws core::PreconditionException unless 0 < portion <= 1.
        void close(double portion = 1.0) const;
    };

    // A trade after its size reached zero; exit fields are set
    using ClosedTrade = Trade;

} // namespace backtester
