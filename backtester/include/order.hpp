#pragma once

#include <limits>
#include <optional>
#include <string>
#include <variant>

namespace backtester {

    class Broker;

    enum class BracketLeg {
        StopLoss,
        TakeProfit
    };

    // What kind of order this is: placed by the strategy, or the SL/TP child
    // of an open trade. The parent is referenced by trade id and resolved by
    // lookup in the broker.
    struct PlainOrder {};
    struct ContingentOf {
        long long trade_id = 0;
        BracketLeg leg = BracketLeg::StopLoss;
    };
    using OrderKind = std::variant<PlainOrder, ContingentOf>;

    // What a fill does: open (or net against) exposure, or shrink one trade.
    struct OpensPosition {};
    struct ReducesTrade {
        long long trade_id = 0;
    };
    using OrderIntent = std::variant<OpensPosition, ReducesTrade>;

    struct Order {
        long long id = 0;
        std::string code;
        double size = 0.0;  // Signed. 0 < |size| < 1 is a fraction of buying power
        std::optional<double> limit;
        std::optional<double> stop;
        std::optional<double> sl;
        std::optional<double> tp;
        std::optional<std::string> tag;
        OrderKind kind = PlainOrder{};
        OrderIntent intent = OpensPosition{};

        long long submitted_bar = -1; // -1 when placed before the first bar
        double submitted_close = std::numeric_limits<double>::quiet_NaN();

        // Non-owning; valid until the owning run is reset
        Broker* broker = nullptr;

        bool isLong() const { return size > 0; }
        bool isShort() const { return size < 0; }
        bool isContingent() const { return std::holds_alternative<ContingentOf>(kind); }
        bool isMarket() const { return !limit && !stop; }
        bool isReducing() const { return std::holds_alternative<ReducesTrade>(intent); }

        // Trade this order acts on, if any
        std::optional<long long> parentTradeId() const;

        // Removes the live order from the broker; no-op once filled or cancelled
        void cancel() const;
    };

} // namespace backtester
