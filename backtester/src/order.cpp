#include "order.hpp"
#include "broker.hpp"

namespace backtester {

    std::optional<long long> Order::parentTradeId() const {
        if (const auto* contingent = std::get_if<ContingentOf>(&kind)) {
            return contingent->trade_id;
        }
        if (const auto* reduce = std::get_if<ReducesTrade>(&intent)) {
            return reduce->trade_id;
        }
        return std::nullopt;
    }

    void Order::cancel() const {
        if (broker) {
            broker->cancelOrder(id);
        }
    }

} // namespace backtester
