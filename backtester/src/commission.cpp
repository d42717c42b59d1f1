#include "commission.hpp"
#include "exceptions.hpp"

#include <cmath>
#include <string>
#include <utility>

namespace backtester {

    CommissionModel::CommissionModel(double relative)
        : relative_(relative) {}

    CommissionModel::CommissionModel(double fixed, double relative)
        : fixed_(fixed), relative_(relative) {}

    CommissionModel::CommissionModel(Function fn)
        : custom_(std::move(fn)) {}

    double CommissionModel::operator()(double order_size, double price) const {
        if (custom_) {
            return custom_(order_size, price);
        }
        return fixed_ + std::abs(order_size) * price * relative_;
    }

    void CommissionModel::validate() const {
        if (custom_) {
            return;
        }
        if (!std::isfinite(fixed_) || fixed_ < 0.0) {
            throw core::ConfigException("Fixed commission must be >= 0, got " + std::to_string(fixed_));
        }
        if (!std::isfinite(relative_) || relative_ < -0.1 || relative_ >= 0.1) {
            throw core::ConfigException("Relative commission must be in [-0.1, 0.1), got " + std::to_string(relative_));
        }
    }

} // namespace backtester
