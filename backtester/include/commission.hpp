#pragma once

#include <functional>

namespace backtester {

    // Commission charged per fill: fixed + |size| * price * relative, or a
    // caller-supplied function of (order size, fill price). Negative values
    // are rebates and increase cash.
    class CommissionModel {
    public:
        using Function = std::function<double(double order_size, double price)>;

        CommissionModel() = default;
        CommissionModel(double relative); // Relative rate only
        CommissionModel(double fixed, double relative);
        explicit CommissionModel(Function fn);

        double operator()(double order_size, double price) const;

        // Throws core::ConfigException for fixed < 0 or relative outside [-0.1, 0.1)
        void validate() const;

        bool isCustom() const { return static_cast<bool>(custom_); }
        double getFixed() const { return fixed_; }
        double getRelative() const { return relative_; }

    private:
        double fixed_ = 0.0;
        double relative_ = 0.0;
        Function custom_;
    };

} // namespace backtester
