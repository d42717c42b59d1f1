#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace backtester {

    class Broker;

    // Derived view over the open trades of one code (or of every code when no
    // code is given). Nothing is stored; every accessor asks the broker.
    class Position {
    public:
        Position() = default;
        Position(Broker* broker, std::optional<std::string> code);

        long long size() const;
        double pl() const;
        // Entry-notional weighted average of trade returns, in percent
        double plPct() const;
        bool isLong() const { return size() > 0; }
        bool isShort() const { return size() < 0; }
        explicit operator bool() const { return size() != 0; }

        // Closes `portion` of every open trade in scope
        void close(double portion = 1.0) const;

        const std::optional<std::string>& getCode() const { return code_; }

        nlohmann::json toJson() const;

    private:
        Broker* broker_ = nullptr;
        std::optional<std::string> code_;
    };

} // namespace backtester
