#pragma once

#include <string>
#include <vector>
#include <chrono>   // For timestamps
#include <optional> // Volume may be missing

namespace core {

    // Bars are stamped with system_clock time points, always interpreted as UTC
    using Timestamp = std::chrono::system_clock::time_point;
    using Duration = std::chrono::system_clock::duration;

    struct Bar {
        Timestamp timestamp;
        double open = 0.0;
        double high = 0.0;
        double low = 0.0;
        double close = 0.0;
        std::optional<double> volume; // Unset when the source has no volume column

        bool operator<(const Bar& other) const {
            return timestamp < other.timestamp;
        }
    };

    template<typename T>
    using TimeSeries = std::vector<T>;

    // One instrument's bars, strictly increasing by timestamp once validated
    using BarSeries = TimeSeries<Bar>;

} // namespace core
