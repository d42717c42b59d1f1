#pragma once

#include "datatypes.hpp"
#include <string>
#include <chrono>

namespace core {
namespace utils {

    // Format as ISO 8601 UTC, e.g. "2024-01-05T00:00:00Z".
    // Milliseconds are appended only when non-zero.
    std::string timestampToString(const Timestamp& ts);

    // Parse ISO 8601. Accepts "YYYY-MM-DD", "YYYY/MM/DD", "YYYY-MM-DDTHH:MM:SS"
    // (space separator also allowed), optional fractional seconds and an optional
    // "Z" / "+HH:MM" / "-HH:MM" suffix. Missing offset means UTC.
    // Throws std::runtime_error on malformed input.
    Timestamp stringToTimestamp(const std::string& iso_string);

    // "N days HH:MM:SS" rendering used by reports.
    std::string durationToString(const Duration& d);

    // Whole UTC days since the epoch (floor), used for calendar bucketing.
    long long utcDayNumber(const Timestamp& ts);

} // namespace utils
} // namespace core
