#include "utils.hpp"
#include <iomanip> // For std::put_time, std::get_time
#include <sstream>
#include <string>
#include <stdexcept>
#include <cmath>
#include <cctype>
#include <ctime>

namespace core {
namespace utils {

    Timestamp stringToTimestamp(const std::string& iso_string) {
        std::tm tm = {};

        // Normalise "YYYY/MM/DD" and "YYYY-MM-DD HH:MM:SS" to the ISO form
        std::string normalised = iso_string;
        if (normalised.size() >= 10 && normalised[4] == '/' && normalised[7] == '/') {
            normalised[4] = '-';
            normalised[7] = '-';
        }
        if (normalised.size() > 10 && normalised[10] == ' ') {
            normalised[10] = 'T';
        }

        std::istringstream ss(normalised);

        // 1. Date part, then optional time part
        ss >> std::get_time(&tm, "%Y-%m-%d");
        if (ss.fail()) {
            throw std::runtime_error("Failed to parse timestamp (date part): " + iso_string);
        }
        if (ss.peek() == 'T') {
            ss.ignore();
            ss >> std::get_time(&tm, "%H:%M:%S");
            if (ss.fail()) {
                throw std::runtime_error("Failed to parse timestamp (time part): " + iso_string);
            }
        }

        // 2. Optional fractional seconds
        double fractional_seconds = 0.0;
        if (ss.peek() == '.') {
            ss.ignore();
            std::string digits;
            while (std::isdigit(ss.peek()) && digits.size() < 9) {
                digits += static_cast<char>(ss.get());
            }
            while (std::isdigit(ss.peek())) {
                ss.ignore();
            }
            if (!digits.empty()) {
                fractional_seconds = std::stod(digits) / std::pow(10.0, static_cast<double>(digits.size()));
            }
        }

        // 3. Optional timezone offset (+HH:MM, -HH:MM, or Z)
        std::chrono::seconds offset_duration(0);
        char sign_or_z = 0;
        if (ss >> sign_or_z) {
            if (sign_or_z == 'Z') {
                offset_duration = std::chrono::seconds(0);
            } else if (sign_or_z == '+' || sign_or_z == '-') {
                int offset_h = 0;
                int offset_m = 0;
                char colon = ' ';
                if (!(ss >> std::setw(2) >> offset_h >> colon >> std::setw(2) >> offset_m) || colon != ':') {
                    throw std::runtime_error("Failed to parse timestamp (timezone offset HH:MM): " + iso_string);
                }
                offset_duration = std::chrono::hours(offset_h) + std::chrono::minutes(offset_m);
                if (sign_or_z == '-') {
                    offset_duration *= -1;
                }
            } else {
                throw std::runtime_error("Invalid timezone indicator '" + std::string(1, sign_or_z) + "' in timestamp: " + iso_string);
            }
            char trailing = 0;
            if (ss >> trailing) {
                throw std::runtime_error("Unexpected trailing characters in timestamp: " + iso_string);
            }
        }

        // 4. struct tm is UTC wall time here
        #ifdef _WIN32
            time_t tt = _mkgmtime(&tm);
        #else
            time_t tt = timegm(&tm);
        #endif
        if (tt == static_cast<time_t>(-1)) {
            throw std::runtime_error("Failed to convert parsed date/time to UTC epoch seconds: " + iso_string);
        }

        auto base_tp_utc = std::chrono::system_clock::from_time_t(tt);
        base_tp_utc += std::chrono::duration_cast<Duration>(std::chrono::duration<double>(fractional_seconds));

        // Local wall time minus its offset gives UTC
        return base_tp_utc - offset_duration;
    }

    std::string timestampToString(const Timestamp& ts) {
        auto secs = std::chrono::floor<std::chrono::seconds>(ts);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(ts - secs);
        auto tt = std::chrono::system_clock::to_time_t(secs);

        std::tm time_tm;
        #ifdef _WIN32
            gmtime_s(&time_tm, &tt);
        #else
            gmtime_r(&tt, &time_tm);
        #endif

        std::ostringstream oss;
        oss << std::put_time(&time_tm, "%Y-%m-%dT%H:%M:%S");
        if (ms.count() != 0) {
            oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
        }
        oss << 'Z';
        return oss.str();
    }

    std::string durationToString(const Duration& d) {
        using namespace std::chrono;
        auto total = duration_cast<seconds>(d);
        bool negative = total.count() < 0;
        if (negative) total = -total;

        long long days = total.count() / 86400;
        long long rem = total.count() % 86400;

        std::ostringstream oss;
        if (negative) oss << '-';
        oss << days << (days == 1 ? " day " : " days ")
            << std::setfill('0') << std::setw(2) << rem / 3600 << ':'
            << std::setw(2) << (rem % 3600) / 60 << ':'
            << std::setw(2) << rem % 60;
        return oss.str();
    }

    long long utcDayNumber(const Timestamp& ts) {
        using days = std::chrono::duration<long long, std::ratio<86400>>;
        return std::chrono::floor<days>(ts.time_since_epoch()).count();
    }

} // namespace utils
} // namespace core
