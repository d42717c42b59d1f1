#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>

#include "utils.hpp"
#include "series_view.hpp"
#include "test_helpers.hpp"

using core::utils::durationToString;
using core::utils::stringToTimestamp;
using core::utils::timestampToString;
using core::utils::utcDayNumber;

TEST(UtilsTest, ParsesDateOnlyAsUtcMidnight) {
    core::Timestamp ts = stringToTimestamp("2024-01-05");
    EXPECT_EQ(timestampToString(ts), "2024-01-05T00:00:00Z");
    EXPECT_EQ(stringToTimestamp("2024/01/05"), ts);
}

TEST(UtilsTest, ParsesTimeOffsetsAndFractions) {
    core::Timestamp utc = stringToTimestamp("2024-01-05T09:15:00Z");
    EXPECT_EQ(stringToTimestamp("2024-01-05 09:15:00"), utc);
    EXPECT_EQ(stringToTimestamp("2024-01-05T14:45:00+05:30"), utc);
    EXPECT_EQ(stringToTimestamp("2024-01-05T04:15:00-05:00"), utc);

    core::Timestamp fractional = stringToTimestamp("2024-01-05T09:15:00.250Z");
    EXPECT_EQ(fractional - utc, std::chrono::milliseconds(250));
    EXPECT_EQ(timestampToString(fractional), "2024-01-05T09:15:00.250Z");
}

TEST(UtilsTest, RejectsMalformedTimestamps) {
    EXPECT_THROW(stringToTimestamp("yesterday"), std::runtime_error);
    EXPECT_THROW(stringToTimestamp("2024-01-05T09:xx"), std::runtime_error);
    EXPECT_THROW(stringToTimestamp("2024-01-05T09:15:00+0530"), std::runtime_error);
    EXPECT_THROW(stringToTimestamp("2024-01-05T09:15:00Zjunk"), std::runtime_error);
}

TEST(UtilsTest, DurationRendering) {
    using namespace std::chrono;
    EXPECT_EQ(durationToString(duration_cast<core::Duration>(hours(24 * 3) + minutes(5) + seconds(9))),
              "3 days 00:05:09");
    EXPECT_EQ(durationToString(duration_cast<core::Duration>(hours(24))), "1 day 00:00:00");
    EXPECT_EQ(durationToString(core::Duration::zero()), "0 days 00:00:00");
}

TEST(UtilsTest, DayNumberFloorsBeforeEpoch) {
    EXPECT_EQ(utcDayNumber(stringToTimestamp("1970-01-01T23:59:59Z")), 0);
    EXPECT_EQ(utcDayNumber(stringToTimestamp("1970-01-02")), 1);
    EXPECT_EQ(utcDayNumber(stringToTimestamp("1969-12-31T12:00:00Z")), -1);
}

TEST(SeriesViewTest, ExposesOnlyLeadingRows) {
    core::BarSeries series = backcast_test::seriesFromPrices({10.0, 11.0, 12.0, 13.0});
    core::SeriesView view(series, 2);
    EXPECT_EQ(view.size(), 2u);
    EXPECT_DOUBLE_EQ(view.back().close, 11.0);
    EXPECT_THROW(view.at(2), std::out_of_range);

    int rows = 0;
    for (const auto& bar : view) {
        EXPECT_LE(bar.close, 11.0);
        ++rows;
    }
    EXPECT_EQ(rows, 2);

    core::SeriesView clamped(series, 10);
    EXPECT_EQ(clamped.size(), 4u);
    EXPECT_TRUE(core::SeriesView().empty());
}
