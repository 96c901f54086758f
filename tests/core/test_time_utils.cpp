#include <gtest/gtest.h>
#include <ctime>
#include <regex>
#include "riskdesk/core/time_utils.hpp"

using namespace riskdesk;
using namespace riskdesk::core;

class TimeUtilsTest : public ::testing::Test {};

TEST_F(TimeUtilsTest, SafeGmtimeEpoch) {
    std::time_t epoch = 0;
    std::tm result;

    std::tm* ret = safe_gmtime(&epoch, &result);

    ASSERT_NE(ret, nullptr);
    EXPECT_EQ(result.tm_year, 70);
    EXPECT_EQ(result.tm_mon, 0);
    EXPECT_EQ(result.tm_mday, 1);
    EXPECT_EQ(result.tm_hour, 0);
}

TEST_F(TimeUtilsTest, MakeDateMatchesEpochDays) {
    EXPECT_EQ(to_epoch_seconds(make_date(1970, 1, 1)), 0);
    EXPECT_EQ(to_epoch_seconds(make_date(2024, 3, 15)), 1710460800);
    EXPECT_EQ(to_epoch_seconds(make_date(2000, 2, 29)), 11016LL * 86400);
}

TEST_F(TimeUtilsTest, FloorToDayDropsTimeOfDay) {
    Timestamp noon = make_date(2024, 3, 15) + std::chrono::hours(12) + std::chrono::minutes(30);
    EXPECT_EQ(floor_to_day(noon), make_date(2024, 3, 15));
    EXPECT_EQ(floor_to_day(make_date(2024, 3, 15)), make_date(2024, 3, 15));
}

TEST_F(TimeUtilsTest, DayArithmeticCrossesMonthAndLeapDay) {
    EXPECT_EQ(next_day(make_date(2024, 2, 28)), make_date(2024, 2, 29));
    EXPECT_EQ(next_day(make_date(2024, 2, 29)), make_date(2024, 3, 1));
    EXPECT_EQ(previous_day(make_date(2024, 1, 1)), make_date(2023, 12, 31));
}

TEST_F(TimeUtilsTest, ParseAndFormatDate) {
    auto parsed = parse_date("2024-03-15");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, make_date(2024, 3, 15));
    EXPECT_EQ(format_date(*parsed), "2024-03-15");

    EXPECT_FALSE(parse_date("not a date").has_value());
    EXPECT_FALSE(parse_date("").has_value());
}

TEST_F(TimeUtilsTest, ParseDateRejectsImpossibleDaysAndTrailingText) {
    EXPECT_FALSE(parse_date("2024-02-31").has_value());
    EXPECT_FALSE(parse_date("2023-02-29").has_value());
    EXPECT_FALSE(parse_date("2024-04-31").has_value());
    EXPECT_FALSE(parse_date("2024-13-01").has_value());
    EXPECT_FALSE(parse_date("2024-03-15junk").has_value());
    EXPECT_FALSE(parse_date("2024-03-15 ").has_value());

    auto leap = parse_date("2024-02-29");
    ASSERT_TRUE(leap.has_value());
    EXPECT_EQ(*leap, make_date(2024, 2, 29));
    ASSERT_TRUE(parse_date("2000-02-29").has_value());
    EXPECT_FALSE(parse_date("1900-02-29").has_value());
    ASSERT_TRUE(parse_date("2024-12-31").has_value());
}

TEST_F(TimeUtilsTest, FormatTimestampIsUtc) {
    Timestamp ts = make_date(2024, 3, 15) + std::chrono::hours(9) + std::chrono::minutes(5) +
                   std::chrono::seconds(7);
    EXPECT_EQ(format_timestamp(ts), "2024-03-15 09:05:07");
}

TEST_F(TimeUtilsTest, EpochSecondsRoundTrip) {
    Timestamp ts = from_epoch_seconds(1710460800);
    EXPECT_EQ(ts, make_date(2024, 3, 15));
    EXPECT_EQ(to_epoch_seconds(ts), 1710460800);
}

TEST_F(TimeUtilsTest, FormattedTimeMatchesPattern) {
    std::string formatted = get_formatted_time("%Y-%m-%d", false);
    EXPECT_TRUE(std::regex_match(formatted, std::regex(R"(\d{4}-\d{2}-\d{2})")));
}

TEST_F(TimeUtilsTest, ManualClockMovesOnlyWhenTold) {
    ManualClock clock(make_date(2024, 3, 15));
    EXPECT_EQ(clock.now(), make_date(2024, 3, 15));

    clock.advance(std::chrono::hours(25));
    EXPECT_EQ(floor_to_day(clock.now()), make_date(2024, 3, 16));

    clock.set(make_date(2020, 1, 1));
    EXPECT_EQ(clock.now(), make_date(2020, 1, 1));
}
