#include <chrono>

#include <gtest/gtest.h>

#include "test_utils.hpp"
#include "time_math.hpp"

using namespace std::chrono;

TEST(Iso8601, FormatsUtcWithMilliseconds)
{
    TimePoint tp = sys_days{year{2025} / 10 / 19} + hours(15) + minutes(4)
        + seconds(5) + milliseconds(123) + microseconds(999);
    EXPECT_EQ(formatIso8601(tp), "2025-10-19T15:04:05.123Z");
    EXPECT_EQ(formatIso8601(referenceTime()), "2025-10-19T12:00:00.000Z");
}

TEST(Iso8601, ParsesZuluAndOffsets)
{
    auto zulu = parseIso8601("2025-10-19T15:04:05Z");
    ASSERT_TRUE(zulu.has_value());
    EXPECT_EQ(formatIso8601(*zulu), "2025-10-19T15:04:05.000Z");

    EXPECT_EQ(parseIso8601("2025-10-19T17:04:05+02:00"), zulu);
    EXPECT_EQ(parseIso8601("2025-10-19T10:04:05-0500"), zulu);
    EXPECT_EQ(parseIso8601("2025-10-19 15:04:05"), zulu);
}

TEST(Iso8601, KeepsFractionalSeconds)
{
    auto tp = parseIso8601("2025-10-19T15:04:05.123456+00:00");
    ASSERT_TRUE(tp.has_value());
    EXPECT_EQ(formatIso8601(*tp), "2025-10-19T15:04:05.123Z");
}

TEST(Iso8601, RejectsMalformedInput)
{
    EXPECT_FALSE(parseIso8601("").has_value());
    EXPECT_FALSE(parseIso8601("null").has_value());
    EXPECT_FALSE(parseIso8601("2025-13-01T00:00:00Z").has_value());
    EXPECT_FALSE(parseIso8601("2025-02-30T00:00:00Z").has_value());
    EXPECT_FALSE(parseIso8601("2025-10-19T15:04").has_value());
    EXPECT_FALSE(parseIso8601("2025-10-19T15:04:05Zjunk").has_value());
    EXPECT_FALSE(parseIso8601("2025-10-19T15:04:05.Z").has_value());
}

TEST(FormatDuration, PicksTheLargestUnits)
{
    EXPECT_EQ(formatDuration(minutes(72)), "1h12m");
    EXPECT_EQ(formatDuration(days(4) + hours(2) + minutes(30)), "4d2h");
    EXPECT_EQ(formatDuration(days(1)), "1d0h");
    EXPECT_EQ(formatDuration(minutes(60)), "1h0m");
    EXPECT_EQ(formatDuration(minutes(5) + seconds(59)), "5m");
    EXPECT_EQ(formatDuration(seconds(59)), "0m");
}

TEST(TimeUntil, CountsDownFromNow)
{
    TimePoint now = referenceTime();
    EXPECT_EQ(timeUntil(formatIso8601(now + minutes(72)), now), "1h12m");
    EXPECT_EQ(timeUntil(formatIso8601(now + days(4) + hours(2)), now), "4d2h");
    EXPECT_EQ(timeUntil(formatIso8601(now + minutes(90)), now + minutes(30)),
              "1h0m");
}

TEST(TimeUntil, HandlesPastAndMissingTimestamps)
{
    TimePoint now = referenceTime();
    EXPECT_EQ(timeUntil(formatIso8601(now - minutes(1)), now), "0 min");
    EXPECT_EQ(timeUntil(formatIso8601(now), now), "0 min");
    EXPECT_EQ(timeUntil("", now), "");
    EXPECT_EQ(timeUntil("soon", now), "");
}

TEST(TimeSince, ReportsAge)
{
    TimePoint now = referenceTime();
    EXPECT_EQ(timeSince(formatIso8601(now - minutes(5)), now), "5m ago");
    EXPECT_EQ(timeSince(formatIso8601(now - hours(26)), now), "1d2h ago");
    EXPECT_EQ(timeSince(formatIso8601(now + minutes(5)), now), "0m ago");
    EXPECT_EQ(timeSince("", now), "");
}
