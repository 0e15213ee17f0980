/**
 * @file TimestampTest.cpp
 * @brief Unit tests for Timestamp
 */

#include <gtest/gtest.h>
#include "domain/Timestamp.hpp"

using namespace ledger::domain;

TEST(TimestampTest, FromString_WithAndWithoutMillis) {
    auto ts = Timestamp::fromString("2025-12-16T10:30:00Z");
    EXPECT_EQ(ts.toString(), "2025-12-16T10:30:00.000Z");

    auto precise = Timestamp::fromString("2025-12-16T10:30:00.25Z");
    EXPECT_EQ(precise.toEpochMillis() - ts.toEpochMillis(), 250);

    // Микросекунды отбрасываются
    auto micros = Timestamp::fromString("2025-12-16T10:30:00.123456Z");
    EXPECT_EQ(micros.toString(), "2025-12-16T10:30:00.123Z");
}

TEST(TimestampTest, FromString_RejectsGarbage) {
    EXPECT_THROW(Timestamp::fromString("yesterday"), std::invalid_argument);
    EXPECT_THROW(Timestamp::fromString("2025-12-16"), std::invalid_argument);
}

TEST(TimestampTest, EpochMillisRoundTrip) {
    auto ts = Timestamp::fromEpochMillis(1700000000123);
    EXPECT_EQ(ts.toEpochMillis(), 1700000000123);
    EXPECT_EQ(ts.toString(), "2023-11-14T22:13:20.123Z");
}

TEST(TimestampTest, FromDate_StartAndEndOfDay) {
    auto start = Timestamp::fromDate("2024-02-29");
    EXPECT_EQ(start.toString(), "2024-02-29T00:00:00.000Z");
    EXPECT_EQ(start.endOfDay().toString(), "2024-02-29T23:59:59.999Z");
    EXPECT_EQ(start.toDateString(), "2024-02-29");
}

TEST(TimestampTest, FromDate_RejectsInvalidCalendarDays) {
    EXPECT_THROW(Timestamp::fromDate("2025-02-30"), std::invalid_argument);
    EXPECT_THROW(Timestamp::fromDate("2025-13-01"), std::invalid_argument);
    EXPECT_THROW(Timestamp::fromDate("2025-1-01"), std::invalid_argument);
    EXPECT_THROW(Timestamp::fromDate("01/02/2025"), std::invalid_argument);
}

TEST(TimestampTest, ArithmeticAndOrdering) {
    auto base = Timestamp::fromDate("2025-01-01");
    EXPECT_EQ(base.addHours(24).toDateString(), "2025-01-02");
    EXPECT_EQ(base.addSeconds(90).toString(), "2025-01-01T00:01:30.000Z");
    EXPECT_LT(base, base.addMillis(1));
    EXPECT_EQ(base, Timestamp::fromString("2025-01-01T00:00:00Z"));
}
