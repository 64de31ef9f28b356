// File: tests/core/context_snapshot_test.cpp
#include "core/context_snapshot.hpp"
#include "core/deadline.hpp"
#include <gtest/gtest.h>
#include <thread>

namespace aase {
namespace {

// ============================================================================
// TimeOfDay
// ============================================================================

TEST(TimeOfDayTest, BucketBoundaries) {
    EXPECT_EQ(TimeOfDay::NIGHT, TimeOfDayForHour(4));
    EXPECT_EQ(TimeOfDay::MORNING, TimeOfDayForHour(5));
    EXPECT_EQ(TimeOfDay::MORNING, TimeOfDayForHour(11));
    EXPECT_EQ(TimeOfDay::AFTERNOON, TimeOfDayForHour(12));
    EXPECT_EQ(TimeOfDay::AFTERNOON, TimeOfDayForHour(16));
    EXPECT_EQ(TimeOfDay::EVENING, TimeOfDayForHour(17));
    EXPECT_EQ(TimeOfDay::EVENING, TimeOfDayForHour(20));
    EXPECT_EQ(TimeOfDay::NIGHT, TimeOfDayForHour(21));
    EXPECT_EQ(TimeOfDay::NIGHT, TimeOfDayForHour(0));
}

TEST(TimeOfDayTest, ParseAndName) {
    EXPECT_EQ(TimeOfDay::EVENING, ParseTimeOfDay("evening"));
    EXPECT_STREQ("night", ToString(TimeOfDay::NIGHT));
    EXPECT_THROW(ParseTimeOfDay("dusk"), std::invalid_argument);
}

TEST(TimeOfDayTest, DayNames) {
    EXPECT_STREQ("sunday", DayOfWeekName(0));
    EXPECT_STREQ("saturday", DayOfWeekName(6));
    EXPECT_STREQ("unknown", DayOfWeekName(7));
}

// ============================================================================
// ContextSnapshot
// ============================================================================

TEST(ContextSnapshotTest, AtTimeDerivesTemporalFields) {
    // 2026-03-07 is a Saturday
    ContextSnapshot ctx = ContextSnapshot::AtTime(Timestamp::FromLocalTime(2026, 3, 7, 23, 40));

    EXPECT_EQ(23, ctx.hour);
    EXPECT_EQ(40, ctx.minute);
    EXPECT_EQ(6, ctx.day_of_week);
    EXPECT_TRUE(ctx.is_weekend);
    EXPECT_EQ(TimeOfDay::NIGHT, ctx.time_of_day);
    EXPECT_FALSE(ctx.battery_percent.has_value());
}

TEST(ContextSnapshotTest, WeekdayIsNotWeekend) {
    // 2026-03-04 is a Wednesday
    ContextSnapshot ctx = ContextSnapshot::AtTime(Timestamp::FromLocalTime(2026, 3, 4, 9, 0));
    EXPECT_EQ(3, ctx.day_of_week);
    EXPECT_FALSE(ctx.is_weekend);
    EXPECT_EQ(TimeOfDay::MORNING, ctx.time_of_day);
}

TEST(ContextSnapshotTest, BatteryDefaultsToFifty) {
    ContextSnapshot ctx;
    EXPECT_EQ(50, ctx.BatteryOrDefault());
    ctx.battery_percent = 12;
    EXPECT_EQ(12, ctx.BatteryOrDefault());
}

TEST(ContextSnapshotTest, BlobPreservesAllFields) {
    ContextSnapshot ctx = ContextSnapshot::AtTime(Timestamp::FromLocalTime(2026, 3, 4, 18, 30));
    ctx.battery_percent = 64;
    ctx.is_charging = true;
    ctx.memory_percent = 71.5f;
    ctx.active_app = "terminal";
    ctx.situation = "focused";
    ctx.detection_confidence = 0.8f;
    ctx.recent_actions = {"editor.open", "music.pause"};

    std::string blob = ctx.ToBlob();
    ContextSnapshot restored = ContextSnapshot::FromBlob(blob.data(), blob.size());

    EXPECT_EQ(ctx.timestamp, restored.timestamp);
    EXPECT_EQ(ctx.hour, restored.hour);
    EXPECT_EQ(ctx.day_of_week, restored.day_of_week);
    EXPECT_EQ(ctx.time_of_day, restored.time_of_day);
    EXPECT_EQ(ctx.battery_percent, restored.battery_percent);
    EXPECT_EQ(ctx.is_charging, restored.is_charging);
    EXPECT_EQ(ctx.memory_percent, restored.memory_percent);
    EXPECT_FALSE(restored.cpu_percent.has_value());
    EXPECT_EQ("terminal", restored.active_app);
    EXPECT_EQ("focused", restored.situation);
    EXPECT_EQ(ctx.recent_actions, restored.recent_actions);
}

TEST(ContextSnapshotTest, CorruptBlobThrows) {
    std::string garbage = "\x07garbage";
    EXPECT_THROW(ContextSnapshot::FromBlob(garbage.data(), garbage.size()), std::runtime_error);

    ContextSnapshot ctx = ContextSnapshot::Now();
    std::string blob = ctx.ToBlob();
    EXPECT_THROW(ContextSnapshot::FromBlob(blob.data(), blob.size() / 2), std::runtime_error);
}

TEST(ContextSnapshotTest, ToStringMentionsSignals) {
    ContextSnapshot ctx = ContextSnapshot::AtTime(Timestamp::FromLocalTime(2026, 3, 4, 18, 30));
    ctx.battery_percent = 30;
    ctx.situation = "commuting";

    std::string str = ctx.ToString();
    EXPECT_NE(std::string::npos, str.find("evening"));
    EXPECT_NE(std::string::npos, str.find("wednesday"));
    EXPECT_NE(std::string::npos, str.find("battery=30%"));
    EXPECT_NE(std::string::npos, str.find("situation=commuting"));
}

// ============================================================================
// Deadline
// ============================================================================

TEST(DeadlineTest, NeverIsUnbounded) {
    Deadline d = Deadline::Never();
    EXPECT_TRUE(d.IsUnbounded());
    EXPECT_FALSE(d.Expired());
    EXPECT_FALSE(d.Remaining().has_value());
}

TEST(DeadlineTest, ExpiresAfterBudget) {
    Deadline d = Deadline::After(std::chrono::milliseconds(10));
    EXPECT_FALSE(d.IsUnbounded());
    std::this_thread::sleep_for(std::chrono::milliseconds(25));
    EXPECT_TRUE(d.Expired());
    EXPECT_EQ(std::chrono::milliseconds(0), *d.Remaining());
}

TEST(DeadlineTest, ZeroBudgetIsAlreadyExpired) {
    EXPECT_TRUE(Deadline::After(std::chrono::milliseconds(0)).Expired());
}

TEST(DeadlineTest, TightenedKeepsTheEarlierBound) {
    Deadline loose = Deadline::After(std::chrono::seconds(60));
    Deadline tight = loose.Tightened(std::chrono::milliseconds(100));
    EXPECT_LE(*tight.Remaining(), std::chrono::milliseconds(100));

    Deadline already_tight = Deadline::After(std::chrono::milliseconds(50));
    Deadline still_tight = already_tight.Tightened(std::chrono::seconds(60));
    EXPECT_LE(*still_tight.Remaining(), std::chrono::milliseconds(50));

    Deadline from_never = Deadline::Never().Tightened(std::chrono::seconds(1));
    EXPECT_FALSE(from_never.IsUnbounded());
}

} // namespace
} // namespace aase
