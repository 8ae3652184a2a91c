#include <gtest/gtest.h>

#include "schedule/schedule_clock.hpp"
#include "test_support.hpp"

namespace reportd::schedule {
namespace {

using reportd::testing::Utc;

TEST(ScheduleClockTest, DailyTriggerMovesToNextDayOncePassed) {
    ScheduleClock clock;
    const auto next = clock.NextRun({Trigger{std::nullopt, 9, 0}}, Utc(2024, 1, 1, 9, 5));
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next.value(), Utc(2024, 1, 2, 9, 0));
}

TEST(ScheduleClockTest, DailyTriggerLaterToday) {
    ScheduleClock clock;
    const auto next = clock.NextRun({Trigger{std::nullopt, 9, 0}}, Utc(2024, 1, 1, 8, 59, 59));
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next.value(), Utc(2024, 1, 1, 9, 0));
}

TEST(ScheduleClockTest, ExactMatchIsNotReturned) {
    ScheduleClock clock;
    const auto next = clock.NextRun({Trigger{std::nullopt, 9, 0}}, Utc(2024, 1, 1, 9, 0));
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next.value(), Utc(2024, 1, 2, 9, 0));
}

TEST(ScheduleClockTest, WeekdayTriggersUseSundayAsOne) {
    ScheduleClock clock;
    // 2024-01-01 is a Monday.
    const auto after = Utc(2024, 1, 1, 9, 5);
    EXPECT_EQ(clock.NextRun({Trigger{1, 9, 0}}, after).value(), Utc(2024, 1, 7, 9, 0));
    EXPECT_EQ(clock.NextRun({Trigger{2, 9, 0}}, after).value(), Utc(2024, 1, 8, 9, 0));
    EXPECT_EQ(clock.NextRun({Trigger{2, 10, 30}}, after).value(), Utc(2024, 1, 1, 10, 30));
    EXPECT_EQ(clock.NextRun({Trigger{7, 0, 0}}, after).value(), Utc(2024, 1, 6, 0, 0));
}

TEST(ScheduleClockTest, ReturnsEarliestAcrossTriggers) {
    ScheduleClock clock;
    const std::vector<Trigger> triggers = {
        Trigger{6, 17, 0},
        Trigger{std::nullopt, 6, 30},
        Trigger{3, 8, 0},
    };
    EXPECT_EQ(clock.NextRun(triggers, Utc(2024, 1, 1, 12, 0)).value(), Utc(2024, 1, 2, 6, 30));
    EXPECT_EQ(clock.NextRun(triggers, Utc(2024, 1, 2, 6, 30)).value(), Utc(2024, 1, 2, 8, 0));
}

TEST(ScheduleClockTest, AppliesConfiguredOffset) {
    ScheduleClock clock(std::chrono::minutes(60));
    // 09:00 at UTC+1 is 08:00 UTC.
    EXPECT_EQ(clock.NextRun({Trigger{std::nullopt, 9, 0}}, Utc(2024, 1, 1, 7, 0)).value(), Utc(2024, 1, 1, 8, 0));

    ScheduleClock west(std::chrono::minutes(-300));
    // Monday 23:30 UTC is still Monday 18:30 at UTC-5.
    EXPECT_EQ(west.NextRun({Trigger{2, 20, 0}}, Utc(2024, 1, 1, 23, 30)).value(), Utc(2024, 1, 2, 1, 0));
}

TEST(ScheduleClockTest, EmptyOrInvalidScheduleHasNoNextRun) {
    ScheduleClock clock;
    EXPECT_FALSE(clock.NextRun({}, Utc(2024, 1, 1)).has_value());
    EXPECT_FALSE(clock.NextRun({Trigger{std::nullopt, 24, 0}}, Utc(2024, 1, 1)).has_value());
    EXPECT_FALSE(clock.NextRun({Trigger{8, 9, 0}}, Utc(2024, 1, 1)).has_value());

    const auto next = clock.NextRun({Trigger{0, 9, 0}, Trigger{std::nullopt, 10, 0}}, Utc(2024, 1, 1));
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next.value(), Utc(2024, 1, 1, 10, 0));
}

TEST(ScheduleClockTest, NextRunIsStrictlyLaterAndWithinAWeek) {
    ScheduleClock clock(std::chrono::minutes(90));
    const std::vector<Trigger> triggers = {Trigger{4, 13, 15}, Trigger{1, 0, 0}};
    auto t = Utc(2024, 2, 27, 0, 0);
    for (int i = 0; i < 500; ++i) {
        const auto next = clock.NextRun(triggers, t);
        ASSERT_TRUE(next.has_value());
        EXPECT_GT(next.value(), t);
        EXPECT_LE(next.value() - t, std::chrono::hours(24 * 7));
        t += std::chrono::minutes(37);
    }
}

}  // namespace
}  // namespace reportd::schedule
