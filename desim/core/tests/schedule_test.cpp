#include <desim/core/schedule.hpp>
#include <desim/core/error.hpp>

#include <gtest/gtest.h>

#include <vector>

using namespace desim::core;

class ScheduleTest : public ::testing::Test {
protected:
    Schedule schedule;
    std::vector<int> fired;

    Action record(int tag) {
        return [this, tag] { fired.push_back(tag); };
    }
};

TEST_F(ScheduleTest, EmptyByDefault) {
    EXPECT_FALSE(schedule.has_events());
    EXPECT_EQ(schedule.event_count(), 0u);
    EXPECT_EQ(schedule.condition_count(), 0u);
    EXPECT_EQ(schedule.periodic_count(), 0u);
    EXPECT_THROW((void)schedule.next_time(), InvalidStateError);
    EXPECT_THROW(schedule.pop_next(), InvalidStateError);
}

TEST_F(ScheduleTest, PopsInTimeOrder) {
    schedule.insert({record(3), 3.0, 0.0});
    schedule.insert({record(1), 1.0, 0.0});
    schedule.insert({record(2), 2.0, 0.0});

    while (schedule.has_events()) {
        schedule.pop_next().action();
    }
    EXPECT_EQ(fired, (std::vector<int>{1, 2, 3}));
}

TEST_F(ScheduleTest, CollidingTimesKeepInsertionOrder) {
    std::vector<double> times;
    for (int i = 0; i < 5; ++i) {
        times.push_back(schedule.insert({record(i), 1.0, 0.0}));
    }

    EXPECT_EQ(times.front(), 1.0);
    for (std::size_t i = 1; i < times.size(); ++i) {
        EXPECT_GT(times[i], times[i - 1]);
    }

    while (schedule.has_events()) {
        schedule.pop_next().action();
    }
    EXPECT_EQ(fired, (std::vector<int>{0, 1, 2, 3, 4}));
}

TEST_F(ScheduleTest, InsertReturnsAdjustedTime) {
    schedule.insert({record(0), 2.0, 0.0});
    double t = schedule.insert({record(1), 2.0, 0.0});

    EXPECT_GT(t, 2.0);
    EXPECT_EQ(schedule.event_times(), (std::vector<double>{2.0, t}));
}

TEST_F(ScheduleTest, ReadyConditionIsRemoved) {
    bool open = false;
    schedule.add_condition({record(1), {[&open] { return open; }}});

    EXPECT_FALSE(schedule.take_ready_condition().has_value());
    EXPECT_EQ(schedule.condition_count(), 1u);

    open = true;
    auto ready = schedule.take_ready_condition();
    ASSERT_TRUE(ready.has_value());
    EXPECT_EQ(schedule.condition_count(), 0u);
    ready->action();
    EXPECT_EQ(fired, (std::vector<int>{1}));
}

TEST_F(ScheduleTest, ConditionIsConjunction) {
    bool a = true;
    bool b = false;
    schedule.add_condition({record(1), {[&a] { return a; }, [&b] { return b; }}});

    EXPECT_FALSE(schedule.take_ready_condition().has_value());
    b = true;
    EXPECT_TRUE(schedule.take_ready_condition().has_value());
}

TEST_F(ScheduleTest, ShiftMovesEveryEvent) {
    schedule.insert({record(0), 1.0, 0.0});
    schedule.insert({record(1), 4.0, 0.0});

    schedule.shift(2.5);

    EXPECT_EQ(schedule.event_times(), (std::vector<double>{3.5, 6.5}));
    EXPECT_EQ(schedule.pop_next().fire_time, 3.5);
}

TEST_F(ScheduleTest, RescaleScalesTimesAndIntervals) {
    schedule.insert({record(0), 2.0, 0.5});

    schedule.rescale(1000.0);

    TimedAction action = schedule.pop_next();
    EXPECT_DOUBLE_EQ(action.fire_time, 2000.0);
    EXPECT_DOUBLE_EQ(action.repeat_interval, 500.0);
}

TEST_F(ScheduleTest, ClearDropsEverything) {
    schedule.insert({record(0), 1.0, 0.0});
    schedule.add_condition({record(1), {[] { return false; }}});
    schedule.add_periodic({record(2), 0.0});

    schedule.clear();

    EXPECT_FALSE(schedule.has_events());
    EXPECT_EQ(schedule.condition_count(), 0u);
    EXPECT_EQ(schedule.periodic_count(), 0u);
}
