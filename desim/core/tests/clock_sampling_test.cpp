#include <desim/core/clock.hpp>
#include <desim/core/error.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace desim::core;

class ClockSamplingTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().set_sink(nullptr);
    }

    void TearDown() override {
        Logger::instance().set_sink(stderr);
    }
};

TEST_F(ClockSamplingTest, TicksWithoutEvents) {
    Clock clock(0.5);

    auto summary = clock.run(5.0);

    EXPECT_EQ(summary.ticks, 10u);
    EXPECT_EQ(summary.events, 0u);
    EXPECT_EQ(clock.time(), 5.0);
}

TEST_F(ClockSamplingTest, PeriodicActionsRunInRegistrationOrder) {
    Clock clock(1.0);
    std::vector<int> order;
    clock.register_periodic([&order] { order.push_back(1); });
    clock.register_periodic([&order] { order.push_back(2); });

    clock.run(2.0);

    EXPECT_EQ(order, (std::vector<int>{1, 2, 1, 2}));
}

TEST_F(ClockSamplingTest, PeriodicWithIntervalSetsSampleTime) {
    Clock clock;
    int samples = 0;

    clock.register_periodic([&samples] { ++samples; }, 0.25);
    clock.run(1.0);

    EXPECT_EQ(clock.dt(), 0.25);
    EXPECT_EQ(samples, 4);
}

TEST_F(ClockSamplingTest, PeriodicDerivesSampleTimeFromEventDensity) {
    Clock clock;
    for (int i = 1; i <= 10; ++i) {
        clock.schedule_at([] {}, static_cast<double>(i));
    }
    clock.run(10.0);

    clock.register_periodic([] {});

    // time / evcount = 1, scaled down by 100
    EXPECT_DOUBLE_EQ(clock.dt(), 0.01);
}

TEST_F(ClockSamplingTest, PeriodicWithoutHistoryUsesDefault) {
    Clock clock;

    clock.register_periodic([] {});

    EXPECT_DOUBLE_EQ(clock.dt(), 0.01);
}

TEST_F(ClockSamplingTest, ConditionFiresOnce) {
    Clock clock;
    int level = 0;
    int fired = 0;
    std::size_t pending_while_firing = 99;

    clock.schedule_every([&level] { ++level; }, 1.0);
    clock.schedule_on([&] {
        ++fired;
        pending_while_firing = clock.schedule().condition_count();
    }, [&level] { return level >= 3; });
    clock.run(10.0);

    EXPECT_EQ(fired, 1);
    EXPECT_EQ(pending_while_firing, 0u);
    EXPECT_EQ(clock.schedule().condition_count(), 0u);
}

TEST_F(ClockSamplingTest, ConditionDerivesSampleTime) {
    Clock clock;
    bool open = false;
    double fired_at = -1.0;

    clock.schedule_at([&open] { open = true; }, 3.0);
    clock.schedule_on([&] { fired_at = clock.time(); }, [&open] { return open; });

    EXPECT_DOUBLE_EQ(clock.dt(), 0.01);
    clock.run(10.0);

    EXPECT_GE(fired_at, 3.0);
    EXPECT_LE(fired_at, 3.02);
    // Derived sampling switches off once nothing is left to sample.
    EXPECT_EQ(clock.dt(), 0.0);
}

TEST_F(ClockSamplingTest, ConditionDuringRunUsesRemainingHorizon) {
    Clock clock;
    clock.schedule_at([&clock] {
        clock.schedule_on([] {}, [] { return false; });
    }, 1.0);

    auto summary = clock.run(51.0);

    EXPECT_GT(summary.ticks, 400u);
    // scale(50) / 100
    EXPECT_DOUBLE_EQ(clock.dt(), 0.1);
    EXPECT_EQ(clock.schedule().condition_count(), 1u);
}

TEST_F(ClockSamplingTest, ReadyConditionRunsImmediatelyWhileBusy) {
    Clock clock;
    double fired_at = -1.0;
    clock.schedule_at([&clock, &fired_at] {
        clock.schedule_on([&clock, &fired_at] { fired_at = clock.time(); }, [] { return true; });
    }, 2.0);

    clock.run(5.0);

    EXPECT_EQ(fired_at, 2.0);
    EXPECT_EQ(clock.schedule().condition_count(), 0u);
}

TEST_F(ClockSamplingTest, ConjunctionOfPredicates) {
    Clock clock(0.5);
    bool a = false;
    bool b = false;
    double fired_at = -1.0;

    clock.schedule_at([&a] { a = true; }, 1.2);
    clock.schedule_at([&b] { b = true; }, 2.2);
    clock.schedule_on([&] { fired_at = clock.time(); },
                      std::vector<Predicate>{[&a] { return a; }, [&b] { return b; }});
    clock.run(5.0);

    EXPECT_EQ(fired_at, 2.5);
}

TEST_F(ClockSamplingTest, TickCoincidingWithEventFiresBoth) {
    Clock clock(1.0);
    std::vector<std::string> order;
    clock.register_periodic([&order] { order.push_back("tick"); });
    clock.schedule_at([&order] { order.push_back("event"); }, 1.0);

    auto summary = clock.step();

    EXPECT_EQ(summary.ticks, 1u);
    EXPECT_EQ(summary.events, 1u);
    EXPECT_EQ(order, (std::vector<std::string>{"tick", "event"}));
    EXPECT_EQ(clock.time(), 1.0);
}

TEST_F(ClockSamplingTest, EventBeforeTickFiresFirst) {
    Clock clock(1.0);
    int fired = 0;
    clock.schedule_at([&fired] { ++fired; }, 0.5);

    auto summary = clock.step();

    EXPECT_EQ(summary.events, 1u);
    EXPECT_EQ(summary.ticks, 0u);
    EXPECT_EQ(clock.time(), 0.5);
}

TEST_F(ClockSamplingTest, SetSampleTimeZeroStopsTicking) {
    Clock clock(0.5);
    clock.run(1.0);

    clock.set_sample_time(0.0);
    auto summary = clock.run(1.0);

    EXPECT_EQ(summary.ticks, 0u);
    EXPECT_EQ(clock.scount(), 2u);
}
