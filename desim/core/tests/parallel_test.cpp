#include <desim/core/active_clock.hpp>
#include <desim/core/clock.hpp>
#include <desim/core/error.hpp>
#include <desim/core/message.hpp>

#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>

using namespace desim::core;

class ParallelTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().set_sink(nullptr);
    }

    void TearDown() override {
        Logger::instance().set_sink(stderr);
    }
};

TEST_F(ParallelTest, ForkStartsWorkers) {
    Clock master;
    master.fork(2);

    EXPECT_EQ(master.workers(), 2u);
    EXPECT_EQ(master.worker(2).id(), 2);
    EXPECT_EQ(master.worker(3).id(), 3);
    EXPECT_TRUE(master.worker(2).running());
    EXPECT_THROW((void)master.worker(4), OutOfRangeError);

    auto snap = master.query(3);
    EXPECT_EQ(snap.id, 3);
    EXPECT_EQ(snap.state, ClockState::Idle);
    EXPECT_DOUBLE_EQ(snap.time, 0.0);
}

TEST_F(ParallelTest, ForkSynchronizesWorkers) {
    Clock master(0.05, 0.0, TimeUnit::Seconds);
    master.run(2.0);
    master.fork(1);

    auto snap = master.query(2);
    EXPECT_DOUBLE_EQ(snap.time, 2.0);
    EXPECT_DOUBLE_EQ(snap.dt, 0.05);
    EXPECT_EQ(snap.unit, TimeUnit::Seconds);
}

TEST_F(ParallelTest, SecondForkIsIgnored) {
    Clock master;
    master.fork(2);
    master.fork(3);
    EXPECT_EQ(master.workers(), 2u);
}

TEST_F(ParallelTest, WorkersRunInLockstep) {
    Clock master(0.05);
    std::atomic<int> events{0};
    std::atomic<int> samples{0};

    master.fork(2);
    master.schedule_at([&events] { ++events; }, 1.0, Placement{2});
    master.register_periodic([&samples] { ++samples; }, Placement{2});

    auto summary = master.run(10.0);

    EXPECT_EQ(summary.state, ClockState::Idle);
    EXPECT_DOUBLE_EQ(master.time(), 10.0);
    EXPECT_EQ(events.load(), 1);
    EXPECT_EQ(samples.load(), 200);

    auto snap = master.query(2);
    EXPECT_NEAR(snap.time, 10.0, 1e-9);
    EXPECT_EQ(snap.scount, 200u);
    EXPECT_EQ(snap.evcount, 1u);
    EXPECT_EQ(snap.periodics, 1u);

    // Worker 3 had nothing to do but still followed the rounds.
    EXPECT_NEAR(master.query(3).time, 10.0, 1e-9);
}

TEST_F(ParallelTest, RegistrationReturnsRemoteFireTime) {
    Clock master;
    master.fork(1);

    EXPECT_DOUBLE_EQ(master.schedule_at([] {}, 4.0, Placement{2}), 4.0);
    EXPECT_EQ(master.query(2).events, 1u);
    EXPECT_EQ(master.schedule().event_count(), 0u);
}

TEST_F(ParallelTest, OwnIdRegistersLocally) {
    Clock master;
    master.fork(1);

    master.schedule_at([] {}, 4.0, Placement{MASTER_CLOCK_ID});
    EXPECT_EQ(master.schedule().event_count(), 1u);
    EXPECT_EQ(master.query(2).events, 0u);
}

TEST_F(ParallelTest, SpawnSpreadsOverWorkers) {
    Clock master;
    std::atomic<int> hits{0};
    master.fork(2);

    for (int i = 0; i < 10; ++i) {
        master.schedule_at([&hits] { ++hits; }, 1.0, Placement{0, true});
    }
    EXPECT_EQ(master.schedule().event_count(), 0u);

    master.run(2.0);

    EXPECT_EQ(hits.load(), 10);
    EXPECT_EQ(master.query(2).evcount + master.query(3).evcount, 10u);
}

TEST_F(ParallelTest, SpawnWithoutWorkersIsLocal) {
    Clock master;
    int hits = 0;

    master.schedule_at([&hits] { ++hits; }, 1.0, Placement{0, true});
    master.run(2.0);

    EXPECT_EQ(hits, 1);
}

TEST_F(ParallelTest, SyncActionsAreHeldUntilBoundary) {
    Clock master;
    std::atomic<int> hits{0};
    master.fork(1);

    master.schedule_at([&hits] { ++hits; }, 0.5, Placement{2, false, true});
    EXPECT_EQ(master.held_actions(), 1u);
    EXPECT_EQ(master.query(2).events, 0u);

    master.run(1.0);

    EXPECT_EQ(master.held_actions(), 0u);
    EXPECT_EQ(hits.load(), 1);
    EXPECT_EQ(master.query(2).evcount, 1u);
}

TEST_F(ParallelTest, WorkerProcessForwardsToSibling) {
    Clock master;
    std::atomic<int> hits{0};
    std::atomic<bool> fork_refused{false};
    master.fork(2);

    auto process = master.register_process(ProcessSpec{int64_t{1}, [&hits, &fork_refused](Clock& c, Process&) -> Routine {
        try {
            c.fork(1);
        } catch (const InvalidStateError&) {
            fork_refused = true;
        }
        c.schedule_at([&hits] { ++hits; }, c.time() + 0.5, Placement{3});
        co_await delay(c, 1.0);
    }, 1}, Placement{2});

    EXPECT_EQ(process, nullptr);
    EXPECT_TRUE(fork_refused.load());

    master.run(2.0);

    EXPECT_EQ(hits.load(), 1);
    EXPECT_EQ(master.query(3).evcount, 1u);
    EXPECT_EQ(master.query(2).processes, 0u);
}

TEST_F(ParallelTest, WorkerFaultIsDiagnosed) {
    Clock master;
    std::atomic<int> later{0};
    master.fork(1);

    EXPECT_FALSE(master.diagnose(2).has_value());

    master.schedule_at([] { throw std::runtime_error("boom"); }, 1.0, Placement{2});
    master.schedule_at([&later] { ++later; }, 2.0, Placement{2});
    auto summary = master.run(3.0);

    EXPECT_EQ(summary.state, ClockState::Idle);
    auto fault = master.diagnose(2);
    ASSERT_TRUE(fault.has_value());
    EXPECT_EQ(fault->what, "boom");
    EXPECT_EQ(fault->command, "Run");
    EXPECT_NEAR(fault->time, 1.0, 1e-9);

    // The worker keeps serving after the fault.
    EXPECT_TRUE(master.worker(2).running());
    EXPECT_EQ(later.load(), 1);
    EXPECT_NEAR(master.query(2).time, 3.0, 1e-9);
}

TEST_F(ParallelTest, ForkRefusedWhileRunning) {
    Clock master;
    bool refused = false;

    master.schedule_at([&master, &refused] {
        try {
            master.fork(1);
        } catch (const InvalidStateError&) {
            refused = true;
        }
    }, 1.0);
    master.run(2.0);

    EXPECT_TRUE(refused);
    EXPECT_EQ(master.workers(), 0u);
}

TEST_F(ParallelTest, CollapseStopsWorkers) {
    Clock master;
    master.fork(2);
    master.schedule_at([] {}, 0.5, Placement{3, false, true});
    master.schedule_at([] {}, 0.5, Placement{MASTER_CLOCK_ID, false, true});
    EXPECT_EQ(master.held_actions(), 2u);

    master.collapse();

    EXPECT_EQ(master.workers(), 0u);
    // Only the action held for the master survives.
    EXPECT_EQ(master.held_actions(), 1u);
    EXPECT_THROW((void)master.query(2), OutOfRangeError);

    master.collapse();
    EXPECT_EQ(master.workers(), 0u);
}

TEST_F(ParallelTest, UnknownWorkerIsOutOfRange) {
    Clock master;
    EXPECT_THROW(master.schedule_at([] {}, 1.0, Placement{5}), OutOfRangeError);

    master.fork(1);
    EXPECT_THROW((void)master.query(7), OutOfRangeError);
    EXPECT_THROW((void)master.diagnose(7), OutOfRangeError);
    EXPECT_THROW(master.schedule_at([] {}, 1.0, Placement{7}), OutOfRangeError);
}

TEST_F(ParallelTest, ResetReachesWorkers) {
    Clock master;
    master.fork(1);
    master.schedule_at([] {}, 4.0, Placement{2});
    master.run(1.0);

    master.reset(cmd::Reset{true, 0.0, 0.0, TimeUnit::None});

    auto snap = master.query(2);
    EXPECT_DOUBLE_EQ(snap.time, 0.0);
    EXPECT_EQ(snap.events, 0u);
}

TEST_F(ParallelTest, SyncIntervalValidation) {
    Clock master;
    EXPECT_THROW(master.set_sync_interval(0.0), InvalidArgumentError);
    EXPECT_THROW(master.set_sync_interval(-1.0), InvalidArgumentError);
    master.set_sync_interval(0.5);
    EXPECT_DOUBLE_EQ(master.sync_interval(), 0.5);
}

TEST_F(ParallelTest, ResumeAfterStopDoesNotRewindWorkers) {
    Clock master;
    std::atomic<double> woke{0.0};
    master.fork(1);

    master.register_process(ProcessSpec{int64_t{1}, [&woke](Clock& c, Process&) -> Routine {
        co_await delay(c, 0.8);
        woke = c.time();
    }, 1}, Placement{2});
    // Stops the master in the middle of a round the worker has already finished.
    master.schedule_at([&master] { master.stop(); }, 0.505);

    auto halted = master.run(1.0);
    EXPECT_EQ(halted.state, ClockState::Halted);
    EXPECT_NEAR(master.time(), 0.505, 1e-12);
    EXPECT_NEAR(master.query(2).time, 0.51, 1e-9);

    auto summary = master.resume();

    EXPECT_EQ(summary.state, ClockState::Idle);
    EXPECT_DOUBLE_EQ(master.time(), 1.0);
    EXPECT_NEAR(woke.load(), 0.8, 1e-9);
    EXPECT_NEAR(master.query(2).time, 1.0, 1e-9);
}

TEST_F(ParallelTest, MasterFaultLeavesWorkersAhead) {
    Clock master;
    std::atomic<int> hits{0};
    master.fork(1);
    master.schedule_at([] { throw std::runtime_error("master"); }, 0.505);
    master.schedule_at([&hits] { ++hits; }, 0.7, Placement{2});

    EXPECT_THROW(master.run(1.0), std::runtime_error);
    EXPECT_EQ(master.state(), ClockState::Idle);
    EXPECT_NEAR(master.time(), 0.505, 1e-12);

    // Shorter than the unfinished round: no round is sent.
    master.run(0.002);
    EXPECT_NEAR(master.time(), 0.507, 1e-12);
    EXPECT_NEAR(master.query(2).time, 0.51, 1e-9);

    master.run(0.493);
    EXPECT_NEAR(master.time(), 1.0, 1e-9);
    EXPECT_NEAR(master.query(2).time, 1.0, 1e-9);
    EXPECT_EQ(hits.load(), 1);
}

TEST_F(ParallelTest, NonStandardWorkerThrowIsReported) {
    Clock master;
    std::atomic<int> later{0};
    master.fork(1);

    master.schedule_at([] { throw 42; }, 1.0, Placement{2});
    master.schedule_at([&later] { ++later; }, 2.0, Placement{2});
    auto summary = master.run(3.0);

    EXPECT_EQ(summary.state, ClockState::Idle);
    auto fault = master.diagnose(2);
    ASSERT_TRUE(fault.has_value());
    EXPECT_EQ(fault->what, "unknown exception");
    EXPECT_EQ(fault->command, "Run");
    EXPECT_FALSE(fault->trace.empty());
    EXPECT_TRUE(master.worker(2).running());
    EXPECT_EQ(later.load(), 1);
}

TEST_F(ParallelTest, FaultEndsWorkerWhenHandlingDisabled) {
    ClockConfig config;
    config.handle_exceptions = false;
    Clock master(config);
    std::atomic<int> later{0};
    master.fork(1);

    master.schedule_at([] { throw std::runtime_error("boom"); }, 1.0, Placement{2});
    master.schedule_at([&later] { ++later; }, 2.0, Placement{2});
    auto summary = master.run(3.0);

    // The master finishes its run alone.
    EXPECT_EQ(summary.state, ClockState::Idle);
    EXPECT_DOUBLE_EQ(master.time(), 3.0);
    EXPECT_EQ(later.load(), 0);
    EXPECT_FALSE(master.worker(2).running());
    EXPECT_THROW((void)master.query(2), InvalidStateError);
    EXPECT_THROW((void)master.diagnose(2), InvalidStateError);
}

TEST_F(ParallelTest, SyncMessageRealignsWorker) {
    Clock master;
    master.fork(1);
    master.schedule_at([] {}, 4.0, Placement{2});

    RemoteClock& remote = master.worker(2);
    ASSERT_TRUE(remote.send(msg::Sync{5.0, 0.1, TimeUnit::Seconds}));
    auto reply = remote.receive();
    ASSERT_TRUE(reply.has_value());
    const auto* response = std::get_if<msg::Response>(&*reply);
    ASSERT_NE(response, nullptr);
    ASSERT_TRUE(std::holds_alternative<double>(response->value));
    EXPECT_DOUBLE_EQ(std::get<double>(response->value), 5.0);

    auto snap = master.query(2);
    EXPECT_DOUBLE_EQ(snap.time, 5.0);
    EXPECT_DOUBLE_EQ(snap.dt, 0.1);
    EXPECT_EQ(snap.unit, TimeUnit::Seconds);
    EXPECT_EQ(snap.events, 1u);
}
