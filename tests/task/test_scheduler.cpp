/*
 * test_scheduler.cpp - Tests for the polling task scheduler
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <filesystem>
#include <future>

#include <unistd.h>

#include "mocks/in_memory_config_store.hpp"
#include "mocks/mock_command_executor.hpp"
#include "mocks/mock_notification_dispatcher.hpp"
#include "mocks/test_helpers.hpp"
#include "task/exception.hpp"
#include "task/scheduler.hpp"

using namespace deq;
using namespace deq::task;
using namespace testing;
using deq::command::CommandResult;
using deq::utils::makeLocalTime;
namespace fs = std::filesystem;

class SchedulerTest : public Test {
protected:
    void SetUp() override {
        const auto* info = UnitTest::GetInstance()->current_test_info();
        logDir_ = fs::temp_directory_path() /
                  ("deq-sched-" + std::string(info->name()) + "-" +
                   std::to_string(::getpid()));

        store_ = std::make_shared<test::InMemoryConfigStore>();
        executor_ = std::make_shared<NiceMock<test::MockCommandExecutor>>();
        loop_ = std::make_shared<app::EventLoop>(2, "test-sched");
        runner_ = std::make_shared<TaskRunner>(
            store_, executor_, std::make_shared<test::RecordingDispatcher>(),
            loop_, logDir_);
        scheduler_ = std::make_unique<TaskScheduler>(store_, runner_);

        auto nas = test::makeRemote("nas", "10.0.0.2");
        nas.wol = device::WolConfig{"AA:BB:CC:DD:EE:FF", "255.255.255.255"};
        store_->addDevice(nas);
        ON_CALL(*executor_, wakeOnLan(_, _))
            .WillByDefault(Return(CommandResult::ok()));
    }

    void TearDown() override {
        scheduler_->stop();
        loop_->stop();
        fs::remove_all(logDir_);
    }

    static auto wakeTask(const std::string& id, const std::string& time)
        -> Task {
        Task task;
        task.id = id;
        task.name = "Wake " + id;
        task.type = TaskType::Wake;
        task.device = "nas";
        task.schedule.type = ScheduleType::Daily;
        task.schedule.time = time;
        return task;
    }

    void waitForIdle() {
        ASSERT_TRUE(
            test::waitUntil([&] { return runner_->runningTasks().empty(); }));
    }

    const utils::TimePoint now_ = makeLocalTime(2025, 6, 4, 12, 0, 0);

    fs::path logDir_;
    std::shared_ptr<test::InMemoryConfigStore> store_;
    std::shared_ptr<NiceMock<test::MockCommandExecutor>> executor_;
    std::shared_ptr<app::EventLoop> loop_;
    std::shared_ptr<TaskRunner> runner_;
    std::unique_ptr<TaskScheduler> scheduler_;
};

// ========== Poll Tests ==========

TEST_F(SchedulerTest, MissingNextRunIsMaterializedWithoutRunning) {
    store_->addTask(wakeTask("w1", "18:00"));
    EXPECT_CALL(*executor_, wakeOnLan(_, _)).Times(0);

    EXPECT_EQ(scheduler_->pollOnce(now_), 0u);
    EXPECT_EQ(store_->getTask("w1")->nextRun,
              makeLocalTime(2025, 6, 4, 18, 0, 0));
}

TEST_F(SchedulerTest, TaskWithoutNextOccurrenceIsNotRewritten) {
    auto task = wakeTask("w1", "18:00");
    task.schedule.type = ScheduleType::Unknown;
    store_->addTask(task);
    const int writesBefore = store_->writeCount();

    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(scheduler_->pollOnce(now_ + std::chrono::minutes(i)), 0u);
    }
    EXPECT_EQ(store_->writeCount(), writesBefore);
    EXPECT_FALSE(store_->getTask("w1")->nextRun.has_value());
}

TEST_F(SchedulerTest, DueTaskRunsAndAdvances) {
    auto task = wakeTask("w1", "11:00");
    task.nextRun = makeLocalTime(2025, 6, 4, 11, 0, 0);
    store_->addTask(task);
    EXPECT_CALL(*executor_, wakeOnLan("AA:BB:CC:DD:EE:FF", _)).Times(1);

    EXPECT_EQ(scheduler_->pollOnce(now_), 1u);
    waitForIdle();

    auto stored = store_->getTask("w1");
    EXPECT_EQ(stored->lastStatus, TaskStatus::Success);
    ASSERT_TRUE(stored->nextRun.has_value());
    EXPECT_GT(*stored->nextRun, now_);
}

TEST_F(SchedulerTest, DueExactlyNowRuns) {
    auto task = wakeTask("w1", "12:00");
    task.nextRun = now_;
    store_->addTask(task);
    EXPECT_EQ(scheduler_->pollOnce(now_), 1u);
    waitForIdle();
}

TEST_F(SchedulerTest, FutureTaskIsLeftAlone) {
    auto task = wakeTask("w1", "18:00");
    task.nextRun = makeLocalTime(2025, 6, 4, 18, 0, 0);
    store_->addTask(task);
    const int writesBefore = store_->writeCount();

    EXPECT_EQ(scheduler_->pollOnce(now_), 0u);
    EXPECT_EQ(store_->writeCount(), writesBefore);
}

TEST_F(SchedulerTest, DisabledTaskIsIgnored) {
    auto task = wakeTask("w1", "11:00");
    task.enabled = false;
    task.nextRun = makeLocalTime(2025, 6, 4, 11, 0, 0);
    store_->addTask(task);

    EXPECT_EQ(scheduler_->pollOnce(now_), 0u);
    EXPECT_EQ(store_->getTask("w1")->nextRun, task.nextRun);
}

TEST_F(SchedulerTest, InvalidScheduleIsSkippedOthersStillRun) {
    auto broken = wakeTask("bad", "25:99");
    store_->addTask(broken);
    auto good = wakeTask("good", "11:00");
    good.nextRun = makeLocalTime(2025, 6, 4, 11, 0, 0);
    store_->addTask(good);

    EXPECT_EQ(scheduler_->pollOnce(now_), 1u);
    waitForIdle();
    EXPECT_FALSE(store_->getTask("bad")->nextRun.has_value());
    EXPECT_EQ(store_->getTask("good")->lastStatus, TaskStatus::Success);
}

TEST_F(SchedulerTest, RunningTaskStillAdvancesNextRun) {
    std::promise<void> release;
    auto gate = release.get_future().share();
    EXPECT_CALL(*executor_, wakeOnLan(_, _))
        .WillOnce(InvokeWithoutArgs([gate] {
            gate.wait();
            return CommandResult::ok();
        }));

    auto task = wakeTask("w1", "11:00");
    store_->addTask(task);
    ASSERT_EQ(scheduler_->runNow("w1", utils::RequestContext{}),
              RunRequest::Started);
    EXPECT_TRUE(scheduler_->isTaskRunning("w1"));

    store_->modifyTask("w1", [](Task& t) {
        t.nextRun = makeLocalTime(2025, 6, 4, 11, 0, 0);
    });
    EXPECT_EQ(scheduler_->pollOnce(now_), 0u);

    auto stored = store_->getTask("w1");
    ASSERT_TRUE(stored->nextRun.has_value());
    EXPECT_EQ(*stored->nextRun, makeLocalTime(2025, 6, 5, 11, 0, 0));

    release.set_value();
    waitForIdle();
}

// ========== Task Management Tests ==========

TEST_F(SchedulerTest, DisableClearsNextRun) {
    auto task = wakeTask("w1", "18:00");
    task.nextRun = makeLocalTime(2025, 6, 4, 18, 0, 0);
    store_->addTask(task);

    auto updated = scheduler_->setTaskEnabled("w1", false);
    ASSERT_TRUE(updated.has_value());
    EXPECT_FALSE(updated->enabled);
    EXPECT_FALSE(updated->nextRun.has_value());
    EXPECT_FALSE(store_->getTask("w1")->enabled);
}

TEST_F(SchedulerTest, EnableComputesNextRun) {
    auto task = wakeTask("w1", "18:00");
    task.enabled = false;
    store_->addTask(task);

    auto updated = scheduler_->setTaskEnabled("w1", true);
    ASSERT_TRUE(updated.has_value());
    EXPECT_TRUE(updated->enabled);
    ASSERT_TRUE(updated->nextRun.has_value());
    EXPECT_GT(*updated->nextRun, utils::Clock::now());
}

TEST_F(SchedulerTest, EnableInvalidScheduleThrowsAndKeepsTask) {
    auto task = wakeTask("w1", "nope");
    task.enabled = false;
    store_->addTask(task);

    EXPECT_THROW(scheduler_->setTaskEnabled("w1", true),
                 InvalidScheduleException);
    EXPECT_FALSE(store_->getTask("w1")->enabled);
}

TEST_F(SchedulerTest, ToggleUnknownTask) {
    EXPECT_FALSE(scheduler_->setTaskEnabled("ghost", true).has_value());
}

TEST_F(SchedulerTest, SaveTaskComputesNextRun) {
    auto saved = scheduler_->saveTask(wakeTask("w2", "06:30"));
    ASSERT_TRUE(saved.nextRun.has_value());
    EXPECT_EQ(utils::toLocalTm(*saved.nextRun).tm_min, 30);
    EXPECT_EQ(store_->getTask("w2")->nextRun, saved.nextRun);
}

TEST_F(SchedulerTest, SaveTaskRejectsBadSchedule) {
    auto task = wakeTask("w2", "06:30");
    task.schedule.type = ScheduleType::Weekly;
    task.schedule.day = 9;
    EXPECT_THROW(scheduler_->saveTask(task), InvalidScheduleException);
    EXPECT_FALSE(store_->getTask("w2").has_value());
}

// ========== Lifecycle Tests ==========

TEST_F(SchedulerTest, StartStopIsIdempotent) {
    store_->addTask(wakeTask("w1", "18:00"));
    scheduler_->start();
    scheduler_->start();
    EXPECT_TRUE(scheduler_->isRunning());

    ASSERT_TRUE(test::waitUntil(
        [&] { return store_->getTask("w1")->nextRun.has_value(); }));

    auto begin = std::chrono::steady_clock::now();
    scheduler_->stop();
    scheduler_->stop();
    EXPECT_FALSE(scheduler_->isRunning());
    EXPECT_LT(std::chrono::steady_clock::now() - begin,
              std::chrono::seconds(3));
}
