/**
 * @file DailyRestartSchedulerTest.cpp
 * @brief Unit tests for DailyRestartScheduler
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "adapters/secondary/scheduling/DailyRestartScheduler.hpp"

using namespace copytrader;
using namespace copytrader::adapters::secondary;
using ::testing::Return;
using ::testing::Throw;

class MockEngineControl : public ports::input::IEngineControl {
public:
    MOCK_METHOD(void, connect, (), (override));
    MOCK_METHOD(void, startReplication, (), (override));
    MOCK_METHOD(void, skipReconciliation, (), (override));
    MOCK_METHOD(void, stop, (), (override));
    MOCK_METHOD(void, restart, (), (override));
    MOCK_METHOD(domain::EngineState, state, (), (const, override));
    MOCK_METHOD(domain::EngineSnapshot, snapshot, (), (const, override));
};

namespace {

using Clock = DailyRestartScheduler::Clock;

// 2024-01-15T00:00:00Z
const Clock::time_point kMonday = Clock::time_point(std::chrono::seconds(1705276800));

} // namespace

class DailyRestartSchedulerTest : public ::testing::Test {
protected:
    void SetUp() override {
        engine_ = std::make_shared<MockEngineControl>();
        settings_ = std::make_shared<settings::EngineSettings>();
        scheduler_ = std::make_unique<DailyRestartScheduler>(engine_, settings_);
    }

    std::shared_ptr<MockEngineControl> engine_;
    std::shared_ptr<settings::EngineSettings> settings_;
    std::unique_ptr<DailyRestartScheduler> scheduler_;
};

// ============================================================================
// computeNextRun
// ============================================================================

TEST(DailyRestartScheduleTest, ComputeNextRun_LaterToday) {
    auto now = kMonday + std::chrono::hours(7) + std::chrono::minutes(59);

    auto next = DailyRestartScheduler::computeNextRun(now, 8, 0);

    EXPECT_EQ(next, kMonday + std::chrono::hours(8));
}

TEST(DailyRestartScheduleTest, ComputeNextRun_AfterTimePassed_Tomorrow) {
    auto now = kMonday + std::chrono::hours(10);

    auto next = DailyRestartScheduler::computeNextRun(now, 8, 0);

    EXPECT_EQ(next, kMonday + std::chrono::hours(24 + 8));
}

TEST(DailyRestartScheduleTest, ComputeNextRun_ExactlyAtTime_IsStrictlyAfter) {
    auto now = kMonday + std::chrono::hours(8);

    auto next = DailyRestartScheduler::computeNextRun(now, 8, 0);

    EXPECT_EQ(next, kMonday + std::chrono::hours(24 + 8));
}

TEST(DailyRestartScheduleTest, ComputeNextRun_HonoursMinutes) {
    auto next = DailyRestartScheduler::computeNextRun(kMonday, 21, 30);

    EXPECT_EQ(next, kMonday + std::chrono::hours(21) + std::chrono::minutes(30));
}

// ============================================================================
// tick
// ============================================================================

TEST_F(DailyRestartSchedulerTest, Tick_BeforeSchedule_DoesNothing) {
    EXPECT_CALL(*engine_, restart()).Times(0);

    EXPECT_FALSE(scheduler_->tick(scheduler_->nextRun() - std::chrono::seconds(1)));
    EXPECT_EQ(scheduler_->restartCount(), 0u);
}

TEST_F(DailyRestartSchedulerTest, Tick_WhenDue_RestartsRunningEngine) {
    auto due = scheduler_->nextRun();
    EXPECT_CALL(*engine_, state()).WillOnce(Return(domain::EngineState::REPLICATING));
    EXPECT_CALL(*engine_, restart()).Times(1);

    EXPECT_TRUE(scheduler_->tick(due));

    EXPECT_EQ(scheduler_->restartCount(), 1u);
    EXPECT_EQ(scheduler_->nextRun(), due + std::chrono::hours(24));
}

TEST_F(DailyRestartSchedulerTest, Tick_WhenDue_SkipsStoppedEngine) {
    auto due = scheduler_->nextRun();
    EXPECT_CALL(*engine_, state()).WillOnce(Return(domain::EngineState::STOPPED));
    EXPECT_CALL(*engine_, restart()).Times(0);

    EXPECT_FALSE(scheduler_->tick(due));

    EXPECT_EQ(scheduler_->restartCount(), 0u);
    EXPECT_GT(scheduler_->nextRun(), due);
}

TEST_F(DailyRestartSchedulerTest, Tick_RunsOncePerDay) {
    auto due = scheduler_->nextRun();
    EXPECT_CALL(*engine_, state()).WillOnce(Return(domain::EngineState::CONNECTED));
    EXPECT_CALL(*engine_, restart()).Times(1);

    EXPECT_TRUE(scheduler_->tick(due));
    EXPECT_FALSE(scheduler_->tick(due + std::chrono::minutes(1)));
}

TEST_F(DailyRestartSchedulerTest, Tick_RestartFailure_NotCounted) {
    auto due = scheduler_->nextRun();
    EXPECT_CALL(*engine_, state()).WillOnce(Return(domain::EngineState::REPLICATING));
    EXPECT_CALL(*engine_, restart()).WillOnce(Throw(std::runtime_error("master unreachable")));

    EXPECT_TRUE(scheduler_->tick(due));
    EXPECT_EQ(scheduler_->restartCount(), 0u);
}

TEST_F(DailyRestartSchedulerTest, Start_Disabled_DoesNotRun) {
    settings_->setDailyRestartEnabled(false);
    EXPECT_CALL(*engine_, restart()).Times(0);

    scheduler_->start();
    scheduler_->stop();
}
