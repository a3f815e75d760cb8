/**
 * @file ReconnectMonitorTest.cpp
 * @brief Unit tests for ReconnectMonitor
 */

#include <gtest/gtest.h>
#include "adapters/secondary/scheduling/ReconnectMonitor.hpp"
#include "adapters/secondary/persistence/InMemoryMultiplierRepository.hpp"
#include "adapters/secondary/persistence/InMemoryOrderMappingRepository.hpp"
#include "adapters/secondary/persistence/InMemoryBlacklistRepository.hpp"
#include "adapters/secondary/persistence/InMemoryAuditRepository.hpp"
#include "../mocks/MockBrokerConnector.hpp"
#include "../mocks/RecordingNotificationSink.hpp"
#include <thread>

using namespace copytrader;
using namespace copytrader::application;
using namespace copytrader::adapters::secondary;
using namespace copytrader::tests;

class ReconnectMonitorTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings_ = std::make_shared<settings::EngineSettings>();
        settings_->setWorkerThreads(2);

        auto accounts = std::make_shared<settings::AccountsSettings>();
        accounts->loadFromJson(R"({"followers": [{"id": "f1", "account_id": "U200"}]})");

        connector_ = std::make_shared<MockBrokerConnector>();
        sink_ = std::make_shared<RecordingNotificationSink>();
        queue_ = std::make_shared<ActionQueue>();

        auto multipliers = std::make_shared<MultiplierResolver>(
            std::make_shared<InMemoryMultiplierRepository>(), accounts);
        auto blacklist = std::make_shared<BlacklistRegistry>(std::make_shared<InMemoryBlacklistRepository>());
        auto mappings = std::make_shared<OrderMappingStore>(std::make_shared<InMemoryOrderMappingRepository>());
        auto audit = std::make_shared<AuditTrail>(std::make_shared<InMemoryAuditRepository>());
        auto replicator = std::make_shared<OrderReplicator>(multipliers, mappings, sink_, audit);
        auto shortSales = std::make_shared<ShortSaleManager>(
            settings_, replicator, multipliers, blacklist, queue_, sink_);

        engine_ = std::make_shared<ReplicationEngine>(
            settings_, std::make_shared<ReplicationState>(),
            std::make_shared<SessionManager>(connector_, accounts),
            mappings, blacklist, queue_, replicator, shortSales, multipliers, sink_, audit);
    }

    void queueSubmit(const std::string& followerId) {
        domain::QueuedAction action;
        action.type = domain::QueuedActionType::SUBMIT;
        action.masterOrderId = "m1";
        action.symbol = "AAPL";
        action.reason = "Follower unreachable at dispatch";
        queue_->enqueue(followerId, action);
    }

    std::shared_ptr<settings::EngineSettings> settings_;
    std::shared_ptr<MockBrokerConnector> connector_;
    std::shared_ptr<RecordingNotificationSink> sink_;
    std::shared_ptr<ActionQueue> queue_;
    std::shared_ptr<ReplicationEngine> engine_;
};

TEST_F(ReconnectMonitorTest, Construction_NotRunning) {
    ReconnectMonitor monitor(engine_, settings_);

    EXPECT_FALSE(monitor.isRunning());
    EXPECT_EQ(monitor.tickCount(), 0u);
}

TEST_F(ReconnectMonitorTest, ManualTick_ReconnectedFollowerWithQueue_Notifies) {
    connector_->session("f1")->setReachable(false);
    engine_->connect();
    queueSubmit("f1");

    ReconnectMonitor monitor(engine_, settings_);
    monitor.manualTick();
    EXPECT_TRUE(sink_->byTopic(domain::topics::ACTIONS_AVAILABLE).empty());

    connector_->session("f1")->setReachable(true);
    monitor.manualTick();

    auto available = sink_->byTopic(domain::topics::ACTIONS_AVAILABLE);
    ASSERT_EQ(available.size(), 1u);
    EXPECT_EQ(available[0].followerId, "f1");
    EXPECT_EQ(monitor.tickCount(), 2u);
}

TEST_F(ReconnectMonitorTest, ManualTick_ReconnectWithoutQueue_Silent) {
    connector_->session("f1")->setReachable(false);
    engine_->connect();

    ReconnectMonitor monitor(engine_, settings_);
    connector_->session("f1")->setReachable(true);
    monitor.manualTick();

    EXPECT_TRUE(sink_->byTopic(domain::topics::ACTIONS_AVAILABLE).empty());
}

TEST_F(ReconnectMonitorTest, StartStop_PollsInBackground) {
    ReconnectMonitor monitor(engine_, settings_);

    monitor.start();
    monitor.start();
    EXPECT_TRUE(monitor.isRunning());

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    monitor.stop();

    EXPECT_FALSE(monitor.isRunning());
    EXPECT_GE(monitor.tickCount(), 1u);
}

TEST_F(ReconnectMonitorTest, Stop_WhenNotRunning_NoOp) {
    ReconnectMonitor monitor(engine_, settings_);

    monitor.stop();

    EXPECT_FALSE(monitor.isRunning());
}
