/**
 * @file OrderReplicatorTest.cpp
 * @brief Unit tests for OrderReplicator
 */

#include <gtest/gtest.h>
#include "application/OrderReplicator.hpp"
#include "adapters/secondary/persistence/InMemoryMultiplierRepository.hpp"
#include "adapters/secondary/persistence/InMemoryOrderMappingRepository.hpp"
#include "adapters/secondary/persistence/InMemoryAuditRepository.hpp"
#include "../mocks/MockBrokerSession.hpp"
#include "../mocks/RecordingNotificationSink.hpp"

using namespace copytrader;
using namespace copytrader::application;
using namespace copytrader::tests;

class OrderReplicatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        accounts_ = std::make_shared<settings::AccountsSettings>();
        accounts_->loadFromJson(R"({"followers": [{"id": "f1", "account_id": "U200", "base_multiplier": 2.0}]})");
        follower_ = *accounts_->findFollower("f1");

        multipliers_ = std::make_shared<MultiplierResolver>(
            std::make_shared<adapters::secondary::InMemoryMultiplierRepository>(), accounts_);
        mappingRepository_ = std::make_shared<adapters::secondary::InMemoryOrderMappingRepository>();
        mappings_ = std::make_shared<OrderMappingStore>(mappingRepository_);
        sink_ = std::make_shared<RecordingNotificationSink>();
        audit_ = std::make_shared<AuditTrail>(std::make_shared<adapters::secondary::InMemoryAuditRepository>());
        replicator_ = std::make_shared<OrderReplicator>(multipliers_, mappings_, sink_, audit_);

        session_ = std::make_shared<MockBrokerSession>("U200");
        session_->connect();
    }

    domain::MasterOrder makeOrder(const std::string& id, int64_t quantity) {
        domain::MasterOrder order;
        order.id = id;
        order.symbol = "AAPL";
        order.side = domain::OrderSide::BUY;
        order.type = domain::OrderType::LIMIT;
        order.quantity = quantity;
        order.price = 187.5;
        order.timeInForce = domain::TimeInForce::GTC;
        return order;
    }

    std::shared_ptr<settings::AccountsSettings> accounts_;
    domain::FollowerConfig follower_;
    std::shared_ptr<MultiplierResolver> multipliers_;
    std::shared_ptr<adapters::secondary::InMemoryOrderMappingRepository> mappingRepository_;
    std::shared_ptr<OrderMappingStore> mappings_;
    std::shared_ptr<RecordingNotificationSink> sink_;
    std::shared_ptr<AuditTrail> audit_;
    std::shared_ptr<OrderReplicator> replicator_;
    std::shared_ptr<MockBrokerSession> session_;
};

// ============================================================================
// SUBMIT
// ============================================================================

TEST_F(OrderReplicatorTest, Replicate_CopiesOrderWithScaledQuantity) {
    auto result = replicator_->replicate(makeOrder("m1", 100), follower_, *session_);

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.quantity, 200);

    auto submitted = session_->submitted();
    ASSERT_EQ(submitted.size(), 1u);
    EXPECT_EQ(submitted[0].quantity, 200);
    EXPECT_EQ(submitted[0].type, domain::OrderType::LIMIT);
    EXPECT_EQ(submitted[0].side, domain::OrderSide::BUY);
    EXPECT_EQ(submitted[0].timeInForce, domain::TimeInForce::GTC);
    ASSERT_TRUE(submitted[0].price.has_value());
    EXPECT_DOUBLE_EQ(*submitted[0].price, 187.5);
    EXPECT_EQ(submitted[0].reference, "m1");
}

TEST_F(OrderReplicatorTest, Replicate_Success_MappingActiveAndNotified) {
    auto result = replicator_->replicate(makeOrder("m1", 100), follower_, *session_);

    auto ref = mappings_->find("m1", "f1");
    ASSERT_TRUE(ref.has_value());
    EXPECT_EQ(ref->status, domain::MappingStatus::ACTIVE);
    EXPECT_EQ(ref->followerOrderId, result.followerOrderId);
    EXPECT_EQ(mappingRepository_->size(), 1u);

    auto notifications = sink_->byTopic(domain::topics::ORDER_REPLICATED);
    ASSERT_EQ(notifications.size(), 1u);
    EXPECT_EQ(notifications[0].details["quantity"], 200);
}

TEST_F(OrderReplicatorTest, Replicate_UsesOverrideMultiplier) {
    multipliers_->setOverride("f1", "AAPL", 0.5);

    auto result = replicator_->replicate(makeOrder("m1", 100), follower_, *session_);

    EXPECT_EQ(result.quantity, 50);
}

TEST_F(OrderReplicatorTest, Replicate_Rejected_MarksFailedWithoutRetry) {
    session_->setSubmitError(domain::BrokerErrorKind::REJECTED);

    auto result = replicator_->replicate(makeOrder("m1", 100), follower_, *session_);

    EXPECT_EQ(result.outcome, ReplicationOutcome::FAILED);
    EXPECT_EQ(mappings_->find("m1", "f1")->status, domain::MappingStatus::FAILED);
    EXPECT_EQ(sink_->byTopic(domain::topics::ORDER_REPLICATION_FAILED).size(), 1u);
}

TEST_F(OrderReplicatorTest, Replicate_Connectivity_ReportsUnreachable) {
    session_->setSubmitError(domain::BrokerErrorKind::CONNECTIVITY);

    auto result = replicator_->replicate(makeOrder("m1", 100), follower_, *session_);

    EXPECT_EQ(result.outcome, ReplicationOutcome::UNREACHABLE);
    EXPECT_EQ(mappings_->find("m1", "f1")->status, domain::MappingStatus::SKIPPED);
    EXPECT_TRUE(sink_->byTopic(domain::topics::ORDER_REPLICATION_FAILED).empty());
}

// ============================================================================
// AUDIT
// ============================================================================

TEST_F(OrderReplicatorTest, Replicate_Success_WritesAuditEntry) {
    auto result = replicator_->replicate(makeOrder("m1", 100), follower_, *session_);

    auto entries = audit_->recent(10, domain::audit::ORDER);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].level, domain::AuditLevel::INFO);
    EXPECT_EQ(entries[0].followerId, "f1");
    EXPECT_EQ(entries[0].symbol, "AAPL");
    EXPECT_EQ(entries[0].details["master_order_id"].get<std::string>(), "m1");
    EXPECT_EQ(entries[0].details["follower_order_id"].get<std::string>(), result.followerOrderId);
}

TEST_F(OrderReplicatorTest, Replicate_Rejected_WritesErrorAuditEntry) {
    session_->setSubmitError(domain::BrokerErrorKind::REJECTED);

    replicator_->replicate(makeOrder("m1", 100), follower_, *session_);

    auto entries = audit_->recent(10, domain::audit::ORDER);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].level, domain::AuditLevel::ERROR);
    EXPECT_EQ(entries[0].followerId, "f1");
    EXPECT_TRUE(audit_->recent(10, domain::audit::SYSTEM).empty());
}

TEST_F(OrderReplicatorTest, Cancel_LiveOrder_AuditNewestFirst) {
    replicator_->replicate(makeOrder("m1", 100), follower_, *session_);
    replicator_->cancel("m1", "f1", *session_);

    auto entries = audit_->recent(10, "");
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_NE(entries[0].message.find("Cancelled"), std::string::npos);
    EXPECT_NE(entries[1].message.find("Replicated"), std::string::npos);
    EXPECT_GT(entries[0].id, entries[1].id);
}

// ============================================================================
// CANCEL / REPLACE
// ============================================================================

TEST_F(OrderReplicatorTest, Cancel_LiveOrder_CancelsOnBroker) {
    auto placed = replicator_->replicate(makeOrder("m1", 100), follower_, *session_);

    auto result = replicator_->cancel("m1", "f1", *session_);

    ASSERT_TRUE(result.ok());
    ASSERT_EQ(session_->cancelled().size(), 1u);
    EXPECT_EQ(session_->cancelled()[0], placed.followerOrderId);
    EXPECT_EQ(mappings_->find("m1", "f1")->status, domain::MappingStatus::CANCELLED);
}

TEST_F(OrderReplicatorTest, Cancel_NoMapping_Skipped) {
    auto result = replicator_->cancel("unknown", "f1", *session_);

    EXPECT_EQ(result.outcome, ReplicationOutcome::SKIPPED);
    EXPECT_TRUE(session_->cancelled().empty());
}

TEST_F(OrderReplicatorTest, Cancel_WhileSubmitPending_CancelsPlacedOrderAfterSubmit) {
    mappings_->beginAttempt("m1", "AAPL", "f1");

    auto cancelResult = replicator_->cancel("m1", "f1", *session_);
    EXPECT_TRUE(cancelResult.ok());
    EXPECT_EQ(mappings_->find("m1", "f1")->status, domain::MappingStatus::CANCELLED);

    // submit завершается уже после отмены мастера
    auto submitResult = replicator_->replicate(makeOrder("m1", 100), follower_, *session_);

    EXPECT_TRUE(submitResult.ok());
    ASSERT_EQ(session_->cancelled().size(), 1u);
    EXPECT_EQ(session_->cancelled()[0], submitResult.followerOrderId);
    EXPECT_EQ(mappings_->find("m1", "f1")->status, domain::MappingStatus::CANCELLED);
}

TEST_F(OrderReplicatorTest, Replace_ScalesNewQuantity) {
    auto placed = replicator_->replicate(makeOrder("m1", 100), follower_, *session_);

    auto result = replicator_->replace("m1", "f1", *session_, 150, std::nullopt);

    ASSERT_TRUE(result.ok());
    auto replaced = session_->replaced();
    ASSERT_EQ(replaced.size(), 1u);
    EXPECT_EQ(replaced[0].first, placed.followerOrderId);
    EXPECT_EQ(replaced[0].second, std::optional<int64_t>(300));
    EXPECT_EQ(sink_->byTopic(domain::topics::ORDER_REPLACED).size(), 1u);
}

TEST_F(OrderReplicatorTest, Replace_NoLiveOrder_Skipped) {
    session_->setSubmitError(domain::BrokerErrorKind::REJECTED);
    replicator_->replicate(makeOrder("m1", 100), follower_, *session_);

    auto result = replicator_->replace("m1", "f1", *session_, 150, std::nullopt);

    EXPECT_EQ(result.outcome, ReplicationOutcome::SKIPPED);
    EXPECT_TRUE(session_->replaced().empty());
}
