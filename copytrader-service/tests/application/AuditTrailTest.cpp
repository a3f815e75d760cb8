/**
 * @file AuditTrailTest.cpp
 * @brief Unit tests for AuditTrail
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "application/AuditTrail.hpp"
#include "adapters/secondary/persistence/InMemoryAuditRepository.hpp"

using namespace copytrader;
using namespace copytrader::application;
using ::testing::_;
using ::testing::Throw;

class FailingAuditRepository : public ports::output::IAuditRepository {
public:
    MOCK_METHOD(void, append, (const domain::AuditEntry&), (override));
    MOCK_METHOD(std::vector<domain::AuditEntry>, recent, (size_t, const std::string&), (override));
};

TEST(AuditTrailTest, Record_StoresLevelFollowerAndDetails) {
    auto repository = std::make_shared<adapters::secondary::InMemoryAuditRepository>();
    AuditTrail audit(repository);

    audit.warn(domain::audit::ORDER, "Queued SUBMIT", "f2", "AAPL", {{"action_id", "qa-1"}});

    auto entries = audit.recent(10, "");
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].level, domain::AuditLevel::WARN);
    EXPECT_EQ(entries[0].category, "order");
    EXPECT_EQ(entries[0].followerId, "f2");
    EXPECT_EQ(entries[0].symbol, "AAPL");
    EXPECT_EQ(entries[0].details["action_id"].get<std::string>(), "qa-1");
    EXPECT_FALSE(entries[0].timestamp.toString().empty());
}

TEST(AuditTrailTest, Record_WithoutDetails_LeavesDetailsNull) {
    auto repository = std::make_shared<adapters::secondary::InMemoryAuditRepository>();
    AuditTrail audit(repository);

    audit.info(domain::audit::SYSTEM, "Replication engine started");

    auto entries = audit.recent(10, domain::audit::SYSTEM);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_TRUE(entries[0].details.is_null());
    EXPECT_TRUE(entries[0].followerId.empty());
}

TEST(AuditTrailTest, Record_RepositoryFailure_DoesNotThrow) {
    auto repository = std::make_shared<FailingAuditRepository>();
    EXPECT_CALL(*repository, append(_)).WillOnce(Throw(std::runtime_error("connection lost")));
    AuditTrail audit(repository);

    EXPECT_NO_THROW(audit.error(domain::audit::ORDER, "Failed to replicate", "f1", "AAPL"));
}
