/**
 * @file InMemoryRepositoriesTest.cpp
 * @brief Unit tests for in-memory repositories
 */

#include <gtest/gtest.h>
#include "adapters/secondary/persistence/InMemoryOrderMappingRepository.hpp"
#include "adapters/secondary/persistence/InMemoryMultiplierRepository.hpp"
#include "adapters/secondary/persistence/InMemoryBlacklistRepository.hpp"
#include "adapters/secondary/persistence/InMemoryAuditRepository.hpp"

using namespace copytrader;
using namespace copytrader::adapters::secondary;

TEST(InMemoryOrderMappingRepositoryTest, SaveFollowerRef_MergesIntoOneMapping) {
    InMemoryOrderMappingRepository repository;
    domain::FollowerOrderRef first;
    first.followerOrderId = "U200-1";
    first.status = domain::MappingStatus::ACTIVE;
    domain::FollowerOrderRef second;
    second.status = domain::MappingStatus::PENDING;

    repository.saveFollowerRef("m1", "AAPL", "f1", first);
    repository.saveFollowerRef("m1", "AAPL", "f2", second);

    auto all = repository.loadAll();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].symbol, "AAPL");
    ASSERT_EQ(all[0].followers.size(), 2u);
    EXPECT_EQ(all[0].followers.at("f1").followerOrderId, "U200-1");
}

TEST(InMemoryOrderMappingRepositoryTest, SaveFollowerRef_OverwritesSameFollower) {
    InMemoryOrderMappingRepository repository;
    domain::FollowerOrderRef ref;
    ref.status = domain::MappingStatus::PENDING;
    repository.saveFollowerRef("m1", "AAPL", "f1", ref);

    ref.status = domain::MappingStatus::CANCELLED;
    repository.saveFollowerRef("m1", "AAPL", "f1", ref);

    EXPECT_EQ(repository.size(), 1u);
    EXPECT_EQ(repository.loadAll()[0].followers.at("f1").status, domain::MappingStatus::CANCELLED);
}

TEST(InMemoryMultiplierRepositoryTest, SaveAndRemove) {
    InMemoryMultiplierRepository repository;
    repository.save({"f1", "AAPL", 2.0, domain::MultiplierSource::USER_OVERRIDE});
    repository.save({"f1", "AAPL", 3.0, domain::MultiplierSource::USER_OVERRIDE});
    repository.save({"f2", "AAPL", 0.5, domain::MultiplierSource::USER_OVERRIDE});

    auto all = repository.loadAll();
    ASSERT_EQ(all.size(), 2u);

    repository.remove("f1", "AAPL");
    all = repository.loadAll();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].followerId, "f2");
}

TEST(InMemoryBlacklistRepositoryTest, SaveAndRemove) {
    InMemoryBlacklistRepository repository;
    domain::BlacklistEntry entry;
    entry.followerId = "f1";
    entry.symbol = "TSLA";
    entry.reason = domain::BlacklistReason::LOCATE_REJECTED;

    repository.save(entry);
    ASSERT_EQ(repository.loadAll().size(), 1u);
    EXPECT_EQ(repository.loadAll()[0].reason, domain::BlacklistReason::LOCATE_REJECTED);

    repository.remove("f1", "TSLA");
    EXPECT_TRUE(repository.loadAll().empty());
}

namespace {

domain::AuditEntry auditEntry(const std::string& category, const std::string& message) {
    domain::AuditEntry entry;
    entry.category = category;
    entry.message = message;
    return entry;
}

} // namespace

TEST(InMemoryAuditRepositoryTest, Recent_NewestFirstWithCategoryFilter) {
    InMemoryAuditRepository repository;
    repository.append(auditEntry(domain::audit::SYSTEM, "started"));
    repository.append(auditEntry(domain::audit::ORDER, "first"));
    repository.append(auditEntry(domain::audit::ORDER, "second"));

    auto orders = repository.recent(10, domain::audit::ORDER);
    ASSERT_EQ(orders.size(), 2u);
    EXPECT_EQ(orders[0].message, "second");
    EXPECT_EQ(orders[1].message, "first");
    EXPECT_GT(orders[0].id, orders[1].id);

    EXPECT_EQ(repository.recent(10, "").size(), 3u);
    EXPECT_EQ(repository.recent(1, "")[0].message, "second");
}

TEST(InMemoryAuditRepositoryTest, Append_DropsOldestOverCapacity) {
    InMemoryAuditRepository repository(2);
    repository.append(auditEntry(domain::audit::ORDER, "a"));
    repository.append(auditEntry(domain::audit::ORDER, "b"));
    repository.append(auditEntry(domain::audit::ORDER, "c"));

    auto all = repository.recent(10, "");
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].message, "c");
    EXPECT_EQ(all[1].message, "b");
    EXPECT_EQ(all[0].id, 3);
}
