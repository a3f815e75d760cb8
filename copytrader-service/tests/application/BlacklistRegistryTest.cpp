/**
 * @file BlacklistRegistryTest.cpp
 * @brief Unit tests for BlacklistRegistry
 */

#include <gtest/gtest.h>
#include "application/BlacklistRegistry.hpp"
#include "adapters/secondary/persistence/InMemoryBlacklistRepository.hpp"

using namespace copytrader;
using namespace copytrader::application;

class BlacklistRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        repository_ = std::make_shared<adapters::secondary::InMemoryBlacklistRepository>();
        registry_ = std::make_shared<BlacklistRegistry>(repository_);
    }

    std::shared_ptr<adapters::secondary::InMemoryBlacklistRepository> repository_;
    std::shared_ptr<BlacklistRegistry> registry_;
};

TEST_F(BlacklistRegistryTest, Add_NewEntry_ReturnsTrueAndBlacklists) {
    EXPECT_TRUE(registry_->add("f1", "TSLA", domain::BlacklistReason::MANUAL));

    EXPECT_TRUE(registry_->isBlacklisted("f1", "TSLA"));
    EXPECT_FALSE(registry_->isBlacklisted("f2", "TSLA"));
    EXPECT_FALSE(registry_->isBlacklisted("f1", "AAPL"));
}

TEST_F(BlacklistRegistryTest, Add_Twice_SecondReturnsFalse) {
    EXPECT_TRUE(registry_->add("f1", "TSLA", domain::BlacklistReason::MANUAL));
    EXPECT_FALSE(registry_->add("f1", "TSLA", domain::BlacklistReason::RECONCILIATION));

    auto entries = registry_->list("f1");
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].reason, domain::BlacklistReason::MANUAL);
}

TEST_F(BlacklistRegistryTest, Symbols_AreCaseInsensitive) {
    registry_->add("f1", "tsla", domain::BlacklistReason::MANUAL);

    EXPECT_TRUE(registry_->isBlacklisted("f1", "TSLA"));
    EXPECT_EQ(registry_->list("f1")[0].symbol, "TSLA");
}

TEST_F(BlacklistRegistryTest, Remove_ExistingEntry_ReturnsTrue) {
    registry_->add("f1", "TSLA", domain::BlacklistReason::MANUAL);

    EXPECT_TRUE(registry_->remove("f1", "TSLA"));
    EXPECT_FALSE(registry_->isBlacklisted("f1", "TSLA"));
    EXPECT_FALSE(registry_->remove("f1", "TSLA"));
}

TEST_F(BlacklistRegistryTest, List_EmptyFollower_ReturnsAll) {
    registry_->add("f1", "TSLA", domain::BlacklistReason::MANUAL);
    registry_->add("f2", "AAPL", domain::BlacklistReason::LOCATE_REJECTED);

    EXPECT_EQ(registry_->list("").size(), 2u);
    EXPECT_EQ(registry_->list("f2").size(), 1u);
}

TEST_F(BlacklistRegistryTest, Reload_RestoresPersistedEntries) {
    registry_->add("f1", "TSLA", domain::BlacklistReason::RECONCILIATION);

    auto restored = std::make_shared<BlacklistRegistry>(repository_);
    EXPECT_FALSE(restored->isBlacklisted("f1", "TSLA"));

    restored->reload();

    EXPECT_TRUE(restored->isBlacklisted("f1", "TSLA"));
    EXPECT_EQ(restored->list("f1")[0].reason, domain::BlacklistReason::RECONCILIATION);
}

TEST_F(BlacklistRegistryTest, Remove_DeletesFromRepository) {
    registry_->add("f1", "TSLA", domain::BlacklistReason::MANUAL);
    registry_->remove("f1", "TSLA");

    EXPECT_TRUE(repository_->loadAll().empty());
}
