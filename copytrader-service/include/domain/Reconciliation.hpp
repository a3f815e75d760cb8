#pragma once

#include "enums/ReconciliationScenario.hpp"
#include "enums/ReconciliationAction.hpp"
#include "enums/MultiplierSource.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace copytrader::domain {

/**
 * @brief Строка отчёта сверки по одному символу
 */
struct ReconciliationEntry {
    std::string symbol;
    int64_t masterQuantity = 0;
    int64_t followerQuantity = 0;
    ReconciliationScenario scenario = ReconciliationScenario::MASTER_ONLY;
    std::optional<double> inferredMultiplier;   ///< только для COMMON_SAME_DIRECTION
    double currentMultiplier = 1.0;
    MultiplierSource currentSource = MultiplierSource::BASE;
    bool blacklisted = false;
    ReconciliationAction defaultAction = ReconciliationAction::BLACKLIST;

    bool operator==(const ReconciliationEntry& other) const {
        return symbol == other.symbol
            && masterQuantity == other.masterQuantity
            && followerQuantity == other.followerQuantity
            && scenario == other.scenario
            && inferredMultiplier == other.inferredMultiplier
            && currentMultiplier == other.currentMultiplier
            && currentSource == other.currentSource
            && blacklisted == other.blacklisted
            && defaultAction == other.defaultAction;
    }
};

struct FollowerReconciliation {
    std::string followerId;
    std::string followerName;
    double baseMultiplier = 1.0;
    std::vector<ReconciliationEntry> entries;

    bool operator==(const FollowerReconciliation& other) const {
        return followerId == other.followerId
            && followerName == other.followerName
            && baseMultiplier == other.baseMultiplier
            && entries == other.entries;
    }
};

/**
 * @brief Решение пользователя по одной паре (follower, symbol)
 *
 * blacklist: true — добавить, false — убрать, nullopt — не трогать.
 */
struct ReconciliationDecision {
    std::string followerId;
    std::string symbol;
    ReconciliationAction action = ReconciliationAction::KEEP;
    std::optional<double> multiplier;
    std::optional<bool> blacklist;
};

struct ReconciliationStats {
    int overridesSet = 0;
    int overridesRemoved = 0;
    int blacklistAdded = 0;
    int blacklistRemoved = 0;
};

} // namespace copytrader::domain
