#pragma once

#include "ports/input/IReconciliationService.hpp"
#include "ports/input/IEngineControl.hpp"
#include "application/SessionManager.hpp"
#include "application/MultiplierResolver.hpp"
#include "application/BlacklistRegistry.hpp"
#include "application/ReplicationState.hpp"
#include "domain/BlacklistEntry.hpp"
#include "domain/Errors.hpp"
#include <memory>
#include <map>
#include <set>
#include <cmath>
#include <cstdlib>
#include <iostream>

namespace copytrader::application {

/**
 * @brief Сверка позиций мастера и follower перед репликацией
 *
 * compute() только читает позиции и ничего не меняет, поэтому повторный
 * вызов без изменения позиций даёт тот же отчёт. apply() применяет решения
 * пользователя, снимает шлюз и запускает репликацию.
 */
class ReconciliationService : public ports::input::IReconciliationService {
public:
    ReconciliationService(
        std::shared_ptr<SessionManager> sessions,
        std::shared_ptr<MultiplierResolver> multipliers,
        std::shared_ptr<BlacklistRegistry> blacklist,
        std::shared_ptr<ReplicationState> state,
        std::shared_ptr<ports::input::IEngineControl> engine)
        : sessions_(std::move(sessions))
        , multipliers_(std::move(multipliers))
        , blacklist_(std::move(blacklist))
        , state_(std::move(state))
        , engine_(std::move(engine))
    {
        std::cout << "[ReconciliationService] Created" << std::endl;
    }

    /**
     * @brief Коэффициент |follower| / |master|, округлённый до 4 знаков
     */
    static double inferMultiplier(int64_t masterQuantity, int64_t followerQuantity) {
        double ratio = static_cast<double>(std::llabs(followerQuantity))
                     / static_cast<double>(std::llabs(masterQuantity));
        return std::round(ratio * 10000.0) / 10000.0;
    }

    std::vector<domain::FollowerReconciliation> compute(
        const std::vector<std::string>& followerIds) override
    {
        if (state_->current() == domain::EngineState::STOPPED) {
            throw domain::EngineStateException("Reconciliation requires connected broker sessions");
        }

        auto master = sessions_->master();
        if (!master) {
            throw domain::EngineStateException("Master session is not open");
        }

        std::set<std::string> filter(followerIds.begin(), followerIds.end());
        for (const auto& id : filter) {
            if (!sessions_->followerConfig(id)) {
                throw domain::NotFoundException("Unknown follower: " + id);
            }
        }

        auto masterPositions = aggregate(master->getPositions());

        std::vector<domain::FollowerReconciliation> result;
        for (const auto& follower : sessions_->enabledFollowers()) {
            if (!filter.empty() && !filter.count(follower.id())) {
                continue;
            }
            auto session = sessions_->follower(follower.id());
            if (!session || !session->isConnected()) {
                std::cout << "[ReconciliationService] Skip unreachable follower " << follower.id() << std::endl;
                continue;
            }

            auto followerPositions = aggregate(session->getPositions());

            domain::FollowerReconciliation report;
            report.followerId = follower.id();
            report.followerName = follower.account.name;
            report.baseMultiplier = multipliers_->baseMultiplier(follower.id());

            for (const auto& [symbol, masterQty] : masterPositions) {
                auto it = followerPositions.find(symbol);
                int64_t followerQty = it == followerPositions.end() ? 0 : it->second;
                report.entries.push_back(classify(follower.id(), symbol, masterQty, followerQty));
            }

            std::cout << "[ReconciliationService] " << follower.id() << ": "
                      << report.entries.size() << " symbols" << std::endl;
            result.push_back(std::move(report));
        }
        return result;
    }

    domain::ReconciliationStats apply(
        const std::vector<domain::ReconciliationDecision>& decisions) override
    {
        state_->requireState(domain::EngineState::CONNECTED);

        // Сначала проверяем всё, чтобы не применить решения частично
        for (const auto& decision : decisions) {
            if (!sessions_->followerConfig(decision.followerId)) {
                throw domain::NotFoundException("Unknown follower: " + decision.followerId);
            }
            if (decision.symbol.empty()) {
                throw domain::ValidationException("Decision for " + decision.followerId + " has no symbol");
            }
            bool needsValue = decision.action == domain::ReconciliationAction::USE_INFERRED
                           || decision.action == domain::ReconciliationAction::MANUAL;
            if (needsValue) {
                if (!decision.multiplier) {
                    throw domain::ValidationException(
                        domain::toString(decision.action) + " requires a multiplier for " + decision.symbol);
                }
                MultiplierResolver::validate(*decision.multiplier);
            }
            if (decision.action == domain::ReconciliationAction::BLACKLIST && decision.blacklist == false) {
                throw domain::ValidationException("Conflicting blacklist decision for " + decision.symbol);
            }
        }

        domain::ReconciliationStats stats;
        for (const auto& decision : decisions) {
            switch (decision.action) {
                case domain::ReconciliationAction::USE_INFERRED:
                case domain::ReconciliationAction::MANUAL:
                    multipliers_->setOverride(decision.followerId, decision.symbol, *decision.multiplier);
                    ++stats.overridesSet;
                    break;
                case domain::ReconciliationAction::USE_DEFAULT:
                    if (multipliers_->clearOverride(decision.followerId, decision.symbol)) {
                        ++stats.overridesRemoved;
                    }
                    break;
                case domain::ReconciliationAction::KEEP:
                case domain::ReconciliationAction::BLACKLIST:
                    break;
            }

            bool addToBlacklist = decision.blacklist.value_or(
                decision.action == domain::ReconciliationAction::BLACKLIST);
            if (addToBlacklist) {
                if (blacklist_->add(decision.followerId, decision.symbol, domain::BlacklistReason::RECONCILIATION)) {
                    ++stats.blacklistAdded;
                }
            } else if (decision.blacklist == false) {
                if (blacklist_->remove(decision.followerId, decision.symbol)) {
                    ++stats.blacklistRemoved;
                }
            }
        }

        std::cout << "[ReconciliationService] Applied " << decisions.size() << " decisions: "
                  << stats.overridesSet << " overrides set, "
                  << stats.overridesRemoved << " removed, "
                  << stats.blacklistAdded << " blacklisted, "
                  << stats.blacklistRemoved << " unblacklisted" << std::endl;

        state_->passGate();
        engine_->startReplication();
        return stats;
    }

private:
    std::shared_ptr<SessionManager> sessions_;
    std::shared_ptr<MultiplierResolver> multipliers_;
    std::shared_ptr<BlacklistRegistry> blacklist_;
    std::shared_ptr<ReplicationState> state_;
    std::shared_ptr<ports::input::IEngineControl> engine_;

    /**
     * @brief Ненулевые позиции по нормализованному символу, отсортированные
     */
    static std::map<std::string, int64_t> aggregate(const std::vector<domain::Position>& positions) {
        std::map<std::string, int64_t> result;
        for (const auto& position : positions) {
            result[domain::normalizeSymbol(position.symbol)] += position.quantity;
        }
        for (auto it = result.begin(); it != result.end();) {
            it = it->second == 0 ? result.erase(it) : std::next(it);
        }
        return result;
    }

    domain::ReconciliationEntry classify(const std::string& followerId, const std::string& symbol,
                                         int64_t masterQty, int64_t followerQty) const {
        domain::ReconciliationEntry entry;
        entry.symbol = symbol;
        entry.masterQuantity = masterQty;
        entry.followerQuantity = followerQty;

        if (followerQty == 0) {
            entry.scenario = domain::ReconciliationScenario::MASTER_ONLY;
            entry.defaultAction = domain::ReconciliationAction::BLACKLIST;
        } else if ((masterQty > 0) == (followerQty > 0)) {
            entry.scenario = domain::ReconciliationScenario::COMMON_SAME_DIRECTION;
            entry.inferredMultiplier = inferMultiplier(masterQty, followerQty);
            entry.defaultAction = domain::ReconciliationAction::USE_INFERRED;
        } else {
            entry.scenario = domain::ReconciliationScenario::COMMON_OPPOSITE_DIRECTION;
            entry.defaultAction = domain::ReconciliationAction::BLACKLIST;
        }

        auto current = multipliers_->resolve(followerId, symbol);
        entry.currentMultiplier = current.value;
        entry.currentSource = current.source;
        entry.blacklisted = blacklist_->isBlacklisted(followerId, symbol);
        return entry;
    }
};

} // namespace copytrader::application
