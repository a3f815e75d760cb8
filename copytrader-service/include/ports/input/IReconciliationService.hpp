#pragma once

#include "domain/Reconciliation.hpp"
#include <vector>
#include <string>

namespace copytrader::ports::input {

class IReconciliationService {
public:
    virtual ~IReconciliationService() = default;

    /**
     * @brief Сравнить позиции мастера и follower
     * @param followerIds пустой список — все подключённые follower
     */
    virtual std::vector<domain::FollowerReconciliation> compute(
        const std::vector<std::string>& followerIds) = 0;

    /**
     * @brief Применить решения пользователя и запустить репликацию
     */
    virtual domain::ReconciliationStats apply(
        const std::vector<domain::ReconciliationDecision>& decisions) = 0;
};

} // namespace copytrader::ports::input
