#pragma once

#include "Timestamp.hpp"
#include "enums/ShortSaleStatus.hpp"
#include <string>
#include <optional>
#include <cstdint>

namespace copytrader::domain {

/**
 * @brief Задача репликации одной короткой продажи на одного follower
 */
struct ShortSaleTask {
    std::string id;
    std::string followerId;
    std::string symbol;
    std::string masterOrderId;
    int64_t requiredQuantity = 0;   ///< масштабированное количество
    int64_t locateDeficit = 0;      ///< сколько не хватило sell capacity
    ShortSaleStatus status = ShortSaleStatus::PENDING;
    std::optional<std::string> error;
    std::optional<std::string> followerOrderId;
    Timestamp createdAt;
    Timestamp updatedAt;

    /**
     * @brief Разрешён ли переход из текущего состояния
     */
    bool canTransition(ShortSaleStatus next) const {
        if (isTerminal(status)) {
            return false;
        }
        switch (next) {
            case ShortSaleStatus::CHECKING:
                return status == ShortSaleStatus::PENDING;
            case ShortSaleStatus::LOCATING:
                return status == ShortSaleStatus::CHECKING;
            case ShortSaleStatus::PLACING_ORDER:
                return status == ShortSaleStatus::CHECKING || status == ShortSaleStatus::LOCATING;
            case ShortSaleStatus::COMPLETED:
                return status == ShortSaleStatus::PLACING_ORDER;
            case ShortSaleStatus::FAILED:
                return status != ShortSaleStatus::PENDING;
            case ShortSaleStatus::CANCELLED:
                return true;
            default:
                return false;
        }
    }

    bool isActive() const { return !isTerminal(status); }
};

} // namespace copytrader::domain
