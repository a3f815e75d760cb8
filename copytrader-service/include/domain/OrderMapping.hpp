#pragma once

#include "Timestamp.hpp"
#include "enums/MappingStatus.hpp"
#include <string>
#include <map>

namespace copytrader::domain {

/**
 * @brief Ссылка на follower-ордер внутри маппинга
 */
struct FollowerOrderRef {
    std::string followerOrderId;   ///< пусто, пока submit не вернул id
    MappingStatus status = MappingStatus::PENDING;
    Timestamp updatedAt;

    bool isLive() const {
        return status == MappingStatus::ACTIVE && !followerOrderId.empty();
    }
};

/**
 * @brief Маппинг master order → follower orders
 *
 * Записи не удаляются: replace перезаписывает followerOrderId,
 * cancel переводит запись в терминальный статус.
 */
struct OrderMapping {
    std::string masterOrderId;
    std::string symbol;
    std::map<std::string, FollowerOrderRef> followers;   ///< followerId → ref
    Timestamp createdAt;
};

} // namespace copytrader::domain
