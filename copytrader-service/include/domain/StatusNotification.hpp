#pragma once

#include "Timestamp.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <optional>

namespace copytrader::domain {

namespace topics {
    inline constexpr const char* SHORT_SALE_TASK_UPDATED = "short_sale.task_updated";
    inline constexpr const char* ORDER_REPLICATED = "order.replicated";
    inline constexpr const char* ORDER_REPLICATION_FAILED = "order.replication_failed";
    inline constexpr const char* ORDER_CANCELLED = "order.cancelled";
    inline constexpr const char* ORDER_REPLACED = "order.replaced";
    inline constexpr const char* ORDER_DISPATCHED = "order.dispatched";
    inline constexpr const char* ACTION_QUEUED = "action.queued";
    inline constexpr const char* ACTIONS_REPLAYED = "actions.replayed";
    inline constexpr const char* ACTIONS_AVAILABLE = "queue.actions_available";
    inline constexpr const char* ENGINE_STATE_CHANGED = "engine.state_changed";
    inline constexpr const char* ALERT = "alert";
}

/**
 * @brief Уведомление для внешних наблюдателей
 *
 * topic совпадает с routing key при публикации в RabbitMQ.
 */
struct StatusNotification {
    std::string topic;
    std::string subjectId;
    std::string followerId;
    std::string symbol;
    std::string status;
    std::optional<std::string> error;
    Timestamp createdAt;
    Timestamp updatedAt;
    nlohmann::json details = nlohmann::json::object();
};

inline StatusNotification makeNotification(const std::string& topic,
                                           const std::string& subjectId,
                                           const std::string& followerId,
                                           const std::string& symbol,
                                           const std::string& status) {
    StatusNotification n;
    n.topic = topic;
    n.subjectId = subjectId;
    n.followerId = followerId;
    n.symbol = symbol;
    n.status = status;
    n.createdAt = Timestamp::now();
    n.updatedAt = n.createdAt;
    return n;
}

} // namespace copytrader::domain
