#pragma once

#include <string>

namespace copytrader::ports::output {

/**
 * @brief Интерфейс для публикации событий
 *
 * Реализуется RabbitMQAdapter.
 */
class IEventPublisher {
public:
    virtual ~IEventPublisher() = default;

    /**
     * @param routingKey Ключ маршрутизации (например, "short_sale.task_updated")
     * @param message JSON-сообщение
     */
    virtual void publish(const std::string& routingKey, const std::string& message) = 0;
};

} // namespace copytrader::ports::output
