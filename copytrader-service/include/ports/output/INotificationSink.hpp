#pragma once

#include "domain/StatusNotification.hpp"

namespace copytrader::ports::output {

/**
 * @brief Приёмник статусных уведомлений
 *
 * Вызывается из рабочих потоков; реализация должна быть потокобезопасной
 * и не бросать исключений.
 */
class INotificationSink {
public:
    virtual ~INotificationSink() = default;

    virtual void notify(const domain::StatusNotification& notification) = 0;
};

} // namespace copytrader::ports::output
