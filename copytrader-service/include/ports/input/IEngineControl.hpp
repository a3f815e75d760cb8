#pragma once

#include "domain/EngineSnapshot.hpp"
#include "domain/enums/EngineState.hpp"

namespace copytrader::ports::input {

/**
 * @brief Управление жизненным циклом движка репликации
 *
 * Недопустимые переходы бросают domain::EngineStateException.
 */
class IEngineControl {
public:
    virtual ~IEngineControl() = default;

    /// STOPPED → CONNECTED, взводит шлюз сверки
    virtual void connect() = 0;

    /// CONNECTED → REPLICATING, только после apply или skip сверки
    virtual void startReplication() = 0;

    /// Снять шлюз сверки без изменений и запустить репликацию
    virtual void skipReconciliation() = 0;

    /// Любое состояние → STOPPED
    virtual void stop() = 0;

    /// stop() + connect(); используется ежедневным планировщиком
    virtual void restart() = 0;

    virtual domain::EngineState state() const = 0;

    virtual domain::EngineSnapshot snapshot() const = 0;
};

} // namespace copytrader::ports::input
