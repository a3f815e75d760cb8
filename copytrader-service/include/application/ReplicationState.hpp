#pragma once

#include "domain/enums/EngineState.hpp"
#include "domain/Errors.hpp"
#include <mutex>
#include <initializer_list>
#include <algorithm>
#include <iostream>

namespace copytrader::application {

/**
 * @brief Состояние жизненного цикла и шлюз сверки
 *
 * Все переходы проходят через transition(); недопустимый переход
 * бросает EngineStateException. Шлюз взводится при connect и
 * снимается apply или skip сверки.
 */
class ReplicationState {
public:
    domain::EngineState current() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    /**
     * @brief Перейти в target, если текущее состояние входит в allowed
     * @return предыдущее состояние
     */
    domain::EngineState transition(std::initializer_list<domain::EngineState> allowed,
                                   domain::EngineState target) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (std::find(allowed.begin(), allowed.end(), state_) == allowed.end()) {
            throw domain::EngineStateException(
                "Cannot move engine from " + domain::toString(state_) + " to " + domain::toString(target));
        }
        if (target == domain::EngineState::REPLICATING && !gatePassed_) {
            throw domain::EngineStateException("Reconciliation must be applied or skipped before replication");
        }
        auto previous = state_;
        state_ = target;
        if (target == domain::EngineState::CONNECTED && previous == domain::EngineState::STOPPED) {
            gatePassed_ = false;
        }
        std::cout << "[ReplicationState] " << domain::toString(previous)
                  << " -> " << domain::toString(target) << std::endl;
        return previous;
    }

    /**
     * @brief Снять шлюз сверки; допустимо только в CONNECTED
     */
    void passGate() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != domain::EngineState::CONNECTED) {
            throw domain::EngineStateException(
                "Reconciliation requires CONNECTED state, engine is " + domain::toString(state_));
        }
        gatePassed_ = true;
    }

    bool gatePassed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return gatePassed_;
    }

    void requireState(domain::EngineState expected) const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != expected) {
            throw domain::EngineStateException(
                "Engine must be " + domain::toString(expected) + ", is " + domain::toString(state_));
        }
    }

private:
    mutable std::mutex mutex_;
    domain::EngineState state_ = domain::EngineState::STOPPED;
    bool gatePassed_ = false;
};

} // namespace copytrader::application
