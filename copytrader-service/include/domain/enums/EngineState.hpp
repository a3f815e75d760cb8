#pragma once

#include <string>

namespace copytrader::domain {

/**
 * @brief Жизненный цикл движка: STOPPED → CONNECTED → REPLICATING
 */
enum class EngineState {
    STOPPED,
    CONNECTED,
    REPLICATING
};

inline std::string toString(EngineState state) {
    switch (state) {
        case EngineState::STOPPED: return "STOPPED";
        case EngineState::CONNECTED: return "CONNECTED";
        case EngineState::REPLICATING: return "REPLICATING";
        default: return "UNKNOWN";
    }
}

} // namespace copytrader::domain
