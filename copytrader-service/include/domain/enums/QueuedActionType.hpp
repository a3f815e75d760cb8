#pragma once

#include <string>

namespace copytrader::domain {

enum class QueuedActionType {
    SUBMIT,
    CANCEL,
    REPLACE
};

inline std::string toString(QueuedActionType type) {
    switch (type) {
        case QueuedActionType::SUBMIT: return "SUBMIT";
        case QueuedActionType::CANCEL: return "CANCEL";
        case QueuedActionType::REPLACE: return "REPLACE";
        default: return "UNKNOWN";
    }
}

} // namespace copytrader::domain
