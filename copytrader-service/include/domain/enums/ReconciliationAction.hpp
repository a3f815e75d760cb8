#pragma once

#include <string>
#include <stdexcept>

namespace copytrader::domain {

/**
 * @brief Действие над множителем при применении сверки
 *
 * BLACKLIST используется только как действие по умолчанию в отчёте;
 * в решении пользователя чёрный список задаётся отдельным флагом.
 */
enum class ReconciliationAction {
    USE_INFERRED,
    MANUAL,
    USE_DEFAULT,
    KEEP,
    BLACKLIST
};

inline std::string toString(ReconciliationAction action) {
    switch (action) {
        case ReconciliationAction::USE_INFERRED: return "USE_INFERRED";
        case ReconciliationAction::MANUAL: return "MANUAL";
        case ReconciliationAction::USE_DEFAULT: return "USE_DEFAULT";
        case ReconciliationAction::KEEP: return "KEEP";
        case ReconciliationAction::BLACKLIST: return "BLACKLIST";
        default: return "UNKNOWN";
    }
}

inline ReconciliationAction parseReconciliationAction(const std::string& str) {
    if (str == "USE_INFERRED") return ReconciliationAction::USE_INFERRED;
    if (str == "MANUAL") return ReconciliationAction::MANUAL;
    if (str == "USE_DEFAULT") return ReconciliationAction::USE_DEFAULT;
    if (str == "KEEP") return ReconciliationAction::KEEP;
    if (str == "BLACKLIST") return ReconciliationAction::BLACKLIST;
    throw std::invalid_argument("Unknown reconciliation action: " + str);
}

} // namespace copytrader::domain
