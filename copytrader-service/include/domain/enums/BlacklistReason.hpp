#pragma once

#include <string>

namespace copytrader::domain {

/**
 * @brief Причина попадания в чёрный список (только для отображения)
 */
enum class BlacklistReason {
    MANUAL,
    LOCATE_REJECTED,
    RECONCILIATION
};

inline std::string toString(BlacklistReason reason) {
    switch (reason) {
        case BlacklistReason::MANUAL: return "MANUAL";
        case BlacklistReason::LOCATE_REJECTED: return "LOCATE_REJECTED";
        case BlacklistReason::RECONCILIATION: return "RECONCILIATION";
        default: return "UNKNOWN";
    }
}

inline BlacklistReason parseBlacklistReason(const std::string& str) {
    if (str == "LOCATE_REJECTED") return BlacklistReason::LOCATE_REJECTED;
    if (str == "RECONCILIATION") return BlacklistReason::RECONCILIATION;
    return BlacklistReason::MANUAL;
}

} // namespace copytrader::domain
