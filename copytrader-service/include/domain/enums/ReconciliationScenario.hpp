#pragma once

#include <string>

namespace copytrader::domain {

enum class ReconciliationScenario {
    COMMON_SAME_DIRECTION,
    COMMON_OPPOSITE_DIRECTION,
    MASTER_ONLY
};

inline std::string toString(ReconciliationScenario scenario) {
    switch (scenario) {
        case ReconciliationScenario::COMMON_SAME_DIRECTION: return "COMMON_SAME_DIRECTION";
        case ReconciliationScenario::COMMON_OPPOSITE_DIRECTION: return "COMMON_OPPOSITE_DIRECTION";
        case ReconciliationScenario::MASTER_ONLY: return "MASTER_ONLY";
        default: return "UNKNOWN";
    }
}

} // namespace copytrader::domain
