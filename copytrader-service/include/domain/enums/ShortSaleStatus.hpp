#pragma once

#include <string>

namespace copytrader::domain {

/**
 * @brief Состояние задачи короткой продажи
 *
 * PENDING → CHECKING → LOCATING → PLACING_ORDER → COMPLETED.
 * FAILED достижим из CHECKING, LOCATING, PLACING_ORDER;
 * CANCELLED — из любого нетерминального.
 */
enum class ShortSaleStatus {
    PENDING,
    CHECKING,
    LOCATING,
    PLACING_ORDER,
    COMPLETED,
    FAILED,
    CANCELLED
};

inline std::string toString(ShortSaleStatus status) {
    switch (status) {
        case ShortSaleStatus::PENDING: return "PENDING";
        case ShortSaleStatus::CHECKING: return "CHECKING";
        case ShortSaleStatus::LOCATING: return "LOCATING";
        case ShortSaleStatus::PLACING_ORDER: return "PLACING_ORDER";
        case ShortSaleStatus::COMPLETED: return "COMPLETED";
        case ShortSaleStatus::FAILED: return "FAILED";
        case ShortSaleStatus::CANCELLED: return "CANCELLED";
        default: return "UNKNOWN";
    }
}

inline bool isTerminal(ShortSaleStatus status) {
    return status == ShortSaleStatus::COMPLETED
        || status == ShortSaleStatus::FAILED
        || status == ShortSaleStatus::CANCELLED;
}

} // namespace copytrader::domain
