#pragma once

#include "Timestamp.hpp"
#include "enums/QueuedActionType.hpp"
#include <string>
#include <optional>
#include <cstdint>

namespace copytrader::domain {

/**
 * @brief Действие, отложенное для недоступного follower
 *
 * Живёт только в памяти и исчезает при перезапуске.
 */
struct QueuedAction {
    std::string id;
    std::string followerId;
    QueuedActionType type = QueuedActionType::SUBMIT;
    std::string masterOrderId;
    std::string symbol;
    bool shortSale = false;
    std::optional<int64_t> newQuantity;   ///< только для REPLACE
    std::optional<double> newPrice;       ///< только для REPLACE
    std::string reason;
    Timestamp queuedAt;
};

} // namespace copytrader::domain
