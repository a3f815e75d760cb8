#pragma once

#include <string>

namespace copytrader::domain {

/**
 * @brief Сторона ордера
 *
 * SHORT — продажа без позиции, требует заёмных акций (locate).
 */
enum class OrderSide {
    BUY,
    SELL,
    SHORT
};

inline std::string toString(OrderSide side) {
    switch (side) {
        case OrderSide::BUY: return "BUY";
        case OrderSide::SELL: return "SELL";
        case OrderSide::SHORT: return "SHORT";
        default: return "UNKNOWN";
    }
}

inline OrderSide parseOrderSide(const std::string& str) {
    if (str == "SELL") return OrderSide::SELL;
    if (str == "SHORT" || str == "SSHORT") return OrderSide::SHORT;
    return OrderSide::BUY;
}

} // namespace copytrader::domain
