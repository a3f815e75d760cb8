#pragma once

#include <string>
#include <cstdint>

namespace copytrader::domain {

/**
 * @brief Позиция счёта; quantity со знаком (< 0 означает шорт)
 */
struct Position {
    std::string symbol;
    int64_t quantity = 0;
    double averagePrice = 0.0;
};

/**
 * @brief Результат locate-запроса
 */
struct LocateResult {
    bool success = false;
    int64_t filledQuantity = 0;
    double pricePerShare = 0.0;
    std::string error;
};

} // namespace copytrader::domain
