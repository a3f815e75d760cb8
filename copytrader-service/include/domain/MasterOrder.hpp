#pragma once

#include "Timestamp.hpp"
#include "enums/OrderSide.hpp"
#include "enums/OrderType.hpp"
#include "enums/TimeInForce.hpp"
#include <string>
#include <optional>
#include <cstdint>

namespace copytrader::domain {

/**
 * @brief Ордер мастер-счёта в том виде, в каком его прислал терминал
 */
struct MasterOrder {
    std::string id;
    std::string symbol;
    OrderSide side = OrderSide::BUY;
    OrderType type = OrderType::MARKET;
    int64_t quantity = 0;
    std::optional<double> price;         ///< лимитная цена
    std::optional<double> stopPrice;
    std::optional<double> trailAmount;
    TimeInForce timeInForce = TimeInForce::DAY;
    std::string route;                   ///< маршрут исполнения (SMART, TESTROUTE...)
    Timestamp createdAt;

    bool isShortSale() const { return side == OrderSide::SHORT; }
};

/**
 * @brief Заявка на follower-счёт: копия мастер-ордера с пересчитанным количеством
 */
struct FollowerOrderRequest {
    std::string symbol;
    OrderSide side = OrderSide::BUY;
    OrderType type = OrderType::MARKET;
    int64_t quantity = 0;
    std::optional<double> price;
    std::optional<double> stopPrice;
    std::optional<double> trailAmount;
    TimeInForce timeInForce = TimeInForce::DAY;
    std::string reference;               ///< master order id, для аудита на стороне брокера
};

} // namespace copytrader::domain
