#pragma once

#include "MasterOrder.hpp"
#include <variant>
#include <type_traits>
#include <string>
#include <optional>

namespace copytrader::domain {

/// Принятый терминалом обычный ордер (BUY / SELL)
struct OrderSubmitted {
    MasterOrder order;
};

/// Принятый терминалом ордер SHORT, уходит через ShortSaleManager
struct ShortSaleSubmitted {
    MasterOrder order;
};

struct OrderCancelled {
    std::string masterOrderId;
    std::string symbol;
};

struct OrderReplaced {
    std::string masterOrderId;
    std::string symbol;
    std::optional<int64_t> newQuantity;
    std::optional<double> newPrice;
};

/**
 * @brief Событие мастер-счёта
 *
 * Ветвление «короткая продажа / обычный ордер» решается один раз
 * при классификации, дальше код работает с конкретной альтернативой.
 */
using MasterOrderEvent = std::variant<OrderSubmitted, ShortSaleSubmitted, OrderCancelled, OrderReplaced>;

inline MasterOrderEvent classifySubmission(const MasterOrder& order) {
    if (order.isShortSale()) {
        return ShortSaleSubmitted{order};
    }
    return OrderSubmitted{order};
}

inline std::string eventSymbol(const MasterOrderEvent& event) {
    return std::visit([](const auto& e) -> std::string {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, OrderSubmitted> || std::is_same_v<T, ShortSaleSubmitted>) {
            return e.order.symbol;
        } else {
            return e.symbol;
        }
    }, event);
}

inline std::string eventOrderId(const MasterOrderEvent& event) {
    return std::visit([](const auto& e) -> std::string {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, OrderSubmitted> || std::is_same_v<T, ShortSaleSubmitted>) {
            return e.order.id;
        } else {
            return e.masterOrderId;
        }
    }, event);
}

inline std::string eventKind(const MasterOrderEvent& event) {
    switch (event.index()) {
        case 0: return "submitted";
        case 1: return "short_sale_submitted";
        case 2: return "cancelled";
        case 3: return "replaced";
        default: return "unknown";
    }
}

} // namespace copytrader::domain
