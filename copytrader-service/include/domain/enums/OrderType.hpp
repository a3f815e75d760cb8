#pragma once

#include <string>

namespace copytrader::domain {

enum class OrderType {
    MARKET,
    LIMIT,
    STOP,
    STOP_LIMIT,
    TRAILING_STOP
};

inline std::string toString(OrderType type) {
    switch (type) {
        case OrderType::MARKET: return "MARKET";
        case OrderType::LIMIT: return "LIMIT";
        case OrderType::STOP: return "STOP";
        case OrderType::STOP_LIMIT: return "STOP_LIMIT";
        case OrderType::TRAILING_STOP: return "TRAILING_STOP";
        default: return "UNKNOWN";
    }
}

inline OrderType parseOrderType(const std::string& str) {
    if (str == "LIMIT" || str == "LMT") return OrderType::LIMIT;
    if (str == "STOP" || str == "STP") return OrderType::STOP;
    if (str == "STOP_LIMIT" || str == "STP LMT") return OrderType::STOP_LIMIT;
    if (str == "TRAILING_STOP" || str == "TRAIL") return OrderType::TRAILING_STOP;
    return OrderType::MARKET;
}

} // namespace copytrader::domain
