#pragma once

#include "Timestamp.hpp"
#include "enums/BlacklistReason.hpp"
#include <string>
#include <algorithm>
#include <cctype>

namespace copytrader::domain {

struct BlacklistEntry {
    std::string followerId;
    std::string symbol;
    BlacklistReason reason = BlacklistReason::MANUAL;
    Timestamp createdAt;
};

/// Тикеры хранятся и сравниваются в верхнем регистре
inline std::string normalizeSymbol(std::string symbol) {
    std::transform(symbol.begin(), symbol.end(), symbol.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return symbol;
}

} // namespace copytrader::domain
