#pragma once

#include "enums/MultiplierSource.hpp"
#include <string>

namespace copytrader::domain {

struct SymbolMultiplier {
    std::string followerId;
    std::string symbol;
    double value = 1.0;
    MultiplierSource source = MultiplierSource::BASE;
};

} // namespace copytrader::domain
