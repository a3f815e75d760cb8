#pragma once

#include "domain/SymbolMultiplier.hpp"
#include <string>
#include <vector>

namespace copytrader::ports::output {

class IMultiplierRepository {
public:
    virtual ~IMultiplierRepository() = default;

    virtual std::vector<domain::SymbolMultiplier> loadAll() = 0;

    virtual void save(const domain::SymbolMultiplier& multiplier) = 0;

    virtual void remove(const std::string& followerId, const std::string& symbol) = 0;
};

} // namespace copytrader::ports::output
