#pragma once

#include "domain/SymbolMultiplier.hpp"
#include <vector>
#include <string>

namespace copytrader::ports::input {

class IMultiplierService {
public:
    virtual ~IMultiplierService() = default;

    virtual double effective(const std::string& followerId, const std::string& symbol) const = 0;

    virtual void setOverride(const std::string& followerId, const std::string& symbol, double value) = 0;

    /// @return false если override не было
    virtual bool clearOverride(const std::string& followerId, const std::string& symbol) = 0;

    virtual std::vector<domain::SymbolMultiplier> overrides(const std::string& followerId) const = 0;
};

} // namespace copytrader::ports::input
