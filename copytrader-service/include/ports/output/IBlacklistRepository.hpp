#pragma once

#include "domain/BlacklistEntry.hpp"
#include <string>
#include <vector>

namespace copytrader::ports::output {

class IBlacklistRepository {
public:
    virtual ~IBlacklistRepository() = default;

    virtual std::vector<domain::BlacklistEntry> loadAll() = 0;

    virtual void save(const domain::BlacklistEntry& entry) = 0;

    virtual void remove(const std::string& followerId, const std::string& symbol) = 0;
};

} // namespace copytrader::ports::output
